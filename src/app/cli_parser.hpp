#pragma once
#include <string>
#include "app/relay_config.hpp"
#include "core/errors/relay_errors.hpp"
#include "protocol/capture_contract.hpp"

namespace relay::app::cli {

    enum class Command {
        Forward,  // run the forwarder loop
        Fetch,    // one interceptor exchange, printed to stdout
        Status    // shared directory summary
    };

    struct CliInvocation {
        Command command = Command::Status;
        RelayConfig config;
        protocol::CapturedCall fetch;
        bool verbose = false;
    };

    relay::core::errors::Result<CliInvocation> parse_and_validate(int argc, char* argv[]);
}

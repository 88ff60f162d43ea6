#include <atomic>
#include <exception>
#include <iostream>
#include <memory>
#include <signal.h>
#include <string>
#include "agents/forwarder_agent.hpp"
#include "agents/interceptor_agent.hpp"
#include "app/cli_parser.hpp"
#include "app/relay_config.hpp"
#include "core/errors/relay_errors.hpp"
#include "core/logging/logger.hpp"
#include "policy/security_gate.hpp"
#include "store/exchange_store.hpp"
#include "transport/curl_transport.hpp"

namespace {

std::atomic_bool* g_stop_flag = nullptr;

void handle_shutdown_signal(int) {
    if (g_stop_flag != nullptr) {
        g_stop_flag->store(true);
    }
}

void install_signal_handlers(const std::shared_ptr<std::atomic_bool>& stop_token) {
    g_stop_flag = stop_token.get();
    struct sigaction action {};
    action.sa_handler = handle_shutdown_signal;
    sigemptyset(&action.sa_mask);
    static_cast<void>(sigaction(SIGINT, &action, nullptr));
    static_cast<void>(sigaction(SIGTERM, &action, nullptr));
}

relay::store::ExchangeStore make_store(const relay::app::RelayConfig& config) {
    return relay::store::ExchangeStore(config.shared_root, config.read_retry);
}

int run_status(const relay::app::RelayConfig& config) {
    const auto store = make_store(config);
    std::cout << "Shared directory: " << config.shared_root.string() << std::endl;

    auto status = store.status();
    if (relay::core::errors::is_error(status)) {
        const auto& err = relay::core::errors::get_error(status);
        LOG_ERROR("Status unavailable [" + err.code + "]: " + err.message);
        if (!err.hint.empty()) {
            LOG_INFO("Hint: " + err.hint);
        }
        return 1;
    }

    const auto& counts = relay::core::errors::get_value(status);
    std::cout << "Pending requests: " << counts.pending_requests << std::endl;
    std::cout << "Responses: " << counts.responses << std::endl;
    return 0;
}

int run_forward(const relay::app::RelayConfig& config,
                const std::shared_ptr<std::atomic_bool>& stop_token) {
    relay::core::logging::Logger::get().set_context("forwarder");
    try {
        relay::transport::CurlTransport transport;
        relay::agents::ForwarderAgent forwarder(
            make_store(config), relay::policy::SecurityGate(config.gate), transport,
            relay::app::forwarder_options(config));

        auto prepared = forwarder.prepare();
        if (relay::core::errors::is_error(prepared)) {
            const auto& err = relay::core::errors::get_error(prepared);
            LOG_ERROR("Unable to prepare shared directory [" + err.code + "]: " +
                      err.message);
            return 3;
        }

        forwarder.run(stop_token);
        return 0;
    } catch (const std::exception& e) {
        LOG_ERROR("Fatal error: " + std::string(e.what()));
        return 1;
    }
}

int run_fetch(const relay::app::cli::CliInvocation& invocation,
              const std::shared_ptr<std::atomic_bool>& stop_token) {
    relay::core::logging::Logger::get().set_context("interceptor");
    const auto store = make_store(invocation.config);
    auto prepared = store.ensure_layout();
    if (relay::core::errors::is_error(prepared)) {
        const auto& err = relay::core::errors::get_error(prepared);
        LOG_ERROR("Unable to prepare shared directory [" + err.code + "]: " +
                  err.message);
        return 3;
    }

    relay::agents::InterceptorAgent interceptor(
        store, relay::app::interceptor_options(invocation.config));
    const auto result = interceptor.handle(invocation.fetch, stop_token);

    LOG_INFO("Exchange " + result.exchange_id + " " +
             relay::protocol::to_string(result.outcome) + ": " +
             std::to_string(result.status_code) + " " + result.reason);
    for (const auto& [name, value] : result.headers) {
        LOG_DEBUG("  " + name + ": " + value);
    }
    std::cout << result.body << std::flush;

    return result.outcome == relay::protocol::InterceptOutcome::Resolved ? 0 : 1;
}

}  // namespace

int main(int argc, char* argv[]) {
    LOG_INFO("fsrelay: bootstrapping...");
    auto parsed = relay::app::cli::parse_and_validate(argc, argv);
    if (relay::core::errors::is_error(parsed)) {
        const auto& err = relay::core::errors::get_error(parsed);
        LOG_ERROR("Input error [" + err.code + "]: " + err.message);
        if (!err.hint.empty()) {
            LOG_INFO("Hint: " + err.hint);
        }
        return 2;
    }

    const auto& invocation = relay::core::errors::get_value(parsed);
    if (invocation.verbose) {
        relay::core::logging::Logger::get().set_min_level(
            relay::core::logging::LogLevel::DEBUG);
    }

    auto stop_token = std::make_shared<std::atomic_bool>(false);
    install_signal_handlers(stop_token);

    switch (invocation.command) {
        case relay::app::cli::Command::Forward:
            return run_forward(invocation.config, stop_token);
        case relay::app::cli::Command::Fetch:
            return run_fetch(invocation, stop_token);
        case relay::app::cli::Command::Status:
            return run_status(invocation.config);
    }
    return 1;
}

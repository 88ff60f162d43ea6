#pragma once

#include <memory>
#include <curl/curl.h>
#include "transport/outbound_transport.hpp"

namespace relay::transport {

// libcurl-backed transport. Reuses one easy handle so connections and DNS
// lookups are cached between calls until reset_connection_cache().
// Not thread-safe; one instance per forwarder loop.
class CurlTransport : public OutboundTransport {
public:
    CurlTransport();

    core::errors::Result<TransportResponse> call(const OutboundCall& request) override;

    void reset_connection_cache() override;

private:
    struct EasyDeleter {
        void operator()(CURL* handle) const { curl_easy_cleanup(handle); }
    };
    struct ShareDeleter {
        void operator()(CURLSH* share) const { curl_share_cleanup(share); }
    };

    void create_handles();

    // Declared first so the easy handle is released before the share it uses.
    std::unique_ptr<CURLSH, ShareDeleter> share_;
    std::unique_ptr<CURL, EasyDeleter> easy_;
};

}  // namespace relay::transport

#include "transport/curl_transport.hpp"

#include <algorithm>
#include <cctype>
#include <cstring>
#include <mutex>
#include <stdexcept>
#include <string>
#include <utility>
#include "core/logging/logger.hpp"

namespace relay::transport {

using core::errors::ErrorCategory;
using core::errors::RelayError;

namespace {

struct SlistDeleter {
    void operator()(curl_slist* list) const { curl_slist_free_all(list); }
};

struct ResponseCapture {
    std::string status_line;
    protocol::Headers headers;
    std::string body;
};

std::string lowercase(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](const unsigned char c) {
                       return static_cast<char>(std::tolower(c));
                   });
    return value;
}

std::string trim(const std::string& value) {
    const auto first = value.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = value.find_last_not_of(" \t\r\n");
    return value.substr(first, last - first + 1);
}

// Headers that only make sense between the client and the capture point.
bool is_proxy_header(const std::string& name) {
    const std::string lowered = lowercase(name);
    return lowered == "proxy-connection" || lowered == "proxy-authorization" ||
           lowered == "content-length";
}

size_t write_body(char* data, size_t size, size_t nmemb, void* userdata) {
    auto* capture = static_cast<ResponseCapture*>(userdata);
    capture->body.append(data, size * nmemb);
    return size * nmemb;
}

size_t write_header(char* data, size_t size, size_t nmemb, void* userdata) {
    auto* capture = static_cast<ResponseCapture*>(userdata);
    const std::string line = trim(std::string(data, size * nmemb));
    if (line.rfind("HTTP/", 0) == 0) {
        // A new status line starts a new response (redirect or 100-continue).
        capture->status_line = line;
        capture->headers.clear();
        return size * nmemb;
    }

    const auto colon = line.find(':');
    if (colon == std::string::npos || colon == 0) {
        return size * nmemb;
    }
    const std::string name = trim(line.substr(0, colon));
    const std::string value = trim(line.substr(colon + 1));
    auto it = capture->headers.find(name);
    if (it == capture->headers.end()) {
        capture->headers.emplace(name, value);
    } else {
        it->second += ", " + value;
    }
    return size * nmemb;
}

std::string reason_from_status_line(const std::string& status_line) {
    // "HTTP/1.1 404 Not Found" -> "Not Found"; HTTP/2 lines carry no reason.
    const auto first_space = status_line.find(' ');
    if (first_space == std::string::npos) {
        return "";
    }
    const auto second_space = status_line.find(' ', first_space + 1);
    if (second_space == std::string::npos) {
        return "";
    }
    return trim(status_line.substr(second_space + 1));
}

void ensure_global_init() {
    static std::once_flag once;
    std::call_once(once, [] {
        if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
            throw std::runtime_error("curl_global_init failed");
        }
    });
}

}  // namespace

CurlTransport::CurlTransport() {
    ensure_global_init();
    create_handles();
}

void CurlTransport::create_handles() {
    easy_.reset();
    share_.reset();

    share_.reset(curl_share_init());
    if (!share_) {
        throw std::runtime_error("curl_share_init failed");
    }
    curl_share_setopt(share_.get(), CURLSHOPT_SHARE, CURL_LOCK_DATA_DNS);

    easy_.reset(curl_easy_init());
    if (!easy_) {
        throw std::runtime_error("curl_easy_init failed");
    }
}

void CurlTransport::reset_connection_cache() {
    LOG_INFO("CurlTransport: clearing DNS and connection cache");
    create_handles();
}

core::errors::Result<TransportResponse> CurlTransport::call(const OutboundCall& request) {
    CURL* handle = easy_.get();
    // Resets options only; the connection pool and DNS cache survive.
    curl_easy_reset(handle);

    ResponseCapture capture;
    char error_buffer[CURL_ERROR_SIZE];
    error_buffer[0] = '\0';

    curl_easy_setopt(handle, CURLOPT_SHARE, share_.get());
    curl_easy_setopt(handle, CURLOPT_ERRORBUFFER, error_buffer);
    curl_easy_setopt(handle, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(handle, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(handle, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(handle, CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(handle, CURLOPT_TIMEOUT_MS,
                     static_cast<long>(request.timeout.count()));
    curl_easy_setopt(handle, CURLOPT_WRITEFUNCTION, write_body);
    curl_easy_setopt(handle, CURLOPT_WRITEDATA, &capture);
    curl_easy_setopt(handle, CURLOPT_HEADERFUNCTION, write_header);
    curl_easy_setopt(handle, CURLOPT_HEADERDATA, &capture);

    // POSTFIELDS alone would turn any method into POST, so every call that
    // carries a body names its method explicitly.
    const bool has_body = !request.body.empty() || request.method == "POST" ||
                          request.method == "PUT" || request.method == "PATCH";
    if (request.method == "HEAD") {
        curl_easy_setopt(handle, CURLOPT_NOBODY, 1L);
    } else if (request.method == "GET" && !has_body) {
        curl_easy_setopt(handle, CURLOPT_HTTPGET, 1L);
    } else {
        if (has_body) {
            curl_easy_setopt(handle, CURLOPT_POSTFIELDSIZE_LARGE,
                             static_cast<curl_off_t>(request.body.size()));
            curl_easy_setopt(handle, CURLOPT_POSTFIELDS, request.body.data());
        }
        curl_easy_setopt(handle, CURLOPT_CUSTOMREQUEST, request.method.c_str());
    }

    std::unique_ptr<curl_slist, SlistDeleter> header_list;
    for (const auto& [name, value] : request.headers) {
        if (is_proxy_header(name)) {
            continue;
        }
        // "Name;" is libcurl's syntax for a header with an empty value.
        const std::string line = value.empty() ? name + ";" : name + ": " + value;
        curl_slist* appended = curl_slist_append(header_list.get(), line.c_str());
        if (appended == nullptr) {
            return RelayError{ErrorCategory::Internal,
                              "Unable to build request headers.",
                              "header_alloc_failed"};
        }
        header_list.release();
        header_list.reset(appended);
    }
    // Suppress libcurl's automatic "Expect: 100-continue".
    if (request.headers.find("Expect") == request.headers.end()) {
        curl_slist* appended = curl_slist_append(header_list.get(), "Expect:");
        if (appended != nullptr) {
            header_list.release();
            header_list.reset(appended);
        }
    }
    curl_easy_setopt(handle, CURLOPT_HTTPHEADER, header_list.get());

    const CURLcode rc = curl_easy_perform(handle);
    if (rc != CURLE_OK) {
        std::string detail = std::strlen(error_buffer) > 0
                                 ? std::string(error_buffer)
                                 : std::string(curl_easy_strerror(rc));
        return RelayError{ErrorCategory::Transport, detail,
                          rc == CURLE_OPERATION_TIMEDOUT ? "transport_timeout"
                                                         : "transport_failed"};
    }

    long status_code = 0;
    curl_easy_getinfo(handle, CURLINFO_RESPONSE_CODE, &status_code);

    TransportResponse response;
    response.status_code = static_cast<int>(status_code);
    response.reason = reason_from_status_line(capture.status_line);
    response.headers = std::move(capture.headers);
    response.body = std::move(capture.body);
    return response;
}

}  // namespace relay::transport

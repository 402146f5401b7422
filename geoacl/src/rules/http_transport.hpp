#pragma once
#include "tasks/cancellation.hpp"
#include <chrono>
#include <memory>
#include <string>

namespace rules {

    struct HttpResponse {
        long status{0};
        std::string body;
    };

    /**
     * Minimal request/response seam used by RemoteRuleStore.
     *
     * Implementations raise errors::ServiceUnavailable (CONNECT or TIMEOUT) when no response was
     * obtained within the timeout, and errors::Cancelled when the token fires mid-flight. Any
     * HTTP status is returned as a response.
     */
    class HttpTransport {
    public:
        HttpTransport() = default;
        HttpTransport(const HttpTransport &) = delete;
        HttpTransport(HttpTransport &&) = delete;
        HttpTransport &operator=(const HttpTransport &) = delete;
        HttpTransport &operator=(HttpTransport &&) = delete;
        virtual ~HttpTransport() = default;

        virtual HttpResponse postJson(
            const std::string &url,
            const std::string &body,
            std::chrono::milliseconds timeout,
            const tasks::CancellationToken &cancel) = 0;
    };

    /**
     * libcurl realisation. Each call uses its own easy handle so the transport can be shared
     * between request threads.
     */
    class CurlTransport : public HttpTransport {
    public:
        CurlTransport();

        HttpResponse postJson(
            const std::string &url,
            const std::string &body,
            std::chrono::milliseconds timeout,
            const tasks::CancellationToken &cancel) override;

        static std::shared_ptr<HttpTransport> create() {
            return std::make_shared<CurlTransport>();
        }
    };

} // namespace rules

#include "rules/http_transport.hpp"
#include "errors/error_base.hpp"
#include "logging/logger.hpp"
#include <curl/curl.h>
#include <initializer_list>
#include <memory>
#include <mutex>

static const auto LOG = // NOLINT(cert-err58-cpp)
    logging::Logger::of("geoacl.rules.CurlTransport");

namespace rules {

    namespace {
        struct CurlEasyDeleter {
            void operator()(CURL *curl) const noexcept {
                curl_easy_cleanup(curl);
            }
        };

        struct CurlSlistDeleter {
            void operator()(curl_slist *list) const noexcept {
                curl_slist_free_all(list);
            }
        };

        using CurlHandle = std::unique_ptr<CURL, CurlEasyDeleter>;
        using CurlHeaders = std::unique_ptr<curl_slist, CurlSlistDeleter>;

        // Called by libcurl with each chunk of the response body
        size_t writeToString(char *contents, size_t size, size_t nmemb, void *userp) {
            size_t totalSize = size * nmemb;
            static_cast<std::string *>(userp)->append(contents, totalSize);
            return totalSize;
        }

        // Returning non-zero aborts the transfer with CURLE_ABORTED_BY_CALLBACK
        int checkCancelled(void *clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
            const auto *cancel = static_cast<const tasks::CancellationToken *>(clientp);
            return cancel->isCancelled() ? 1 : 0;
        }
    } // namespace

    CurlTransport::CurlTransport() {
        static std::once_flag globalInit;
        std::call_once(globalInit, []() {
            if(curl_global_init(CURL_GLOBAL_ALL) != CURLE_OK) {
                LOG.atError().event("curl-init-failed").log("Failed to initialize libcurl");
            }
        });
    }

    HttpResponse CurlTransport::postJson(
        const std::string &url,
        const std::string &body,
        std::chrono::milliseconds timeout,
        const tasks::CancellationToken &cancel) {

        CurlHandle curl{curl_easy_init()};
        if(!curl) {
            throw errors::ServiceUnavailable(
                errors::ServiceUnavailable::Failure::CONNECT, "Failed to initialize libcurl");
        }
        CurlHeaders headers;
        for(const char *header : {"Content-Type: application/json", "Accept: application/json"}) {
            curl_slist *appended = curl_slist_append(headers.get(), header);
            if(appended == nullptr) {
                throw errors::ServiceUnavailable(
                    errors::ServiceUnavailable::Failure::CONNECT, "Failed to build request headers");
            }
            // The head only changes on the first append
            static_cast<void>(headers.release());
            headers.reset(appended);
        }

        HttpResponse response;
        curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
        curl_easy_setopt(curl.get(), CURLOPT_POST, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, body.c_str());
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
        curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
        curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, static_cast<long>(timeout.count()));
        curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(timeout.count()));
        curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, writeToString);
        curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response.body);
        curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, 0L);
        curl_easy_setopt(curl.get(), CURLOPT_XFERINFOFUNCTION, checkCancelled);
        curl_easy_setopt(
            curl.get(), CURLOPT_XFERINFODATA, const_cast<void *>(static_cast<const void *>(&cancel)));

        CURLcode res = curl_easy_perform(curl.get());
        if(res == CURLE_ABORTED_BY_CALLBACK) {
            throw errors::Cancelled("Authorization request cancelled");
        }
        if(res == CURLE_OPERATION_TIMEDOUT) {
            throw errors::ServiceUnavailable(
                errors::ServiceUnavailable::Failure::TIMEOUT,
                std::string("Authorization service timed out: ") + curl_easy_strerror(res));
        }
        if(res != CURLE_OK) {
            throw errors::ServiceUnavailable(
                errors::ServiceUnavailable::Failure::CONNECT,
                std::string("Authorization service unreachable: ") + curl_easy_strerror(res));
        }
        curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.status);
        LOG.atTrace()
            .event("http-response")
            .kv("url", url)
            .kv("status", response.status)
            .log();
        return response;
    }

} // namespace rules

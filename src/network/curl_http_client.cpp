#include "chunkrelay/network/curl_http_client.hpp"
#include "chunkrelay/core/config.hpp"
#include "chunkrelay/core/logger.hpp"
#include "chunkrelay/core/utils.hpp"
#include <curl/curl.h>
#include <cstring>
#include <mutex>
#include <stdexcept>

#define CURL_TEST_OK(x)                                                         \
    do {                                                                        \
        if ((x) != CURLE_OK) throw std::runtime_error("call to " #x " failed"); \
    } while (0)

namespace chunkrelay::network {

namespace {

void ensure_curl_initialized() {
    static std::once_flag once;
    std::call_once(once, [] {
        if (curl_global_init(CURL_GLOBAL_ALL) != CURLE_OK) {
            throw std::runtime_error("curl_global_init() failed");
        }
        auto* version = curl_version_info(CURLVERSION_NOW);
        LOG_DEBUG("libcurl {} ({})", version ? version->version : "?",
                  (version && version->ssl_version) ? version->ssl_version : "no ssl");
    });
}

class CurlSList {
public:
    CurlSList() = default;
    ~CurlSList() {
        if (list_) curl_slist_free_all(list_);
    }

    CurlSList(const CurlSList&) = delete;
    CurlSList& operator=(const CurlSList&) = delete;

    void append(const std::string& item) {
        auto* next = curl_slist_append(list_, item.c_str());
        if (!next) throw std::runtime_error("curl_slist_append() failed");
        list_ = next;
    }

    curl_slist* get() const { return list_; }

private:
    curl_slist* list_ = nullptr;
};

class CurlEasy {
public:
    CurlEasy() : handle_(curl_easy_init()) {
        if (!handle_) throw std::runtime_error("curl_easy_init() failed");
    }
    ~CurlEasy() { curl_easy_cleanup(handle_); }

    CurlEasy(const CurlEasy&) = delete;
    CurlEasy& operator=(const CurlEasy&) = delete;

    CURL* get() const { return handle_; }

private:
    CURL* handle_;
};

struct TransferState {
    HttpResponse* response;
    const HttpRequest* request;
    std::stop_token stop;
};

size_t write_body(char* data, size_t size, size_t items, void* context) {
    auto* state = static_cast<TransferState*>(context);
    size *= items;

    auto& body = state->response->body;
    if (state->request->max_body_bytes && body.size() + size > *state->request->max_body_bytes) {
        state->response->body_limit_exceeded = true;
        return 0; // aborts with CURLE_WRITE_ERROR
    }

    body.insert(body.end(), data, data + size);
    return size;
}

size_t process_header(char* data, size_t size, size_t items, void* context) {
    auto* state = static_cast<TransferState*>(context);
    size *= items;

    std::string line(data, size);

    // A new status line starts the headers of the next response (redirects, 100-continue).
    if (line.rfind("HTTP/", 0) == 0) {
        state->response->headers.clear();
        return size;
    }

    auto colon = line.find(':');
    if (colon == std::string::npos) {
        return size;
    }

    auto name = core::utils::StringUtils::to_lower(core::utils::StringUtils::trim(line.substr(0, colon)));
    auto value = core::utils::StringUtils::trim(line.substr(colon + 1));
    state->response->headers[name] = value;

    return size;
}

// Query strings may carry SAS signatures; keep them out of the log.
std::string loggable_url(const std::string& url) {
    return url.substr(0, url.find('?'));
}

int check_stop(void* context, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    auto* state = static_cast<TransferState*>(context);
    return state->stop.stop_requested() ? 1 : 0;
}

}

CurlHttpClient::Options CurlHttpClient::Options::from_config() {
    auto& config = core::Config::instance();
    Options options;
    options.connect_timeout = std::chrono::seconds(config.get_int("http.connect_timeout_s", 15));
    options.request_timeout = std::chrono::seconds(config.get_int("http.request_timeout_s", 120));
    return options;
}

CurlHttpClient::CurlHttpClient()
    : CurlHttpClient(Options{})
{
}

CurlHttpClient::CurlHttpClient(Options options)
    : options_(std::move(options))
{
    ensure_curl_initialized();
}

HttpResponse CurlHttpClient::perform(const HttpRequest& request, std::stop_token stop) {
    HttpResponse response;

    if (stop.stop_requested()) {
        response.cancelled = true;
        return response;
    }

    CurlEasy curl;
    CurlSList headers;
    TransferState state{&response, &request, stop};
    char error_buffer[CURL_ERROR_SIZE] = {0};

    auto timeout = request.timeout.value_or(
        std::chrono::duration_cast<std::chrono::milliseconds>(options_.request_timeout));

    CURL_TEST_OK(curl_easy_setopt(curl.get(), CURLOPT_URL, request.url.c_str()));
    CURL_TEST_OK(curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L));
    CURL_TEST_OK(curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L));
    CURL_TEST_OK(curl_easy_setopt(curl.get(), CURLOPT_ERRORBUFFER, error_buffer));
    CURL_TEST_OK(curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, options_.user_agent.c_str()));
    CURL_TEST_OK(curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT,
                                  static_cast<long>(options_.connect_timeout.count())));
    CURL_TEST_OK(curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, static_cast<long>(timeout.count())));

    CURL_TEST_OK(curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_body));
    CURL_TEST_OK(curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &state));
    CURL_TEST_OK(curl_easy_setopt(curl.get(), CURLOPT_HEADERFUNCTION, process_header));
    CURL_TEST_OK(curl_easy_setopt(curl.get(), CURLOPT_HEADERDATA, &state));
    CURL_TEST_OK(curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, 0L));
    CURL_TEST_OK(curl_easy_setopt(curl.get(), CURLOPT_XFERINFOFUNCTION, check_stop));
    CURL_TEST_OK(curl_easy_setopt(curl.get(), CURLOPT_XFERINFODATA, &state));

    switch (request.method) {
        case HttpMethod::GET:
            break;
        case HttpMethod::HEAD:
            CURL_TEST_OK(curl_easy_setopt(curl.get(), CURLOPT_NOBODY, 1L));
            break;
        case HttpMethod::DELETE:
            CURL_TEST_OK(curl_easy_setopt(curl.get(), CURLOPT_CUSTOMREQUEST, "DELETE"));
            break;
        case HttpMethod::PUT:
        case HttpMethod::POST:
            CURL_TEST_OK(curl_easy_setopt(curl.get(), CURLOPT_CUSTOMREQUEST, to_string(request.method)));
            CURL_TEST_OK(curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS,
                                          request.body.empty() ? "" :
                                          reinterpret_cast<const char*>(request.body.data())));
            CURL_TEST_OK(curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE_LARGE,
                                          static_cast<curl_off_t>(request.body.size())));
            // No "Expect: 100-continue" round trip for part uploads.
            headers.append("Expect:");
            break;
    }

    for (const auto& [name, value] : request.headers) {
        headers.append(name + ": " + value);
    }
    if (headers.get()) {
        CURL_TEST_OK(curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get()));
    }

    CURLcode result = curl_easy_perform(curl.get());

    switch (result) {
        case CURLE_OK:
            response.transport_ok = true;
            CURL_TEST_OK(curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.status));
            break;

        case CURLE_ABORTED_BY_CALLBACK:
            response.cancelled = true;
            response.transport_error = "aborted";
            break;

        case CURLE_OPERATION_TIMEDOUT:
            response.timed_out = true;
            response.transport_error = error_buffer[0] ? error_buffer : curl_easy_strerror(result);
            break;

        case CURLE_WRITE_ERROR:
            if (response.body_limit_exceeded) {
                // The status line has arrived; report it so the caller sees what the server sent.
                response.transport_ok = true;
                CURL_TEST_OK(curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.status));
                break;
            }
            [[fallthrough]];

        default:
            response.transport_error = error_buffer[0] ? error_buffer : curl_easy_strerror(result);
            break;
    }

    if (!response.transport_ok && !response.cancelled) {
        LOG_DEBUG("{} {} failed: {}", to_string(request.method), loggable_url(request.url),
                  response.transport_error);
    } else if (response.transport_ok) {
        LOG_TRACE("{} {} -> {} ({} bytes)", to_string(request.method), loggable_url(request.url),
                  response.status, response.body.size());
    }

    return response;
}

} // namespace chunkrelay::network

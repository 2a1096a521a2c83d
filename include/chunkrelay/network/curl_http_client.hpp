#pragma once

#include "http_client.hpp"
#include <chrono>
#include <string>

namespace chunkrelay::network {

// libcurl-backed client. Each call uses its own easy handle, so one instance
// may serve any number of concurrent sessions.
class CurlHttpClient : public HttpClient {
public:
    struct Options {
        std::chrono::seconds connect_timeout{15};
        std::chrono::seconds request_timeout{120};
        std::string user_agent = "chunkrelay/1.0";

        static Options from_config();
    };

    CurlHttpClient();
    explicit CurlHttpClient(Options options);

    HttpResponse perform(const HttpRequest& request, std::stop_token stop) override;

private:
    Options options_;
};

} // namespace chunkrelay::network

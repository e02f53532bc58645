#pragma once

#include <omc/core/types.h>

#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace omc::net {

struct Header {
    std::string name;
    std::string value;
};

struct HttpRequest {
    std::string url;
    std::string body;
    std::vector<Header> headers;
    std::chrono::milliseconds timeout{30000};
};

struct HttpResponse {
    long status = 0;
    std::string body;
};

// Abstract POST-only HTTP client. Non-2xx replies are returned as responses, not errors;
// errors are reserved for transport failures.
class IHttpClient {
public:
    virtual ~IHttpClient() = default;

    virtual Result<HttpResponse> post(const HttpRequest& request) = 0;
};

// libcurl implementation
std::shared_ptr<IHttpClient> makeCurlHttpClient();

} // namespace omc::net

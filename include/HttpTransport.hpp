#pragma once
#include <string>
#include <vector>
#include <utility>
#include <boost/asio/awaitable.hpp>

struct HttpRequest
{
    std::string host;
    std::string target;
    std::vector<std::pair<std::string, std::string>> headers;
};

struct HttpResponse
{
    unsigned status = 0;
    std::string body;
    std::string location;   // Location header, if any

    [[nodiscard]] bool ok() const noexcept { return status >= 200 && status < 300; }
};

// Single-shot HTTPS GET. Implementations raise NetworkError for transport
// failures and hand every HTTP status back to the caller.
class HttpTransport
{
public:
    virtual ~HttpTransport() = default;
    virtual boost::asio::awaitable<HttpResponse> get(HttpRequest request) = 0;
};

#pragma once
#include <string>
#include <chrono>
#include <optional>
#include <utility>
#include <boost/asio.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast.hpp>
#include <boost/beast/ssl.hpp>
#include "HttpTransport.hpp"

class HttpsClient : public HttpTransport
{
private:
    boost::asio::io_context& ioContext;
    boost::asio::ssl::context sslContext;
    std::chrono::seconds timeout;

    void configureTlsStream(boost::beast::ssl_stream<boost::beast::tcp_stream>& stream, std::string const& host);
    boost::asio::awaitable<boost::asio::ip::tcp::resolver::results_type> resolve(boost::asio::ip::tcp::resolver& resolver, std::string const& host);
    boost::asio::awaitable<void> connect(boost::asio::ip::tcp::resolver::results_type results, boost::beast::ssl_stream<boost::beast::tcp_stream>& stream);
    boost::beast::http::request<boost::beast::http::string_body> buildGetRequest(HttpRequest const& request) const;
    boost::asio::awaitable<void> sendRequest(boost::beast::ssl_stream<boost::beast::tcp_stream>& stream, boost::beast::http::request<boost::beast::http::string_body> const& request);
    boost::asio::awaitable<boost::beast::http::response<boost::beast::http::string_body>> readResponse(boost::beast::ssl_stream<boost::beast::tcp_stream>& stream);
    boost::asio::awaitable<void> shutdownStream(boost::beast::ssl_stream<boost::beast::tcp_stream>& stream);
    boost::asio::awaitable<HttpResponse> exchange(HttpRequest const& request);

public:
    static constexpr int MAX_REDIRECTS = 5;

    explicit HttpsClient(boost::asio::io_context& ioc, std::chrono::seconds requestTimeout = std::chrono::seconds(30));
    boost::asio::awaitable<HttpResponse> get(HttpRequest request) override;

    // Request to issue for a 3xx answer, or nullopt when it is not a redirect this
    // client follows (only https and same-origin paths are followed).
    static std::optional<HttpRequest> redirectRequest(HttpRequest const& from, HttpResponse const& response);
};

#include "ConfigurationManager.hpp"
#include "Errors.hpp"
#include "HttpsClient.hpp"

HttpsClient::HttpsClient(boost::asio::io_context& ioc, std::chrono::seconds requestTimeout)
        : ioContext(ioc)
        , sslContext(boost::asio::ssl::context::tls_client)
        , timeout(requestTimeout)
    {
        sslContext.set_options(
            boost::asio::ssl::context::default_workarounds
            | boost::asio::ssl::context::no_sslv2
            | boost::asio::ssl::context::no_sslv3
            | boost::asio::ssl::context::no_tlsv1
            | boost::asio::ssl::context::no_tlsv1_1
            | boost::asio::ssl::context::single_dh_use
        );

        sslContext.set_default_verify_paths();
        sslContext.set_verify_mode(boost::asio::ssl::verify_peer);
    }


void HttpsClient::configureTlsStream(boost::beast::ssl_stream<boost::beast::tcp_stream>& stream, std::string const& host)
{
    if (!SSL_set_tlsext_host_name(stream.native_handle(), host.c_str()))
    {
        throw boost::beast::system_error(boost::system::error_code(static_cast<int>(::ERR_get_error()), boost::asio::error::get_ssl_category()), "Failed to set SNI");
    }
    stream.set_verify_callback(boost::asio::ssl::host_name_verification(host));
}

boost::asio::awaitable<boost::asio::ip::tcp::resolver::results_type> HttpsClient::resolve(boost::asio::ip::tcp::resolver& resolver, std::string const& host)
{
    boost::asio::ip::tcp::resolver::results_type results = co_await resolver.async_resolve(host, ConfigurationManager::HTTPS_PORT, boost::asio::use_awaitable);
    co_return results;
}

boost::asio::awaitable<void> HttpsClient::connect(boost::asio::ip::tcp::resolver::results_type results, boost::beast::ssl_stream<boost::beast::tcp_stream>& stream)
{
    boost::beast::get_lowest_layer(stream).expires_after(timeout);
    co_await boost::beast::get_lowest_layer(stream).async_connect(results, boost::asio::use_awaitable);

    boost::beast::get_lowest_layer(stream).expires_after(timeout);
    co_await stream.async_handshake(boost::asio::ssl::stream_base::client, boost::asio::use_awaitable);
    co_return;
}

boost::beast::http::request<boost::beast::http::string_body> HttpsClient::buildGetRequest(HttpRequest const& request) const
{
    boost::beast::http::request<boost::beast::http::string_body> message(boost::beast::http::verb::get, request.target, 11);
    message.set(boost::beast::http::field::host, request.host);
    message.set(boost::beast::http::field::user_agent, BOOST_BEAST_VERSION_STRING);

    for (auto const& [name, value] : request.headers)
        message.set(name, value);

    return message;
}


boost::asio::awaitable<void> HttpsClient::sendRequest(boost::beast::ssl_stream<boost::beast::tcp_stream>& stream, boost::beast::http::request<boost::beast::http::string_body> const& request)
{
    boost::beast::get_lowest_layer(stream).expires_after(timeout);
    co_await boost::beast::http::async_write(stream, request, boost::asio::use_awaitable);
}

boost::asio::awaitable<boost::beast::http::response<boost::beast::http::string_body>> HttpsClient::readResponse(boost::beast::ssl_stream<boost::beast::tcp_stream>& stream)
{
    boost::beast::http::response_parser<boost::beast::http::string_body> parser;
    parser.body_limit(32 * 1024 * 1024);
    boost::beast::flat_buffer buffer;

    boost::beast::get_lowest_layer(stream).expires_after(timeout);
    co_await boost::beast::http::async_read(stream, buffer, parser, boost::asio::use_awaitable);
    co_return parser.release();
}

boost::asio::awaitable<void> HttpsClient::shutdownStream(boost::beast::ssl_stream<boost::beast::tcp_stream>& stream)
{
    // Servers routinely drop the connection without close_notify; the response is already complete.
    boost::system::error_code ec;
    boost::beast::get_lowest_layer(stream).expires_after(timeout);
    co_await stream.async_shutdown(boost::asio::redirect_error(boost::asio::use_awaitable, ec));
    co_return;
}


boost::asio::awaitable<HttpResponse> HttpsClient::exchange(HttpRequest const& request)
{
    auto executor = co_await boost::asio::this_coro::executor;
    boost::asio::ip::tcp::resolver resolver(ioContext);
    boost::beast::ssl_stream<boost::beast::tcp_stream> stream(executor, sslContext);

    configureTlsStream(stream, request.host);
    boost::asio::ip::tcp::resolver::results_type results = co_await resolve(resolver, request.host);
    co_await connect(results, stream);
    boost::beast::http::request<boost::beast::http::string_body> message = buildGetRequest(request);
    co_await sendRequest(stream, message);
    boost::beast::http::response<boost::beast::http::string_body> response = co_await this->readResponse(stream);
    co_await shutdownStream(stream);

    HttpResponse result{response.result_int(), std::move(response.body()), {}};
    if (auto location = response.find(boost::beast::http::field::location); location != response.end())
        result.location = std::string(location->value());

    co_return result;
}

std::optional<HttpRequest> HttpsClient::redirectRequest(HttpRequest const& from, HttpResponse const& response)
{
    switch (response.status)
    {
    case 301: case 302: case 303: case 307: case 308:
        break;
    default:
        return std::nullopt;
    }

    std::string const& location = response.location;
    HttpRequest next = from;

    if (location.rfind("https://", 0) == 0 || location.rfind("//", 0) == 0)
    {
        std::string rest = location.substr(location.find("//") + 2);
        std::size_t slash = rest.find('/');
        std::string host = rest.substr(0, slash);
        next.target = slash == std::string::npos ? "/" : rest.substr(slash);

        if (host.size() > 4 && host.compare(host.size() - 4, 4, ":443") == 0)
            host.resize(host.size() - 4);
        if (host.empty() || host.find(':') != std::string::npos || host.find('@') != std::string::npos)
            return std::nullopt;

        if (host != from.host)
        {
            std::erase_if(next.headers, [](auto const& header) { return header.first == "Authorization"; });
            next.host = host;
        }
    }
    else if (location.rfind("/", 0) == 0)
    {
        next.target = location;
    }
    else
    {
        return std::nullopt;
    }

    return next;
}

boost::asio::awaitable<HttpResponse> HttpsClient::get(HttpRequest request)
{
    std::string reason;
    try
    {
        HttpResponse response = co_await exchange(request);
        for (int hop = 0; hop < MAX_REDIRECTS; ++hop)
        {
            std::optional<HttpRequest> next = redirectRequest(request, response);
            if (!next)
                break;

            request = std::move(*next);
            response = co_await exchange(request);
        }
        co_return response;
    }
    catch (boost::system::system_error const& e)
    {
        reason = e.code() == boost::beast::error::timeout ? std::string("request timed out") : std::string(e.what());
    }

    throw NetworkError(request.host + ": " + reason);
}

#include <regex>
#include "ConfigurationManager.hpp"
#include "Errors.hpp"
#include "CredentialResolver.hpp"

PageTokenResolver::PageTokenResolver(HttpTransport& http)
    : transport(http)
{
}

HttpRequest PageTokenResolver::buildPageRequest()
{
    HttpRequest request;
    request.host   = ConfigurationManager::WEB_HOST;
    request.target = ConfigurationManager::TOKEN_PAGE;
    request.headers = {
        {"User-Agent",      ConfigurationManager::USER_AGENT},
        {"Accept",          "text/html,application/xhtml+xml,application/xml;q=0.9,*/*;q=0.8"},
        {"Accept-Language", "el-GR,el;q=0.8,en-US;q=0.5,en;q=0.3"},
        {"Referer",         ConfigurationManager::WEB_ORIGIN + "/"}
    };
    return request;
}

std::string PageTokenResolver::extractToken(std::string const& page)
{
    static const std::regex tokenPattern(R"(const token = '([^']+)')");

    std::smatch match;
    if (!std::regex_search(page, match, tokenPattern))
        throw TokenNotFoundError("No Bearer token found in page JavaScript");

    return match[1].str();
}

boost::asio::awaitable<std::string> PageTokenResolver::resolveToken()
{
    HttpResponse response;
    try
    {
        response = co_await transport.get(buildPageRequest());
    }
    catch (NetworkError const& e)
    {
        throw CredentialFetchError(e.what());
    }

    if (!response.ok())
        throw CredentialFetchError(ConfigurationManager::WEB_HOST + ConfigurationManager::TOKEN_PAGE + " returned HTTP " + std::to_string(response.status));

    co_return extractToken(response.body);
}

#pragma once
#include <string>
#include <utility>
#include <boost/asio/awaitable.hpp>
#include "HttpTransport.hpp"

class CredentialResolver
{
public:
    virtual ~CredentialResolver() = default;
    virtual boost::asio::awaitable<std::string> resolveToken() = 0;
};

// Scrapes the bearer token that the public web front end embeds in its page
// script. Every call fetches the page again; nothing is cached.
class PageTokenResolver : public CredentialResolver
{
private:
    HttpTransport& transport;

    static HttpRequest buildPageRequest();

public:
    explicit PageTokenResolver(HttpTransport& http);

    boost::asio::awaitable<std::string> resolveToken() override;

    // Throws TokenNotFoundError when the page carries no `const token = '...'` assignment.
    static std::string extractToken(std::string const& page);
};

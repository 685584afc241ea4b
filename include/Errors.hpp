#pragma once
#include <stdexcept>
#include <string>

class CityBusError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

// The token page could not be fetched.
class CredentialFetchError : public CityBusError
{
public:
    using CityBusError::CityBusError;
};

// The token page was fetched but no longer carries the embedded token.
class TokenNotFoundError : public CityBusError
{
public:
    using CityBusError::CityBusError;
};

class NetworkError : public CityBusError
{
public:
    using CityBusError::CityBusError;
};

class PayloadError : public CityBusError
{
public:
    using CityBusError::CityBusError;
};

class LocationUnavailableError : public CityBusError
{
public:
    using CityBusError::CityBusError;
};

class CacheReadError : public CityBusError
{
public:
    using CityBusError::CityBusError;
};

enum class Endpoint
{
    Schedule,
    Live,
    Directory
};

class HttpStatusError : public CityBusError
{
private:
    unsigned statusCode;
    Endpoint source;
    bool expiredToken;

public:
    HttpStatusError(unsigned status, Endpoint endpoint, bool tokenExpired = false);

    [[nodiscard]] unsigned status() const noexcept { return statusCode; }
    [[nodiscard]] Endpoint endpoint() const noexcept { return source; }
    [[nodiscard]] bool tokenLikelyExpired() const noexcept { return expiredToken; }
};

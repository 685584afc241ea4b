#include "Errors.hpp"

HttpStatusError::HttpStatusError(unsigned status, Endpoint endpoint, bool tokenExpired)
    : CityBusError(tokenExpired
                       ? std::to_string(status) + " Unauthorized - Token may be expired"
                       : "HTTP " + std::to_string(status))
    , statusCode(status)
    , source(endpoint)
    , expiredToken(tokenExpired)
{
}

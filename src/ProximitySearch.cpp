#include <algorithm>
#include <cmath>
#include <cstdlib>
#include "Errors.hpp"
#include "ProximitySearch.hpp"

namespace
{
constexpr double PI = 3.14159265358979323846;

double toRadians(double degrees)
{
    return degrees * PI / 180.0;
}

bool validCoordinate(double lat, double lon)
{
    return std::isfinite(lat) && std::isfinite(lon)
        && std::fabs(lat) <= 90.0 && std::fabs(lon) <= 180.0;
}
}

double haversine(double lat1, double lon1, double lat2, double lon2)
{
    double dLat = toRadians(lat2 - lat1);
    double dLon = toRadians(lon2 - lon1);
    double sinLat = std::sin(dLat / 2);
    double sinLon = std::sin(dLon / 2);

    double a = sinLat * sinLat + std::cos(toRadians(lat1)) * std::cos(toRadians(lat2)) * sinLon * sinLon;
    return 2 * EARTH_RADIUS_M * std::asin(std::sqrt(std::min(1.0, a)));
}

std::optional<Coordinate> EnvironmentLocationProvider::currentLocation()
{
    const char* value = std::getenv("CITYBUS_LOCATION");
    if (!value)
        return std::nullopt;
    return parse(value);
}

std::optional<Coordinate> EnvironmentLocationProvider::parse(std::string const& text)
{
    std::size_t comma = text.find(',');
    if (comma == std::string::npos)
        return std::nullopt;

    std::string latText = text.substr(0, comma);
    std::string lonText = text.substr(comma + 1);

    char* latEnd = nullptr;
    char* lonEnd = nullptr;
    double lat = std::strtod(latText.c_str(), &latEnd);
    double lon = std::strtod(lonText.c_str(), &lonEnd);

    if (latText.empty() || lonText.empty() || *latEnd != '\0' || *lonEnd != '\0')
        return std::nullopt;
    if (!validCoordinate(lat, lon))
        return std::nullopt;

    return Coordinate{lat, lon};
}

bool ProximitySearch::hasValidCoordinates(StopRecord const& stop)
{
    return stop.latitude && stop.longitude && validCoordinate(*stop.latitude, *stop.longitude);
}

std::vector<ProximityResult> ProximitySearch::findNearby(StopDirectory const& directory,
                                                         double maxDistanceMeters,
                                                         std::optional<Coordinate> origin,
                                                         LocationProvider& locations)
{
    if (!origin)
        origin = locations.currentLocation();
    if (!origin)
        throw LocationUnavailableError("No location available; pass --lat and --lon or set CITYBUS_LOCATION");

    return findNearby(directory, maxDistanceMeters, *origin);
}

std::vector<ProximityResult> ProximitySearch::findNearby(StopDirectory const& directory,
                                                         double maxDistanceMeters,
                                                         Coordinate origin)
{
    std::vector<ProximityResult> results;

    for (auto const& stop : directory)
    {
        if (!hasValidCoordinates(stop))
            continue;

        double distance = haversine(origin.latitude, origin.longitude, *stop.latitude, *stop.longitude);
        if (distance <= maxDistanceMeters)
            results.push_back(ProximityResult{stop, distance});
    }

    std::stable_sort(results.begin(), results.end(),
                     [](ProximityResult const& a, ProximityResult const& b)
                     {
                         return a.distanceMeters < b.distanceMeters;
                     });
    return results;
}

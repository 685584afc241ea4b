#pragma once
#include <optional>
#include <string>
#include <vector>
#include "Types.hpp"

inline constexpr double EARTH_RADIUS_M = 6371000.0;

// Great-circle distance in metres between two points given in decimal degrees.
double haversine(double lat1, double lon1, double lat2, double lon2);

class LocationProvider
{
public:
    virtual ~LocationProvider() = default;
    virtual std::optional<Coordinate> currentLocation() = 0;
};

class NoLocationProvider : public LocationProvider
{
public:
    std::optional<Coordinate> currentLocation() override { return std::nullopt; }
};

// Reads "lat,lon" from CITYBUS_LOCATION.
class EnvironmentLocationProvider : public LocationProvider
{
public:
    std::optional<Coordinate> currentLocation() override;

    static std::optional<Coordinate> parse(std::string const& text);
};

class ProximitySearch
{
public:
    // Stops within maxDistanceMeters of origin, nearest first; directory order breaks ties.
    // Without an origin the provider is asked, and LocationUnavailableError is thrown if it has none.
    static std::vector<ProximityResult> findNearby(StopDirectory const& directory,
                                                   double maxDistanceMeters,
                                                   std::optional<Coordinate> origin,
                                                   LocationProvider& locations);

    static std::vector<ProximityResult> findNearby(StopDirectory const& directory,
                                                   double maxDistanceMeters,
                                                   Coordinate origin);

private:
    static bool hasValidCoordinates(StopRecord const& stop);
};

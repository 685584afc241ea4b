#pragma once
#include <string>
#include <vector>
#include <optional>
#include <cstdint>
#include <utility>

struct Coordinate
{
    double latitude;
    double longitude;
};

// One entry of the stop directory as served by the REST API.
struct StopRecord
{
    std::int64_t code;
    std::string name;
    std::optional<double> latitude;   // absent when the record has no usable coordinates
    std::optional<double> longitude;
};

using StopDirectory = std::vector<StopRecord>;

// code -> name, in the order the directory lists the stops
using StopNameMap = std::vector<std::pair<std::string, std::string>>;

struct TripEntry
{
    std::string tripTime;   // "HH:MM"
    std::string routeName;
    std::string lineCode;
    std::string stopName;
};

struct LiveVehicle
{
    std::optional<int> departureMins;   // nullopt when the service reports no estimate
    std::string routeName;
    std::string lineCode;
};

struct LiveResponse
{
    std::vector<LiveVehicle> vehicles;
};

struct ProximityResult
{
    StopRecord stop;
    double distanceMeters;
};

#pragma once
#include <chrono>
#include <string>
#include <vector>
#include "Types.hpp"

class Renderer
{
public:
    explicit Renderer(bool useColor);

    std::string schedule(std::vector<TripEntry> const& trips) const;
    std::string live(LiveResponse const& response, std::chrono::system_clock::time_point now) const;
    std::string nearby(std::vector<ProximityResult> const& results, double maxDistanceMeters) const;
    static std::string names(StopNameMap const& stopNames);

    // Local wall-clock time in the service's zone, minutes from now.
    static std::string arrivalClock(std::chrono::system_clock::time_point now, int minutes);
    static std::string pad(std::string const& text, std::size_t width);
    static bool terminalSupportsColor();

private:
    bool color;

    std::string paint(std::string const& text, char const* code) const;
};

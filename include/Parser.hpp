#pragma once
#include <string>
#include <vector>
#include <optional>
#include <cstdint>
#include <nlohmann/json.hpp>
#include "Types.hpp"

class Parser
{
public:
    static std::vector<TripEntry> parseSchedule(std::string const& data);
    static LiveResponse parseLive(std::string const& data);
    static StopDirectory parseDirectory(std::string const& data);

    static nlohmann::json directoryToJson(StopDirectory const& directory);
    static nlohmann::ordered_json nameMapToJson(StopNameMap const& names);
    static StopNameMap parseNameMap(std::string const& data);

private:
    static nlohmann::json parseDocument(std::string const& data, char const* what);
    static std::string textField(nlohmann::json const& object, char const* key);
    static std::optional<int> minutesField(nlohmann::json const& object, char const* key);
    static std::int64_t codeField(nlohmann::json const& object);
    static std::optional<double> coordinateField(nlohmann::json const& object, char const* key, double limit);
};

#include <cmath>
#include <cstdlib>
#include <algorithm>
#include <cctype>
#include <limits>
#include "Errors.hpp"
#include "Parser.hpp"

nlohmann::json Parser::parseDocument(std::string const& data, char const* what)
{
    nlohmann::json document = nlohmann::json::parse(data, nullptr, false);
    if (document.is_discarded())
        throw PayloadError(std::string(what) + ": response is not valid JSON");
    return document;
}

std::string Parser::textField(nlohmann::json const& object, char const* key)
{
    auto it = object.find(key);
    if (it == object.end() || it->is_null())
        return "N/A";
    if (it->is_string())
        return it->get<std::string>();
    return it->dump();
}

std::optional<int> Parser::minutesField(nlohmann::json const& object, char const* key)
{
    auto it = object.find(key);
    if (it == object.end())
        return std::nullopt;

    if (it->is_number_unsigned())
    {
        auto value = it->get<std::uint64_t>();
        if (value > static_cast<std::uint64_t>(std::numeric_limits<int>::max()))
            return std::nullopt;
        return static_cast<int>(value);
    }

    if (it->is_number_integer())
    {
        auto value = it->get<std::int64_t>();
        if (value < std::numeric_limits<int>::min() || value > std::numeric_limits<int>::max())
            return std::nullopt;
        return static_cast<int>(value);
    }

    if (it->is_string())
    {
        std::string const& text = it->get_ref<std::string const&>();
        bool digitsOnly = !text.empty() && text.size() <= 9
                       && std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isdigit(c); });
        if (digitsOnly)
            return std::stoi(text);
    }
    return std::nullopt;
}

std::int64_t Parser::codeField(nlohmann::json const& object)
{
    auto it = object.find("code");
    if (it != object.end())
    {
        if (it->is_number_integer())
            return it->get<std::int64_t>();

        if (it->is_string())
        {
            std::string const& text = it->get_ref<std::string const&>();
            char* end = nullptr;
            long long value = std::strtoll(text.c_str(), &end, 10);
            if (!text.empty() && end && *end == '\0')
                return value;
        }
    }
    throw PayloadError("stop directory: record without a valid 'code'");
}

std::optional<double> Parser::coordinateField(nlohmann::json const& object, char const* key, double limit)
{
    auto it = object.find(key);
    if (it == object.end())
        return std::nullopt;

    double value = NAN;
    if (it->is_number())
    {
        value = it->get<double>();
    }
    else if (it->is_string())
    {
        std::string const& text = it->get_ref<std::string const&>();
        char* end = nullptr;
        value = std::strtod(text.c_str(), &end);
        if (text.empty() || !end || *end != '\0')
            return std::nullopt;
    }

    if (!std::isfinite(value) || std::fabs(value) > limit)
        return std::nullopt;
    return value;
}

std::vector<TripEntry> Parser::parseSchedule(std::string const& data)
{
    nlohmann::json document = parseDocument(data, "schedule");
    if (!document.is_array())
        throw PayloadError("schedule: expected a JSON array of trips");

    std::vector<TripEntry> trips;
    trips.reserve(document.size());

    for (auto const& entry : document)
    {
        if (!entry.is_object())
            throw PayloadError("schedule: trip entry is not an object");

        trips.push_back(TripEntry{
            textField(entry, "tripTime"),
            textField(entry, "routeName"),
            textField(entry, "lineCode"),
            textField(entry, "stopName")
        });
    }
    return trips;
}

LiveResponse Parser::parseLive(std::string const& data)
{
    nlohmann::json document = parseDocument(data, "live");
    // The live endpoint answers with an empty body when nothing is on its way.
    if ((document.is_object() || document.is_array()) && document.empty())
        return LiveResponse{};

    if (!document.is_object() || !document.contains("vehicles") || !document["vehicles"].is_array())
        throw PayloadError("live: expected an object with a 'vehicles' array");

    LiveResponse live;
    for (auto const& entry : document["vehicles"])
    {
        if (!entry.is_object())
            throw PayloadError("live: vehicle entry is not an object");

        live.vehicles.push_back(LiveVehicle{
            minutesField(entry, "departureMins"),
            textField(entry, "routeName"),
            textField(entry, "lineCode")
        });
    }
    return live;
}

StopDirectory Parser::parseDirectory(std::string const& data)
{
    nlohmann::json document = parseDocument(data, "stop directory");
    if (!document.is_array())
        throw PayloadError("stop directory: expected a JSON array of stops");

    StopDirectory directory;
    directory.reserve(document.size());

    for (auto const& entry : document)
    {
        if (!entry.is_object())
            throw PayloadError("stop directory: record is not an object");

        auto name = entry.find("name");
        if (name == entry.end() || !name->is_string())
            throw PayloadError("stop directory: record without a 'name'");

        StopRecord record;
        record.code      = codeField(entry);
        record.name      = name->get<std::string>();
        record.latitude  = coordinateField(entry, "latitude", 90.0);
        record.longitude = coordinateField(entry, "longitude", 180.0);
        if (!record.latitude || !record.longitude)
        {
            record.latitude.reset();
            record.longitude.reset();
        }
        directory.push_back(std::move(record));
    }
    return directory;
}

nlohmann::json Parser::directoryToJson(StopDirectory const& directory)
{
    nlohmann::json document = nlohmann::json::array();
    for (auto const& stop : directory)
    {
        nlohmann::json record = {{"code", stop.code}, {"name", stop.name}};
        record["latitude"]  = stop.latitude  ? nlohmann::json(*stop.latitude)  : nlohmann::json(nullptr);
        record["longitude"] = stop.longitude ? nlohmann::json(*stop.longitude) : nlohmann::json(nullptr);
        document.push_back(std::move(record));
    }
    return document;
}

nlohmann::ordered_json Parser::nameMapToJson(StopNameMap const& names)
{
    nlohmann::ordered_json document = nlohmann::ordered_json::object();
    for (auto const& [code, name] : names)
        document[code] = name;
    return document;
}

StopNameMap Parser::parseNameMap(std::string const& data)
{
    nlohmann::ordered_json document = nlohmann::ordered_json::parse(data, nullptr, false);
    if (document.is_discarded())
        throw PayloadError("stop names: response is not valid JSON");
    if (!document.is_object())
        throw PayloadError("stop names: expected a JSON object");

    StopNameMap names;
    names.reserve(document.size());
    for (auto const& [code, name] : document.items())
    {
        if (!name.is_string())
            throw PayloadError("stop names: value for " + code + " is not a string");
        names.emplace_back(code, name.get<std::string>());
    }
    return names;
}

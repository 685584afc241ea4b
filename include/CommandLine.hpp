#pragma once
#include <string>
#include <optional>
#include <exception>
#include <stdexcept>
#include "ConfigurationManager.hpp"

class UsageError : public std::invalid_argument
{
public:
    using std::invalid_argument::invalid_argument;
};

enum class Command
{
    Schedule,
    Live,
    Names,
    Nearby,
    Help
};

struct CommandLine
{
    Command command = Command::Schedule;
    int stop = 0;
    int day = 0;
    std::string nameQuery;
    double radiusMeters = 500.0;
    std::optional<double> latitude;
    std::optional<double> longitude;
};

// What the user sees when a command fails, and the process exit status.
struct Failure
{
    std::string message;
    int exitCode;
};

extern const char* const USAGE;

// Throws UsageError for unknown options, malformed values and out-of-range
// arguments of the selected command.
CommandLine parseCommandLineArgs(int argc, char const* const argv[], UserPreferences const& defaults);

std::string failurePrefix(Command command);

// Maps an exception escaping a command to its message and exit status
// (2 for usage errors, 1 for everything else).
Failure describeFailure(std::exception_ptr error, Command command);

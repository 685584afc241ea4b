#include <gtest/gtest.h>
#include <stdexcept>
#include <vector>
#include "CommandLine.hpp"
#include "Errors.hpp"

namespace
{
CommandLine parse(std::vector<char const*> args, UserPreferences defaults = {})
{
    args.insert(args.begin(), "citybus");
    return parseCommandLineArgs(static_cast<int>(args.size()), args.data(), defaults);
}

template <typename E>
Failure failureFor(E error, Command command)
{
    return describeFailure(std::make_exception_ptr(error), command);
}
}

TEST(CommandLineTest, DefaultsComeFromPreferences)
{
    CommandLine args = parse({}, UserPreferences{301, 2});

    EXPECT_EQ(args.command, Command::Schedule);
    EXPECT_EQ(args.stop, 301);
    EXPECT_EQ(args.day, 2);
}

TEST(CommandLineTest, StopAndDayOverrideDefaults)
{
    CommandLine args = parse({"--stop", "88", "--day", "7"});

    EXPECT_EQ(args.stop, 88);
    EXPECT_EQ(args.day, 7);
}

TEST(CommandLineTest, NamesTakesOptionalQuery)
{
    CommandLine all = parse({"--names"});
    EXPECT_EQ(all.command, Command::Names);
    EXPECT_TRUE(all.nameQuery.empty());

    CommandLine filtered = parse({"--names", "ΡΙΟ"});
    EXPECT_EQ(filtered.nameQuery, "ΡΙΟ");

    CommandLine beforeOption = parse({"--names", "--stop", "12"});
    EXPECT_EQ(beforeOption.command, Command::Names);
    EXPECT_TRUE(beforeOption.nameQuery.empty());
    EXPECT_EQ(beforeOption.stop, 12);
}

TEST(CommandLineTest, NearbyTakesOptionalRadiusAndOrigin)
{
    CommandLine defaults = parse({"--nearby"});
    EXPECT_EQ(defaults.command, Command::Nearby);
    EXPECT_DOUBLE_EQ(defaults.radiusMeters, 500.0);
    EXPECT_FALSE(defaults.latitude.has_value());

    CommandLine explicitArgs = parse({"--nearby", "1200", "--lat", "38.2466", "--lon", "21.7346"});
    EXPECT_DOUBLE_EQ(explicitArgs.radiusMeters, 1200.0);
    EXPECT_DOUBLE_EQ(*explicitArgs.latitude, 38.2466);
    EXPECT_DOUBLE_EQ(*explicitArgs.longitude, 21.7346);

    CommandLine southWest = parse({"--nearby", "--lat", "-33.86", "--lon", "-70.6"});
    EXPECT_DOUBLE_EQ(*southWest.latitude, -33.86);
}

TEST(CommandLineTest, MalformedArgumentsAreUsageErrors)
{
    EXPECT_THROW(parse({"--bogus"}), UsageError);
    EXPECT_THROW(parse({"--stop"}), UsageError);
    EXPECT_THROW(parse({"--stop", "12b"}), UsageError);
    EXPECT_THROW(parse({"--day", "8"}), UsageError);
    EXPECT_THROW(parse({"--day", "0"}), UsageError);
    EXPECT_THROW(parse({"--stop", "0"}), UsageError);
    EXPECT_THROW(parse({"--nearby", "far"}), UsageError);
    EXPECT_THROW(parse({"--nearby", "--lat", "38.2"}), UsageError);
    EXPECT_THROW(parse({"--nearby", "--lat", "91", "--lon", "21.7"}), UsageError);
}

TEST(CommandLineTest, DayOnlyMattersForSchedule)
{
    UserPreferences badDay{214, 9};

    EXPECT_THROW(parse({}, badDay), UsageError);
    EXPECT_EQ(parse({"--live"}, badDay).command, Command::Live);
    EXPECT_EQ(parse({"--names"}, badDay).command, Command::Names);
    EXPECT_EQ(parse({"--nearby", "--lat", "38.2", "--lon", "21.7"}, badDay).command, Command::Nearby);
}

TEST(CommandLineTest, StopOnlyMattersForScheduleAndLive)
{
    UserPreferences badStop{0, 3};

    EXPECT_THROW(parse({}, badStop), UsageError);
    EXPECT_THROW(parse({"--live"}, badStop), UsageError);
    EXPECT_EQ(parse({"--names"}, badStop).command, Command::Names);
    EXPECT_EQ(parse({"--nearby", "--lat", "38.2", "--lon", "21.7"}, badStop).command, Command::Nearby);
}

TEST(CommandLineTest, HelpSkipsValidation)
{
    EXPECT_EQ(parse({"--help"}, UserPreferences{0, 0}).command, Command::Help);
}

TEST(FailureTest, UsageErrorsExitWithTwo)
{
    Failure failure = failureFor(UsageError("unknown or malformed argument: --x"), Command::Schedule);

    EXPECT_EQ(failure.exitCode, 2);
    EXPECT_EQ(failure.message.rfind("citybus: unknown or malformed argument: --x\n", 0), 0u);
    EXPECT_NE(failure.message.find("Usage: citybus"), std::string::npos);
}

TEST(FailureTest, ExpiredTokenHasItsOwnMessage)
{
    Failure failure = failureFor(HttpStatusError(401, Endpoint::Schedule, true), Command::Schedule);

    EXPECT_EQ(failure.exitCode, 1);
    EXPECT_EQ(failure.message, "401 Unauthorized - Token may be expired\n");
}

TEST(FailureTest, OtherStatusesCarryTheCommandPrefix)
{
    EXPECT_EQ(failureFor(HttpStatusError(500, Endpoint::Schedule), Command::Schedule).message,
              "Error fetching data: HTTP 500\n");
    EXPECT_EQ(failureFor(HttpStatusError(401, Endpoint::Live), Command::Live).message,
              "Error fetching live data: HTTP 401\n");
    EXPECT_EQ(failureFor(HttpStatusError(503, Endpoint::Directory), Command::Names).message,
              "Error fetching stops: HTTP 503\n");
}

TEST(FailureTest, CredentialAndTransportFailures)
{
    Failure credentials = failureFor(CredentialFetchError("patra.citybus.gr: connection refused"), Command::Live);
    EXPECT_EQ(credentials.exitCode, 1);
    EXPECT_EQ(credentials.message, "Error getting Bearer token: patra.citybus.gr: connection refused\n");

    Failure token = failureFor(TokenNotFoundError("No Bearer token found in page JavaScript"), Command::Schedule);
    EXPECT_EQ(token.message, "No Bearer token found in page JavaScript\n");

    Failure network = failureFor(NetworkError("rest.citybus.gr: request timed out"), Command::Live);
    EXPECT_EQ(network.exitCode, 1);
    EXPECT_EQ(network.message, "Error fetching live data: rest.citybus.gr: request timed out\n");

    Failure payload = failureFor(PayloadError("schedule: response is not valid JSON"), Command::Schedule);
    EXPECT_EQ(payload.message, "Error fetching data: schedule: response is not valid JSON\n");
}

TEST(FailureTest, EverythingElseIsFatal)
{
    Failure location = failureFor(LocationUnavailableError("No location available"), Command::Nearby);
    EXPECT_EQ(location.exitCode, 1);
    EXPECT_EQ(location.message, "No location available\n");

    Failure other = failureFor(std::runtime_error("disk full"), Command::Names);
    EXPECT_EQ(other.exitCode, 1);
    EXPECT_EQ(other.message, "Main Error: disk full\n");
}

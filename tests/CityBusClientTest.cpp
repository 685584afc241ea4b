#include <gtest/gtest.h>
#include <stdexcept>
#include <boost/asio/io_context.hpp>
#include "CityBusClient.hpp"
#include "ConfigurationManager.hpp"
#include "Errors.hpp"
#include "Fakes.hpp"
#include "RunBlocking.hpp"

class CityBusClientTest : public ::testing::Test
{
protected:
    boost::asio::io_context io;
    FakeTransport transport;
    FakeCredentialResolver credentials;
    CityBusClient client{transport, credentials};
};

TEST_F(CityBusClientTest, ScheduleRequestCarriesBearerAndFrontEndHeaders)
{
    credentials.token = "abc123";
    transport.enqueue(200, R"([{"tripTime":"07:15","routeName":"ΠΑΝΕΠΙΣΤΗΜΙΟ","lineCode":"6","stopName":"ΠΛΑΤΕΙΑ ΓΕΩΡΓΙΟΥ"}])");

    auto trips = runBlocking(io, client.fetchSchedule(214, 5));

    ASSERT_EQ(transport.requests.size(), 1u);
    HttpRequest const& request = transport.requests.front();
    EXPECT_EQ(request.host, ConfigurationManager::API_HOST);
    EXPECT_EQ(request.target, "/api/v1/el/112/trips/stop/214/day/5");
    EXPECT_EQ(headerValue(request, "Authorization"), "Bearer abc123");
    EXPECT_EQ(headerValue(request, "Origin"), "https://patra.citybus.gr");
    EXPECT_EQ(headerValue(request, "Referer"), "https://patra.citybus.gr/");
    EXPECT_EQ(credentials.calls, 1);

    ASSERT_EQ(trips.size(), 1u);
    EXPECT_EQ(trips[0].tripTime, "07:15");
    EXPECT_EQ(trips[0].routeName, "ΠΑΝΕΠΙΣΤΗΜΙΟ");
    EXPECT_EQ(trips[0].lineCode, "6");
    EXPECT_EQ(trips[0].stopName, "ΠΛΑΤΕΙΑ ΓΕΩΡΓΙΟΥ");
}

TEST_F(CityBusClientTest, EachOperationResolvesAFreshToken)
{
    transport.enqueue(200, "[]");
    transport.enqueue(200, R"({"vehicles":[]})");

    runBlocking(io, client.fetchSchedule(1, 1));
    runBlocking(io, client.fetchLive(1));

    EXPECT_EQ(credentials.calls, 2);
}

TEST_F(CityBusClientTest, ScheduleUnauthorizedIsFlaggedAsExpiredToken)
{
    transport.enqueue(401, R"({"message":"Unauthenticated."})");

    try
    {
        runBlocking(io, client.fetchSchedule(214, 5));
        FAIL() << "expected HttpStatusError";
    }
    catch (HttpStatusError const& e)
    {
        EXPECT_EQ(e.status(), 401u);
        EXPECT_EQ(e.endpoint(), Endpoint::Schedule);
        EXPECT_TRUE(e.tokenLikelyExpired());
        EXPECT_NE(std::string(e.what()).find("Token may be expired"), std::string::npos);
    }
}

TEST_F(CityBusClientTest, OtherScheduleStatusesAreNotExpiredToken)
{
    for (unsigned status : {403u, 404u, 500u, 503u})
    {
        transport.enqueue(status, "oops");
        try
        {
            runBlocking(io, client.fetchSchedule(214, 5));
            FAIL() << "expected HttpStatusError for " << status;
        }
        catch (HttpStatusError const& e)
        {
            EXPECT_EQ(e.status(), status);
            EXPECT_FALSE(e.tokenLikelyExpired());
        }
    }
}

TEST_F(CityBusClientTest, LiveUnauthorizedIsAPlainStatusError)
{
    transport.enqueue(401, "");

    try
    {
        runBlocking(io, client.fetchLive(214));
        FAIL() << "expected HttpStatusError";
    }
    catch (HttpStatusError const& e)
    {
        EXPECT_EQ(e.status(), 401u);
        EXPECT_EQ(e.endpoint(), Endpoint::Live);
        EXPECT_FALSE(e.tokenLikelyExpired());
    }
}

TEST_F(CityBusClientTest, LiveVehiclesDistinguishKnownAndUnknownMinutes)
{
    transport.enqueue(200, R"({"vehicles":[
        {"departureMins":3,"routeName":"ΚΕΝΤΡΟ","lineCode":"2"},
        {"departureMins":"12","routeName":"ΡΙΟ","lineCode":"6"},
        {"departureMins":"N/A","routeName":"ΡΙΟ","lineCode":"6"},
        {"routeName":"ΠΡΟΑΣΤΙΟ","lineCode":"18"}
    ]})");

    LiveResponse live = runBlocking(io, client.fetchLive(214));

    EXPECT_EQ(transport.requests.front().target, "/api/v1/el/112/stops/live/214");
    ASSERT_EQ(live.vehicles.size(), 4u);
    EXPECT_EQ(live.vehicles[0].departureMins, std::optional<int>(3));
    EXPECT_EQ(live.vehicles[1].departureMins, std::optional<int>(12));
    EXPECT_FALSE(live.vehicles[2].departureMins.has_value());
    EXPECT_FALSE(live.vehicles[3].departureMins.has_value());
    EXPECT_EQ(live.vehicles[3].lineCode, "18");
}

TEST_F(CityBusClientTest, DirectoryRequestHitsStopsEndpoint)
{
    transport.enqueue(200, R"([{"code":1,"name":"A","latitude":38.2,"longitude":21.7}])");

    StopDirectory directory = runBlocking(io, client.fetchDirectory());

    EXPECT_EQ(transport.requests.front().target, "/api/v1/el/112/stops");
    EXPECT_EQ(headerValue(transport.requests.front(), "Authorization"), "Bearer test-token");
    ASSERT_EQ(directory.size(), 1u);
    EXPECT_EQ(directory[0].code, 1);
}

TEST_F(CityBusClientTest, InvalidJsonIsPayloadError)
{
    transport.enqueue(200, "<html>Service Unavailable</html>");
    EXPECT_THROW(runBlocking(io, client.fetchSchedule(214, 5)), PayloadError);

    transport.enqueue(200, R"([{"tripTime":"07:15"}])");
    EXPECT_THROW(runBlocking(io, client.fetchLive(214)), PayloadError);
}

TEST_F(CityBusClientTest, TransportFailureIsNetworkError)
{
    transport.failNetwork = true;
    EXPECT_THROW(runBlocking(io, client.fetchSchedule(214, 5)), NetworkError);
    EXPECT_THROW(runBlocking(io, client.fetchDirectory()), NetworkError);
}

TEST_F(CityBusClientTest, RejectsOutOfRangeArgumentsBeforeAnyTraffic)
{
    EXPECT_THROW(runBlocking(io, client.fetchSchedule(214, 0)), std::invalid_argument);
    EXPECT_THROW(runBlocking(io, client.fetchSchedule(214, 8)), std::invalid_argument);
    EXPECT_THROW(runBlocking(io, client.fetchSchedule(0, 3)), std::invalid_argument);
    EXPECT_THROW(runBlocking(io, client.fetchLive(-4)), std::invalid_argument);

    EXPECT_TRUE(transport.requests.empty());
    EXPECT_EQ(credentials.calls, 0);
}

TEST_F(CityBusClientTest, CredentialFailureStopsBeforeApiCall)
{
    FakeTransport pageTransport;
    pageTransport.enqueue(200, "<html>no token here</html>");
    PageTokenResolver scraper(pageTransport);
    CityBusClient scrapingClient(transport, scraper);

    EXPECT_THROW(runBlocking(io, scrapingClient.fetchSchedule(214, 5)), TokenNotFoundError);
    EXPECT_TRUE(transport.requests.empty());
}

/**
 * @file test_position.cpp
 * @brief Unit tests for the position provider adapter
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "platform/PositionRequest.hpp"
#include "platform/StaticLocationService.hpp"

#include "mocks/MockLocationService.hpp"
#include "utils/TestHelpers.hpp"

#include <chrono>
#include <future>
#include <thread>

using namespace GeoKit;
using namespace GeoKit::Platform;
using namespace GeoKit::Test;
using ::testing::_;
using ::testing::Field;
using ::testing::Invoke;
using ::testing::Return;

namespace {

LocationData MakeLocation(const Coordinate& coordinate) {
    LocationData location;
    location.coordinate = coordinate;
    location.timestamp = 1700000000000;
    location.provider = "Mock";
    return location;
}

} // namespace

// =============================================================================
// Static provider
// =============================================================================

class StaticLocationServiceTest : public ::testing::Test {
protected:
    StaticLocationService service{Places::Hirtshals()};
};

TEST_F(StaticLocationServiceTest, ReportsConfiguredPosition) {
    auto future = RequestPosition(service);
    const LocationData location = future.get();

    EXPECT_EQ(Places::Hirtshals(), location.coordinate);
    EXPECT_EQ("Static", location.provider);
    EXPECT_GT(location.timestamp, 0);
    EXPECT_TRUE(location.IsValid());
}

TEST_F(StaticLocationServiceTest, OptionsArePassedThrough) {
    PositionOptions options;
    options.enableHighAccuracy = true;
    options.maximumAgeMs = 5000;
    options.timeoutMs = 250;

    (void)RequestPosition(service, options).get();

    const auto received = service.GetLastOptions();
    ASSERT_TRUE(received.has_value());
    EXPECT_TRUE(received->enableHighAccuracy);
    EXPECT_EQ(5000, received->maximumAgeMs);
    EXPECT_EQ(250, received->timeoutMs);
}

TEST_F(StaticLocationServiceTest, EachRequestIsIndependent) {
    (void)RequestPosition(service).get();
    (void)RequestPosition(service).get();

    EXPECT_EQ(2u, service.GetRequestCount());
}

TEST_F(StaticLocationServiceTest, ScriptedFailureRejectsFuture) {
    service.SetFailure(LocationError::PermissionDenied, "User denied Geolocation");

    auto future = RequestPosition(service);
    try {
        (void)future.get();
        FAIL() << "Expected PositionError";
    } catch (const PositionError& e) {
        EXPECT_EQ(LocationError::PermissionDenied, e.GetError());
        EXPECT_STREQ("User denied Geolocation", e.what());
    }

    service.ClearFailure();
    EXPECT_NO_THROW((void)RequestPosition(service).get());
}

TEST(StaticLocationServiceUnsetTest, NoPositionIsLocationDisabled) {
    StaticLocationService service;

    try {
        (void)RequestPosition(service).get();
        FAIL() << "Expected PositionError";
    } catch (const PositionError& e) {
        EXPECT_EQ(LocationError::LocationDisabled, e.GetError());
    }
}

// =============================================================================
// Request bridging
// =============================================================================

TEST(PositionRequestTest, FirstCallbackWins) {
    MockLocationService service;
    EXPECT_CALL(service, GetServiceName()).WillRepeatedly(Return("Mock"));
    EXPECT_CALL(service, RequestSingleUpdate(_, _, _))
        .WillOnce(Invoke([](const PositionOptions&, LocationCallback onLocation, LocationErrorCallback onError) {
            onLocation(MakeLocation(Places::SanFrancisco()));
            onError(LocationError::Timeout, "late");
            onLocation(MakeLocation(Places::LosAngeles()));
        }));

    const LocationData location = RequestPosition(service).get();
    EXPECT_EQ(Places::SanFrancisco(), location.coordinate);
}

TEST(PositionRequestTest, ErrorBeforeSuccessRejects) {
    MockLocationService service;
    EXPECT_CALL(service, GetServiceName()).WillRepeatedly(Return("Mock"));
    EXPECT_CALL(service, RequestSingleUpdate(_, _, _))
        .WillOnce(Invoke([](const PositionOptions&, LocationCallback onLocation, LocationErrorCallback onError) {
            onError(LocationError::Timeout, "Timeout expired");
            onLocation(MakeLocation(Places::SanFrancisco()));
        }));

    auto future = RequestPosition(service);
    EXPECT_THROW((void)future.get(), PositionError);
}

TEST(PositionRequestTest, OptionsReachProviderUnmodified) {
    MockLocationService service;
    EXPECT_CALL(service, GetServiceName()).WillRepeatedly(Return("Mock"));
    EXPECT_CALL(service, RequestSingleUpdate(Field(&PositionOptions::timeoutMs, 1234), _, _))
        .WillOnce(Invoke([](const PositionOptions&, LocationCallback onLocation, LocationErrorCallback) {
            onLocation(MakeLocation(Places::TowerBridge()));
        }));

    PositionOptions options;
    options.timeoutMs = 1234;
    EXPECT_NO_THROW((void)RequestPosition(service, options).get());
}

TEST(PositionRequestTest, ResolvesFromAnotherThread) {
    MockLocationService service;
    std::thread worker;

    EXPECT_CALL(service, GetServiceName()).WillRepeatedly(Return("Mock"));
    EXPECT_CALL(service, RequestSingleUpdate(_, _, _))
        .WillOnce(Invoke([&worker](const PositionOptions&, LocationCallback onLocation, LocationErrorCallback) {
            worker = std::thread([onLocation]() {
                std::this_thread::sleep_for(std::chrono::milliseconds(10));
                onLocation(MakeLocation(Places::EiffelTower()));
            });
        }));

    auto future = RequestPosition(service);
    future.wait();
    worker.join();

    const LocationData location = future.get();

    EXPECT_EQ(Places::EiffelTower(), location.coordinate);
}

// =============================================================================
// Current position geohash
// =============================================================================

TEST(CurrentPositionHashTest, LengthFollowsReportedAccuracy) {
    StaticLocationService service(Places::Hirtshals());
    EXPECT_EQ("u4pruydqqvj", GetCurrentPositionHash(service).get());
}

TEST(CurrentPositionHashTest, CoarseAccuracyGivesShortHash) {
    Coordinate coords{57.64911, 10.40744};
    coords.accuracy = 20000.0;
    StaticLocationService service(coords);

    EXPECT_EQ("u4pr", GetCurrentPositionHash(service).get());
}

TEST(CurrentPositionHashTest, ProviderFailurePropagates) {
    StaticLocationService service;
    service.SetFailure(LocationError::Timeout, "Timeout expired");

    auto future = GetCurrentPositionHash(service);
    EXPECT_THROW((void)future.get(), PositionError);
}

TEST(CurrentPositionHashTest, ImpossiblePositionIsRejected) {
    StaticLocationService service(Coordinate{123.0, 0.0});

    auto future = GetCurrentPositionHash(service);
    EXPECT_THROW((void)future.get(), CoordinateRangeError);
}

TEST(LocationErrorTest, Names) {
    EXPECT_STREQ("permission_denied", LocationErrorToString(LocationError::PermissionDenied));
    EXPECT_STREQ("timeout", LocationErrorToString(LocationError::Timeout));
}

/**
 * @file test_geo_uri.cpp
 * @brief Unit tests for geo: URI creation, parsing and geohash conversion
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "geohash/Geohash.hpp"
#include "uri/GeoUri.hpp"

#include "utils/TestHelpers.hpp"

using namespace GeoKit;
using namespace GeoKit::Uri;
using namespace GeoKit::Test;
using ::testing::ElementsAre;
using ::testing::Pair;

// =============================================================================
// CreateGeoUri
// =============================================================================

class GeoUriCreateTest : public ::testing::Test {
protected:
    Coordinate plain{57.64911, 10.40744};
    Coordinate full = Places::Hirtshals();
};

TEST_F(GeoUriCreateTest, PlainCoordinates) {
    EXPECT_EQ("geo:57.64911,10.40744", CreateGeoUri(plain));
}

TEST_F(GeoUriCreateTest, AltitudeAndUncertainty) {
    EXPECT_EQ("geo:57.64911,10.40744,42;u=0.0074", CreateGeoUri(full));
}

TEST_F(GeoUriCreateTest, NonPositiveAltitudeIsOmitted) {
    plain.altitude = 0.0;
    EXPECT_EQ("geo:57.64911,10.40744", CreateGeoUri(plain));

    plain.altitude = -12.0;
    EXPECT_EQ("geo:57.64911,10.40744", CreateGeoUri(plain));
}

TEST_F(GeoUriCreateTest, NegativeUncertaintyIsOmitted) {
    plain.accuracy = -1.0;
    EXPECT_EQ("geo:57.64911,10.40744", CreateGeoUri(plain));

    plain.accuracy = 0.0;
    EXPECT_EQ("geo:57.64911,10.40744;u=0", CreateGeoUri(plain));
}

TEST_F(GeoUriCreateTest, QueryParametersInOrder) {
    GeoUriParams params;
    params.zoom = 7;
    params.query = "foo";
    params.type = "what?";

    EXPECT_EQ("geo:57.64911,10.40744,42;u=0.0074?z=7&q=foo&t=what%3F", CreateGeoUri(full, params));
}

TEST_F(GeoUriCreateTest, ZoomOutsideRangeIsOmitted) {
    GeoUriParams params;
    params.zoom = 0;
    EXPECT_EQ("geo:57.64911,10.40744", CreateGeoUri(plain, params));

    params.zoom = 22;
    EXPECT_EQ("geo:57.64911,10.40744", CreateGeoUri(plain, params));

    params.zoom = 21;
    EXPECT_EQ("geo:57.64911,10.40744?z=21", CreateGeoUri(plain, params));
}

TEST_F(GeoUriCreateTest, GoogleMapsCompatibleReplacesQuery) {
    GeoUriParams params;
    params.query = "ignored";
    params.googleMapsCompatible = true;

    EXPECT_EQ("geo:57.64911,10.40744?q=57.64911%2C10.40744", CreateGeoUri(plain, params));
}

TEST_F(GeoUriCreateTest, ExtensionsFollowStandardParameters) {
    GeoUriParams params;
    params.query = "cafe";
    params.extensions = {{"lang", "en"}, {"q", "override"}, {"note", "a b"}};

    EXPECT_EQ("geo:57.64911,10.40744?q=override&lang=en&note=a+b", CreateGeoUri(plain, params));
}

TEST_F(GeoUriCreateTest, RejectsOutOfRangeCoordinates) {
    EXPECT_THROW((void)CreateGeoUri(Coordinate{91, 0}), CoordinateRangeError);
    EXPECT_THROW((void)CreateGeoUri(Coordinate{}), CoordinateRangeError);
}

TEST_F(GeoUriCreateTest, CoercesText) {
    EXPECT_EQ("geo:-33.8688,151.2093", CreateGeoUri("-33.8688", "151.2093"));
    EXPECT_THROW((void)CreateGeoUri("-100", "0"), CoordinateRangeError);
    EXPECT_THROW((void)CreateGeoUri("here", "0"), GeoError);
}

// =============================================================================
// ParseGeoUri
// =============================================================================

TEST(GeoUriParseTest, RoundTripKeepsCoordinatesAndParams) {
    GeoUriParams params;
    params.zoom = 7;
    params.query = "foo";
    params.type = "what?";

    const auto result = ParseGeoUri(CreateGeoUri(Places::Hirtshals(), params));

    EXPECT_EQ(Places::Hirtshals(), result.coords);
    EXPECT_EQ(params, result.params);
}

TEST(GeoUriParseTest, PlainUri) {
    const auto result = ParseGeoUri("geo:37.7749,-122.4194");

    EXPECT_DOUBLE_EQ(37.7749, result.coords.latitude);
    EXPECT_DOUBLE_EQ(-122.4194, result.coords.longitude);
    EXPECT_FALSE(result.coords.altitude.has_value());
    EXPECT_FALSE(result.coords.accuracy.has_value());
    EXPECT_EQ(GeoUriParams{}, result.params);
}

TEST(GeoUriParseTest, SchemeIsCaseInsensitive) {
    EXPECT_DOUBLE_EQ(10.0, ParseGeoUri("GEO:10,20").coords.latitude);
}

TEST(GeoUriParseTest, ZoomIsClamped) {
    EXPECT_EQ(21, ParseGeoUri("geo:10,20?z=40").params.zoom.value_or(0));
    EXPECT_EQ(1, ParseGeoUri("geo:10,20?z=-3").params.zoom.value_or(0));
}

TEST(GeoUriParseTest, UnknownParametersAreKeptInOrder) {
    const auto result = ParseGeoUri("geo:10,20;crs=wgs84;u=5?lang=en&q=Caf%C3%A9+Noir&x=1#frag");

    EXPECT_DOUBLE_EQ(5.0, result.coords.accuracy.value_or(-1.0));
    EXPECT_EQ("Café Noir", result.params.query.value_or(""));
    EXPECT_THAT(result.params.uriParameters, ElementsAre(Pair("crs", "wgs84")));
    EXPECT_THAT(result.params.extensions, ElementsAre(Pair("lang", "en"), Pair("x", "1")));
}

TEST(GeoUriParseTest, WrongSchemeIsRejected) {
    try {
        (void)ParseGeoUri("http://example.com");
        FAIL() << "Expected GeoUriError";
    } catch (const GeoUriError& e) {
        EXPECT_EQ(GeoErrorCode::InvalidScheme, e.GetCode());
    }
}

TEST(GeoUriParseTest, AuthorityIsRejected) {
    try {
        (void)ParseGeoUri("geo://host/10,20");
        FAIL() << "Expected GeoUriError";
    } catch (const GeoUriError& e) {
        EXPECT_EQ(GeoErrorCode::InvalidScheme, e.GetCode());
    }
}

TEST(GeoUriParseTest, MalformedBodyIsRejected) {
    for (const char* uri : {"geo:", "geo:10", "geo:abc,20", "geo:10,20;u=wide", "geo:10,20?z=far"}) {
        try {
            (void)ParseGeoUri(uri);
            FAIL() << "Expected GeoUriError for " << uri;
        } catch (const GeoUriError& e) {
            EXPECT_EQ(GeoErrorCode::InvalidFormat, e.GetCode()) << uri;
        }
    }
}

TEST(GeoUriParseTest, UnboundedUncertaintyIsRejected) {
    for (const char* uri : {"geo:10,20;u=inf", "geo:10,20;u=nan", "geo:10,20;u=-1"}) {
        EXPECT_THROW((void)ParseGeoUri(uri), GeoUriError) << uri;
        EXPECT_THROW((void)GeoUriToGeohash(uri), GeoUriError) << uri;
    }
}

TEST(GeoUriParseTest, OutOfRangeCoordinatesAreRejected) {
    EXPECT_THROW((void)ParseGeoUri("geo:95,20"), CoordinateRangeError);
    EXPECT_THROW((void)ParseGeoUri("geo:10,-190"), CoordinateRangeError);
}

// =============================================================================
// Geohash conversions
// =============================================================================

TEST(GeoUriGeohashTest, UncertaintySelectsLength) {
    EXPECT_EQ("u4pruydqqvj", GeoUriToGeohash("geo:57.64911,10.40744;u=0.0074"));
    EXPECT_EQ("u4pruydq", GeoUriToGeohash("geo:57.64911,10.40744;u=19"));
}

TEST(GeoUriGeohashTest, DecimalDigitsSelectLengthWithoutUncertainty) {
    // Five decimals at this latitude is just under 0.6 m
    EXPECT_EQ("u4pruydqqvj", GeoUriToGeohash("geo:57.64911,10.40744"));
    EXPECT_EQ("u4prs", GeoUriToGeohash("geo:57.6,10.4"));
}

TEST(GeoUriGeohashTest, GeohashToGeoUriUsesCellCentre) {
    const std::string uri = GeohashToGeoUri("u4pruydq");
    const auto parsed = ParseGeoUri(uri);
    const auto centre = Geohash::Decode("u4pruydq");

    EXPECT_COORD_NEAR(centre, parsed.coords, 1e-12);
    EXPECT_DOUBLE_EQ(19.0, parsed.coords.accuracy.value_or(-1.0));
}

TEST(GeoUriGeohashTest, GeohashToGeoUriOptions) {
    GeohashUriOptions options;
    options.altitude = 100.0;
    options.zoom = 12;
    options.googleMapsCompatible = true;

    const auto parsed = ParseGeoUri(GeohashToGeoUri("u4pr", options));

    EXPECT_DOUBLE_EQ(100.0, parsed.coords.altitude.value_or(-1.0));
    EXPECT_EQ(12, parsed.params.zoom.value_or(0));
    ASSERT_TRUE(parsed.params.query.has_value());
    EXPECT_THAT(*parsed.params.query, ::testing::HasSubstr(","));
}

TEST(GeoUriGeohashTest, GeohashToGeoUriRejectsInvalidGeohash) {
    EXPECT_THROW((void)GeohashToGeoUri("not-a-hash"), GeohashError);
}

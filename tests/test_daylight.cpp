#include <gtest/gtest.h>
#include <chrono>
#include "boatcount/daylight.hpp"
#include "test_support.hpp"

using namespace boatcount;
using boatcount::testing::utc;

namespace {

// Sunrise equation accuracy plus rounding of the reference values
constexpr std::chrono::minutes kTolerance(3);

void expectNear(WallTime actual, WallTime expected) {
    const auto diff = actual > expected ? actual - expected : expected - actual;
    EXPECT_LE(diff, kTolerance)
        << "off by " << std::chrono::duration_cast<std::chrono::seconds>(diff).count() << " s";
}

const GeoLocation kLondon{51.5074, -0.1278};
const GeoLocation kColoradoSprings{38.833, -104.821};
const GeoLocation kTromso{69.65, 18.96};

} // namespace

TEST(CivilDateTest, DaysFromCivil) {
    EXPECT_EQ(daysFromCivil(1970, 1, 1), 0);
    EXPECT_EQ(daysFromCivil(2000, 3, 1), 11017);
    EXPECT_EQ(daysFromCivil(1969, 12, 31), -1);
}

TEST(CivilDateTest, LocalSolarDayFollowsLongitude) {
    const std::int64_t june20 = daysFromCivil(2024, 6, 20);
    // 02:00 UTC is still the previous evening in Colorado
    EXPECT_EQ(localSolarDay(utc(2024, 6, 21, 2, 0), -104.821), june20);
    EXPECT_EQ(localSolarDay(utc(2024, 6, 21, 2, 0), 0.0), june20 + 1);
    // 20:00 UTC is already the next morning far east
    EXPECT_EQ(localSolarDay(utc(2024, 6, 20, 20, 0), 150.0), june20 + 1);
}

TEST(SunTimesTest, LondonSummerSolstice) {
    SunTimes times = computeSunTimes(daysFromCivil(2024, 6, 21), kLondon);

    ASSERT_EQ(times.official.coverage, SunCoverage::Normal);
    expectNear(times.official.begin, utc(2024, 6, 21, 3, 43));
    expectNear(times.official.end, utc(2024, 6, 21, 20, 21));

    ASSERT_EQ(times.civil.coverage, SunCoverage::Normal);
    expectNear(times.civil.begin, utc(2024, 6, 21, 2, 55));
    expectNear(times.civil.end, utc(2024, 6, 21, 21, 9));
}

TEST(SunTimesTest, ColoradoSpringsSunsetFallsOnNextUtcDay) {
    SunTimes times = computeSunTimes(daysFromCivil(2024, 6, 20), kColoradoSprings);

    expectNear(times.official.begin, utc(2024, 6, 20, 11, 34));
    expectNear(times.official.end, utc(2024, 6, 21, 2, 27));
    expectNear(times.civil.begin, utc(2024, 6, 20, 11, 2));
    expectNear(times.civil.end, utc(2024, 6, 21, 2, 59));
}

TEST(SunTimesTest, EquinoxAtTheEquator) {
    SunTimes times = computeSunTimes(daysFromCivil(2024, 3, 20), GeoLocation{0.0, 0.0});
    expectNear(times.official.begin, utc(2024, 3, 20, 6, 4));
    expectNear(times.official.end, utc(2024, 3, 20, 18, 10));
}

TEST(SunTimesTest, PolarNightAndPolarDay) {
    SunTimes winter = computeSunTimes(daysFromCivil(2024, 12, 21), kTromso);
    EXPECT_EQ(winter.official.coverage, SunCoverage::AlwaysBelow);
    ASSERT_EQ(winter.civil.coverage, SunCoverage::Normal);
    expectNear(winter.civil.begin, utc(2024, 12, 21, 8, 31));
    expectNear(winter.civil.end, utc(2024, 12, 21, 12, 53));
    expectNear(winter.solar_noon, utc(2024, 12, 21, 10, 42));

    SunTimes summer = computeSunTimes(daysFromCivil(2024, 6, 21), kTromso);
    EXPECT_EQ(summer.civil.coverage, SunCoverage::AlwaysAbove);
    EXPECT_EQ(summer.official.coverage, SunCoverage::AlwaysAbove);
}

TEST(SolarDaylightTest, CivilWindowIncludesTwilight) {
    SolarDaylight civil(kColoradoSprings, DaylightWindow::Civil);
    SolarDaylight official(kColoradoSprings, DaylightWindow::Official);

    // Local noon and local midnight
    EXPECT_TRUE(civil.isDaytime(utc(2024, 6, 20, 19, 0)));
    EXPECT_FALSE(civil.isDaytime(utc(2024, 6, 21, 7, 0)));

    // Between sunset (02:27 UTC) and dusk (02:59 UTC)
    EXPECT_TRUE(civil.isDaytime(utc(2024, 6, 21, 2, 45)));
    EXPECT_FALSE(official.isDaytime(utc(2024, 6, 21, 2, 45)));

    // Between dawn (11:02 UTC) and sunrise (11:34 UTC)
    EXPECT_TRUE(civil.isDaytime(utc(2024, 6, 20, 11, 18)));
    EXPECT_FALSE(official.isDaytime(utc(2024, 6, 20, 11, 18)));
}

TEST(SolarDaylightTest, PolarDayIsDaytimeAndPolarNightIsNot) {
    SolarDaylight daylight(kTromso, DaylightWindow::Official);
    EXPECT_TRUE(daylight.isDaytime(utc(2024, 6, 21, 23, 0)));
    EXPECT_FALSE(daylight.isDaytime(utc(2024, 12, 21, 10, 42)));
}

TEST(SolarDaylightTest, RecomputesWhenTheDayChanges) {
    SolarDaylight daylight(kLondon);
    const SunTimes first = daylight.sunTimesFor(utc(2024, 6, 21, 12, 0));
    EXPECT_EQ(first.solar_day, daysFromCivil(2024, 6, 21));

    const SunTimes& next = daylight.sunTimesFor(utc(2024, 6, 22, 12, 0));
    EXPECT_EQ(next.solar_day, daysFromCivil(2024, 6, 22));
    EXPECT_NE(next.civil.begin, first.civil.begin);
}

TEST(SolarDaylightTest, BuildsFromConfig) {
    DaylightConfig config;
    config.window = DaylightWindow::Official;
    SolarDaylight daylight(config);
    EXPECT_EQ(daylight.getWindow(), DaylightWindow::Official);
}

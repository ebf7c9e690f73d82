#pragma once

#include <cstdint>
#include "boatcount/clock.hpp"
#include "boatcount/config.hpp"

namespace boatcount {

struct GeoLocation {
    double latitude;    // degrees, north positive
    double longitude;   // degrees, east positive
};

enum class SunCoverage {
    Normal,       // the sun crosses the altitude twice
    AlwaysAbove,  // polar day for this altitude
    AlwaysBelow   // polar night for this altitude
};

/**
 * @brief Interval during which the sun is above a given altitude
 */
struct SunInterval {
    WallTime begin;
    WallTime end;
    SunCoverage coverage = SunCoverage::Normal;

    bool contains(WallTime t) const;
};

struct SunTimes {
    std::int64_t solar_day = 0;   // days since 1970-01-01
    WallTime solar_noon;
    SunInterval civil;            // dawn to dusk, sun above -6 degrees
    SunInterval official;         // sunrise to sunset, sun above -0.833 degrees
};

/**
 * @brief Days since 1970-01-01 for a proleptic Gregorian date
 */
std::int64_t daysFromCivil(int year, unsigned month, unsigned day);

/**
 * @brief Calendar day of the mean local solar time at a longitude
 *
 * Used instead of a timezone: the whole daylight interval of a solar day falls
 * within it.
 */
std::int64_t localSolarDay(WallTime t, double longitude);

/**
 * @brief Dawn, sunrise, sunset and dusk for a solar day (sunrise equation)
 *
 * Accurate to about a minute at non-polar latitudes.
 */
SunTimes computeSunTimes(std::int64_t solar_day, const GeoLocation& location);

/**
 * @brief Daylight predicate for one location, caching sun times per day
 */
class SolarDaylight {
public:
    SolarDaylight(const GeoLocation& location, DaylightWindow window = DaylightWindow::Civil);
    explicit SolarDaylight(const DaylightConfig& config);

    bool isDaytime(WallTime t);

    /**
     * @brief Sun times of the solar day containing t, recomputed when the day changes
     */
    const SunTimes& sunTimesFor(WallTime t);

    DaylightWindow getWindow() const { return window_; }

private:
    GeoLocation location_;
    DaylightWindow window_;
    bool cached_ = false;
    SunTimes times_;
};

} // namespace boatcount

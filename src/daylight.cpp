#include "boatcount/daylight.hpp"
#include <cmath>
#include <spdlog/spdlog.h>
#include <spdlog/fmt/chrono.h>

namespace boatcount {

namespace {

constexpr double kPi = 3.14159265358979323846;
constexpr double kUnixEpochJulian = 2440587.5;
constexpr double kJ2000 = 2451545.0;
constexpr double kSecondsPerDay = 86400.0;

// Sun altitudes, degrees; -0.833 accounts for refraction and the solar disc radius
constexpr double kOfficialAltitude = -0.833;
constexpr double kCivilAltitude = -6.0;

double toRadians(double degrees) { return degrees * kPi / 180.0; }
double toDegrees(double radians) { return radians * 180.0 / kPi; }

double normalizeDegrees(double degrees) {
    double d = std::fmod(degrees, 360.0);
    return d < 0.0 ? d + 360.0 : d;
}

WallTime fromJulian(double julian) {
    const double seconds = (julian - kUnixEpochJulian) * kSecondsPerDay;
    return WallTime(std::chrono::duration_cast<WallTime::duration>(
        std::chrono::duration<double>(seconds)));
}

SunInterval intervalAt(double altitude_deg, double transit, double sin_declination,
                       double latitude_deg) {
    const double phi = toRadians(latitude_deg);
    const double cos_declination = std::cos(std::asin(sin_declination));
    const double cos_hour_angle = (std::sin(toRadians(altitude_deg)) - std::sin(phi) * sin_declination)
                                  / (std::cos(phi) * cos_declination);

    SunInterval interval;
    if (cos_hour_angle > 1.0) {
        interval.coverage = SunCoverage::AlwaysBelow;
        interval.begin = interval.end = fromJulian(transit);
        return interval;
    }
    if (cos_hour_angle < -1.0) {
        interval.coverage = SunCoverage::AlwaysAbove;
        interval.begin = fromJulian(transit - 0.5);
        interval.end = fromJulian(transit + 0.5);
        return interval;
    }
    const double hour_angle = toDegrees(std::acos(cos_hour_angle));
    interval.begin = fromJulian(transit - hour_angle / 360.0);
    interval.end = fromJulian(transit + hour_angle / 360.0);
    return interval;
}

} // namespace

bool SunInterval::contains(WallTime t) const {
    switch (coverage) {
        case SunCoverage::AlwaysAbove: return true;
        case SunCoverage::AlwaysBelow: return false;
        case SunCoverage::Normal: break;
    }
    return begin <= t && t <= end;
}

std::int64_t daysFromCivil(int year, unsigned month, unsigned day) {
    const int y = year - (month <= 2 ? 1 : 0);
    const int era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (month + (month > 2 ? -3 : 9)) + 2) / 5 + day - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return static_cast<std::int64_t>(era) * 146097 + static_cast<std::int64_t>(doe) - 719468;
}

std::int64_t localSolarDay(WallTime t, double longitude) {
    const double seconds = std::chrono::duration<double>(t.time_since_epoch()).count()
                           + longitude / 360.0 * kSecondsPerDay;
    return static_cast<std::int64_t>(std::floor(seconds / kSecondsPerDay));
}

SunTimes computeSunTimes(std::int64_t solar_day, const GeoLocation& location) {
    // Days since J2000 at noon UT of the requested date, shifted to local mean noon
    const double n = static_cast<double>(solar_day) + (kUnixEpochJulian + 0.5) - kJ2000;
    const double mean_noon = n - location.longitude / 360.0;

    const double mean_anomaly = normalizeDegrees(357.5291 + 0.98560028 * mean_noon);
    const double m = toRadians(mean_anomaly);
    const double center = 1.9148 * std::sin(m) + 0.0200 * std::sin(2 * m) + 0.0003 * std::sin(3 * m);
    const double ecliptic_longitude = normalizeDegrees(mean_anomaly + center + 180.0 + 102.9372);
    const double lambda = toRadians(ecliptic_longitude);

    const double transit = kJ2000 + mean_noon + 0.0053 * std::sin(m) - 0.0069 * std::sin(2 * lambda);
    const double sin_declination = std::sin(lambda) * std::sin(toRadians(23.4397));

    SunTimes times;
    times.solar_day = solar_day;
    times.solar_noon = fromJulian(transit);
    times.civil = intervalAt(kCivilAltitude, transit, sin_declination, location.latitude);
    times.official = intervalAt(kOfficialAltitude, transit, sin_declination, location.latitude);
    return times;
}

SolarDaylight::SolarDaylight(const GeoLocation& location, DaylightWindow window)
    : location_(location)
    , window_(window) {
}

SolarDaylight::SolarDaylight(const DaylightConfig& config)
    : SolarDaylight(GeoLocation{config.latitude, config.longitude}, config.window) {
}

const SunTimes& SolarDaylight::sunTimesFor(WallTime t) {
    const std::int64_t day = localSolarDay(t, location_.longitude);
    if (!cached_ || times_.solar_day != day) {
        times_ = computeSunTimes(day, location_);
        cached_ = true;

        const SunInterval& interval = window_ == DaylightWindow::Civil ? times_.civil : times_.official;
        if (interval.coverage == SunCoverage::Normal) {
            spdlog::debug("Sun window recalculated ({}): {:%Y-%m-%d %H:%M} to {:%Y-%m-%d %H:%M} UTC",
                toString(window_),
                fmt::gmtime(std::chrono::system_clock::to_time_t(interval.begin)),
                fmt::gmtime(std::chrono::system_clock::to_time_t(interval.end)));
        } else {
            spdlog::debug("Sun window recalculated ({}): sun {} all day", toString(window_),
                interval.coverage == SunCoverage::AlwaysAbove ? "up" : "down");
        }
    }
    return times_;
}

bool SolarDaylight::isDaytime(WallTime t) {
    const SunTimes& times = sunTimesFor(t);
    return window_ == DaylightWindow::Civil ? times.civil.contains(t) : times.official.contains(t);
}

} // namespace boatcount

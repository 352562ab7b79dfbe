/// @file sky_catalog.cpp
/// @brief Implementation of catalog parsing and sighting synthesis.

#include "catalog/sky_catalog.hpp"

#include "astro/coordinates.hpp"
#include "astro/local_direction.hpp"
#include "astro/time_system.hpp"
#include "core/error.hpp"

#include <cctype>
#include <charconv>
#include <utility>

namespace orbis::catalog
{

namespace
{
    constexpr std::string_view kDegreeSign = "\xC2\xB0";  // UTF-8 '°'

    /// Consume leading decimal digits of @p text into @p value.
    bool take_digits(std::string_view& text, u32& value)
    {
        const char* first = text.data();
        const char* last = first + text.size();
        auto [ptr, ec] = std::from_chars(first, last, value);
        if (ec != std::errc{} || ptr == first)
        {
            return false;
        }
        text.remove_prefix(static_cast<std::size_t>(ptr - first));
        return true;
    }

    /// Consume @p literal from the front of @p text.
    bool take_literal(std::string_view& text, std::string_view literal)
    {
        if (!text.starts_with(literal))
        {
            return false;
        }
        text.remove_prefix(literal.size());
        return true;
    }

    bool iequals(std::string_view a, std::string_view b)
    {
        if (a.size() != b.size())
        {
            return false;
        }
        for (std::size_t i = 0; i < a.size(); ++i)
        {
            if (std::tolower(static_cast<unsigned char>(a[i])) !=
                std::tolower(static_cast<unsigned char>(b[i])))
            {
                return false;
            }
        }
        return true;
    }
}

SkyCatalog::SkyCatalog(std::vector<CatalogStar> stars)
    : m_stars(std::move(stars))
{
}

// -----------------------------------------------------------------
// Built-in entries (epoch of the manual observations)
// -----------------------------------------------------------------

SkyCatalog SkyCatalog::builtin()
{
    SkyCatalog cat;
    cat.add(parse("Capella",    "05h16m41s", "+45°59'56\""));
    cat.add(parse("Betelgeuse", "05h55m10s", "+07°24'25\""));
    cat.add(parse("Rigel",      "05h14m32s", "-08°12'05\""));
    cat.add(parse("Aldebaran",  "04h35m55s", "+16°30'35\""));
    cat.add(parse("Sirius",     "06h45m09s", "-16°42'47\""));
    cat.add(parse("Procyon",    "07h39m18s", "+05°13'39\""));
    cat.add(parse("Polaris",    "02h31m47s", "+89°15'50\""));
    cat.add(parse("Dubhe",      "11h03m43s", "+61°45'03\""));
    return cat;
}

CatalogStar SkyCatalog::sun()
{
    return parse("Sun", "23h07m00s", "-05°39'00\"");
}

CatalogStar SkyCatalog::parse(std::string name,
                              std::string_view right_ascension,
                              std::string_view declination)
{
    return CatalogStar{
        .name                = std::move(name),
        .right_ascension_deg = parse_right_ascension(right_ascension),
        .declination_deg     = parse_declination(declination),
    };
}

// -----------------------------------------------------------------
// HHhMMmSSs
// -----------------------------------------------------------------

f64 SkyCatalog::parse_right_ascension(std::string_view text)
{
    std::string_view rest = text;
    u32 hours = 0;
    u32 minutes = 0;
    u32 seconds = 0;

    if (!take_digits(rest, hours) || !take_literal(rest, "h") ||
        !take_digits(rest, minutes) || !take_literal(rest, "m") ||
        !take_digits(rest, seconds) || !take_literal(rest, "s") ||
        !rest.empty())
    {
        throw ParseError("could not parse right ascension: '" + std::string(text) + "'");
    }
    if (hours >= 24 || minutes >= 60 || seconds >= 60)
    {
        throw ParseError("right ascension out of range: '" + std::string(text) + "'");
    }

    return hours * 15.0 + minutes * (15.0 / 60.0) + seconds * (15.0 / 3600.0);
}

// -----------------------------------------------------------------
// ±DD°MM'SS"
// -----------------------------------------------------------------

f64 SkyCatalog::parse_declination(std::string_view text)
{
    std::string_view rest = text;
    bool negative = false;
    if (take_literal(rest, "-"))
    {
        negative = true;
    }
    else
    {
        take_literal(rest, "+");
    }

    u32 degrees = 0;
    u32 minutes = 0;
    u32 seconds = 0;

    if (!take_digits(rest, degrees) || !take_literal(rest, kDegreeSign) ||
        !take_digits(rest, minutes) || !take_literal(rest, "'") ||
        !take_digits(rest, seconds) || !take_literal(rest, "\"") ||
        !rest.empty())
    {
        throw ParseError("could not parse declination: '" + std::string(text) + "'");
    }
    const f64 value = degrees + minutes / 60.0 + seconds / 3600.0;
    if (minutes >= 60 || seconds >= 60 || value > 90.0)
    {
        throw ParseError("declination out of range: '" + std::string(text) + "'");
    }

    return negative ? -value : value;
}

void SkyCatalog::add(CatalogStar star)
{
    m_stars.push_back(std::move(star));
}

const CatalogStar* SkyCatalog::find_by_name(std::string_view name) const
{
    for (const auto& star : m_stars)
    {
        if (iequals(star.name, name))
        {
            return &star;
        }
    }
    return nullptr;
}

StarObservations SkyCatalog::observe(f64 unix_time, f64 latitude, f64 longitude) const
{
    StarObservations result;
    result.reserve(m_stars.size());
    for (const auto& star : m_stars)
    {
        result.push_back(observe_star(star, unix_time, latitude, longitude));
    }
    return result;
}

// -----------------------------------------------------------------
// Catalog entry -> azimuth/elevation
//
// Unix time -> Julian Date -> local mean sidereal time, then the
// equatorial -> horizontal transform. No refraction is applied.
// -----------------------------------------------------------------

StarObservation SkyCatalog::observe_star(const CatalogStar& star,
                                         f64 unix_time,
                                         f64 latitude,
                                         f64 longitude)
{
    using namespace astro_constants;

    const f64 jd = astro::TimeSystem::unix_to_julian_date(unix_time);
    const f64 lst = astro::TimeSystem::lmst(jd, longitude * kDegToRad);

    const astro::HorizontalCoord hz = astro::Coordinates::equatorial_to_horizontal(
        {.ra = star.right_ascension_deg * kDegToRad, .dec = star.declination_deg * kDegToRad},
        {.latitude_rad = latitude * kDegToRad, .longitude_rad = longitude * kDegToRad},
        lst);

    return StarObservation{
        .latitude  = latitude,
        .longitude = longitude,
        .name      = star.name,
        .azimuth   = astro::LocalDirection::normalize_degrees(hz.az * kRadToDeg),
        .elevation = hz.alt * kRadToDeg,
    };
}

StarObservation SkyCatalog::observe_sun(f64 unix_time, f64 latitude, f64 longitude)
{
    return observe_star(sun(), unix_time, latitude, longitude);
}

std::vector<std::string> SkyCatalog::names() const
{
    std::vector<std::string> result;
    result.reserve(m_stars.size());
    for (const auto& star : m_stars)
    {
        result.push_back(star.name);
    }
    return result;
}

} // namespace orbis::catalog

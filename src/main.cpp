// src/main.cpp - orbis demo
//
// Walks through the engine on the bundled data:
//  1. Infer curvature between 38N 122W and 38N 113W from Dubhe and Sirius
//  2. Reconstruct the reference square's orientation on every world model
//  3. Compare sightings synthesized from the reference site with the
//     catalog at each manually observed longitude

#include "astro/curvature_calculator.hpp"
#include "astro/star_generator.hpp"
#include "catalog/sky_catalog.hpp"
#include "core/logger.hpp"
#include "observation/reference_observations.hpp"
#include "world/world_model.hpp"

#include <algorithm>
#include <cmath>
#include <exception>
#include <iomanip>
#include <iostream>
#include <vector>

using namespace orbis;

namespace {

void printCurvature() {
    std::cout << "--- Curvature from Dubhe (A) and Sirius (B) ---\n";

    const astro::CurvatureInput input = astro::CurvatureInput::dubhe_sirius();
    const astro::CurvatureCalculator calculator;
    const astro::CurvatureResult result = calculator.calculate(input);

    std::cout << std::fixed << std::setprecision(5)
              << "  Start heading:       " << input.start_travel_heading << " deg\n"
              << "  Distance:            " << std::setprecision(3) << input.distance_km << " km\n"
              << std::setprecision(5)
              << "  Deviation of B:      " << result.deviation_b_deg << " deg\n"
              << std::scientific << std::setprecision(6)
              << "  Normal curvature:    " << result.normal_curvature << " 1/km"
              << "  (radius " << std::fixed << std::setprecision(1)
              << 1.0 / result.normal_curvature << " km)\n"
              << std::scientific << std::setprecision(6)
              << "  Geodesic torsion:    " << result.geodesic_torsion << " deg/km\n";
    if (result.geodesic_curvature) {
        std::cout << "  Geodesic curvature:  " << *result.geodesic_curvature << " deg/km\n";
    }
    std::cout << std::defaultfloat;

    if (result.warnings.empty()) {
        std::cout << "  No warnings.\n";
    }
    for (const auto& warning : result.warnings) {
        std::cout << "  Warning: " << warning << "\n";
    }
    std::cout << "\n";
}

void printOrientations(const std::vector<world::WorldModel>& worlds) {
    std::cout << "--- Reference square (38N 122W) on each world ---\n";
    for (const auto& world : worlds) {
        const surface::SurfaceSquare square = world.model_square(observation::kReferenceLatitude,
                                                                 observation::kReferenceLongitude);
        const Vec3d packed = square.rotation_from_nominal.to_packed();
        std::cout << "  " << std::left << std::setw(46) << world.description << std::right
                  << std::fixed << std::setprecision(3)
                  << " rotation (" << packed.x << ", " << packed.y << ", " << packed.z << ")"
                  << "  up (" << square.up.x << ", " << square.up.y << ", " << square.up.z << ")\n";
    }
    std::cout << std::defaultfloat << "\n";
}

void printSynthesisVsCatalog(const world::WorldModel& world) {
    std::cout << "--- Synthesized (" << world.description << ") vs. catalog ---\n";

    const catalog::SkyCatalog catalog = catalog::SkyCatalog::builtin();
    const f64 longitudes[] = {-122.0, -113.0, -104.0, -95.0, -86.0};

    for (f64 longitude : longitudes) {
        const surface::SurfaceSquare square = world.model_square(observation::kReferenceLatitude,
                                                                 longitude);
        const StarObservations synthesized =
            astro::StarGenerator::synthesize(square, world.model_star_map());

        f64 worst = 0.0;
        for (const auto& obs : synthesized) {
            const catalog::CatalogStar* star = catalog.find_by_name(obs.name);
            if (!star) continue;
            const StarObservation expected = catalog::SkyCatalog::observe_star(
                *star, observation::kManualDataUnixTime, obs.latitude, obs.longitude);

            f64 daz = std::abs(obs.azimuth - expected.azimuth);
            if (daz > 180.0) daz = 360.0 - daz;
            worst = std::max({worst, daz, std::abs(obs.elevation - expected.elevation)});
        }

        std::cout << "  " << std::fixed << std::setprecision(1) << longitude << ": "
                  << synthesized.size() << " stars, worst difference "
                  << std::setprecision(3) << worst << " deg\n";
    }
    std::cout << std::defaultfloat << "\n";
}

} // namespace

int main() {
    core::Logger::init();

    std::cout << "================================================================\n"
              << "  orbis v0.1 - surface shape from star sightings\n"
              << "================================================================\n\n";

    try {
        printCurvature();

        const std::vector<world::WorldModel> worlds = world::make_all_worlds();
        printOrientations(worlds);
        printSynthesisVsCatalog(worlds.front());
    } catch (const std::exception& e) {
        ORB_CRITICAL("orbis: {}", e.what());
        core::Logger::shutdown();
        return 1;
    }

    ORB_INFO("Done");
    core::Logger::shutdown();
    return 0;
}

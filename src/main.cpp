/**
 * orbitwatch headless driver
 *
 * Runs the reference scenario (or a scenario file) through the tick loop,
 * answers early warnings with the escape planner and finishes with an
 * integrator comparison.
 *
 * Usage:
 *   orbitwatch_sim [scenario-file|-] [euler|verlet|rk4] [-v]
 */

#include <iomanip>
#include <iostream>
#include <string>

#include "log.hpp"
#include "simulation.hpp"

using namespace orbitwatch;

int main(int argc, char** argv) {

    // --- Simulation Parameters ---
    SimConfig config;
    config.dt = 0.2;
    config.integrator = IntegratorKind::Verlet;
    config.initial_satellites = 6;
    config.physics.drag_enabled = false;

    const int total_ticks = 3000;
    const int report_every = 250;

    std::string scenario_file;
    // "-" keeps the reference scenario
    if (argc > 1 && std::string(argv[1]) != "-") {
        scenario_file = argv[1];
    }
    if (argc > 2) {
        config.integrator = ParseIntegratorKind(argv[2]);
    }
    if (argc > 3 && std::string(argv[3]) == "-v") {
        SetLogLevel(LogLevel::Debug);
    }

    // --- End Parameters ---

    Simulation sim(config);

    if (scenario_file.empty()) {
        sim.ResetScenario();
    } else if (!sim.LoadScenario(scenario_file)) {
        std::cerr << "Failed to load scenario. Exiting." << std::endl;
        return 1;
    }

    sim.SetWarningCallback([](const EarlyWarning& warning) {
        std::cout << "  warning: " << warning.body_id << " risk " << std::fixed << std::setprecision(0)
                  << warning.score << std::endl;
    });
    sim.SetEscapeCallback([](const std::string& id, const std::optional<ManeuverCandidate>& result) {
        if (result) {
            std::cout << "  escape: " << id << " -> (" << std::fixed << std::setprecision(3)
                      << result->velocity.x << ", " << result->velocity.y << ")" << std::endl;
        } else {
            std::cout << "  escape: " << id << " has no safe course" << std::endl;
        }
    });

    std::cout << "Running " << total_ticks << " ticks with " << ToString(sim.Integrator())
              << ", dt=" << config.dt << std::endl;

    int collisions = 0;
    for (int i = 0; i < total_ticks; ++i) {
        TickResult result = sim.Tick();
        collisions += static_cast<int>(result.collisions.size());

        // A paused loop with an open warning waits for a decision.
        if (sim.ActiveWarning() && !sim.EscapePending()) {
            if (!sim.EscapeWarning()) {
                sim.DismissWarning();
            }
        }
        if (sim.EscapePending()) {
            sim.WaitForAnalyses();
            if (sim.ActiveWarning()) {
                sim.DismissWarning();
            }
        }

        if (i % report_every == 0) {
            const auto& risk = sim.LastRisk();
            std::cout << "t=" << std::fixed << std::setprecision(1) << result.time
                      << " satellites=" << sim.SatelliteCount()
                      << " drift=" << std::setprecision(4) << sim.Energy().DriftPercent() << "%"
                      << " (" << ToString(sim.Energy().Status()) << ")"
                      << " risk=" << std::setprecision(0) << (risk ? risk->score : 0.0)
                      << std::endl;
        }
    }
    sim.WaitForAnalyses();

    std::cout << "\nSimulation finished: " << collisions << " collisions, "
              << sim.SatelliteCount() << " satellites left." << std::endl;

    const ComparisonResult comparison = sim.RunComparison();
    if (comparison.samples.empty()) {
        std::cout << "Not enough bodies for an integrator comparison." << std::endl;
        return 0;
    }

    std::cout << "\nEnergy drift (%) by integrator\n"
              << std::setw(6) << "step" << std::setw(12) << "euler"
              << std::setw(12) << "rk4" << std::setw(12) << "verlet" << "\n";
    for (std::size_t i = 0; i < comparison.samples.size(); i += 6) {
        const auto& s = comparison.samples[i];
        std::cout << std::setw(6) << s.step << std::fixed << std::setprecision(4)
                  << std::setw(12) << s.euler << std::setw(12) << s.rk4
                  << std::setw(12) << s.verlet << "\n";
    }
    return 0;
}

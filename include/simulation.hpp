#ifndef ORBITWATCH_SIMULATION_HPP
#define ORBITWATCH_SIMULATION_HPP

#include <entt/entt.hpp>
#include <chrono>
#include <cstddef>
#include <functional>
#include <future>
#include <map>
#include <optional>
#include <random>
#include <string>
#include <vector>

#include "collision.hpp"
#include "comparison.hpp"
#include "components.hpp"
#include "energy.hpp"
#include "escape.hpp"
#include "integrators.hpp"
#include "kepler.hpp"
#include "registry.hpp"
#include "risk.hpp"
#include "systems.hpp"

namespace orbitwatch {

// --- Simulation Configuration ---

struct SimConfig {
    PhysicsSettings physics;

    double dt = 0.2;
    IntegratorKind integrator = IntegratorKind::Verlet;
    std::size_t trail_length = 200;

    // Analyzer workloads
    int prediction_steps = 400;
    EscapeSettings escape;
    int comparison_steps = 300;
    int comparison_stride = 5;

    // Cadence, in ticks
    int energy_interval = 5;
    int risk_interval = 15;
    std::size_t energy_window = 100;

    // Reference scenario
    Vec2 center;
    std::string central_id = "EARTH";
    double central_mass = 10000.0;
    double central_radius = 30.0;
    double satellite_mass = 5.0;
    double satellite_radius = 6.0;
    double min_orbit_radius = 120.0;
    double max_orbit_radius = 320.0;
    std::size_t initial_satellites = 3;
    std::size_t max_satellites = 20;
    unsigned int seed = 5489u;

    // Early warning
    double warning_threshold = 60.0;
    std::chrono::milliseconds warning_cooldown{4000};
    bool pause_on_warning = true;

    // Run risk prediction, escape planning and comparisons on worker threads.
    bool async_analysis = true;
};

/**
 * @brief What one Tick() produced.
 */
struct TickResult {
    std::vector<Body> bodies;
    std::vector<CollisionEvent> collisions;
    double time = 0.0;
    bool advanced = false; // false while paused
};


// --- Simulation Class ---

/**
 * @brief Owns the live body registry and drives it one tick at a time.
 *
 * Only Tick() and the explicit edit operations mutate the registry.
 * Risk prediction, escape planning and integrator comparisons read a clone
 * taken on the tick thread; with async_analysis they run on std::async
 * workers and their results are picked up by the next Tick(). At most one
 * job of each kind is in flight.
 */
class Simulation {
public:
    using CollisionCallback = std::function<void(const CollisionEvent&)>;
    using WarningCallback = std::function<void(const EarlyWarning&)>;
    using RiskCallback = std::function<void(const RiskReport&)>;
    using EscapeCallback = std::function<void(const std::string&, const std::optional<ManeuverCandidate>&)>;
    using ComparisonCallback = std::function<void(const ComparisonResult&)>;
    using SelectionClearedCallback = std::function<void(const std::string&)>;

    /**
     * @brief Throws std::invalid_argument on a non-positive dt, interval,
     * stride or trail length, or an empty orbit radius range.
     */
    explicit Simulation(const SimConfig& config = {});
    ~Simulation();

    Simulation(const Simulation&) = delete;
    Simulation& operator=(const Simulation&) = delete;

    // --- Scenario ---

    /**
     * @brief Clears everything and creates the central body plus
     * `initial_satellites` satellites on circular orbits.
     */
    void ResetScenario();

    /**
     * @brief Clears everything and loads bodies from a scenario file.
     */
    bool LoadScenario(const std::string& filename);

    /**
     * @brief Removes every body and resets time, diagnostics and warnings.
     */
    void Clear();

    /**
     * @brief Adds a hand-made body. Throws std::invalid_argument like CreateBody().
     */
    void SpawnBody(const BodySpec& spec);

    // --- Tick loop ---

    TickResult Tick(double dt);
    TickResult Tick() { return Tick(m_config.dt); }

    void Pause() { m_paused = true; }
    void Resume() { m_paused = false; }
    bool IsPaused() const { return m_paused; }

    // --- Controls ---

    void SetIntegrator(IntegratorKind kind);
    IntegratorKind Integrator() const { return m_integrator; }

    void SetDrag(bool enabled);
    bool DragEnabled() const;

    /**
     * @brief Adds a satellite on a circular orbit of random radius around
     * `near_fixed_id` (the first fixed body when empty). Returns its id, or
     * std::nullopt at the satellite limit or without a matching fixed body.
     */
    std::optional<std::string> AddBody(const std::string& near_fixed_id = {});

    /**
     * @brief Removes the most recently created non-fixed body.
     */
    bool RemoveLastBody();

    bool SetVelocity(const std::string& body_id, const Vec2& velocity);

    // --- Selection ---

    bool SelectBody(const std::string& body_id);
    void ClearSelection();
    const std::optional<std::string>& SelectedBody() const { return m_selected; }
    // Refreshed on the energy cadence.
    const std::optional<KeplerResult>& SelectedOrbit() const { return m_selected_orbit; }

    // --- Analysis (synchronous, on clones) ---

    std::optional<KeplerResult> AnalyzeOrbit(const std::string& body_id) const;
    RiskReport PredictRisk() const;
    std::optional<ManeuverCandidate> PlanEscape(const std::string& body_id) const;
    ComparisonResult RunComparison() const;
    std::vector<Vec2> PreviewTrajectory(const std::string& body_id, const Vec2& velocity) const;

    // --- Analysis (background) ---

    /**
     * @brief Starts a risk prediction unless one is pending or the
     * simulation is paused. Tick() calls this on the risk cadence.
     */
    bool RequestRiskPrediction();

    /**
     * @brief Plans an escape for `body_id` and applies the winner to the
     * live body. Rejected while another escape is pending.
     */
    bool RequestEscape(const std::string& body_id);

    /**
     * @brief Compares the integrators on a clone; the live loop stays
     * paused until the result is delivered.
     */
    bool RequestComparison();

    /**
     * @brief Blocks until every pending job has finished and delivers the results.
     */
    void WaitForAnalyses();

    bool RiskPending() const { return m_risk_job.valid(); }
    bool EscapePending() const { return m_escape_job.valid(); }
    bool ComparisonPending() const { return m_comparison_job.valid(); }

    // --- Early warning ---

    const std::optional<EarlyWarning>& ActiveWarning() const { return m_active_warning; }

    // Applies a hand-picked velocity to the warned body and resumes.
    bool ConfirmWarning(const Vec2& velocity);
    // Suppresses further warnings for this body for the cooldown and resumes.
    bool DismissWarning();
    // RequestEscape() for the warned body.
    bool EscapeWarning();

    // --- Callbacks ---

    void SetCollisionCallback(CollisionCallback callback) { m_on_collision = std::move(callback); }
    void SetWarningCallback(WarningCallback callback) { m_on_warning = std::move(callback); }
    void SetRiskCallback(RiskCallback callback) { m_on_risk = std::move(callback); }
    void SetEscapeCallback(EscapeCallback callback) { m_on_escape = std::move(callback); }
    void SetComparisonCallback(ComparisonCallback callback) { m_on_comparison = std::move(callback); }
    void SetSelectionClearedCallback(SelectionClearedCallback callback) { m_on_selection_cleared = std::move(callback); }

    // --- State ---

    const entt::registry& Registry() const { return m_registry; }
    std::vector<Body> Snapshot() const { return TakeSnapshot(m_registry); }
    const SimConfig& Config() const { return m_config; }
    double Time() const;
    std::uint64_t TickCount() const;
    std::size_t SatelliteCount() const;

    const EnergyMonitor& Energy() const { return m_energy; }
    const std::optional<RiskReport>& LastRisk() const { return m_last_risk; }
    const std::optional<ComparisonResult>& LastComparison() const { return m_last_comparison; }

private:
    /**
     * @brief Performs a single, complete physics step.
     */
    std::vector<CollisionEvent> StepSimulation(double dt);

    void RunPeriodicDiagnostics();
    void PollAnalyses();

    void HandleRiskReport(const RiskReport& report);
    void HandleEscapeResult(const std::string& body_id, const std::optional<ManeuverCandidate>& result);
    void HandleComparison(const ComparisonResult& result);
    void HandleRemoved(const std::string& body_id);

    void CreateSatellite(entt::entity anchor);
    std::string NextSatelliteId();

private:
    entt::registry m_registry;
    SimConfig m_config;
    double m_dt;
    bool m_paused = false;

    // Pluggable pipelines
    std::vector<ForceSystemFn> m_force_pipeline;
    ForcePipelineFn m_force_pipeline_fn;

    // Integrator management
    std::map<IntegratorKind, IntegratorStepFn> m_integrators;
    IntegratorKind m_integrator;

    std::mt19937 m_rng;
    std::uint64_t m_satellite_counter = 0;

    std::optional<std::string> m_selected;
    std::optional<KeplerResult> m_selected_orbit;

    EnergyMonitor m_energy;
    std::optional<RiskReport> m_last_risk;
    std::optional<ComparisonResult> m_last_comparison;
    std::optional<EarlyWarning> m_active_warning;
    WarningDebouncer m_debouncer;

    // Background jobs
    std::future<RiskReport> m_risk_job;
    std::future<std::optional<ManeuverCandidate>> m_escape_job;
    std::string m_escape_target;
    std::future<ComparisonResult> m_comparison_job;
    bool m_paused_for_comparison = false;

    CollisionCallback m_on_collision;
    WarningCallback m_on_warning;
    RiskCallback m_on_risk;
    EscapeCallback m_on_escape;
    ComparisonCallback m_on_comparison;
    SelectionClearedCallback m_on_selection_cleared;
};

} // namespace orbitwatch

#endif // ORBITWATCH_SIMULATION_HPP

#include "simulation.hpp"
#include "log.hpp"

#include <cmath>
#include <exception>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace orbitwatch {

namespace {
    constexpr double kTwoPi = 6.283185307179586;

    template <typename T>
    bool IsReady(const std::future<T>& job) {
        return job.valid() && job.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
    }
} // namespace

Simulation::Simulation(const SimConfig& config)
    : m_config(config),
      m_dt(config.dt),
      m_integrator(config.integrator),
      m_rng(config.seed),
      m_energy(config.energy_window),
      m_debouncer(config.warning_cooldown) {
    if (!(m_config.dt > 0.0)) {
        throw std::invalid_argument("dt must be positive");
    }
    if (m_config.energy_interval <= 0 || m_config.risk_interval <= 0 || m_config.comparison_stride <= 0) {
        throw std::invalid_argument("analysis intervals must be positive");
    }
    if (m_config.trail_length == 0) {
        throw std::invalid_argument("trail length must be positive");
    }
    if (!(m_config.min_orbit_radius > 0.0) || m_config.max_orbit_radius < m_config.min_orbit_radius) {
        throw std::invalid_argument("invalid satellite orbit radius range");
    }

    // Store global sim state in the registry's "context"
    PrepareRegistry(m_registry, m_config.physics);

    // --- 1. Register Integrators ---
    for (auto kind : {IntegratorKind::Euler, IntegratorKind::Verlet, IntegratorKind::RK4}) {
        m_integrators[kind] = GetIntegrator(kind);
    }

    // --- 2. Build the Force Pipeline ---
    // Add systems in the order they should run.
    m_force_pipeline = DefaultForceSystems();
    m_force_pipeline_fn = [this](entt::registry& reg) {
        for (auto& system_fn : m_force_pipeline) {
            system_fn(reg);
        }
    };

    ORBITWATCH_LOG_DEBUG(std::string("Simulation ready, integrator: ") + ToString(m_integrator));
}

Simulation::~Simulation() {
    // Futures from std::async join on destruction; wait here so no worker
    // outlives the members it reports back to.
    if (m_risk_job.valid()) m_risk_job.wait();
    if (m_escape_job.valid()) m_escape_job.wait();
    if (m_comparison_job.valid()) m_comparison_job.wait();
}


// --- Scenario ---

void Simulation::Clear() {
    WaitForAnalyses();

    m_registry.clear();
    m_registry.ctx().get<SimState>() = SimState{};
    m_registry.ctx().get<PhysicsSettings>() = m_config.physics;

    m_satellite_counter = 0;
    m_selected.reset();
    m_selected_orbit.reset();
    m_energy.Reset();
    m_last_risk.reset();
    m_last_comparison.reset();
    m_active_warning.reset();
    m_debouncer.Clear();
    m_paused = false;
    m_paused_for_comparison = false;
}

void Simulation::ResetScenario() {
    const bool drag = DragEnabled();
    Clear();
    m_registry.ctx().get<PhysicsSettings>().drag_enabled = drag;

    BodySpec central;
    central.id = m_config.central_id;
    central.position = m_config.center;
    central.mass = m_config.central_mass;
    central.radius = m_config.central_radius;
    central.fixed = true;
    const auto anchor = CreateBody(m_registry, central);

    for (std::size_t i = 0; i < m_config.initial_satellites && i < m_config.max_satellites; ++i) {
        CreateSatellite(anchor);
    }
    ORBITWATCH_LOG_INFO("Scenario reset with " + std::to_string(SatelliteCount()) + " satellites.");
}

bool Simulation::LoadScenario(const std::string& filename) {
    const bool drag = DragEnabled();
    Clear();
    m_registry.ctx().get<PhysicsSettings>().drag_enabled = drag;
    return loadScenarioFromFile(m_registry, filename);
}

void Simulation::SpawnBody(const BodySpec& spec) {
    CreateBody(m_registry, spec);
}

std::string Simulation::NextSatelliteId() {
    std::string id;
    do {
        id = "SAT-" + std::to_string(++m_satellite_counter);
    } while (FindBody(m_registry, id) != entt::null);
    return id;
}

void Simulation::CreateSatellite(entt::entity anchor) {
    std::uniform_real_distribution<double> radius_dist(m_config.min_orbit_radius, m_config.max_orbit_radius);
    std::uniform_real_distribution<double> angle_dist(0.0, kTwoPi);

    const double r = radius_dist(m_rng);
    const double angle = angle_dist(m_rng);
    const double G = m_registry.ctx().get<PhysicsSettings>().gravitational_constant;
    const double v = std::sqrt(G * m_registry.get<Mass>(anchor).m / r);

    BodySpec spec;
    spec.id = NextSatelliteId();
    spec.position = m_registry.get<Position>(anchor).p + Vec2{r * std::cos(angle), r * std::sin(angle)};
    spec.velocity = m_registry.get<Velocity>(anchor).v + Vec2{-std::sin(angle) * v, std::cos(angle) * v};
    spec.mass = m_config.satellite_mass;
    spec.radius = m_config.satellite_radius;
    CreateBody(m_registry, spec);
}


// --- Tick loop ---

TickResult Simulation::Tick(double dt) {
    TickResult result;
    PollAnalyses();

    if (!m_paused) {
        m_dt = dt;
        result.collisions = StepSimulation(dt);
        result.advanced = true;

        RunPeriodicDiagnostics();
        m_registry.ctx().get<SimState>().tick_count++;
    }

    result.bodies = TakeSnapshot(m_registry);
    result.time = Time();
    return result;
}

std::vector<CollisionEvent> Simulation::StepSimulation(double dt) {
    // Run the chosen integrator, which will call the force pipeline
    m_integrators.at(m_integrator)(m_registry, dt, m_force_pipeline_fn);

    auto collisions = ResolveCollisions(m_registry);
    for (const auto& event : collisions) {
        ORBITWATCH_LOG_WARN(Describe(event));
        if (m_on_collision) m_on_collision(event);

        HandleRemoved(event.first_id);
        if (event.kind == CollisionKind::Mutual) {
            HandleRemoved(event.second_id);
        }
    }

    UpdateTrailSystem(m_registry, m_config.trail_length);

    // Update the global simulation time
    m_registry.ctx().get<SimState>().current_time += dt;
    return collisions;
}

void Simulation::RunPeriodicDiagnostics() {
    const auto tick = m_registry.ctx().get<SimState>().tick_count;

    if (tick % static_cast<std::uint64_t>(m_config.energy_interval) == 0) {
        m_energy.Record(TotalEnergy(m_registry));
        if (m_selected) {
            m_selected_orbit = orbitwatch::AnalyzeOrbit(m_registry, *m_selected);
        }
    }
    if (tick % static_cast<std::uint64_t>(m_config.risk_interval) == 0) {
        RequestRiskPrediction();
    }
}

void Simulation::HandleRemoved(const std::string& body_id) {
    if (m_selected && *m_selected == body_id) {
        m_selected.reset();
        m_selected_orbit.reset();
        if (m_on_selection_cleared) m_on_selection_cleared(body_id);
    }
    if (m_active_warning && m_active_warning->body_id == body_id) {
        m_active_warning.reset();
        m_paused = false;
    }
}


// --- Controls ---

void Simulation::SetIntegrator(IntegratorKind kind) {
    m_integrator = kind;
    ORBITWATCH_LOG_INFO(std::string("Using integrator: ") + ToString(kind));
}

void Simulation::SetDrag(bool enabled) {
    m_registry.ctx().get<PhysicsSettings>().drag_enabled = enabled;
}

bool Simulation::DragEnabled() const {
    return m_registry.ctx().get<PhysicsSettings>().drag_enabled;
}

std::optional<std::string> Simulation::AddBody(const std::string& near_fixed_id) {
    if (SatelliteCount() >= m_config.max_satellites) {
        ORBITWATCH_LOG_DEBUG("Satellite limit reached");
        return std::nullopt;
    }

    const auto anchor = near_fixed_id.empty() ? FindFixedBody(m_registry) : FindBody(m_registry, near_fixed_id);
    if (anchor == entt::null || !m_registry.all_of<Fixed>(anchor)) {
        ORBITWATCH_LOG_DEBUG("No fixed body to orbit: " + near_fixed_id);
        return std::nullopt;
    }

    CreateSatellite(anchor);
    return "SAT-" + std::to_string(m_satellite_counter);
}

bool Simulation::RemoveLastBody() {
    const auto bodies = OrderedBodies(m_registry);
    for (auto it = bodies.rbegin(); it != bodies.rend(); ++it) {
        if (m_registry.all_of<Fixed>(*it)) continue;

        const std::string id = m_registry.get<Identifier>(*it).id;
        m_registry.destroy(*it);
        HandleRemoved(id);
        return true;
    }
    return false;
}

bool Simulation::SetVelocity(const std::string& body_id, const Vec2& velocity) {
    return SetBodyVelocity(m_registry, body_id, velocity);
}


// --- Selection ---

bool Simulation::SelectBody(const std::string& body_id) {
    const auto entity = FindBody(m_registry, body_id);
    if (entity == entt::null || m_registry.all_of<Fixed>(entity)) {
        return false;
    }
    m_selected = body_id;
    m_selected_orbit = orbitwatch::AnalyzeOrbit(m_registry, body_id);
    return true;
}

void Simulation::ClearSelection() {
    m_selected.reset();
    m_selected_orbit.reset();
}


// --- Analysis (synchronous) ---

std::optional<KeplerResult> Simulation::AnalyzeOrbit(const std::string& body_id) const {
    return orbitwatch::AnalyzeOrbit(m_registry, body_id);
}

RiskReport Simulation::PredictRisk() const {
    return orbitwatch::PredictRisk(m_registry, m_dt, m_config.prediction_steps);
}

std::optional<ManeuverCandidate> Simulation::PlanEscape(const std::string& body_id) const {
    return orbitwatch::PlanEscape(m_registry, body_id, m_dt, m_config.escape);
}

ComparisonResult Simulation::RunComparison() const {
    return orbitwatch::RunComparison(m_registry, m_dt, m_config.comparison_steps, m_config.comparison_stride);
}

std::vector<Vec2> Simulation::PreviewTrajectory(const std::string& body_id, const Vec2& velocity) const {
    return orbitwatch::PreviewTrajectory(m_registry, body_id, velocity, m_dt, m_config.escape.steps);
}


// --- Analysis (background) ---

bool Simulation::RequestRiskPrediction() {
    if (m_paused) {
        return false;
    }
    if (m_risk_job.valid()) {
        ORBITWATCH_LOG_TRACE("Risk prediction still running, skipping this one");
        return false;
    }

    if (!m_config.async_analysis) {
        HandleRiskReport(PredictRisk());
        return true;
    }

    m_risk_job = std::async(std::launch::async,
        [ghost = CloneRegistry(m_registry), dt = m_dt, steps = m_config.prediction_steps]() {
            return orbitwatch::PredictRisk(ghost, dt, steps);
        });
    return true;
}

bool Simulation::RequestEscape(const std::string& body_id) {
    if (m_escape_job.valid()) {
        ORBITWATCH_LOG_DEBUG("Escape planning already running, rejecting request for " + body_id);
        return false;
    }

    if (!m_config.async_analysis) {
        HandleEscapeResult(body_id, PlanEscape(body_id));
        return true;
    }

    m_escape_target = body_id;
    m_escape_job = std::async(std::launch::async,
        [ghost = CloneRegistry(m_registry), body_id, dt = m_dt, settings = m_config.escape]() {
            return orbitwatch::PlanEscape(ghost, body_id, dt, settings);
        });
    return true;
}

bool Simulation::RequestComparison() {
    if (m_comparison_job.valid()) {
        return false;
    }

    if (!m_config.async_analysis) {
        HandleComparison(RunComparison());
        return true;
    }

    if (!m_paused) {
        m_paused = true;
        m_paused_for_comparison = true;
    }
    m_comparison_job = std::async(std::launch::async,
        [ghost = CloneRegistry(m_registry), dt = m_dt,
         steps = m_config.comparison_steps, stride = m_config.comparison_stride]() {
            return orbitwatch::RunComparison(ghost, dt, steps, stride);
        });
    return true;
}

void Simulation::PollAnalyses() {
    if (IsReady(m_risk_job)) {
        try {
            HandleRiskReport(m_risk_job.get());
        } catch (const std::exception& e) {
            ORBITWATCH_LOG_ERROR(std::string("Risk prediction failed: ") + e.what());
        }
    }
    if (IsReady(m_escape_job)) {
        const std::string target = std::move(m_escape_target);
        m_escape_target.clear();
        try {
            HandleEscapeResult(target, m_escape_job.get());
        } catch (const std::exception& e) {
            ORBITWATCH_LOG_ERROR("Escape planning for " + target + " failed: " + e.what());
        }
    }
    if (IsReady(m_comparison_job)) {
        try {
            HandleComparison(m_comparison_job.get());
        } catch (const std::exception& e) {
            ORBITWATCH_LOG_ERROR(std::string("Integrator comparison failed: ") + e.what());
            if (m_paused_for_comparison) {
                m_paused_for_comparison = false;
                m_paused = false;
            }
        }
    }
}

void Simulation::WaitForAnalyses() {
    if (m_risk_job.valid()) m_risk_job.wait();
    if (m_escape_job.valid()) m_escape_job.wait();
    if (m_comparison_job.valid()) m_comparison_job.wait();
    PollAnalyses();
}

void Simulation::HandleRiskReport(const RiskReport& report) {
    m_last_risk = report;
    if (m_on_risk) m_on_risk(report);

    if (report.score < m_config.warning_threshold || !report.first_collider) return;
    if (m_paused || m_active_warning) return;

    const auto now = WarningDebouncer::Clock::now();
    m_debouncer.Prune(now);
    const std::string& id = *report.first_collider;
    if (m_debouncer.IsSuppressed(id, now)) {
        ORBITWATCH_LOG_TRACE("Warning for " + id + " suppressed by cooldown");
        return;
    }

    // The projection may be a few ticks old; report what the body is doing now.
    const auto entity = FindBody(m_registry, id);
    if (entity == entt::null) return;

    EarlyWarning warning;
    warning.body_id = id;
    warning.position = m_registry.get<Position>(entity).p;
    warning.velocity = m_registry.get<Velocity>(entity).v;
    warning.score = report.score;
    m_active_warning = warning;
    if (m_config.pause_on_warning) {
        m_paused = true;
    }

    std::ostringstream msg;
    msg << "EARLY WARNING: " << id << " is on a risky course (risk " << static_cast<int>(report.score) << ")";
    ORBITWATCH_LOG_WARN(msg.str());
    if (m_on_warning) m_on_warning(warning);
}

void Simulation::HandleEscapeResult(const std::string& body_id, const std::optional<ManeuverCandidate>& result) {
    if (result && SetBodyVelocity(m_registry, body_id, result->velocity)) {
        ORBITWATCH_LOG_INFO("Stable escape course applied to " + body_id);
        if (m_active_warning && m_active_warning->body_id == body_id) {
            m_active_warning.reset();
            m_paused = false;
        }
    } else if (result) {
        ORBITWATCH_LOG_WARN("Escape course for " + body_id + " dropped: body no longer exists");
    } else {
        ORBITWATCH_LOG_ERROR("No safe escape course found for " + body_id);
    }
    if (m_on_escape) m_on_escape(body_id, result);
}

void Simulation::HandleComparison(const ComparisonResult& result) {
    m_last_comparison = result;
    if (m_paused_for_comparison) {
        m_paused_for_comparison = false;
        m_paused = false;
    }
    if (m_on_comparison) m_on_comparison(result);
}


// --- Early warning ---

bool Simulation::ConfirmWarning(const Vec2& velocity) {
    if (!m_active_warning) return false;

    const std::string id = m_active_warning->body_id;
    if (SetBodyVelocity(m_registry, id, velocity)) {
        ORBITWATCH_LOG_INFO(id + " corrected manually.");
    }
    m_active_warning.reset();
    m_paused = false;
    return true;
}

bool Simulation::DismissWarning() {
    if (!m_active_warning) return false;

    const std::string id = m_active_warning->body_id;
    m_debouncer.Dismiss(id, WarningDebouncer::Clock::now());
    ORBITWATCH_LOG_WARN("Warning for " + id + " dismissed.");
    m_active_warning.reset();
    m_paused = false;
    return true;
}

bool Simulation::EscapeWarning() {
    if (!m_active_warning) return false;
    // Copied: a finished escape clears the warning that owns the id.
    const std::string id = m_active_warning->body_id;
    return RequestEscape(id);
}


// --- State ---

double Simulation::Time() const {
    return m_registry.ctx().get<SimState>().current_time;
}

std::uint64_t Simulation::TickCount() const {
    return m_registry.ctx().get<SimState>().tick_count;
}

std::size_t Simulation::SatelliteCount() const {
    std::size_t count = 0;
    for (auto entity : OrderedBodies(m_registry)) {
        if (!m_registry.all_of<Fixed>(entity)) ++count;
    }
    return count;
}

} // namespace orbitwatch

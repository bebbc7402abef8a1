#ifndef ORBITWATCH_RISK_HPP
#define ORBITWATCH_RISK_HPP

#include <entt/entt.hpp>
#include <chrono>
#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "components.hpp"

namespace orbitwatch {

enum class RiskLevel {
    Medium,   // ratio <= 4.0
    High,     // ratio <= 2.5
    Critical  // ratio <= 1.2
};

const char* ToString(RiskLevel level);

/**
 * @brief Severity band of a distance / (r_i + r_j) ratio below 4.
 */
RiskLevel ClassifyRatio(double ratio);

/**
 * @brief 100 at or below contact, 0 beyond 8 radii, linear in between.
 */
double RiskScore(double min_ratio);

struct RiskPair {
    std::string first_id;
    std::string second_id;
    double distance = 0.0;
    double ratio = 0.0;
    RiskLevel level = RiskLevel::Medium;
};

struct RiskReport {
    double score = 0.0;
    // Infinity when fewer than two non-fixed bodies exist.
    double min_ratio = 0.0;
    int steps_run = 0;
    // First three flagged pairs, in the order they were discovered.
    std::vector<RiskPair> pairs;
    // First body of the first pair already within 2 radii when it was flagged.
    std::optional<std::string> first_collider;
};

constexpr std::size_t kMaxReportedPairs = 3;

/**
 * @brief Ghost simulation: projects a clone of `registry` forward with
 * velocity Verlet at 2*dt for at most `steps` steps and reports the closest
 * approach between non-fixed bodies. The registry itself is not modified.
 */
RiskReport PredictRisk(const entt::registry& registry, double dt, int steps);

/**
 * @brief Live state of the body flagged by the risk predictor.
 */
struct EarlyWarning {
    std::string body_id;
    Vec2 position;
    Vec2 velocity;
    double score = 0.0;
};

/**
 * @brief Per-body cooldown after a warning has been dismissed.
 */
class WarningDebouncer {
public:
    using Clock = std::chrono::steady_clock;

    explicit WarningDebouncer(Clock::duration cooldown = std::chrono::seconds(4))
        : m_cooldown(cooldown) {}

    void Dismiss(const std::string& body_id, Clock::time_point now);
    bool IsSuppressed(const std::string& body_id, Clock::time_point now) const;

    // Drops entries whose cooldown has expired.
    void Prune(Clock::time_point now);
    void Clear() { m_dismissed.clear(); }
    std::size_t Size() const { return m_dismissed.size(); }

private:
    Clock::duration m_cooldown;
    std::map<std::string, Clock::time_point> m_dismissed;
};

} // namespace orbitwatch

#endif // ORBITWATCH_RISK_HPP

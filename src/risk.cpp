#include "risk.hpp"
#include "integrators.hpp"
#include "registry.hpp"
#include "systems.hpp"

#include <algorithm>
#include <limits>

namespace orbitwatch {

namespace {
    constexpr double kContactRatio = 1.0;
    constexpr double kCriticalRatio = 1.2;
    constexpr double kHighRatio = 2.5;
    constexpr double kFlagRatio = 4.0;
    constexpr double kColliderRatio = 2.0;
    constexpr double kSafeRatio = 8.0;
} // namespace

const char* ToString(RiskLevel level) {
    switch (level) {
        case RiskLevel::Medium:   return "medium";
        case RiskLevel::High:     return "high";
        case RiskLevel::Critical: return "critical";
    }
    return "unknown";
}

RiskLevel ClassifyRatio(double ratio) {
    if (ratio <= kCriticalRatio) return RiskLevel::Critical;
    if (ratio <= kHighRatio) return RiskLevel::High;
    return RiskLevel::Medium;
}

double RiskScore(double min_ratio) {
    if (min_ratio <= kContactRatio) return 100.0;
    if (min_ratio > kSafeRatio) return 0.0;
    return 100.0 * (kSafeRatio - min_ratio) / (kSafeRatio - kContactRatio);
}

RiskReport PredictRisk(const entt::registry& registry, double dt, int steps) {
    entt::registry ghost = CloneRegistry(registry);

    std::vector<entt::entity> movers;
    for (auto entity : OrderedBodies(ghost)) {
        if (!ghost.all_of<Fixed>(entity)) {
            movers.push_back(entity);
        }
    }

    RiskReport report;
    report.min_ratio = std::numeric_limits<double>::infinity();
    std::vector<RiskPair> flagged;

    for (int step = 0; step < steps; ++step) {
        IntegrateVelocityVerlet(ghost, dt * 2.0, ComputeForces);
        report.steps_run = step + 1;

        for (std::size_t i = 0; i < movers.size(); ++i) {
            for (std::size_t j = i + 1; j < movers.size(); ++j) {
                const auto b1 = movers[i];
                const auto b2 = movers[j];
                const double d = Distance(ghost.get<Position>(b1).p, ghost.get<Position>(b2).p);
                const double ratio = d / (ghost.get<Radius>(b1).r + ghost.get<Radius>(b2).r);
                report.min_ratio = std::min(report.min_ratio, ratio);

                if (ratio >= kFlagRatio) continue;

                const auto& id1 = ghost.get<Identifier>(b1).id;
                const auto& id2 = ghost.get<Identifier>(b2).id;
                const bool known = std::any_of(flagged.begin(), flagged.end(), [&](const RiskPair& p) {
                    return p.first_id == id1 && p.second_id == id2;
                });
                if (known) continue;

                flagged.push_back(RiskPair{id1, id2, d, ratio, ClassifyRatio(ratio)});
                // Only a pair that is already this close when first flagged names a collider.
                if (ratio <= kColliderRatio && !report.first_collider) {
                    report.first_collider = id1;
                }
            }
        }

        if (report.min_ratio <= kContactRatio) break;
    }

    report.score = RiskScore(report.min_ratio);
    if (flagged.size() > kMaxReportedPairs) {
        flagged.resize(kMaxReportedPairs);
    }
    report.pairs = std::move(flagged);
    return report;
}

void WarningDebouncer::Dismiss(const std::string& body_id, Clock::time_point now) {
    m_dismissed[body_id] = now;
}

bool WarningDebouncer::IsSuppressed(const std::string& body_id, Clock::time_point now) const {
    auto it = m_dismissed.find(body_id);
    if (it == m_dismissed.end()) {
        return false;
    }
    return now - it->second < m_cooldown;
}

void WarningDebouncer::Prune(Clock::time_point now) {
    for (auto it = m_dismissed.begin(); it != m_dismissed.end();) {
        if (now - it->second >= m_cooldown) {
            it = m_dismissed.erase(it);
        } else {
            ++it;
        }
    }
}

} // namespace orbitwatch

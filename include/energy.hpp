#ifndef ORBITWATCH_ENERGY_HPP
#define ORBITWATCH_ENERGY_HPP

#include <entt/entt.hpp>
#include <cstddef>
#include <deque>
#include <optional>

namespace orbitwatch {

/**
 * @brief Total mechanical energy: sum(1/2 m v^2) - sum_{i<j} G m_i m_j / r_ij.
 * Distances are not softened; coincident pairs are skipped.
 */
double TotalEnergy(const entt::registry& registry);

/**
 * @brief |(e - e0) / e0| * 100, or 0 when e0 is zero.
 */
double EnergyDriftPercent(double initial_energy, double energy);

enum class EnergyStatus {
    Stable,
    Unstable,
    Critical
};

const char* ToString(EnergyStatus status);

/**
 * @brief Rolling record of live energy samples.
 *
 * The first sample after construction or Reset() becomes the reference
 * energy. Only the newest `capacity` samples are kept.
 */
class EnergyMonitor {
public:
    explicit EnergyMonitor(std::size_t capacity = 100) : m_capacity(capacity) {}

    void Record(double energy);
    void Reset();

    const std::deque<double>& Samples() const { return m_samples; }
    std::optional<double> InitialEnergy() const { return m_initial; }

    double DriftPercent() const;
    // 100 - 10 * drift, floored at 0
    double AccuracyScore() const;
    EnergyStatus Status() const;

private:
    std::size_t m_capacity;
    std::deque<double> m_samples;
    std::optional<double> m_initial;
};

} // namespace orbitwatch

#endif // ORBITWATCH_ENERGY_HPP

/**
 * @file planner.hpp
 * @brief point-source placement strategies (single → multi-source) uwu
 *
 * the planner turns geometry (center + axis extents) and a source count into
 * a SourcePlan: ordered (coordinate, charge) pairs that still live in
 * continuous space. snapping onto mesh nodes happens later in projector.hpp.
 *
 * each layout is its own small strategy type exposing
 * `plan(center, extents, count) → SourcePlan`; the Strategy variant holds one
 * of them and select_strategy() picks by count:
 *
 * - 1 → SingleStrategy: one unit charge at the center
 * - 2 → DipoleStrategy: ±0.3 × longest extent along the longest axis, ±1
 * - 3 → TriangularStrategy: circle in the two widest axes, charges 1, 0.8, -0.6
 * - 4+ → MultiSourceStrategy: tetra vertices then octant centers, alternating
 *   decaying charges, seeded gaussian jitter
 *
 * coordinates stay inside (or right next to) the bounding box but are not
 * guaranteed to be inside the mesh volume.
 *
 * @author LukeFrankio
 * @date 2026-10-19
 * @version 1.0
 *
 * example (basic usage):
 * @code
 * auto report = psf::analysis::analyze(mesh);
 * auto plan   = psf::sources::plan_sources(*report, {});
 * for (const auto &source : *plan) {
 *     fmt::print("({}, {}, {}) q={}\n", source.position[0], source.position[1],
 *                source.position[2], source.charge);
 * }
 * @endcode
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>
#include <variant>
#include <vector>

#include "psf/analysis/complexity.hpp"
#include "psf/common/error.hpp"
#include "psf/common/math.hpp"

namespace psf::sources
{

inline constexpr std::uint64_t kDefaultSeed = 42U;
/// upper bound on planned sources; larger requests are InvalidSourceCount
inline constexpr std::int64_t kMaxSourceCount = 4096;

/**
 * @brief one candidate source in continuous space
 */
struct PlannedSource
{
    common::Vec3 position{}; ///< geometric coordinate (not yet a mesh node)
    double       charge{};   ///< signed magnitude
};

using SourcePlan = std::vector<PlannedSource>;

/**
 * @brief one unit charge at the geometric center
 */
struct SingleStrategy
{
    [[nodiscard]] auto plan(const common::Vec3 &center, const common::Vec3 &extents, std::size_t count) const
        -> SourcePlan;
};

/**
 * @brief ±1 pair along the axis of maximum extent (ties: x, y, z)
 */
struct DipoleStrategy
{
    static constexpr double kOffsetFraction = 0.3;

    [[nodiscard]] auto plan(const common::Vec3 &center, const common::Vec3 &extents, std::size_t count) const
        -> SourcePlan;
};

/**
 * @brief three sources at 0°, 120°, 240° in the plane of the two widest axes
 *
 * radius = 0.3 × the larger of the two in-plane extents. charges are exactly
 * 1.0, 0.8, -0.6 in angle order (net +1.2, intentionally unbalanced).
 */
struct TriangularStrategy
{
    static constexpr double kRadiusFraction = 0.3;

    [[nodiscard]] auto plan(const common::Vec3 &center, const common::Vec3 &extents, std::size_t count) const
        -> SourcePlan;
};

/**
 * @brief stratified layout for four or more sources
 *
 * sources 0-3 sit on the regular tetrahedron (+,+,+) (+,-,-) (-,+,-) (-,-,+)
 * scaled per axis by 0.2 × extent. later sources walk the eight octant
 * centers at 0.1 × extent, then 0.05 × extent, halving each round. charge i
 * has sign (-1)^i and magnitude 1 - 0.6·i/(count-1), so four sources give
 * 1.0, -0.8, 0.6, -0.4.
 *
 * every coordinate gets N(0, σ²) jitter with σ = 0.01 × extent on that axis,
 * clamped to ±3σ. the engine is a std::mt19937_64 built from `seed` on every
 * plan() call, so identical inputs give identical plans.
 */
struct MultiSourceStrategy
{
    static constexpr double kTetraFraction  = 0.2;
    static constexpr double kOctantFraction = 0.1;
    static constexpr double kJitterFraction = 0.01;
    static constexpr double kJitterClamp    = 3.0;

    std::uint64_t seed{kDefaultSeed};

    [[nodiscard]] auto plan(const common::Vec3 &center, const common::Vec3 &extents, std::size_t count) const
        -> SourcePlan;
};

using Strategy = std::variant<SingleStrategy, DipoleStrategy, TriangularStrategy, MultiSourceStrategy>;

/**
 * @brief knobs for the automatic planner
 */
struct PlannerOptions
{
    std::optional<std::int64_t> count_override; ///< replaces the recommended count when set
    std::uint64_t               seed{kDefaultSeed};
};

/**
 * @brief picks the strategy for a source count
 *
 * ✨ PURE FUNCTION ✨
 *
 * @return strategy, or ErrorCode::InvalidSourceCount when count < 1 or count > kMaxSourceCount
 */
[[nodiscard]] auto select_strategy(std::int64_t count, std::uint64_t seed = kDefaultSeed) -> Result<Strategy>;

/**
 * @brief short name for logs ("single", "dipole", "triangular", "multi_source")
 */
[[nodiscard]] auto strategy_name(const Strategy &strategy) noexcept -> std::string_view;

/**
 * @brief plans `count` sources around a center/extents pair
 *
 * ✨ PURE FUNCTION ✨ (randomness comes only from the explicit seed)
 *
 * @return SourcePlan of length count, or ErrorCode::InvalidSourceCount
 */
[[nodiscard]] auto plan_sources(const common::Vec3 &center, const common::Vec3 &extents, std::int64_t count,
                                std::uint64_t seed = kDefaultSeed) -> Result<SourcePlan>;

/**
 * @brief plans from a ComplexityReport (recommended count unless overridden)
 */
[[nodiscard]] auto plan_sources(const analysis::ComplexityReport &report, const PlannerOptions &options)
    -> Result<SourcePlan>;

} // namespace psf::sources

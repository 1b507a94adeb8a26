/**
 * @file planner.cpp
 * @brief source layout strategies + dispatcher
 */
#include "psf/sources/planner.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <numbers>
#include <random>

#include <fmt/core.h>

namespace psf::sources
{
namespace
{

using common::Vec3;

constexpr std::array<Vec3, 4> kTetraSigns{{
    {1.0, 1.0, 1.0},
    {1.0, -1.0, -1.0},
    {-1.0, 1.0, -1.0},
    {-1.0, -1.0, 1.0},
}};

// axes sorted by extent, widest first; equal extents keep x, y, z priority
[[nodiscard]] auto axes_by_extent(const Vec3 &extents) -> std::array<std::size_t, 3>
{
    std::array<std::size_t, 3> axes{0U, 1U, 2U};
    std::stable_sort(axes.begin(), axes.end(),
                     [&extents](std::size_t lhs, std::size_t rhs) { return extents[lhs] > extents[rhs]; });
    return axes;
}

[[nodiscard]] auto octant_signs(std::size_t octant) -> Vec3
{
    return Vec3{(octant & 1U) != 0U ? -1.0 : 1.0, (octant & 2U) != 0U ? -1.0 : 1.0,
                (octant & 4U) != 0U ? -1.0 : 1.0};
}

[[nodiscard]] auto multi_source_offset(std::size_t index, const Vec3 &extents) -> Vec3
{
    if (index < kTetraSigns.size())
    {
        const auto &signs = kTetraSigns[index];
        Vec3        offset{};
        for (std::size_t axis = 0; axis < 3; ++axis)
        {
            offset[axis] = signs[axis] * MultiSourceStrategy::kTetraFraction * extents[axis];
        }
        return offset;
    }
    const auto slot     = index - kTetraSigns.size();
    const auto round    = slot / 8U;
    const auto signs    = octant_signs(slot % 8U);
    const auto fraction = MultiSourceStrategy::kOctantFraction * std::ldexp(1.0, -static_cast<int>(round));
    Vec3       offset{};
    for (std::size_t axis = 0; axis < 3; ++axis)
    {
        offset[axis] = signs[axis] * fraction * extents[axis];
    }
    return offset;
}

} // namespace

auto SingleStrategy::plan(const Vec3 &center, const Vec3 & /*extents*/, std::size_t /*count*/) const -> SourcePlan
{
    return SourcePlan{PlannedSource{center, 1.0}};
}

auto DipoleStrategy::plan(const Vec3 &center, const Vec3 &extents, std::size_t /*count*/) const -> SourcePlan
{
    const auto axis   = axes_by_extent(extents)[0];
    Vec3       offset{0.0, 0.0, 0.0};
    offset[axis] = kOffsetFraction * extents[axis];
    return SourcePlan{PlannedSource{common::add(center, offset), 1.0},
                      PlannedSource{common::subtract(center, offset), -1.0}};
}

auto TriangularStrategy::plan(const Vec3 &center, const Vec3 &extents, std::size_t /*count*/) const -> SourcePlan
{
    constexpr std::array<double, 3> kCharges{1.0, 0.8, -0.6};

    const auto   axes   = axes_by_extent(extents);
    const double radius = kRadiusFraction * extents[axes[0]];

    SourcePlan plan;
    plan.reserve(kCharges.size());
    for (std::size_t i = 0; i < kCharges.size(); ++i)
    {
        const double angle = 2.0 * std::numbers::pi * static_cast<double>(i) / 3.0;
        Vec3         position = center;
        position[axes[0]] += radius * std::cos(angle);
        position[axes[1]] += radius * std::sin(angle);
        plan.push_back(PlannedSource{position, kCharges[i]});
    }
    return plan;
}

auto MultiSourceStrategy::plan(const Vec3 &center, const Vec3 &extents, std::size_t count) const -> SourcePlan
{
    std::mt19937_64                  engine(seed);
    std::normal_distribution<double> jitter(0.0, 1.0);

    SourcePlan plan;
    plan.reserve(count);
    for (std::size_t i = 0; i < count; ++i)
    {
        auto position = common::add(center, multi_source_offset(i, extents));
        for (std::size_t axis = 0; axis < 3; ++axis)
        {
            const double sigma = kJitterFraction * extents[axis];
            const double draw  = std::clamp(jitter(engine), -kJitterClamp, kJitterClamp);
            position[axis] += draw * sigma;
        }

        const double decay =
            count > 1U ? 1.0 - 0.6 * static_cast<double>(i) / static_cast<double>(count - 1U) : 1.0;
        const double sign = (i % 2U == 0U) ? 1.0 : -1.0;
        plan.push_back(PlannedSource{position, sign * decay});
    }
    return plan;
}

auto select_strategy(std::int64_t count, std::uint64_t seed) -> Result<Strategy>
{
    if (count < 1)
    {
        return make_unexpected(ErrorCode::InvalidSourceCount,
                               fmt::format("source count must be >= 1 (got {})", count), {"sources", "count"});
    }
    if (count > kMaxSourceCount)
    {
        return make_unexpected(ErrorCode::InvalidSourceCount,
                               fmt::format("source count must be <= {} (got {})", kMaxSourceCount, count),
                               {"sources", "count"});
    }
    switch (count)
    {
    case 1:
        return Strategy{SingleStrategy{}};
    case 2:
        return Strategy{DipoleStrategy{}};
    case 3:
        return Strategy{TriangularStrategy{}};
    default:
        return Strategy{MultiSourceStrategy{seed}};
    }
}

auto strategy_name(const Strategy &strategy) noexcept -> std::string_view
{
    constexpr std::array<std::string_view, 4> kNames{"single", "dipole", "triangular", "multi_source"};
    return kNames[strategy.index()];
}

auto plan_sources(const Vec3 &center, const Vec3 &extents, std::int64_t count, std::uint64_t seed)
    -> Result<SourcePlan>
{
    auto strategy = select_strategy(count, seed);
    if (!strategy)
    {
        return std::unexpected(strategy.error());
    }
    const auto n = static_cast<std::size_t>(count);
    return std::visit([&](const auto &chosen) { return chosen.plan(center, extents, n); }, *strategy);
}

auto plan_sources(const analysis::ComplexityReport &report, const PlannerOptions &options) -> Result<SourcePlan>
{
    const auto count = options.count_override.value_or(static_cast<std::int64_t>(report.recommended_sources));
    return plan_sources(report.center, report.extents, count, options.seed);
}

} // namespace psf::sources

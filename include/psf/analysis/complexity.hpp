/**
 * @file complexity.hpp
 * @brief mesh geometry analyzer: bounding box, center, complexity tier uwu
 *
 * a single sweep over the node array yields everything the source planner
 * needs: per-axis min/max, extents, the arithmetic-mean center and a coarse
 * bounding-box volume. the node count then lands in one of four complexity
 * tiers, each implying a recommended number of point sources.
 *
 * | nodes            | level        | sources |
 * |------------------|--------------|---------|
 * | n < 100          | simple       | 1       |
 * | 100 <= n < 500   | moderate     | 2       |
 * | 500 <= n < 1000  | complex      | 3       |
 * | n >= 1000        | very_complex | 4       |
 *
 * @author LukeFrankio
 * @date 2026-10-19
 * @version 1.0
 *
 * example (basic usage):
 * @code
 * auto report = psf::analysis::analyze(mesh);
 * if (report) {
 *     fmt::print("{} nodes → {} ({} sources)\n", report->node_count,
 *                psf::analysis::to_string(report->level), report->recommended_sources);
 * }
 * @endcode
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

#include "psf/common/error.hpp"
#include "psf/common/math.hpp"
#include "psf/mesh/mesh.hpp"

namespace psf::analysis
{

/**
 * @brief discrete mesh complexity tiers
 */
enum class ComplexityLevel : std::uint8_t
{
    Simple,
    Moderate,
    Complex,
    VeryComplex
};

/**
 * @brief derived geometry summary, computed fresh per request
 */
struct ComplexityReport
{
    std::size_t     node_count{};
    std::size_t     element_count{};
    common::Vec3    bbox_min{};
    common::Vec3    bbox_max{};
    common::Vec3    extents{};          ///< bbox_max - bbox_min per axis
    common::Vec3    center{};           ///< arithmetic mean of node coordinates
    double          estimated_volume{}; ///< product of extents (bounding-box proxy)
    ComplexityLevel level{ComplexityLevel::Simple};
    std::size_t     recommended_sources{1U};
};

/**
 * @brief node-count step function onto the four tiers
 *
 * ✨ PURE FUNCTION ✨
 */
[[nodiscard]] constexpr auto classify(std::size_t node_count) noexcept -> ComplexityLevel
{
    if (node_count < 100U)
    {
        return ComplexityLevel::Simple;
    }
    if (node_count < 500U)
    {
        return ComplexityLevel::Moderate;
    }
    if (node_count < 1000U)
    {
        return ComplexityLevel::Complex;
    }
    return ComplexityLevel::VeryComplex;
}

/**
 * @brief recommended source count for a tier (1, 2, 3, 4)
 */
[[nodiscard]] constexpr auto recommended_sources(ComplexityLevel level) noexcept -> std::size_t
{
    return static_cast<std::size_t>(level) + 1U;
}

/**
 * @brief label used in logs ("simple", "moderate", "complex", "very_complex")
 */
[[nodiscard]] constexpr auto to_string(ComplexityLevel level) noexcept -> std::string_view
{
    switch (level)
    {
    case ComplexityLevel::Simple:
        return "simple";
    case ComplexityLevel::Moderate:
        return "moderate";
    case ComplexityLevel::Complex:
        return "complex";
    case ComplexityLevel::VeryComplex:
        return "very_complex";
    }
    return "unknown";
}

/**
 * @brief analyzes mesh geometry in one pass over the nodes
 *
 * ✨ PURE FUNCTION ✨
 *
 * @param[in] mesh mesh to inspect (only nodes + element count are read)
 * @return ComplexityReport, or ErrorCode::EmptyMesh when the mesh has no nodes
 *
 * @complexity O(n) time, O(1) extra space
 */
[[nodiscard]] auto analyze(const mesh::Mesh &mesh) -> Result<ComplexityReport>;

} // namespace psf::analysis

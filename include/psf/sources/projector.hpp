/**
 * @file projector.hpp
 * @brief snaps planned source coordinates onto mesh nodes
 *
 * point sources only make sense on a degree of freedom, so each candidate
 * coordinate is replaced by the index of the nearest node (squared Euclidean
 * distance, brute force, ties → lowest index). charges pass through untouched
 * and in order. two candidates may land on the same node; the solver sums
 * them.
 *
 * @author LukeFrankio
 * @date 2026-10-19
 * @version 1.0
 */
#pragma once

#include <cstdint>
#include <vector>

#include "psf/common/error.hpp"
#include "psf/common/math.hpp"
#include "psf/mesh/mesh.hpp"
#include "psf/sources/planner.hpp"

namespace psf::sources
{

/**
 * @brief source pinned to a mesh node
 */
struct ProjectedSource
{
    std::uint32_t node{};   ///< index into Mesh::nodes
    double        charge{}; ///< signed magnitude (copied from the plan)
};

using ProjectedSources = std::vector<ProjectedSource>;

/**
 * @brief index of the node closest to `point`
 *
 * ✨ PURE FUNCTION ✨
 *
 * @return node index, or ErrorCode::EmptyMesh for an empty node list
 *
 * @complexity O(n) time, O(1) space
 */
[[nodiscard]] auto nearest_node(const std::vector<common::Vec3> &nodes, const common::Vec3 &point)
    -> Result<std::uint32_t>;

/**
 * @brief projects every planned source onto its nearest node
 *
 * ✨ PURE FUNCTION ✨
 *
 * @complexity O(sources × nodes) time
 */
[[nodiscard]] auto project_sources(const mesh::Mesh &mesh, const SourcePlan &plan) -> Result<ProjectedSources>;

} // namespace psf::sources

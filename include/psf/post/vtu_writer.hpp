/**
 * @file vtu_writer.hpp
 * @brief binary VTU exporter for the nodal potential + source markers uwu
 */
#pragma once

#include <expected>
#include <filesystem>
#include <string>
#include <vector>

#include "psf/mesh/mesh.hpp"
#include "psf/sources/projector.hpp"

namespace psf::post
{

/**
 * @brief contextual error payload for VTU export mishaps
 */
struct VtuError
{
    std::string              message; ///< spicy human-readable reason
    std::vector<std::string> context; ///< breadcrumbs (path, stage, etc.)
};

/**
 * @brief deterministic binary VTU dump (appended raw, UInt32 headers)
 *
 * ⚠️ IMPURE FUNCTION ⚠️ (touches the filesystem)
 *
 * exported fields:
 * - PointData: potential (Float64), source_charge (Float64, summed charge per
 *   node, zero elsewhere), boundary_node (UInt8, 1 on Dirichlet nodes)
 * - CellData: element_volume (Float64)
 * - Geometry: node positions (Float64) and VTK_TETRA connectivity
 *
 * @param[in] path output `.vtu` path (parent directories auto-created)
 * @param[in] mesh mesh the potential lives on
 * @param[in] potential one value per node
 * @param[in] sources projected sources used by the solve
 * @return success or contextual failure (size mismatch, I/O)
 */
[[nodiscard]] auto write_vtu(const std::filesystem::path &path, const mesh::Mesh &mesh,
                             const std::vector<double> &potential, const sources::ProjectedSources &sources)
    -> std::expected<void, VtuError>;

} // namespace psf::post

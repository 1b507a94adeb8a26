/**
 * @file vtk_reader.hpp
 * @brief legacy ASCII VTK ingestion for tetra meshes uwu
 *
 * parses `# vtk DataFile Version` ASCII files with an UNSTRUCTURED_GRID
 * dataset into the flat psf::mesh::Mesh. both cell layouts are understood:
 * the classic `CELLS n size` list (versions 2.0 - 4.2) and the 5.1
 * OFFSETS/CONNECTIVITY pair.
 *
 * cell handling:
 * - VTK_TETRA (10) → element
 * - VTK_QUADRATIC_TETRA (24) → element from the four corner nodes
 * - VTK_TRIANGLE (5) / VTK_QUADRATIC_TRIANGLE (22) → boundary facet
 * - anything else is skipped
 *
 * nodes not referenced by any tetrahedron (quadratic midside nodes, stray
 * vertex points) are compacted away so every remaining node is a real
 * degree of freedom. when the file carries no triangles the boundary is
 * derived from tet topology via extract_boundary_facets.
 *
 * @author LukeFrankio
 * @date 2026-10-19
 * @version 1.0
 *
 * example (basic usage):
 * @code
 * auto mesh_result = psf::mesh::load_vtk_file("data/sphere.vtk");
 * if (!mesh_result) {
 *     fmt::print(stderr, "mesh error: {}\n", mesh_result.error().message);
 *     return;
 * }
 * const auto &mesh = *mesh_result;
 * @endcode
 */
#pragma once

#include <expected>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include "psf/mesh/mesh.hpp"

namespace psf::mesh
{

/**
 * @brief mesh loader error payload with spicy breadcrumbs
 */
struct MeshError
{
    std::string              message; ///< human-friendly vibe check for what failed
    std::vector<std::string> context; ///< structured breadcrumbs (e.g., "CELLS", "[12]")
};

/**
 * @brief result alias for the VTK loader (std::expected wrapper)
 */
using MeshResult = std::expected<Mesh, MeshError>;

/**
 * @brief reads a legacy ASCII VTK file from disk
 *
 * ⚠️ IMPURE FUNCTION (file I/O)
 *
 * @param[in] path filesystem path to a .vtk file
 * @return MeshResult containing the mesh or a MeshError with context
 */
[[nodiscard]] auto load_vtk_file(const std::filesystem::path &path) -> MeshResult;

/**
 * @brief parses already buffered legacy VTK contents (tests/tooling)
 *
 * @param[in] ascii_contents full text of a legacy VTK file
 * @return MeshResult analogous to load_vtk_file
 */
[[nodiscard]] auto load_vtk_from_string(std::string_view ascii_contents) -> MeshResult;

} // namespace psf::mesh

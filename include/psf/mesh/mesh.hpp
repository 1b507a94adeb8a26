/**
 * @file mesh.hpp
 * @brief flat tetra mesh data model + boundary helpers that keep FEM zen
 *
 * this header defines the in-memory mesh the potential solver consumes:
 * contiguous node coordinates (identity = index), linear tetrahedra that only
 * ever reference node indices, and triangular boundary facets used for the
 * Dirichlet condition. arena-of-nodes + index-based elements means no
 * ownership cycles and cache-friendly sweeps during assembly and nearest-node
 * search.
 *
 * loaders (see vtk_reader.hpp) fill this struct; the core treats it as
 * immutable for the duration of a solve.
 *
 * @author LukeFrankio
 * @date 2026-10-19
 * @version 1.0
 *
 * example (basic usage):
 * @code
 * using namespace psf::mesh;
 * Mesh mesh{};
 * mesh.nodes = {{0.0, 0.0, 0.0}, {1.0, 0.0, 0.0}, {0.0, 1.0, 0.0}, {0.0, 0.0, 1.0}};
 * mesh.elements.push_back(Element{{0U, 1U, 2U, 3U}, 0U});
 * mesh.boundary_facets = extract_boundary_facets(mesh);
 * // four faces, all on the boundary uwu
 * @endcode
 */
#pragma once

#include <array>
#include <cstdint>
#include <vector>

#include "psf/common/math.hpp"

namespace psf::mesh
{

/**
 * @brief linear tetrahedron referencing four node indices
 */
struct Element
{
    std::array<std::uint32_t, 4> nodes{}; ///< indices into Mesh::nodes
    std::uint32_t                 tag{};  ///< region/cell tag from the source file (0 if none)
};

/**
 * @brief triangular boundary facet (Dirichlet surface piece)
 */
struct Facet
{
    std::array<std::uint32_t, 3> nodes{}; ///< indices into Mesh::nodes
    std::uint32_t                tag{};   ///< boundary tag (0 if untagged)
};

/**
 * @brief compact index-addressable mesh representation
 */
struct Mesh
{
    std::vector<common::Vec3> nodes;           ///< xyz per node, identity = index
    std::vector<Element>      elements;        ///< tetrahedra
    std::vector<Facet>        boundary_facets; ///< boundary triangles (may be empty)
};

/**
 * @brief derives boundary facets from tetrahedral topology
 *
 * ✨ PURE FUNCTION ✨
 *
 * every tet contributes four faces; a face referenced by exactly one tet sits
 * on the boundary. faces are keyed by their sorted node triple so orientation
 * does not matter. returned facets keep the node order of the first tet that
 * produced them and follow first-appearance order, so the output is
 * deterministic for a given element list.
 *
 * @param[in] mesh mesh whose elements are scanned (boundary_facets ignored)
 * @return boundary facets (empty when the mesh has no elements)
 *
 * @complexity O(E) expected time for the face hashing plus a sort of the
 *             boundary faces, O(E) space
 */
[[nodiscard]] auto extract_boundary_facets(const Mesh &mesh) -> std::vector<Facet>;

/**
 * @brief sorted unique node indices touched by mesh.boundary_facets
 *
 * ✨ PURE FUNCTION ✨
 */
[[nodiscard]] auto boundary_nodes(const Mesh &mesh) -> std::vector<std::uint32_t>;

} // namespace psf::mesh

/**
 * @file preprocess.hpp
 * @brief mesh preprocessing sorcery: volumes, P1 gradients, adjacency uwu
 *
 * this header turns the raw psf::mesh::Mesh into the per-element geometry the
 * stiffness assembly needs. it computes tetrahedral volumes, constant shape
 * function gradients, and node-element adjacency (CSR layout) so the sparsity
 * pattern can be built without another pass over the elements.
 *
 * bad node references, duplicate nodes/elements and degenerate tetrahedra are
 * rejected here with ErrorCode::InvalidMesh so the solver never sees them.
 *
 * @author LukeFrankio
 * @date 2026-10-19
 * @version 1.0
 */
#pragma once

#include <array>
#include <cstdint>
#include <vector>

#include "psf/common/error.hpp"
#include "psf/common/math.hpp"
#include "psf/mesh/mesh.hpp"

namespace psf::mesh::pre {

/**
 * @brief CSR-style node adjacency (node → incident elements)
 */
struct NodeAdjacency {
    std::vector<std::uint32_t> offsets;          ///< size = nodes + 1
    std::vector<std::uint32_t> element_indices;  ///< flattened element indices per node
};

/**
 * @brief bundle of geometric preprocessing outputs
 */
struct Outputs {
    NodeAdjacency adjacency;                                  ///< node-element incidence
    std::vector<double> element_volumes;                      ///< |volume| per element
    std::vector<std::array<common::Vec3, 4>> shape_gradients; ///< grad Ni per element (constant on P1 tets)
};

/**
 * @brief preprocess mesh to obtain volumes + gradients + adjacency
 *
 * ⚠️ IMPURE FUNCTION (depends on numeric stability of the input geometry)
 *
 * @param[in] mesh parsed mesh (see vtk_reader.hpp)
 * @return Outputs or an InvalidMesh/EmptyMesh Error with element breadcrumbs
 */
[[nodiscard]] auto run(const mesh::Mesh &mesh) -> Result<Outputs>;

}  // namespace psf::mesh::pre

/**
 * @file poisson.hpp
 * @brief P1 Poisson assembly + Dirichlet-reduced direct solve uwu
 *
 * solves  -Δφ = Σ q_s δ(x - x_s)  on the mesh with φ = g on every boundary
 * facet node. the stiffness K_ij = Σ_e V_e ∇N_i·∇N_j depends on geometry
 * only, so it lives in a StiffnessOperator that is built once and shared
 * read-only across any number of solves.
 *
 * the boundary value g is uniform, and constants are in the kernel of K, so
 * the solver works on u = φ - g: K_ff u_f = b_f with u = 0 on the boundary.
 * a zero load therefore yields φ ≡ g exactly, and flipping every charge flips
 * u bit for bit.
 *
 * @author LukeFrankio
 * @date 2026-10-19
 * @version 1.0
 *
 * example (basic usage):
 * @code
 * auto op       = psf::physics::build_stiffness(mesh);
 * auto solution = psf::physics::solve_poisson(*op, mesh, projected, {});
 * if (solution) {
 *     fmt::print("residual {:.3e}\n", solution->residual_norm);
 * }
 * @endcode
 */
#pragma once

#include <cstddef>
#include <vector>

#include "psf/common/error.hpp"
#include "psf/mesh/mesh.hpp"
#include "psf/physics/sparse.hpp"
#include "psf/sources/projector.hpp"

namespace psf::physics
{

/**
 * @brief cached geometry-only stiffness matrix (never mutated after build)
 */
struct StiffnessOperator
{
    sparse::CsrMatrix   matrix;          ///< full K over all mesh nodes
    std::vector<double> element_volumes; ///< |V_e| per element
    double              total_volume{};  ///< Σ |V_e| (exact tetra volume)
};

/**
 * @brief boundary condition: φ = value on every boundary facet node
 */
struct DirichletSpec
{
    double value{0.0};
};

/**
 * @brief solver knobs
 */
struct SolverOptions
{
    DirichletSpec dirichlet{};
    double        pivot_tolerance{1.0e-10}; ///< relative Cholesky pivot floor
};

/**
 * @brief potential field + solve diagnostics
 */
struct PotentialSolution
{
    std::vector<double> field;           ///< φ per mesh node
    double              residual_norm{}; ///< ||K_ff u_f - b_f||₂ of the reduced system
    std::size_t         free_nodes{};
    std::size_t         boundary_nodes{};
};

/**
 * @brief assembles the P1 stiffness operator
 *
 * ⚠️ IMPURE FUNCTION (logs assembly stats)
 *
 * @return operator, or the InvalidMesh/EmptyMesh error from preprocessing
 */
[[nodiscard]] auto build_stiffness(const mesh::Mesh &mesh) -> Result<StiffnessOperator>;

/**
 * @brief concentrated load vector, summed in ProjectedSources order
 *
 * ✨ PURE FUNCTION ✨
 *
 * @return b with b[node] = Σ charges projected onto node, or
 *         ErrorCode::MismatchedInput for a node outside [0, node_count)
 */
[[nodiscard]] auto assemble_load(std::size_t node_count, const sources::ProjectedSources &projected)
    -> Result<std::vector<double>>;

/**
 * @brief solves for the nodal potential
 *
 * @param[in] op stiffness operator built from the same mesh
 * @param[in] mesh mesh providing the boundary facets
 * @param[in] projected sources pinned to nodes
 * @param[in] options Dirichlet value + pivot tolerance
 * @return solution, ErrorCode::NoBoundaryNodes or ErrorCode::SingularSystem
 */
[[nodiscard]] auto solve_poisson(const StiffnessOperator &op, const mesh::Mesh &mesh,
                                 const sources::ProjectedSources &projected, const SolverOptions &options)
    -> Result<PotentialSolution>;

} // namespace psf::physics

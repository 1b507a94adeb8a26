/**
 * @file sparse.hpp
 * @brief CSR storage, RCM ordering and envelope Cholesky for SPD systems uwu
 *
 * the Dirichlet-reduced Laplacian is symmetric positive definite, so one
 * direct factorization is all the solver needs. the pipeline is:
 *
 * 1. reverse_cuthill_mckee() shrinks the bandwidth of the CSR graph
 * 2. factorize() builds a row-oriented envelope (skyline) Cholesky factor of
 *    P A Pᵀ; only entries between each row's first nonzero and the diagonal
 *    are stored, and fill never escapes that envelope
 * 3. solve() runs forward/back substitution and undoes the permutation
 *
 * a pivot that is not larger than pivot_tolerance × max|diag| means the
 * matrix is singular (floating component, orphan node) and is reported as
 * ErrorCode::SingularSystem instead of producing garbage.
 *
 * @author LukeFrankio
 * @date 2026-10-19
 * @version 1.0
 *
 * example (basic usage):
 * @code
 * auto perm   = psf::physics::sparse::reverse_cuthill_mckee(matrix);
 * auto factor = psf::physics::sparse::factorize(matrix, perm, 1.0e-10);
 * if (factor) {
 *     auto x = psf::physics::sparse::solve(*factor, rhs);
 * }
 * @endcode
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "psf/common/error.hpp"

namespace psf::physics::sparse
{

/**
 * @brief compressed sparse row matrix (square, columns sorted per row)
 */
struct CsrMatrix
{
    std::size_t                dimension{};
    std::vector<std::uint32_t> row_ptr; ///< size = dimension + 1
    std::vector<std::uint32_t> col_idx; ///< column per stored entry
    std::vector<double>        values;  ///< value per stored entry
};

/**
 * @brief envelope Cholesky factor L (A = P ᵀ L Lᵀ P)
 */
struct EnvelopeFactor
{
    std::size_t                dimension{};
    std::vector<std::uint32_t> permutation;  ///< permutation[new] = old
    std::vector<std::uint32_t> first_column; ///< first stored column per row (new numbering)
    std::vector<std::size_t>   row_start;    ///< offset of each row in values, size = dimension + 1
    std::vector<double>        values;       ///< row i holds L(i, first_column[i] .. i)
};

/**
 * @brief y = A x
 *
 * ✨ PURE FUNCTION ✨
 */
[[nodiscard]] auto multiply(const CsrMatrix &matrix, const std::vector<double> &x) -> std::vector<double>;

/**
 * @brief diagonal entries (zero where a row stores no diagonal)
 */
[[nodiscard]] auto diagonal(const CsrMatrix &matrix) -> std::vector<double>;

/**
 * @brief reverse Cuthill-McKee ordering of the matrix graph
 *
 * ✨ PURE FUNCTION ✨
 *
 * every connected component is visited from a minimum-degree start node;
 * neighbors are queued by increasing degree (ties: lower index).
 *
 * @return permutation with permutation[new] = old
 */
[[nodiscard]] auto reverse_cuthill_mckee(const CsrMatrix &matrix) -> std::vector<std::uint32_t>;

/**
 * @brief envelope size (stored entries of L) for a given ordering
 */
[[nodiscard]] auto envelope_size(const CsrMatrix &matrix, const std::vector<std::uint32_t> &permutation)
    -> std::size_t;

/**
 * @brief Cholesky factorization of P A Pᵀ in envelope storage
 *
 * @param[in] matrix symmetric matrix (both triangles stored)
 * @param[in] permutation ordering from reverse_cuthill_mckee (or identity)
 * @param[in] pivot_tolerance relative pivot floor
 * @return factor, or ErrorCode::SingularSystem naming the offending row
 *
 * @complexity O(Σ envelope_row²) time, O(envelope) space
 */
[[nodiscard]] auto factorize(const CsrMatrix &matrix, const std::vector<std::uint32_t> &permutation,
                             double pivot_tolerance) -> Result<EnvelopeFactor>;

/**
 * @brief solves A x = rhs with a finished factor
 *
 * ✨ PURE FUNCTION ✨
 */
[[nodiscard]] auto solve(const EnvelopeFactor &factor, const std::vector<double> &rhs) -> std::vector<double>;

} // namespace psf::physics::sparse

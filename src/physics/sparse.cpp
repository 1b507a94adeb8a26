/**
 * @file sparse.cpp
 * @brief CSR helpers, RCM ordering, envelope Cholesky kernels
 */
#include "psf/physics/sparse.hpp"

#include <algorithm>
#include <cmath>
#include <deque>
#include <numeric>

#include <fmt/core.h>

namespace psf::physics::sparse
{
namespace
{

[[nodiscard]] auto inverse_permutation(const std::vector<std::uint32_t> &permutation) -> std::vector<std::uint32_t>
{
    std::vector<std::uint32_t> inverse(permutation.size(), 0U);
    for (std::size_t p = 0; p < permutation.size(); ++p)
    {
        inverse[permutation[p]] = static_cast<std::uint32_t>(p);
    }
    return inverse;
}

[[nodiscard]] auto first_columns(const CsrMatrix &matrix, const std::vector<std::uint32_t> &permutation,
                                 const std::vector<std::uint32_t> &inverse) -> std::vector<std::uint32_t>
{
    std::vector<std::uint32_t> first(matrix.dimension, 0U);
    for (std::size_t p = 0; p < matrix.dimension; ++p)
    {
        auto       column = static_cast<std::uint32_t>(p);
        const auto row    = permutation[p];
        for (auto idx = matrix.row_ptr[row]; idx < matrix.row_ptr[row + 1U]; ++idx)
        {
            column = std::min(column, inverse[matrix.col_idx[idx]]);
        }
        first[p] = column;
    }
    return first;
}

} // namespace

auto multiply(const CsrMatrix &matrix, const std::vector<double> &x) -> std::vector<double>
{
    std::vector<double> y(matrix.dimension, 0.0);
    for (std::size_t row = 0; row < matrix.dimension; ++row)
    {
        double sum = 0.0;
        for (auto idx = matrix.row_ptr[row]; idx < matrix.row_ptr[row + 1U]; ++idx)
        {
            sum += matrix.values[idx] * x[matrix.col_idx[idx]];
        }
        y[row] = sum;
    }
    return y;
}

auto diagonal(const CsrMatrix &matrix) -> std::vector<double>
{
    std::vector<double> diag(matrix.dimension, 0.0);
    for (std::size_t row = 0; row < matrix.dimension; ++row)
    {
        for (auto idx = matrix.row_ptr[row]; idx < matrix.row_ptr[row + 1U]; ++idx)
        {
            if (matrix.col_idx[idx] == row)
            {
                diag[row] += matrix.values[idx];
            }
        }
    }
    return diag;
}

auto reverse_cuthill_mckee(const CsrMatrix &matrix) -> std::vector<std::uint32_t>
{
    const auto                 n = matrix.dimension;
    std::vector<std::uint32_t> degree(n, 0U);
    for (std::size_t row = 0; row < n; ++row)
    {
        for (auto idx = matrix.row_ptr[row]; idx < matrix.row_ptr[row + 1U]; ++idx)
        {
            if (matrix.col_idx[idx] != row)
            {
                ++degree[row];
            }
        }
    }

    auto by_degree = [&degree](std::uint32_t lhs, std::uint32_t rhs) {
        return degree[lhs] != degree[rhs] ? degree[lhs] < degree[rhs] : lhs < rhs;
    };

    std::vector<std::uint32_t> nodes(n);
    std::iota(nodes.begin(), nodes.end(), 0U);
    std::sort(nodes.begin(), nodes.end(), by_degree);

    std::vector<bool>          visited(n, false);
    std::vector<std::uint32_t> order;
    order.reserve(n);
    std::deque<std::uint32_t>  queue;
    std::vector<std::uint32_t> neighbors;

    for (const auto start : nodes)
    {
        if (visited[start])
        {
            continue;
        }
        visited[start] = true;
        queue.push_back(start);
        while (!queue.empty())
        {
            const auto current = queue.front();
            queue.pop_front();
            order.push_back(current);

            neighbors.clear();
            for (auto idx = matrix.row_ptr[current]; idx < matrix.row_ptr[current + 1U]; ++idx)
            {
                const auto column = matrix.col_idx[idx];
                if (!visited[column])
                {
                    visited[column] = true;
                    neighbors.push_back(column);
                }
            }
            std::sort(neighbors.begin(), neighbors.end(), by_degree);
            queue.insert(queue.end(), neighbors.begin(), neighbors.end());
        }
    }

    std::reverse(order.begin(), order.end());
    return order;
}

auto envelope_size(const CsrMatrix &matrix, const std::vector<std::uint32_t> &permutation) -> std::size_t
{
    const auto  inverse = inverse_permutation(permutation);
    const auto  first   = first_columns(matrix, permutation, inverse);
    std::size_t total   = 0U;
    for (std::size_t p = 0; p < matrix.dimension; ++p)
    {
        total += p - first[p] + 1U;
    }
    return total;
}

auto factorize(const CsrMatrix &matrix, const std::vector<std::uint32_t> &permutation, double pivot_tolerance)
    -> Result<EnvelopeFactor>
{
    const auto n = matrix.dimension;
    if (permutation.size() != n)
    {
        return make_unexpected(ErrorCode::SingularSystem,
                               fmt::format("permutation has {} entries for a {}x{} matrix", permutation.size(), n, n),
                               {"factorize"});
    }

    EnvelopeFactor factor{};
    factor.dimension    = n;
    factor.permutation  = permutation;
    const auto inverse  = inverse_permutation(permutation);
    factor.first_column = first_columns(matrix, permutation, inverse);
    factor.row_start.resize(n + 1U, 0U);
    for (std::size_t p = 0; p < n; ++p)
    {
        factor.row_start[p + 1U] = factor.row_start[p] + (p - factor.first_column[p] + 1U);
    }
    factor.values.assign(factor.row_start.back(), 0.0);

    double max_diag = 0.0;
    for (std::size_t p = 0; p < n; ++p)
    {
        const auto row = permutation[p];
        for (auto idx = matrix.row_ptr[row]; idx < matrix.row_ptr[row + 1U]; ++idx)
        {
            const auto q = inverse[matrix.col_idx[idx]];
            if (q <= p)
            {
                factor.values[factor.row_start[p] + (q - factor.first_column[p])] += matrix.values[idx];
            }
            if (q == p)
            {
                max_diag = std::max(max_diag, std::abs(matrix.values[idx]));
            }
        }
    }
    const double pivot_floor = pivot_tolerance * max_diag;

    for (std::size_t i = 0; i < n; ++i)
    {
        const std::size_t fi = factor.first_column[i];
        double           *Li = factor.values.data() + factor.row_start[i];
        for (std::size_t j = fi; j < i; ++j)
        {
            const std::size_t fj = factor.first_column[j];
            const double     *Lj = factor.values.data() + factor.row_start[j];
            double            sum = Li[j - fi];
            for (std::size_t k = std::max(fi, fj); k < j; ++k)
            {
                sum -= Li[k - fi] * Lj[k - fj];
            }
            Li[j - fi] = sum / Lj[j - fj];
        }
        double pivot = Li[i - fi];
        for (std::size_t k = fi; k < i; ++k)
        {
            pivot -= Li[k - fi] * Li[k - fi];
        }
        if (!(pivot > pivot_floor))
        {
            return make_unexpected(ErrorCode::SingularSystem,
                                   fmt::format("non-positive pivot {:.3e} (floor {:.3e})", pivot, pivot_floor),
                                   {"factorize", fmt::format("row[{}]", permutation[i])});
        }
        Li[i - fi] = std::sqrt(pivot);
    }
    return factor;
}

auto solve(const EnvelopeFactor &factor, const std::vector<double> &rhs) -> std::vector<double>
{
    const auto          n = factor.dimension;
    std::vector<double> y(n, 0.0);
    for (std::size_t p = 0; p < n; ++p)
    {
        y[p] = rhs[factor.permutation[p]];
    }

    // L z = P b
    for (std::size_t i = 0; i < n; ++i)
    {
        const std::size_t fi  = factor.first_column[i];
        const double     *Li  = factor.values.data() + factor.row_start[i];
        double            sum = y[i];
        for (std::size_t k = fi; k < i; ++k)
        {
            sum -= Li[k - fi] * y[k];
        }
        y[i] = sum / Li[i - fi];
    }

    // Lᵀ w = z, column sweep over the stored rows
    for (std::size_t i = n; i-- > 0U;)
    {
        const std::size_t fi = factor.first_column[i];
        const double     *Li = factor.values.data() + factor.row_start[i];
        y[i] /= Li[i - fi];
        for (std::size_t k = fi; k < i; ++k)
        {
            y[k] -= Li[k - fi] * y[i];
        }
    }

    std::vector<double> x(n, 0.0);
    for (std::size_t p = 0; p < n; ++p)
    {
        x[factor.permutation[p]] = y[p];
    }
    return x;
}

} // namespace psf::physics::sparse

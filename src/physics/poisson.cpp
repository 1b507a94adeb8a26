/**
 * @file poisson.cpp
 * @brief CSR stiffness assembly, Dirichlet reduction, direct solve
 */
#include "psf/physics/poisson.hpp"

#include <algorithm>
#include <charconv>
#include <cmath>
#include <limits>
#include <numeric>

#include <fmt/core.h>

#include "psf/common/log.hpp"
#include "psf/mesh/preprocess.hpp"

namespace psf::physics
{
namespace
{

constexpr std::string_view kLogTag = "physics";
constexpr std::uint32_t    kFixed  = std::numeric_limits<std::uint32_t>::max();

// sparsity pattern from node → element adjacency; every row keeps its diagonal
[[nodiscard]] auto build_pattern(const mesh::Mesh &mesh, const mesh::pre::NodeAdjacency &adjacency)
    -> sparse::CsrMatrix
{
    sparse::CsrMatrix matrix{};
    matrix.dimension = mesh.nodes.size();
    matrix.row_ptr.assign(matrix.dimension + 1U, 0U);

    std::vector<std::uint32_t> columns;
    for (std::size_t node = 0; node < matrix.dimension; ++node)
    {
        columns.clear();
        columns.push_back(static_cast<std::uint32_t>(node));
        for (auto slot = adjacency.offsets[node]; slot < adjacency.offsets[node + 1U]; ++slot)
        {
            const auto &element = mesh.elements[adjacency.element_indices[slot]];
            columns.insert(columns.end(), element.nodes.begin(), element.nodes.end());
        }
        std::sort(columns.begin(), columns.end());
        columns.erase(std::unique(columns.begin(), columns.end()), columns.end());
        matrix.col_idx.insert(matrix.col_idx.end(), columns.begin(), columns.end());
        matrix.row_ptr[node + 1U] = static_cast<std::uint32_t>(matrix.col_idx.size());
    }
    matrix.values.assign(matrix.col_idx.size(), 0.0);
    return matrix;
}

[[nodiscard]] auto entry_index(const sparse::CsrMatrix &matrix, std::uint32_t row, std::uint32_t col) -> std::size_t
{
    const auto begin = matrix.col_idx.begin() + matrix.row_ptr[row];
    const auto end   = matrix.col_idx.begin() + matrix.row_ptr[row + 1U];
    return static_cast<std::size_t>(std::lower_bound(begin, end, col) - matrix.col_idx.begin());
}

// K_ff restricted to free nodes, renumbered through free_index
[[nodiscard]] auto reduce(const sparse::CsrMatrix &full, const std::vector<std::uint32_t> &free_nodes,
                          const std::vector<std::uint32_t> &free_index) -> sparse::CsrMatrix
{
    sparse::CsrMatrix reduced{};
    reduced.dimension = free_nodes.size();
    reduced.row_ptr.assign(reduced.dimension + 1U, 0U);
    for (std::size_t r = 0; r < free_nodes.size(); ++r)
    {
        const auto row = free_nodes[r];
        for (auto idx = full.row_ptr[row]; idx < full.row_ptr[row + 1U]; ++idx)
        {
            const auto mapped = free_index[full.col_idx[idx]];
            if (mapped == kFixed)
            {
                continue;
            }
            reduced.col_idx.push_back(mapped);
            reduced.values.push_back(full.values[idx]);
        }
        reduced.row_ptr[r + 1U] = static_cast<std::uint32_t>(reduced.col_idx.size());
    }
    return reduced;
}

} // namespace

auto build_stiffness(const mesh::Mesh &mesh) -> Result<StiffnessOperator>
{
    auto pre = mesh::pre::run(mesh);
    if (!pre)
    {
        auto error = pre.error();
        error.context.insert(error.context.begin(), "stiffness");
        return std::unexpected(std::move(error));
    }

    StiffnessOperator op{};
    op.matrix          = build_pattern(mesh, pre->adjacency);
    op.element_volumes = std::move(pre->element_volumes);

    for (std::size_t elem_index = 0; elem_index < mesh.elements.size(); ++elem_index)
    {
        const auto &element   = mesh.elements[elem_index];
        const auto &gradients = pre->shape_gradients[elem_index];
        const auto  volume    = op.element_volumes[elem_index];
        for (std::size_t a = 0; a < 4U; ++a)
        {
            for (std::size_t b = 0; b < 4U; ++b)
            {
                const auto idx = entry_index(op.matrix, element.nodes[a], element.nodes[b]);
                op.matrix.values[idx] += volume * common::dot(gradients[a], gradients[b]);
            }
        }
    }
    op.total_volume = std::accumulate(op.element_volumes.begin(), op.element_volumes.end(), 0.0);

    log::debug(kLogTag, "assembled stiffness: {} nodes, {} nonzeros, volume {:.6g}", op.matrix.dimension,
               op.matrix.values.size(), op.total_volume);
    return op;
}

auto assemble_load(std::size_t node_count, const sources::ProjectedSources &projected)
    -> Result<std::vector<double>>
{
    std::vector<double> load(node_count, 0.0);
    for (std::size_t i = 0; i < projected.size(); ++i)
    {
        const auto &source = projected[i];
        if (source.node >= node_count)
        {
            return make_unexpected(ErrorCode::MismatchedInput,
                                   fmt::format("source node {} outside mesh with {} nodes", source.node, node_count),
                                   {"sources", fmt::format("[{}]", i)});
        }
        load[source.node] += source.charge;
    }
    return load;
}

auto solve_poisson(const StiffnessOperator &op, const mesh::Mesh &mesh, const sources::ProjectedSources &projected,
                   const SolverOptions &options) -> Result<PotentialSolution>
{
    const auto node_count = op.matrix.dimension;
    if (node_count != mesh.nodes.size())
    {
        return make_unexpected(ErrorCode::InvalidMesh,
                               fmt::format("stiffness operator has {} rows but mesh has {} nodes", node_count,
                                           mesh.nodes.size()),
                               {"solver"});
    }

    const auto fixed = mesh::boundary_nodes(mesh);
    if (fixed.empty())
    {
        return make_unexpected(ErrorCode::NoBoundaryNodes,
                               "mesh has no boundary facets, Dirichlet condition cannot be imposed",
                               {"solver", "boundary_facets"});
    }
    if (fixed.back() >= node_count)
    {
        return make_unexpected(ErrorCode::InvalidMesh,
                               fmt::format("boundary facet references node {} out of range", fixed.back()),
                               {"solver", "boundary_facets"});
    }

    auto load = assemble_load(node_count, projected);
    if (!load)
    {
        return std::unexpected(load.error());
    }

    std::vector<std::uint32_t> free_index(node_count, 0U);
    for (const auto node : fixed)
    {
        free_index[node] = kFixed;
    }
    std::vector<std::uint32_t> free_nodes;
    free_nodes.reserve(node_count - fixed.size());
    for (std::size_t node = 0; node < node_count; ++node)
    {
        if (free_index[node] != kFixed)
        {
            free_index[node] = static_cast<std::uint32_t>(free_nodes.size());
            free_nodes.push_back(static_cast<std::uint32_t>(node));
        }
    }

    std::size_t dropped = 0U;
    for (const auto &source : projected)
    {
        if (free_index[source.node] == kFixed)
        {
            ++dropped;
        }
    }
    if (dropped > 0U)
    {
        log::warn(kLogTag, "{} source(s) landed on boundary nodes, their charge is overridden by the Dirichlet value",
                  dropped);
    }

    PotentialSolution solution{};
    solution.free_nodes     = free_nodes.size();
    solution.boundary_nodes = fixed.size();
    solution.field.assign(node_count, options.dirichlet.value);
    if (free_nodes.empty())
    {
        return solution;
    }

    const auto          reduced = reduce(op.matrix, free_nodes, free_index);
    std::vector<double> rhs(free_nodes.size(), 0.0);
    for (std::size_t r = 0; r < free_nodes.size(); ++r)
    {
        rhs[r] = (*load)[free_nodes[r]];
    }

    const auto permutation = sparse::reverse_cuthill_mckee(reduced);
    log::debug(kLogTag, "reduced system {}x{}, envelope {} entries after RCM", reduced.dimension,
               reduced.dimension, sparse::envelope_size(reduced, permutation));

    auto factor = sparse::factorize(reduced, permutation, options.pivot_tolerance);
    if (!factor)
    {
        auto error = factor.error();
        error.message = fmt::format("stiffness matrix is singular after boundary elimination: {}", error.message);
        // translate the reduced row back to a mesh node id
        if (!error.context.empty() && error.context.back().starts_with("row["))
        {
            const auto &label       = error.context.back();
            std::size_t reduced_row = 0U;
            const auto  parsed      = std::from_chars(label.data() + 4, label.data() + label.size(), reduced_row);
            if (parsed.ec == std::errc{} && reduced_row < free_nodes.size())
            {
                error.context.back() = fmt::format("node[{}]", free_nodes[reduced_row]);
            }
        }
        error.context.insert(error.context.begin(), "solver");
        return std::unexpected(std::move(error));
    }

    const auto deviation = sparse::solve(*factor, rhs);
    auto       residual  = sparse::multiply(reduced, deviation);
    double     norm_sq   = 0.0;
    for (std::size_t r = 0; r < residual.size(); ++r)
    {
        const double diff = residual[r] - rhs[r];
        norm_sq += diff * diff;
    }
    solution.residual_norm = std::sqrt(norm_sq);

    for (std::size_t r = 0; r < free_nodes.size(); ++r)
    {
        solution.field[free_nodes[r]] = options.dirichlet.value + deviation[r];
    }
    log::debug(kLogTag, "solved {} free nodes, residual {:.3e}", free_nodes.size(), solution.residual_norm);
    return solution;
}

} // namespace psf::physics

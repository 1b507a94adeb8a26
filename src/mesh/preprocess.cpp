/**
 * @file preprocess.cpp
 * @brief CPU preprocessing pipeline: volumes, gradients, adjacency uwu
 */
#include "psf/mesh/preprocess.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <unordered_map>

#include <fmt/core.h>

namespace psf::mesh::pre
{
namespace
{

using common::Vec3;

[[nodiscard]] auto make_error(ErrorCode code, std::string message, std::vector<std::string> ctx)
    -> Result<Outputs>
{
    return make_unexpected(code, std::move(message), std::move(ctx));
}

[[nodiscard]] auto check_duplicate_elements(const mesh::Mesh &mesh) -> Result<void>
{
    std::unordered_map<std::uint64_t, std::vector<std::size_t>> conn_hash_to_indices;

    auto sorted_nodes = [&mesh](std::size_t index) {
        auto nodes = mesh.elements[index].nodes;
        std::sort(nodes.begin(), nodes.end());
        return nodes;
    };

    for (std::size_t i = 0; i < mesh.elements.size(); ++i)
    {
        std::uint64_t hash = 0;
        for (const auto node : sorted_nodes(i))
        {
            hash ^= (static_cast<std::uint64_t>(node) * 2654435761ULL);
        }
        conn_hash_to_indices[hash].push_back(i);
    }

    for (const auto &[hash, indices] : conn_hash_to_indices)
    {
        for (std::size_t i = 0; i < indices.size(); ++i)
        {
            for (std::size_t j = i + 1; j < indices.size(); ++j)
            {
                if (sorted_nodes(indices[i]) == sorted_nodes(indices[j]))
                {
                    const auto first  = std::min(indices[i], indices[j]);
                    const auto second = std::max(indices[i], indices[j]);
                    return make_unexpected(
                        ErrorCode::InvalidMesh,
                        fmt::format("duplicate elements detected: element {} and element {} have same connectivity",
                                    first, second),
                        {"mesh", "elements"});
                }
            }
        }
    }
    return {};
}

[[nodiscard]] auto compute_tet_gradients(const std::array<Vec3, 4> &positions, double volume6)
    -> std::array<Vec3, 4>
{
    const Vec3  &p0   = positions[0];
    const Vec3  &p1   = positions[1];
    const Vec3  &p2   = positions[2];
    const Vec3  &p3   = positions[3];
    const double inv6 = -1.0 / volume6;
    return {common::scale(common::cross(common::subtract(p2, p1), common::subtract(p3, p1)), inv6),
            common::scale(common::cross(common::subtract(p3, p0), common::subtract(p2, p0)), inv6),
            common::scale(common::cross(common::subtract(p1, p0), common::subtract(p3, p0)), inv6),
            common::scale(common::cross(common::subtract(p2, p0), common::subtract(p1, p0)), inv6)};
}

} // namespace

auto run(const mesh::Mesh &mesh) -> Result<Outputs>
{
    if (mesh.nodes.empty())
    {
        return make_error(ErrorCode::EmptyMesh, "mesh has zero nodes", {"mesh"});
    }
    if (mesh.elements.empty())
    {
        return make_error(ErrorCode::InvalidMesh, "mesh has zero elements", {"mesh"});
    }

    Outputs outputs{};
    outputs.element_volumes.resize(mesh.elements.size());
    outputs.shape_gradients.resize(mesh.elements.size());

    std::vector<std::uint32_t> incident_counts(mesh.nodes.size(), 0U);

    // characteristic length^3 so the degeneracy check does not depend on units
    double max_extent = 0.0;
    for (std::size_t axis = 0; axis < 3; ++axis)
    {
        const auto [lo, hi] = std::minmax_element(mesh.nodes.begin(), mesh.nodes.end(),
                                                  [axis](const Vec3 &a, const Vec3 &b) { return a[axis] < b[axis]; });
        max_extent = std::max(max_extent, (*hi)[axis] - (*lo)[axis]);
    }
    const double volume_floor = std::numeric_limits<double>::epsilon() * max_extent * max_extent * max_extent;

    for (std::size_t elem_index = 0; elem_index < mesh.elements.size(); ++elem_index)
    {
        const auto         &element = mesh.elements[elem_index];
        std::array<Vec3, 4> positions{};
        for (std::size_t local = 0; local < 4; ++local)
        {
            const auto node_idx = element.nodes[local];
            if (node_idx >= mesh.nodes.size())
            {
                return make_error(ErrorCode::InvalidMesh,
                                  fmt::format("element references node {} out of range", node_idx),
                                  {"elements", fmt::format("[{}]", elem_index)});
            }
            positions[local] = mesh.nodes[node_idx];
            ++incident_counts[node_idx];
        }
        const Vec3   e0      = common::subtract(positions[1], positions[0]);
        const Vec3   e1      = common::subtract(positions[2], positions[0]);
        const Vec3   e2      = common::subtract(positions[3], positions[0]);
        const double volume6 = common::dot(e0, common::cross(e1, e2));
        const double volume  = std::abs(volume6) / 6.0;
        if (!std::isfinite(volume) || volume <= volume_floor)
        {
            return make_error(ErrorCode::InvalidMesh, "tetrahedron volume non-positive",
                              {"elements", fmt::format("[{}]", elem_index)});
        }
        outputs.element_volumes[elem_index] = volume;
        outputs.shape_gradients[elem_index] = compute_tet_gradients(positions, volume6);
    }

    if (auto dup_elems = check_duplicate_elements(mesh); !dup_elems)
    {
        return std::unexpected(dup_elems.error());
    }

    outputs.adjacency.offsets.resize(mesh.nodes.size() + 1U, 0U);
    std::uint32_t accumulator = 0U;
    for (std::size_t node = 0; node < mesh.nodes.size(); ++node)
    {
        outputs.adjacency.offsets[node] = accumulator;
        accumulator += incident_counts[node];
    }
    outputs.adjacency.offsets.back() = accumulator;
    outputs.adjacency.element_indices.resize(accumulator, 0U);

    std::vector<std::uint32_t> cursor(mesh.nodes.size(), 0U);
    for (std::size_t elem_index = 0; elem_index < mesh.elements.size(); ++elem_index)
    {
        const auto &element = mesh.elements[elem_index];
        for (std::size_t local = 0; local < 4; ++local)
        {
            const auto node_index = element.nodes[local];
            const auto write_base = outputs.adjacency.offsets[node_index] + cursor[node_index];
            outputs.adjacency.element_indices[write_base] = static_cast<std::uint32_t>(elem_index);
            ++cursor[node_index];
        }
    }

    return outputs;
}

} // namespace psf::mesh::pre

/**
 * @file projector.cpp
 * @brief brute-force nearest node search
 */
#include "psf/sources/projector.hpp"

#include <limits>

#include <fmt/core.h>

namespace psf::sources
{

auto nearest_node(const std::vector<common::Vec3> &nodes, const common::Vec3 &point) -> Result<std::uint32_t>
{
    if (nodes.empty())
    {
        return make_unexpected(ErrorCode::EmptyMesh, "cannot project onto a mesh without nodes", {"mesh", "nodes"});
    }
    std::uint32_t best          = 0U;
    double        best_distance = std::numeric_limits<double>::infinity();
    for (std::size_t index = 0; index < nodes.size(); ++index)
    {
        const double distance = common::distance_squared(nodes[index], point);
        // strict < keeps the lowest index on ties
        if (distance < best_distance)
        {
            best_distance = distance;
            best          = static_cast<std::uint32_t>(index);
        }
    }
    return best;
}

auto project_sources(const mesh::Mesh &mesh, const SourcePlan &plan) -> Result<ProjectedSources>
{
    ProjectedSources projected;
    projected.reserve(plan.size());
    for (std::size_t i = 0; i < plan.size(); ++i)
    {
        auto node = nearest_node(mesh.nodes, plan[i].position);
        if (!node)
        {
            auto error = node.error();
            error.context.push_back(fmt::format("sources[{}]", i));
            return std::unexpected(std::move(error));
        }
        projected.push_back(ProjectedSource{*node, plan[i].charge});
    }
    return projected;
}

} // namespace psf::sources

/**
 * @file complexity.cpp
 * @brief single-pass bounding box + center sweep
 */
#include "psf/analysis/complexity.hpp"

#include <algorithm>
#include <limits>

namespace psf::analysis
{

auto analyze(const mesh::Mesh &mesh) -> Result<ComplexityReport>
{
    if (mesh.nodes.empty())
    {
        return make_unexpected(ErrorCode::EmptyMesh, "mesh has zero nodes, geometry is undefined", {"mesh", "nodes"});
    }

    ComplexityReport report{};
    report.node_count    = mesh.nodes.size();
    report.element_count = mesh.elements.size();
    report.bbox_min.fill(std::numeric_limits<double>::infinity());
    report.bbox_max.fill(-std::numeric_limits<double>::infinity());

    common::Vec3 sum{0.0, 0.0, 0.0};
    for (const auto &node : mesh.nodes)
    {
        for (std::size_t axis = 0; axis < 3; ++axis)
        {
            report.bbox_min[axis] = std::min(report.bbox_min[axis], node[axis]);
            report.bbox_max[axis] = std::max(report.bbox_max[axis], node[axis]);
        }
        sum = common::add(sum, node);
    }

    const auto count  = static_cast<double>(report.node_count);
    report.center     = common::scale(sum, 1.0 / count);
    report.extents    = common::subtract(report.bbox_max, report.bbox_min);
    report.estimated_volume = report.extents[0] * report.extents[1] * report.extents[2];
    report.level               = classify(report.node_count);
    report.recommended_sources = recommended_sources(report.level);
    return report;
}

} // namespace psf::analysis

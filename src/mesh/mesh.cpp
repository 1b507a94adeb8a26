/**
 * @file mesh.cpp
 * @brief boundary facet extraction + boundary node gathering
 */
#include "psf/mesh/mesh.hpp"

#include <algorithm>
#include <cstddef>
#include <unordered_map>

namespace psf::mesh
{
namespace
{

using FaceKey = std::array<std::uint32_t, 3>;

struct FaceKeyHash
{
    [[nodiscard]] auto operator()(const FaceKey &key) const noexcept -> std::size_t
    {
        std::uint64_t hash = 1469598103934665603ULL;
        for (const auto value : key)
        {
            hash ^= static_cast<std::uint64_t>(value);
            hash *= 1099511628211ULL;
        }
        return static_cast<std::size_t>(hash);
    }
};

// local vertex triples of the four tet faces (opposite vertex 3, 2, 1, 0)
constexpr std::array<std::array<std::size_t, 3>, 4> kTetFaces{{
    {0U, 1U, 2U},
    {0U, 1U, 3U},
    {0U, 2U, 3U},
    {1U, 2U, 3U},
}};

struct FaceRecord
{
    Facet       facet;
    std::size_t count{};
    std::size_t first_seen{};
};

[[nodiscard]] auto make_face_key(FaceKey nodes) noexcept -> FaceKey
{
    std::sort(nodes.begin(), nodes.end());
    return nodes;
}

} // namespace

auto extract_boundary_facets(const Mesh &mesh) -> std::vector<Facet>
{
    std::unordered_map<FaceKey, FaceRecord, FaceKeyHash> faces;
    faces.reserve(mesh.elements.size() * 4U);

    std::size_t order = 0U;
    for (const auto &element : mesh.elements)
    {
        for (const auto &local : kTetFaces)
        {
            const std::array<std::uint32_t, 3> nodes{element.nodes[local[0]], element.nodes[local[1]],
                                                     element.nodes[local[2]]};
            const auto key = make_face_key(nodes);
            auto [iter, inserted] = faces.try_emplace(key);
            if (inserted)
            {
                iter->second.facet      = Facet{nodes, 0U};
                iter->second.first_seen = order++;
            }
            ++iter->second.count;
        }
    }

    std::vector<const FaceRecord *> boundary;
    boundary.reserve(faces.size());
    for (const auto &[key, record] : faces)
    {
        if (record.count == 1U)
        {
            boundary.push_back(&record);
        }
    }
    std::sort(boundary.begin(), boundary.end(),
              [](const FaceRecord *lhs, const FaceRecord *rhs) { return lhs->first_seen < rhs->first_seen; });

    std::vector<Facet> facets;
    facets.reserve(boundary.size());
    for (const auto *record : boundary)
    {
        facets.push_back(record->facet);
    }
    return facets;
}

auto boundary_nodes(const Mesh &mesh) -> std::vector<std::uint32_t>
{
    std::vector<std::uint32_t> nodes;
    nodes.reserve(mesh.boundary_facets.size() * 3U);
    for (const auto &facet : mesh.boundary_facets)
    {
        nodes.insert(nodes.end(), facet.nodes.begin(), facet.nodes.end());
    }
    std::sort(nodes.begin(), nodes.end());
    nodes.erase(std::unique(nodes.begin(), nodes.end()), nodes.end());
    return nodes;
}

} // namespace psf::mesh

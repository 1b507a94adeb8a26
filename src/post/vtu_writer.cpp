/**
 * @file vtu_writer.cpp
 * @brief implementation for the binary VTU export uwu
 */
#include "psf/post/vtu_writer.hpp"

#include <cmath>
#include <cstdint>
#include <fstream>
#include <limits>
#include <system_error>

#include <fmt/core.h>

#include "psf/common/log.hpp"

namespace psf::post
{
namespace
{

constexpr std::uint8_t kVtkTetra = 10U;

struct DataArraySpec
{
    std::string   name;
    std::string   type;
    std::uint32_t components;
    std::size_t   offset{0U};
};

[[nodiscard]] auto make_error(std::string message, std::initializer_list<std::string> ctx = {})
    -> std::unexpected<VtuError>
{
    VtuError err{};
    err.message = std::move(message);
    err.context.assign(ctx.begin(), ctx.end());
    return std::unexpected(std::move(err));
}

template <typename T>
[[nodiscard]] auto append_block(std::vector<std::uint8_t> &blob, const std::vector<T> &data) -> std::size_t
{
    const std::size_t   offset       = blob.size();
    const std::uint32_t payload_size = static_cast<std::uint32_t>(data.size() * sizeof(T));
    const auto         *size_ptr     = reinterpret_cast<const std::uint8_t *>(&payload_size);
    blob.insert(blob.end(), size_ptr, size_ptr + sizeof(std::uint32_t));
    const auto *bytes = reinterpret_cast<const std::uint8_t *>(data.data());
    blob.insert(blob.end(), bytes, bytes + data.size() * sizeof(T));
    return offset;
}

[[nodiscard]] auto flatten_points(const mesh::Mesh &mesh) -> std::vector<double>
{
    std::vector<double> points;
    points.reserve(mesh.nodes.size() * 3U);
    for (const auto &node : mesh.nodes)
    {
        points.insert(points.end(), node.begin(), node.end());
    }
    return points;
}

[[nodiscard]] auto element_volumes(const mesh::Mesh &mesh) -> std::vector<double>
{
    std::vector<double> volumes;
    volumes.reserve(mesh.elements.size());
    for (const auto &element : mesh.elements)
    {
        const auto &p0 = mesh.nodes[element.nodes[0]];
        const auto  e0 = common::subtract(mesh.nodes[element.nodes[1]], p0);
        const auto  e1 = common::subtract(mesh.nodes[element.nodes[2]], p0);
        const auto  e2 = common::subtract(mesh.nodes[element.nodes[3]], p0);
        volumes.push_back(std::abs(common::dot(e0, common::cross(e1, e2))) / 6.0);
    }
    return volumes;
}

void write_array_header(std::ofstream &file, const DataArraySpec &spec)
{
    file << "        <DataArray type=\"" << spec.type << "\" Name=\"" << spec.name << "\" NumberOfComponents=\""
         << spec.components << "\" format=\"appended\" offset=\"" << spec.offset << "\"/>\n";
}

} // namespace

auto write_vtu(const std::filesystem::path &path, const mesh::Mesh &mesh, const std::vector<double> &potential,
               const sources::ProjectedSources &sources) -> std::expected<void, VtuError>
{
    const auto node_count = mesh.nodes.size();
    if (potential.size() != node_count)
    {
        return make_error(fmt::format("potential has {} values for {} nodes", potential.size(), node_count),
                          {path.string(), "potential"});
    }
    // largest block is the Float64 point array
    if (node_count * 3U * sizeof(double) > std::numeric_limits<std::uint32_t>::max() ||
        mesh.elements.size() * 4U * sizeof(std::int32_t) > std::numeric_limits<std::uint32_t>::max())
    {
        return make_error("VTU block exceeds UInt32 header limit", {path.string()});
    }

    std::vector<double> source_charge(node_count, 0.0);
    for (std::size_t i = 0; i < sources.size(); ++i)
    {
        if (sources[i].node >= node_count)
        {
            return make_error(fmt::format("source node {} out of range", sources[i].node),
                              {path.string(), "sources", fmt::format("[{}]", i)});
        }
        source_charge[sources[i].node] += sources[i].charge;
    }

    std::vector<std::uint8_t> boundary(node_count, 0U);
    for (const auto node : mesh::boundary_nodes(mesh))
    {
        if (node < node_count)
        {
            boundary[node] = 1U;
        }
    }

    std::vector<std::int32_t> connectivity;
    std::vector<std::int32_t> offsets;
    std::vector<std::uint8_t> types(mesh.elements.size(), kVtkTetra);
    connectivity.reserve(mesh.elements.size() * 4U);
    offsets.reserve(mesh.elements.size());
    for (const auto &element : mesh.elements)
    {
        for (const auto node : element.nodes)
        {
            if (node >= node_count)
            {
                return make_error(fmt::format("element references node {} out of range", node),
                                  {path.string(), "elements"});
            }
            connectivity.push_back(static_cast<std::int32_t>(node));
        }
        offsets.push_back(static_cast<std::int32_t>(connectivity.size()));
    }

    std::vector<std::uint8_t> appended;
    appended.reserve(node_count * 6U * sizeof(double) + connectivity.size() * sizeof(std::int32_t));

    DataArraySpec point_arrays[] = {
        {.name = "potential", .type = "Float64", .components = 1U},
        {.name = "source_charge", .type = "Float64", .components = 1U},
        {.name = "boundary_node", .type = "UInt8", .components = 1U},
    };
    point_arrays[0].offset = append_block(appended, potential);
    point_arrays[1].offset = append_block(appended, source_charge);
    point_arrays[2].offset = append_block(appended, boundary);

    DataArraySpec cell_arrays[] = {
        {.name = "element_volume", .type = "Float64", .components = 1U},
    };
    cell_arrays[0].offset = append_block(appended, element_volumes(mesh));

    const auto points_offset       = append_block(appended, flatten_points(mesh));
    const auto connectivity_offset = append_block(appended, connectivity);
    const auto offsets_offset      = append_block(appended, offsets);
    const auto types_offset        = append_block(appended, types);

    std::error_code ec;
    if (!path.parent_path().empty())
    {
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec)
        {
            return make_error(fmt::format("failed to create output directory: {}", ec.message()),
                              {path.parent_path().string()});
        }
    }

    std::ofstream file(path, std::ios::binary);
    if (!file)
    {
        return make_error("failed to open VTU file", {path.string()});
    }

    file << "<?xml version=\"1.0\"?>\n";
    file << "<VTKFile type=\"UnstructuredGrid\" version=\"1.0\" byte_order=\"LittleEndian\" header_type=\"UInt32\">\n";
    file << "  <UnstructuredGrid>\n";
    file << "    <Piece NumberOfPoints=\"" << node_count << "\" NumberOfCells=\"" << mesh.elements.size() << "\">\n";

    file << "      <PointData Scalars=\"potential\">\n";
    for (const auto &spec : point_arrays)
    {
        write_array_header(file, spec);
    }
    file << "      </PointData>\n";

    file << "      <CellData Scalars=\"element_volume\">\n";
    for (const auto &spec : cell_arrays)
    {
        write_array_header(file, spec);
    }
    file << "      </CellData>\n";

    file << "      <Points>\n";
    file << "        <DataArray type=\"Float64\" NumberOfComponents=\"3\" format=\"appended\" offset=\""
         << points_offset << "\"/>\n";
    file << "      </Points>\n";

    file << "      <Cells>\n";
    file << "        <DataArray type=\"Int32\" Name=\"connectivity\" format=\"appended\" offset=\""
         << connectivity_offset << "\"/>\n";
    file << "        <DataArray type=\"Int32\" Name=\"offsets\" format=\"appended\" offset=\"" << offsets_offset
         << "\"/>\n";
    file << "        <DataArray type=\"UInt8\" Name=\"types\" format=\"appended\" offset=\"" << types_offset
         << "\"/>\n";
    file << "      </Cells>\n";

    file << "    </Piece>\n";
    file << "  </UnstructuredGrid>\n";
    file << "  <AppendedData encoding=\"raw\">\n";
    file << "_";
    file.write(reinterpret_cast<const char *>(appended.data()), static_cast<std::streamsize>(appended.size()));
    file << "\n  </AppendedData>\n";
    file << "</VTKFile>\n";

    if (!file)
    {
        return make_error("failed while writing VTU file", {path.string()});
    }
    log::debug("post", "wrote {} ({} bytes appended)", path.string(), appended.size());
    return {};
}

} // namespace psf::post

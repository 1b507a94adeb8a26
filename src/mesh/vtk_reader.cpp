/**
 * @file vtk_reader.cpp
 * @brief legacy VTK ASCII parser implementation w/ breadcrumb errors
 *
 * this TU tokenizes the body of a legacy VTK file and decodes POINTS, CELLS
 * (classic or OFFSETS/CONNECTIVITY) and CELL_TYPES. attribute sections
 * (POINT_DATA, CELL_DATA) end the scan since the solver has no use for them.
 */
#include "psf/mesh/vtk_reader.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <fstream>
#include <limits>
#include <optional>
#include <sstream>

#include <fmt/core.h>

#include "psf/common/log.hpp"

namespace psf::mesh
{
namespace
{

constexpr std::string_view kLogTag = "mesh";

constexpr std::int64_t kVtkTriangle          = 5;
constexpr std::int64_t kVtkTetra             = 10;
constexpr std::int64_t kVtkQuadraticTriangle = 22;
constexpr std::int64_t kVtkQuadraticTetra    = 24;

struct RawCells
{
    std::vector<std::int64_t> offsets;      ///< size = cells + 1
    std::vector<std::int64_t> connectivity; ///< flattened node ids
};

struct ParseState
{
    std::vector<common::Vec3>  points;
    std::optional<RawCells>    cells;
    std::vector<std::int64_t>  cell_types;
    bool                       saw_dataset{false};
};

[[nodiscard]] auto make_error(std::string message, std::vector<std::string> ctx) -> std::unexpected<MeshError>
{
    return std::unexpected(MeshError{std::move(message), std::move(ctx)});
}

[[nodiscard]] auto trim(std::string_view value) -> std::string_view
{
    const auto start = value.find_first_not_of(" \t\r");
    if (start == std::string_view::npos)
    {
        return {};
    }
    const auto end = value.find_last_not_of(" \t\r");
    return value.substr(start, end - start + 1U);
}

[[nodiscard]] auto to_upper(std::string value) -> std::string
{
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return value;
}

template <typename T>
[[nodiscard]] auto read_values(std::istringstream &stream, std::size_t count, std::string_view section)
    -> std::expected<std::vector<T>, MeshError>
{
    // every value takes at least one character plus a separator
    const auto remaining = static_cast<std::size_t>(std::max<std::streamsize>(stream.rdbuf()->in_avail(), 0));
    if (count > remaining / 2U + 1U)
    {
        return make_error(fmt::format("unexpected end of data in {} section ({} values declared)", section, count),
                          {std::string(section)});
    }
    std::vector<T> values;
    values.reserve(count);
    for (std::size_t i = 0; i < count; ++i)
    {
        T value{};
        if (!(stream >> value))
        {
            return make_error(fmt::format("unexpected end of data in {} section", section),
                              {std::string(section), fmt::format("[{}]", i)});
        }
        values.push_back(value);
    }
    return values;
}

[[nodiscard]] auto read_count(std::istringstream &stream, std::string_view section)
    -> std::expected<std::size_t, MeshError>
{
    long long count = -1;
    if (!(stream >> count) || count < 0)
    {
        return make_error(fmt::format("malformed {} header", section), {std::string(section)});
    }
    return static_cast<std::size_t>(count);
}

[[nodiscard]] auto parse_points(std::istringstream &stream, ParseState &state) -> std::expected<void, MeshError>
{
    auto count = read_count(stream, "POINTS");
    if (!count)
    {
        return std::unexpected(count.error());
    }
    if (*count > std::numeric_limits<std::size_t>::max() / 3U)
    {
        return make_error("malformed POINTS header", {"POINTS"});
    }
    std::string data_type;
    stream >> data_type;
    auto coords = read_values<double>(stream, *count * 3U, "POINTS");
    if (!coords)
    {
        return std::unexpected(coords.error());
    }
    state.points.resize(*count);
    for (std::size_t node = 0; node < *count; ++node)
    {
        state.points[node] = common::Vec3{(*coords)[node * 3U + 0U], (*coords)[node * 3U + 1U],
                                          (*coords)[node * 3U + 2U]};
    }
    return {};
}

// classic layout: `CELLS n size` then n rows of `k id0 ... idk-1`
[[nodiscard]] auto parse_classic_cells(std::istringstream &stream, std::size_t cell_count, std::size_t total)
    -> std::expected<RawCells, MeshError>
{
    auto flat = read_values<std::int64_t>(stream, total, "CELLS");
    if (!flat)
    {
        return std::unexpected(flat.error());
    }
    // each row starts with its node count
    if (cell_count > flat->size())
    {
        return make_error("CELLS size smaller than cell list", {"CELLS"});
    }
    RawCells    cells{};
    std::size_t cursor = 0U;
    cells.offsets.reserve(cell_count + 1U);
    cells.offsets.push_back(0);
    for (std::size_t cell = 0; cell < cell_count; ++cell)
    {
        if (cursor >= flat->size())
        {
            return make_error("CELLS size smaller than cell list", {"CELLS", fmt::format("[{}]", cell)});
        }
        const auto node_count = (*flat)[cursor++];
        if (node_count < 0 || cursor + static_cast<std::size_t>(node_count) > flat->size())
        {
            return make_error("CELLS row overruns declared size", {"CELLS", fmt::format("[{}]", cell)});
        }
        cells.connectivity.insert(cells.connectivity.end(), flat->begin() + static_cast<std::ptrdiff_t>(cursor),
                                  flat->begin() + static_cast<std::ptrdiff_t>(cursor) + node_count);
        cursor += static_cast<std::size_t>(node_count);
        cells.offsets.push_back(static_cast<std::int64_t>(cells.connectivity.size()));
    }
    return cells;
}

// 5.1 layout: `CELLS n_offsets n_conn`, `OFFSETS type ...`, `CONNECTIVITY type ...`
[[nodiscard]] auto parse_offset_cells(std::istringstream &stream, std::size_t offset_count,
                                      std::size_t connectivity_count) -> std::expected<RawCells, MeshError>
{
    std::string data_type;
    stream >> data_type;
    auto offsets = read_values<std::int64_t>(stream, offset_count, "OFFSETS");
    if (!offsets)
    {
        return std::unexpected(offsets.error());
    }
    std::string keyword;
    if (!(stream >> keyword) || to_upper(keyword) != "CONNECTIVITY")
    {
        return make_error("expected CONNECTIVITY after OFFSETS", {"CELLS"});
    }
    stream >> data_type;
    auto connectivity = read_values<std::int64_t>(stream, connectivity_count, "CONNECTIVITY");
    if (!connectivity)
    {
        return std::unexpected(connectivity.error());
    }
    if (offsets->empty() || offsets->front() != 0 ||
        offsets->back() != static_cast<std::int64_t>(connectivity->size()) ||
        !std::is_sorted(offsets->begin(), offsets->end()))
    {
        return make_error("OFFSETS inconsistent with CONNECTIVITY", {"CELLS", "OFFSETS"});
    }
    return RawCells{std::move(offsets.value()), std::move(connectivity.value())};
}

[[nodiscard]] auto parse_cells(std::istringstream &stream, ParseState &state) -> std::expected<void, MeshError>
{
    auto first = read_count(stream, "CELLS");
    if (!first)
    {
        return std::unexpected(first.error());
    }
    auto second = read_count(stream, "CELLS");
    if (!second)
    {
        return std::unexpected(second.error());
    }

    const auto rewind = stream.tellg();
    std::string peek;
    stream >> peek;
    if (to_upper(peek) == "OFFSETS")
    {
        auto cells = parse_offset_cells(stream, *first, *second);
        if (!cells)
        {
            return std::unexpected(cells.error());
        }
        state.cells = std::move(cells.value());
        return {};
    }

    stream.clear();
    stream.seekg(rewind);
    auto cells = parse_classic_cells(stream, *first, *second);
    if (!cells)
    {
        return std::unexpected(cells.error());
    }
    state.cells = std::move(cells.value());
    return {};
}

[[nodiscard]] auto parse_cell_types(std::istringstream &stream, ParseState &state)
    -> std::expected<void, MeshError>
{
    auto count = read_count(stream, "CELL_TYPES");
    if (!count)
    {
        return std::unexpected(count.error());
    }
    auto types = read_values<std::int64_t>(stream, *count, "CELL_TYPES");
    if (!types)
    {
        return std::unexpected(types.error());
    }
    state.cell_types = std::move(types.value());
    return {};
}

[[nodiscard]] auto node_index(std::int64_t raw, std::size_t point_count, std::size_t cell)
    -> std::expected<std::uint32_t, MeshError>
{
    if (raw < 0 || static_cast<std::size_t>(raw) >= point_count)
    {
        return make_error(fmt::format("cell references unknown node {}", raw), {"CELLS", fmt::format("[{}]", cell)});
    }
    return static_cast<std::uint32_t>(raw);
}

[[nodiscard]] auto build_mesh(ParseState &state) -> MeshResult
{
    const auto &cells = *state.cells;
    const auto  cell_count = cells.offsets.size() - 1U;
    if (state.cell_types.size() != cell_count)
    {
        return make_error(fmt::format("CELL_TYPES count {} does not match {} cells", state.cell_types.size(),
                                      cell_count),
                          {"CELL_TYPES"});
    }

    Mesh mesh{};
    for (std::size_t cell = 0; cell < cell_count; ++cell)
    {
        const auto type  = state.cell_types[cell];
        const auto begin = static_cast<std::size_t>(cells.offsets[cell]);
        const auto size  = static_cast<std::size_t>(cells.offsets[cell + 1U]) - begin;

        std::size_t corners = 0U;
        bool        volume  = false;
        if (type == kVtkTetra || type == kVtkQuadraticTetra)
        {
            corners = 4U;
            volume  = true;
        }
        else if (type == kVtkTriangle || type == kVtkQuadraticTriangle)
        {
            corners = 3U;
        }
        else
        {
            continue;
        }
        if (size < corners)
        {
            return make_error(fmt::format("cell of type {} has only {} nodes", type, size),
                              {"CELLS", fmt::format("[{}]", cell)});
        }

        std::array<std::uint32_t, 4> nodes{};
        for (std::size_t local = 0; local < corners; ++local)
        {
            auto index = node_index(cells.connectivity[begin + local], state.points.size(), cell);
            if (!index)
            {
                return std::unexpected(index.error());
            }
            nodes[local] = *index;
        }
        if (volume)
        {
            mesh.elements.push_back(Element{nodes, static_cast<std::uint32_t>(type)});
        }
        else
        {
            mesh.boundary_facets.push_back(
                Facet{{nodes[0], nodes[1], nodes[2]}, static_cast<std::uint32_t>(type)});
        }
    }

    if (mesh.elements.empty())
    {
        return make_error("VTK file contains no tetrahedral cells", {"CELL_TYPES"});
    }

    // compact away nodes no tetrahedron touches
    constexpr auto             kUnused = std::numeric_limits<std::uint32_t>::max();
    std::vector<std::uint32_t> remap(state.points.size(), kUnused);
    for (const auto &element : mesh.elements)
    {
        for (const auto node : element.nodes)
        {
            remap[node] = 0U;
        }
    }
    std::uint32_t next = 0U;
    mesh.nodes.reserve(state.points.size());
    for (std::size_t node = 0; node < remap.size(); ++node)
    {
        if (remap[node] == kUnused)
        {
            continue;
        }
        remap[node] = next++;
        mesh.nodes.push_back(state.points[node]);
    }
    const auto dropped = state.points.size() - mesh.nodes.size();
    if (dropped > 0U)
    {
        log::debug(kLogTag, "dropped {} nodes not attached to any tetrahedron", dropped);
    }
    for (auto &element : mesh.elements)
    {
        for (auto &node : element.nodes)
        {
            node = remap[node];
        }
    }
    std::vector<Facet> kept;
    kept.reserve(mesh.boundary_facets.size());
    for (auto facet : mesh.boundary_facets)
    {
        if (std::any_of(facet.nodes.begin(), facet.nodes.end(),
                        [&remap](std::uint32_t node) { return remap[node] == kUnused; }))
        {
            continue;
        }
        for (auto &node : facet.nodes)
        {
            node = remap[node];
        }
        kept.push_back(facet);
    }
    mesh.boundary_facets = std::move(kept);

    if (mesh.boundary_facets.empty())
    {
        mesh.boundary_facets = extract_boundary_facets(mesh);
        log::debug(kLogTag, "no triangle cells in file, derived {} boundary facets from topology",
                   mesh.boundary_facets.size());
    }
    return mesh;
}

} // namespace

auto load_vtk_file(const std::filesystem::path &path) -> MeshResult
{
    std::ifstream file(path);
    if (!file.is_open())
    {
        return make_error(fmt::format("failed to open mesh file: {}", path.string()), {path.string()});
    }
    std::ostringstream buffer;
    buffer << file.rdbuf();
    auto result = load_vtk_from_string(buffer.str());
    if (!result)
    {
        result.error().context.insert(result.error().context.begin(), path.string());
    }
    return result;
}

auto load_vtk_from_string(std::string_view ascii_contents) -> MeshResult
{
    std::istringstream input{std::string(ascii_contents)};
    std::string        line;

    if (!std::getline(input, line) || !trim(line).starts_with("# vtk DataFile Version"))
    {
        return make_error("missing '# vtk DataFile Version' header", {"header"});
    }
    if (!std::getline(input, line))
    {
        return make_error("missing title line", {"header"});
    }
    if (!std::getline(input, line))
    {
        return make_error("missing format line", {"header"});
    }
    const auto format = to_upper(std::string(trim(line)));
    if (format != "ASCII")
    {
        return make_error(fmt::format("only ASCII legacy VTK is supported (got '{}')", format), {"header"});
    }

    std::ostringstream body;
    body << input.rdbuf();
    std::istringstream stream{body.str()};

    ParseState  state{};
    std::string token;
    while (stream >> token)
    {
        const auto keyword = to_upper(token);
        if (keyword == "DATASET")
        {
            std::string kind;
            stream >> kind;
            if (to_upper(kind) != "UNSTRUCTURED_GRID")
            {
                return make_error(fmt::format("unsupported dataset '{}'", kind), {"DATASET"});
            }
            state.saw_dataset = true;
        }
        else if (keyword == "POINTS")
        {
            if (auto res = parse_points(stream, state); !res)
            {
                return std::unexpected(res.error());
            }
        }
        else if (keyword == "CELLS")
        {
            if (auto res = parse_cells(stream, state); !res)
            {
                return std::unexpected(res.error());
            }
        }
        else if (keyword == "CELL_TYPES")
        {
            if (auto res = parse_cell_types(stream, state); !res)
            {
                return std::unexpected(res.error());
            }
        }
        else if (keyword == "POINT_DATA" || keyword == "CELL_DATA")
        {
            break;
        }
        // METADATA blocks and their INFORMATION payload fall through token by token
    }

    if (!state.saw_dataset)
    {
        return make_error("missing DATASET UNSTRUCTURED_GRID", {"DATASET"});
    }
    if (state.points.empty())
    {
        return make_error("missing POINTS section", {"POINTS"});
    }
    if (!state.cells)
    {
        return make_error("missing CELLS section", {"CELLS"});
    }
    if (state.cell_types.empty())
    {
        return make_error("missing CELL_TYPES section", {"CELL_TYPES"});
    }
    return build_mesh(state);
}

} // namespace psf::mesh

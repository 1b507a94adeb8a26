/**
 * @file config.cpp
 * @brief implementation of the YAML config loader with bougie validation uwu
 *
 * yaml-cpp throws on type mismatches, so every conversion sits in a try block
 * that maps YAML::Exception onto a ConfigError with breadcrumbs.
 */
#include "psf/config/config.hpp"

#include <cmath>
#include <string>

#include <fmt/core.h>
#include <yaml-cpp/yaml.h>

#include "psf/sources/planner.hpp"

namespace psf::config
{
namespace
{

[[nodiscard]] auto make_error(std::string message, std::vector<std::string> ctx) -> ConfigResult
{
    return std::unexpected(ConfigError{std::move(message), std::move(ctx)});
}

[[nodiscard]] auto node_to_vec3(const YAML::Node &node, std::vector<std::string> ctx)
    -> std::expected<common::Vec3, ConfigError>
{
    if (!node || !node.IsSequence() || node.size() != 3U)
    {
        return std::unexpected(ConfigError{"expected sequence[3] for point", std::move(ctx)});
    }
    common::Vec3 values{};
    for (std::size_t i = 0; i < 3; ++i)
    {
        try
        {
            values[i] = node[i].as<double>();
        }
        catch (const YAML::Exception &ex)
        {
            auto child_ctx = ctx;
            child_ctx.emplace_back(fmt::format("[{}]", i));
            return std::unexpected(ConfigError{ex.what(), std::move(child_ctx)});
        }
    }
    return values;
}

template <typename T>
[[nodiscard]] auto scalar_or(const YAML::Node &parent, const char *key, T fallback, std::vector<std::string> ctx)
    -> std::expected<T, ConfigError>
{
    const auto node = parent[key];
    if (!node || node.IsNull())
    {
        return fallback;
    }
    if (!node.IsScalar())
    {
        return std::unexpected(ConfigError{fmt::format("{} must be a scalar", key), std::move(ctx)});
    }
    try
    {
        return node.as<T>();
    }
    catch (const YAML::Exception &ex)
    {
        return std::unexpected(ConfigError{ex.what(), std::move(ctx)});
    }
}

[[nodiscard]] auto parse_sources(const YAML::Node &node, SourceSettings &out) -> std::expected<void, ConfigError>
{
    if (!node || node.IsNull())
    {
        return {};
    }
    if (!node.IsMap())
    {
        return std::unexpected(ConfigError{"sources must be a mapping", {"sources"}});
    }

    auto mode = scalar_or<std::string>(node, "mode", "auto", {"sources", "mode"});
    if (!mode)
    {
        return std::unexpected(mode.error());
    }
    if (*mode == "auto")
    {
        out.mode = SourceMode::Automatic;
    }
    else if (*mode == "manual")
    {
        out.mode = SourceMode::Manual;
    }
    else
    {
        return std::unexpected(
            ConfigError{fmt::format("sources.mode must be 'auto' or 'manual' (got '{}')", *mode), {"sources", "mode"}});
    }

    if (const auto count_node = node["count"]; count_node && !count_node.IsNull())
    {
        auto count = scalar_or<std::int64_t>(node, "count", 0, {"sources", "count"});
        if (!count)
        {
            return std::unexpected(count.error());
        }
        if (*count < 1)
        {
            return std::unexpected(ConfigError{"sources.count must be >= 1", {"sources", "count"}});
        }
        if (*count > psf::sources::kMaxSourceCount)
        {
            return std::unexpected(ConfigError{
                fmt::format("sources.count must be <= {} (got {})", psf::sources::kMaxSourceCount, *count),
                {"sources", "count"}});
        }
        out.count = *count;
    }

    auto seed = scalar_or<std::uint64_t>(node, "seed", out.seed, {"sources", "seed"});
    if (!seed)
    {
        return std::unexpected(seed.error());
    }
    out.seed = *seed;

    if (const auto points = node["points"]; points && !points.IsNull())
    {
        if (!points.IsSequence())
        {
            return std::unexpected(ConfigError{"sources.points must be a sequence", {"sources", "points"}});
        }
        for (std::size_t i = 0; i < points.size(); ++i)
        {
            auto point = node_to_vec3(points[i], {"sources", "points", fmt::format("[{}]", i)});
            if (!point)
            {
                return std::unexpected(point.error());
            }
            if (!common::is_finite(*point))
            {
                return std::unexpected(
                    ConfigError{"source point must be finite", {"sources", "points", fmt::format("[{}]", i)}});
            }
            out.points.push_back(*point);
        }
    }

    if (const auto charges = node["charges"]; charges && !charges.IsNull())
    {
        if (!charges.IsSequence())
        {
            return std::unexpected(ConfigError{"sources.charges must be a sequence", {"sources", "charges"}});
        }
        for (std::size_t i = 0; i < charges.size(); ++i)
        {
            try
            {
                out.charges.push_back(charges[i].as<double>());
            }
            catch (const YAML::Exception &ex)
            {
                return std::unexpected(ConfigError{ex.what(), {"sources", "charges", fmt::format("[{}]", i)}});
            }
            if (!std::isfinite(out.charges.back()))
            {
                return std::unexpected(
                    ConfigError{"charge must be finite", {"sources", "charges", fmt::format("[{}]", i)}});
            }
        }
    }

    if (out.mode == SourceMode::Manual)
    {
        if (out.points.empty())
        {
            return std::unexpected(ConfigError{"manual mode requires sources.points", {"sources", "points"}});
        }
        if (out.points.size() != out.charges.size())
        {
            return std::unexpected(ConfigError{
                fmt::format("sources.points has {} entries but sources.charges has {}", out.points.size(),
                            out.charges.size()),
                {"sources", "charges"}});
        }
    }
    return {};
}

} // namespace

auto to_string(SourceMode mode) noexcept -> std::string_view
{
    return mode == SourceMode::Manual ? "manual" : "auto";
}

auto load_config_from_file(const std::filesystem::path &path) -> ConfigResult
{
    try
    {
        const auto node = YAML::LoadFile(path.string());
        auto       result = parse_config_node(node);
        if (!result)
        {
            result.error().context.insert(result.error().context.begin(), path.string());
        }
        return result;
    }
    catch (const YAML::BadFile &ex)
    {
        return make_error(fmt::format("unable to open config file: {}", ex.what()), {path.string()});
    }
    catch (const YAML::Exception &ex)
    {
        return make_error(fmt::format("YAML parse error: {}", ex.what()), {path.string()});
    }
}

auto load_config_from_string(std::string_view yaml_text) -> ConfigResult
{
    try
    {
        const auto node = YAML::Load(std::string(yaml_text));
        return parse_config_node(node);
    }
    catch (const YAML::Exception &ex)
    {
        return make_error(fmt::format("YAML parse error: {}", ex.what()), {});
    }
}

auto parse_config_node(const YAML::Node &root) -> ConfigResult
{
    if (!root || !root.IsMap())
    {
        return make_error("config root must be a mapping", {});
    }

    Config cfg{};

    // mesh
    const auto mesh_node = root["mesh"];
    if (!mesh_node || !mesh_node.IsMap())
    {
        return make_error("missing 'mesh' section", {"mesh"});
    }
    const auto mesh_path_node = mesh_node["path"];
    if (!mesh_path_node || !mesh_path_node.IsScalar() || mesh_path_node.Scalar().empty())
    {
        return make_error("mesh.path must be a scalar string", {"mesh", "path"});
    }
    cfg.mesh_path = std::filesystem::path(mesh_path_node.Scalar());

    // sources
    if (auto sources = parse_sources(root["sources"], cfg.sources); !sources)
    {
        return std::unexpected(sources.error());
    }

    // solver
    if (const auto solver = root["solver"]; solver && !solver.IsNull())
    {
        if (!solver.IsMap())
        {
            return make_error("solver must be a mapping", {"solver"});
        }
        auto value = scalar_or<double>(solver, "dirichlet_value", cfg.solver.dirichlet_value,
                                       {"solver", "dirichlet_value"});
        if (!value)
        {
            return std::unexpected(value.error());
        }
        if (!std::isfinite(*value))
        {
            return make_error("solver.dirichlet_value must be finite", {"solver", "dirichlet_value"});
        }
        cfg.solver.dirichlet_value = *value;

        auto tolerance = scalar_or<double>(solver, "pivot_tolerance", cfg.solver.pivot_tolerance,
                                           {"solver", "pivot_tolerance"});
        if (!tolerance)
        {
            return std::unexpected(tolerance.error());
        }
        if (!(*tolerance > 0.0 && *tolerance < 1.0))
        {
            return make_error("solver.pivot_tolerance must be in (0, 1)", {"solver", "pivot_tolerance"});
        }
        cfg.solver.pivot_tolerance = *tolerance;
    }

    // output
    if (const auto output = root["output"]; output && !output.IsNull())
    {
        if (!output.IsMap())
        {
            return make_error("output must be a mapping", {"output"});
        }
        if (const auto vtu = output["vtu"]; vtu && !vtu.IsNull())
        {
            if (!vtu.IsScalar() || vtu.Scalar().empty())
            {
                return make_error("output.vtu must be a non-empty path", {"output", "vtu"});
            }
            cfg.output.vtu = std::filesystem::path(vtu.Scalar());
        }
    }

    // logging
    if (const auto logging = root["logging"]; logging && !logging.IsNull())
    {
        if (!logging.IsMap())
        {
            return make_error("logging must be a mapping", {"logging"});
        }
        auto verbose = scalar_or<bool>(logging, "verbose", false, {"logging", "verbose"});
        if (!verbose)
        {
            return std::unexpected(verbose.error());
        }
        cfg.logging.verbose = *verbose;
    }

    return cfg;
}

} // namespace psf::config

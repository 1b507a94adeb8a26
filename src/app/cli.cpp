/**
 * @file cli.cpp
 * @brief flag tokenizer for psf_solve
 */
#include "psf/app/cli.hpp"

#include <charconv>

#include <fmt/core.h>

#include "psf/sources/parse.hpp"

namespace psf::app
{
namespace
{

template <typename T>
[[nodiscard]] auto parse_integer(const std::string &text, std::string_view flag) -> std::expected<T, std::string>
{
    T          value{};
    const auto parsed = std::from_chars(text.data(), text.data() + text.size(), value);
    if (text.empty() || parsed.ec != std::errc{} || parsed.ptr != text.data() + text.size())
    {
        return std::unexpected(fmt::format("{} expects an integer (got '{}')", flag, text));
    }
    return value;
}

} // namespace

auto parse_arguments(const std::vector<std::string> &args) -> std::expected<CliOptions, std::string>
{
    CliOptions options{};
    for (std::size_t i = 1; i < args.size(); ++i)
    {
        const auto &arg = args[i];
        if (arg == "-h" || arg == "--help")
        {
            options.help = true;
            continue;
        }
        if (arg == "-v" || arg == "--verbose")
        {
            options.verbose = true;
            continue;
        }
        if (!arg.starts_with("--"))
        {
            if (options.config_path)
            {
                return std::unexpected(fmt::format("unexpected positional argument '{}'", arg));
            }
            options.config_path = std::filesystem::path(arg);
            continue;
        }
        if (i + 1U >= args.size())
        {
            return std::unexpected(fmt::format("{} requires a value", arg));
        }
        const auto &value = args[++i];
        if (arg == "--mesh")
        {
            options.mesh_path = std::filesystem::path(value);
        }
        else if (arg == "--sources")
        {
            options.sources = value;
        }
        else if (arg == "--charges")
        {
            options.charges = value;
        }
        else if (arg == "--output")
        {
            options.output = std::filesystem::path(value);
        }
        else if (arg == "--count")
        {
            auto count = parse_integer<std::int64_t>(value, arg);
            if (!count)
            {
                return std::unexpected(count.error());
            }
            options.count = *count;
        }
        else if (arg == "--seed")
        {
            auto seed = parse_integer<std::uint64_t>(value, arg);
            if (!seed)
            {
                return std::unexpected(seed.error());
            }
            options.seed = *seed;
        }
        else
        {
            return std::unexpected(fmt::format("unknown option '{}'", arg));
        }
    }
    if (!options.help && !options.config_path && !options.mesh_path)
    {
        return std::unexpected(std::string("a config file or --mesh is required"));
    }
    return options;
}

auto usage(std::string_view program) -> std::string
{
    return fmt::format("usage: {} <config.yaml> [options]\n"
                       "  --mesh <file.vtk>        mesh path (overrides mesh.path)\n"
                       "  --sources \"x,y,z;...\"    manual source coordinates\n"
                       "  --charges \"q1,q2,...\"    manual source charges\n"
                       "  --count <N>              automatic source count override\n"
                       "  --seed <S>               multi-source perturbation seed\n"
                       "  --output <file.vtu>      VTU export path\n"
                       "  -v, --verbose            debug logging\n"
                       "  -h, --help               show this help\n",
                       program);
}

auto apply_overrides(config::Config &cfg, const CliOptions &options) -> Result<void>
{
    if (options.mesh_path)
    {
        cfg.mesh_path = *options.mesh_path;
    }
    if (options.sources || options.charges)
    {
        if (!options.sources || !options.charges)
        {
            return make_unexpected(ErrorCode::MismatchedInput, "--sources and --charges must be given together",
                                   {"cli"});
        }
        auto points = sources::parse_source_list(*options.sources);
        if (!points)
        {
            return std::unexpected(points.error());
        }
        auto charges = sources::parse_charge_list(*options.charges);
        if (!charges)
        {
            return std::unexpected(charges.error());
        }
        cfg.sources.mode    = config::SourceMode::Manual;
        cfg.sources.points  = std::move(points.value());
        cfg.sources.charges = std::move(charges.value());
    }
    if (options.count)
    {
        cfg.sources.count = *options.count;
    }
    if (options.seed)
    {
        cfg.sources.seed = *options.seed;
    }
    if (options.output)
    {
        cfg.output.vtu = *options.output;
    }
    if (options.verbose)
    {
        cfg.logging.verbose = true;
    }
    return {};
}

} // namespace psf::app

/**
 * @file cli.hpp
 * @brief psf_solve argument parsing + config overrides
 *
 * usage:
 * @code{.sh}
 * psf_solve <config.yaml> [--mesh m.vtk] [--sources "x,y,z;x,y,z"] [--charges "q1,q2"]
 *           [--count N] [--seed S] [--output out.vtu] [--verbose]
 * @endcode
 *
 * --sources/--charges switch the run to manual mode; --count forces the
 * automatic source count. the config file may be omitted when --mesh is set.
 */
#pragma once

#include <cstdint>
#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "psf/common/error.hpp"
#include "psf/config/config.hpp"

namespace psf::app
{

struct CliOptions
{
    std::optional<std::filesystem::path> config_path;
    std::optional<std::filesystem::path> mesh_path;
    std::optional<std::string>           sources;
    std::optional<std::string>           charges;
    std::optional<std::int64_t>          count;
    std::optional<std::uint64_t>         seed;
    std::optional<std::filesystem::path> output;
    bool                                 verbose{false};
    bool                                 help{false};
};

/**
 * @brief tokenizes argv (argv[0] skipped); unknown flags and missing values are errors
 */
[[nodiscard]] auto parse_arguments(const std::vector<std::string> &args) -> std::expected<CliOptions, std::string>;

/**
 * @brief usage text for --help and argument errors
 */
[[nodiscard]] auto usage(std::string_view program) -> std::string;

/**
 * @brief folds command-line overrides into a loaded (or default) config
 *
 * @return void, or the parse error of --sources/--charges
 */
[[nodiscard]] auto apply_overrides(config::Config &cfg, const CliOptions &options) -> Result<void>;

} // namespace psf::app

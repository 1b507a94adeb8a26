/**
 * @file config.hpp
 * @brief YAML scenario config for the point-source solver uwu
 *
 * this header defines the typed configuration model behind psf_solve. it
 * parses YAML documents into plain structs, validates them aggressively, and
 * bubbles up ergonomic errors via std::expected with breadcrumb context
 * (e.g. "sources", "points", "[1]"). the loader never throws.
 *
 * schema:
 * @code{.yaml}
 * mesh:
 *   path: data/sphere.vtk          # required
 * sources:
 *   mode: auto                     # auto | manual (default auto)
 *   count: 3                       # optional override, >= 1
 *   seed: 42                       # optional multi-source seed
 *   points: [[0, 0, 0], [0.1, 0, 0]]  # manual mode only
 *   charges: [1.0, -1.0]              # manual mode only
 * solver:
 *   dirichlet_value: 0.0
 *   pivot_tolerance: 1.0e-10
 * output:
 *   vtu: out/potential.vtu
 * logging:
 *   verbose: false
 * @endcode
 *
 * @author LukeFrankio
 * @date 2026-10-19
 * @version 1.0
 *
 * @note yaml-cpp powers parsing; everything else stays dependency-light
 *
 * example (basic usage):
 * @code
 * auto config_result = psf::config::load_config_from_file("scenario.yaml");
 * if (!config_result) {
 *     fmt::print(stderr, "config error: {}\n", config_result.error().message);
 *     return EXIT_FAILURE;
 * }
 * @endcode
 */
#pragma once

#include <cstdint>
#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "psf/common/math.hpp"

namespace YAML
{
class Node;
} // namespace YAML

namespace psf::config
{

/**
 * @brief config error payload with context breadcrumbs for days
 */
struct ConfigError
{
    std::string              message; ///< spicy human-readable error message uwu
    std::vector<std::string> context; ///< breadcrumb trail showing where things derailed
};

/**
 * @brief how sources are chosen
 */
enum class SourceMode : std::uint8_t
{
    Automatic, ///< analyzer + planner decide
    Manual     ///< explicit points + charges
};

struct SourceSettings
{
    SourceMode                  mode{SourceMode::Automatic};
    std::optional<std::int64_t> count;     ///< automatic mode override
    std::uint64_t               seed{42U}; ///< multi-source jitter seed
    std::vector<common::Vec3>   points;    ///< manual mode coordinates
    std::vector<double>         charges;   ///< manual mode charges
};

struct SolverSettings
{
    double dirichlet_value{0.0};
    double pivot_tolerance{1.0e-10}; ///< relative Cholesky pivot floor, in (0, 1)
};

struct OutputSettings
{
    std::optional<std::filesystem::path> vtu; ///< VTU export target (skipped when empty)
};

struct LoggingSettings
{
    bool verbose{false};
};

/**
 * @brief main configuration object bundling all scenario inputs
 */
struct Config
{
    std::filesystem::path mesh_path;
    SourceSettings        sources{};
    SolverSettings        solver{};
    OutputSettings        output{};
    LoggingSettings       logging{};
};

/**
 * @brief convenience alias for the loader result type (std::expected wrapper)
 */
using ConfigResult = std::expected<Config, ConfigError>;

[[nodiscard]] auto to_string(SourceMode mode) noexcept -> std::string_view;

/**
 * @brief parses YAML config from a file path with aggressive validation
 *
 * ⚠️ IMPURE FUNCTION (file I/O)
 */
[[nodiscard]] auto load_config_from_file(const std::filesystem::path &path) -> ConfigResult;

/**
 * @brief parses YAML config directly from a string buffer (test-friendly)
 */
[[nodiscard]] auto load_config_from_string(std::string_view yaml_text) -> ConfigResult;

/**
 * @brief low-level parser for already-loaded YAML nodes
 */
[[nodiscard]] auto parse_config_node(const YAML::Node &root) -> ConfigResult;

} // namespace psf::config

/**
 * @file main.cpp
 * @brief psf_solve: VTK mesh in, potential field (and optional VTU) out
 */
#include <cstdlib>
#include <string>
#include <vector>

#include <fmt/core.h>

#include "psf/analysis/complexity.hpp"
#include "psf/app/cli.hpp"
#include "psf/common/log.hpp"
#include "psf/config/config.hpp"
#include "psf/mesh/vtk_reader.hpp"
#include "psf/physics/poisson.hpp"
#include "psf/pipeline/pipeline.hpp"
#include "psf/post/vtu_writer.hpp"

namespace
{

constexpr std::string_view kLogTag = "solve";

[[nodiscard]] auto join_context(const std::vector<std::string> &context) -> std::string
{
    std::string joined;
    for (const auto &part : context)
    {
        if (!joined.empty() && !part.starts_with("["))
        {
            joined += '.';
        }
        joined += part;
    }
    return joined;
}

void report_error(const psf::Error &error)
{
    psf::log::error(kLogTag, "{}: {} ({})", psf::to_string(error.code), error.message, join_context(error.context));
}

[[nodiscard]] auto run(const psf::app::CliOptions &options) -> int
{
    psf::config::Config cfg{};
    if (options.config_path)
    {
        auto loaded = psf::config::load_config_from_file(*options.config_path);
        if (!loaded)
        {
            psf::log::error(kLogTag, "config error: {} ({})", loaded.error().message,
                            join_context(loaded.error().context));
            return EXIT_FAILURE;
        }
        cfg = std::move(loaded.value());
        // mesh paths in a config file are relative to that file
        if (cfg.mesh_path.is_relative() && !options.mesh_path)
        {
            cfg.mesh_path = options.config_path->parent_path() / cfg.mesh_path;
        }
    }
    if (auto applied = psf::app::apply_overrides(cfg, options); !applied)
    {
        report_error(applied.error());
        return EXIT_FAILURE;
    }
    psf::log::set_verbose(cfg.logging.verbose);

    auto mesh = psf::mesh::load_vtk_file(cfg.mesh_path);
    if (!mesh)
    {
        psf::log::error(kLogTag, "mesh error: {} ({})", mesh.error().message, join_context(mesh.error().context));
        return EXIT_FAILURE;
    }
    psf::log::info(kLogTag, "mesh {}: {} nodes, {} tetrahedra, {} boundary facets", cfg.mesh_path.string(),
                   mesh->nodes.size(), mesh->elements.size(), mesh->boundary_facets.size());

    auto stiffness = psf::physics::build_stiffness(*mesh);
    if (!stiffness)
    {
        report_error(stiffness.error());
        return EXIT_FAILURE;
    }

    psf::pipeline::PipelineOptions pipeline_options{};
    pipeline_options.planner.count_override = cfg.sources.count;
    pipeline_options.planner.seed           = cfg.sources.seed;
    pipeline_options.solver.dirichlet.value = cfg.solver.dirichlet_value;
    pipeline_options.solver.pivot_tolerance = cfg.solver.pivot_tolerance;
    pipeline_options.stiffness              = &stiffness.value();

    psf::log::info(kLogTag, "source mode: {}", psf::config::to_string(cfg.sources.mode));
    auto result = cfg.sources.mode == psf::config::SourceMode::Manual
                      ? psf::pipeline::run_manual(*mesh, cfg.sources.points, cfg.sources.charges, pipeline_options)
                      : psf::pipeline::run_automatic(*mesh, pipeline_options);
    if (!result)
    {
        report_error(result.error());
        return EXIT_FAILURE;
    }

    if (result->report)
    {
        const auto &report = *result->report;
        psf::log::info(kLogTag, "complexity {} ({} sources recommended), bbox volume {:.6g}",
                       psf::analysis::to_string(report.level), report.recommended_sources, report.estimated_volume);
        psf::log::info(kLogTag, "center ({:.6g}, {:.6g}, {:.6g}), extents ({:.6g}, {:.6g}, {:.6g})", report.center[0],
                       report.center[1], report.center[2], report.extents[0], report.extents[1], report.extents[2]);
    }
    if (result->plan)
    {
        for (std::size_t i = 0; i < result->plan->size(); ++i)
        {
            const auto &planned = (*result->plan)[i];
            psf::log::debug(kLogTag, "planned[{}] ({:.6g}, {:.6g}, {:.6g}) q={:+.3f}", i, planned.position[0],
                            planned.position[1], planned.position[2], planned.charge);
        }
    }
    for (std::size_t i = 0; i < result->sources.size(); ++i)
    {
        const auto &source = result->sources[i];
        const auto &node   = mesh->nodes[source.node];
        psf::log::info(kLogTag, "source[{}] node {} at ({:.6g}, {:.6g}, {:.6g}) q={:+.3f}", i, source.node, node[0],
                       node[1], node[2], source.charge);
    }

    const auto summary = psf::pipeline::summarize(result->potential);
    psf::log::info(kLogTag, "potential min {:.6e} max {:.6e} mean {:.6e} (residual {:.3e})", summary.min,
                   summary.max, summary.mean, result->residual_norm);

    if (cfg.output.vtu)
    {
        auto written = psf::post::write_vtu(*cfg.output.vtu, *mesh, result->potential, result->sources);
        if (!written)
        {
            psf::log::error(kLogTag, "export error: {} ({})", written.error().message,
                            join_context(written.error().context));
            return EXIT_FAILURE;
        }
        psf::log::info(kLogTag, "wrote {}", cfg.output.vtu->string());
    }
    return EXIT_SUCCESS;
}

} // namespace

auto main(int argc, char **argv) -> int
{
    const std::vector<std::string> args(argv, argv + argc);
    const std::string              program = args.empty() ? std::string("psf_solve") : args.front();

    auto options = psf::app::parse_arguments(args);
    if (!options)
    {
        psf::log::error(kLogTag, "{}", options.error());
        fmt::print(stderr, "{}", psf::app::usage(program));
        return 2;
    }
    if (options->help)
    {
        fmt::print("{}", psf::app::usage(program));
        return EXIT_SUCCESS;
    }
    return run(*options);
}

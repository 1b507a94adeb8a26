/**
 * @file pipeline.cpp
 * @brief automatic/manual solve orchestration
 */
#include "psf/pipeline/pipeline.hpp"

#include <algorithm>
#include <numeric>

#include "psf/common/log.hpp"
#include "psf/sources/parse.hpp"

namespace psf::pipeline
{
namespace
{

constexpr std::string_view kLogTag = "pipeline";

[[nodiscard]] auto solve_projected(const mesh::Mesh &mesh, sources::ProjectedSources projected,
                                   const PipelineOptions &options) -> Result<SolveResult>
{
    std::optional<physics::StiffnessOperator> owned;
    const physics::StiffnessOperator         *op = options.stiffness;
    if (op == nullptr)
    {
        auto built = physics::build_stiffness(mesh);
        if (!built)
        {
            return std::unexpected(built.error());
        }
        owned = std::move(built.value());
        op    = &owned.value();
    }

    auto solution = physics::solve_poisson(*op, mesh, projected, options.solver);
    if (!solution)
    {
        return std::unexpected(solution.error());
    }
    return package(std::move(solution.value()), std::move(projected));
}

} // namespace

auto run_automatic(const mesh::Mesh &mesh, const PipelineOptions &options) -> Result<SolveResult>
{
    auto report = analysis::analyze(mesh);
    if (!report)
    {
        return std::unexpected(report.error());
    }
    log::debug(kLogTag, "{} nodes → {} ({} recommended sources)", report->node_count,
               analysis::to_string(report->level), report->recommended_sources);

    auto plan = sources::plan_sources(*report, options.planner);
    if (!plan)
    {
        return std::unexpected(plan.error());
    }

    auto projected = sources::project_sources(mesh, *plan);
    if (!projected)
    {
        return std::unexpected(projected.error());
    }

    auto result = solve_projected(mesh, std::move(projected.value()), options);
    if (!result)
    {
        return result;
    }
    result->report = std::move(report.value());
    result->plan   = std::move(plan.value());
    return result;
}

auto run_manual(const mesh::Mesh &mesh, const std::vector<common::Vec3> &coordinates,
                const std::vector<double> &charges, const PipelineOptions &options) -> Result<SolveResult>
{
    if (auto valid = sources::validate_sources_charges(coordinates, charges); !valid)
    {
        return std::unexpected(valid.error());
    }

    sources::SourcePlan plan;
    plan.reserve(coordinates.size());
    for (std::size_t i = 0; i < coordinates.size(); ++i)
    {
        plan.push_back(sources::PlannedSource{coordinates[i], charges[i]});
    }

    auto projected = sources::project_sources(mesh, plan);
    if (!projected)
    {
        return std::unexpected(projected.error());
    }
    return solve_projected(mesh, std::move(projected.value()), options);
}

auto package(physics::PotentialSolution solution, sources::ProjectedSources projected) -> SolveResult
{
    SolveResult result{};
    result.potential     = std::move(solution.field);
    result.sources       = std::move(projected);
    result.residual_norm = solution.residual_norm;
    return result;
}

auto summarize(const std::vector<double> &field) noexcept -> FieldSummary
{
    if (field.empty())
    {
        return {};
    }
    const auto [lo, hi] = std::minmax_element(field.begin(), field.end());
    const double sum    = std::accumulate(field.begin(), field.end(), 0.0);
    return FieldSummary{*lo, *hi, sum / static_cast<double>(field.size())};
}

} // namespace psf::pipeline

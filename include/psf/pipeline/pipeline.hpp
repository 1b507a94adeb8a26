/**
 * @file pipeline.hpp
 * @brief end-to-end entry points: analyze → plan → project → solve → package
 *
 * run_automatic() lets the analyzer and planner pick sources from mesh
 * geometry; run_manual() takes caller coordinates + charges and validates
 * them before any numerical work. both accept an optional prebuilt
 * StiffnessOperator so repeated solves on one mesh skip assembly.
 *
 * @author LukeFrankio
 * @date 2026-10-19
 * @version 1.0
 *
 * example (basic usage):
 * @code
 * auto result = psf::pipeline::run_automatic(mesh, {});
 * if (!result) {
 *     fmt::print(stderr, "{}: {}\n", psf::to_string(result.error().code), result.error().message);
 * }
 * @endcode
 */
#pragma once

#include <cstdint>
#include <optional>
#include <vector>

#include "psf/analysis/complexity.hpp"
#include "psf/common/error.hpp"
#include "psf/mesh/mesh.hpp"
#include "psf/physics/poisson.hpp"
#include "psf/sources/planner.hpp"
#include "psf/sources/projector.hpp"

namespace psf::pipeline
{

/**
 * @brief knobs shared by both entry points
 */
struct PipelineOptions
{
    sources::PlannerOptions               planner{};
    physics::SolverOptions                solver{};
    const physics::StiffnessOperator     *stiffness{nullptr}; ///< reused when set, must match the mesh
};

/**
 * @brief packaged result: potential + the sources the solve honored
 */
struct SolveResult
{
    std::vector<double>                      potential;     ///< one value per mesh node
    sources::ProjectedSources                sources;       ///< node-aligned sources actually used
    double                                   residual_norm{};
    std::optional<analysis::ComplexityReport> report;       ///< automatic path only
    std::optional<sources::SourcePlan>        plan;         ///< automatic path only
};

/**
 * @brief min/max/mean over a field
 */
struct FieldSummary
{
    double min{};
    double max{};
    double mean{};
};

/**
 * @brief automatic pipeline (recommended or overridden source count)
 */
[[nodiscard]] auto run_automatic(const mesh::Mesh &mesh, const PipelineOptions &options) -> Result<SolveResult>;

/**
 * @brief manual pipeline; MismatchedInput / NonFiniteInput are raised before any solve
 */
[[nodiscard]] auto run_manual(const mesh::Mesh &mesh, const std::vector<common::Vec3> &coordinates,
                              const std::vector<double> &charges, const PipelineOptions &options)
    -> Result<SolveResult>;

/**
 * @brief bundles a field with its sources (pure aggregation)
 */
[[nodiscard]] auto package(physics::PotentialSolution solution, sources::ProjectedSources projected) -> SolveResult;

/**
 * @brief min/max/mean of a field (all zero for an empty field)
 *
 * ✨ PURE FUNCTION ✨
 */
[[nodiscard]] auto summarize(const std::vector<double> &field) noexcept -> FieldSummary;

} // namespace psf::pipeline

/**
 * @file sources_test.cpp
 * @brief planner strategies, nearest-node projection, manual parsing uwu
 *
 * covers the geometric invariants of every layout (dipole symmetry, exact
 * triangular charges, multi-source determinism) plus the projector's
 * exact-match and tie rules.
 */
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <cmath>
#include <limits>
#include <numeric>
#include <variant>

#include "psf/common/math.hpp"
#include "psf/sources/parse.hpp"
#include "psf/sources/planner.hpp"
#include "psf/sources/projector.hpp"
#include "support/mesh_builder.hpp"

using ::testing::DoubleNear;
using ::testing::ElementsAre;
using ::testing::HasSubstr;

namespace
{

constexpr double kEpsilon = 1.0e-12;

const psf::common::Vec3 kCenter{1.0, 2.0, 3.0};
const psf::common::Vec3 kExtents{2.0, 6.0, 4.0};

[[nodiscard]] auto plan_or_die(std::int64_t count, std::uint64_t seed = psf::sources::kDefaultSeed)
    -> psf::sources::SourcePlan
{
    auto plan = psf::sources::plan_sources(kCenter, kExtents, count, seed);
    EXPECT_TRUE(plan.has_value());
    return plan.value_or(psf::sources::SourcePlan{});
}

} // namespace

TEST(Planner, StrategySelectionFollowsCount)
{
    EXPECT_EQ(psf::sources::strategy_name(psf::sources::select_strategy(1).value()), "single");
    EXPECT_EQ(psf::sources::strategy_name(psf::sources::select_strategy(2).value()), "dipole");
    EXPECT_EQ(psf::sources::strategy_name(psf::sources::select_strategy(3).value()), "triangular");
    EXPECT_EQ(psf::sources::strategy_name(psf::sources::select_strategy(4).value()), "multi_source");
    EXPECT_EQ(psf::sources::strategy_name(psf::sources::select_strategy(17).value()), "multi_source");
}

TEST(Planner, CountBelowOneIsRejected)
{
    for (const std::int64_t count : {0, -1, -42})
    {
        const auto plan = psf::sources::plan_sources(kCenter, kExtents, count);
        ASSERT_FALSE(plan.has_value());
        EXPECT_EQ(plan.error().code, psf::ErrorCode::InvalidSourceCount);
    }
}

TEST(Planner, CountAboveTheCapIsRejected)
{
    const auto largest = psf::sources::plan_sources(kCenter, kExtents, psf::sources::kMaxSourceCount);
    ASSERT_TRUE(largest.has_value());
    EXPECT_EQ(largest->size(), static_cast<std::size_t>(psf::sources::kMaxSourceCount));

    for (const std::int64_t count : {psf::sources::kMaxSourceCount + 1, std::int64_t{4000000000000000000}})
    {
        const auto plan = psf::sources::plan_sources(kCenter, kExtents, count);
        ASSERT_FALSE(plan.has_value());
        EXPECT_EQ(plan.error().code, psf::ErrorCode::InvalidSourceCount);
        EXPECT_THAT(plan.error().context, ElementsAre("sources", "count"));
    }
}

TEST(Planner, SingleSourceSitsOnTheCenterWithUnitCharge)
{
    const auto plan = plan_or_die(1);
    ASSERT_EQ(plan.size(), 1U);
    EXPECT_THAT(plan[0].position, ElementsAre(1.0, 2.0, 3.0));
    EXPECT_DOUBLE_EQ(plan[0].charge, 1.0);
}

TEST(Planner, DipoleIsSymmetricAlongTheLongestAxisWithZeroNetCharge)
{
    const auto plan = plan_or_die(2);
    ASSERT_EQ(plan.size(), 2U);
    EXPECT_DOUBLE_EQ(plan[0].charge + plan[1].charge, 0.0);
    EXPECT_DOUBLE_EQ(plan[0].charge, 1.0);

    // y is the longest axis (6.0) → offset 1.8
    EXPECT_THAT(plan[0].position, ElementsAre(1.0, DoubleNear(3.8, kEpsilon), 3.0));
    EXPECT_THAT(plan[1].position, ElementsAre(1.0, DoubleNear(0.2, kEpsilon), 3.0));
    for (std::size_t axis = 0; axis < 3U; ++axis)
    {
        EXPECT_NEAR(0.5 * (plan[0].position[axis] + plan[1].position[axis]), kCenter[axis], kEpsilon);
    }
}

TEST(Planner, DipoleTiesPreferX)
{
    const auto plan = psf::sources::plan_sources({0.0, 0.0, 0.0}, {1.0, 1.0, 1.0}, 2);
    ASSERT_TRUE(plan.has_value());
    EXPECT_THAT((*plan)[0].position, ElementsAre(DoubleNear(0.3, kEpsilon), 0.0, 0.0));
    EXPECT_THAT((*plan)[1].position, ElementsAre(DoubleNear(-0.3, kEpsilon), 0.0, 0.0));
}

TEST(Planner, TriangularChargesAreExactAndSourcesEquidistant)
{
    const auto plan = plan_or_die(3);
    ASSERT_EQ(plan.size(), 3U);
    EXPECT_EQ(plan[0].charge, 1.0);
    EXPECT_EQ(plan[1].charge, 0.8);
    EXPECT_EQ(plan[2].charge, -0.6);

    // plane of y (6.0) and z (4.0); radius 0.3 × 6.0
    for (const auto &source : plan)
    {
        EXPECT_DOUBLE_EQ(source.position[0], kCenter[0]);
        EXPECT_NEAR(std::sqrt(psf::common::distance_squared(source.position, kCenter)), 1.8, kEpsilon);
    }
    EXPECT_THAT(plan[0].position, ElementsAre(1.0, DoubleNear(3.8, kEpsilon), DoubleNear(3.0, kEpsilon)));
}

TEST(Planner, TriangularChargesDoNotDependOnGeometry)
{
    for (const psf::common::Vec3 extents : {psf::common::Vec3{1.0, 1.0, 1.0}, psf::common::Vec3{0.0, 0.0, 0.0},
                                            psf::common::Vec3{10.0, 0.1, 3.0}})
    {
        const auto plan = psf::sources::plan_sources(kCenter, extents, 3);
        ASSERT_TRUE(plan.has_value());
        EXPECT_EQ((*plan)[0].charge, 1.0);
        EXPECT_EQ((*plan)[1].charge, 0.8);
        EXPECT_EQ((*plan)[2].charge, -0.6);
    }
}

TEST(Planner, MultiSourceChargesAlternateAndDecay)
{
    const auto plan = plan_or_die(4);
    ASSERT_EQ(plan.size(), 4U);
    EXPECT_NEAR(plan[0].charge, 1.0, kEpsilon);
    EXPECT_NEAR(plan[1].charge, -0.8, kEpsilon);
    EXPECT_NEAR(plan[2].charge, 0.6, kEpsilon);
    EXPECT_NEAR(plan[3].charge, -0.4, kEpsilon);

    const auto many = plan_or_die(11);
    ASSERT_EQ(many.size(), 11U);
    for (std::size_t i = 1; i < many.size(); ++i)
    {
        EXPECT_LT(std::abs(many[i].charge), std::abs(many[i - 1U].charge));
        EXPECT_LT(many[i].charge * many[i - 1U].charge, 0.0);
    }
    EXPECT_NEAR(many.back().charge, 0.4, kEpsilon);
}

TEST(Planner, MultiSourceIsReproducibleForAFixedSeed)
{
    const auto first  = plan_or_die(9, 7U);
    const auto second = plan_or_die(9, 7U);
    ASSERT_EQ(first.size(), second.size());
    for (std::size_t i = 0; i < first.size(); ++i)
    {
        EXPECT_EQ(first[i].position, second[i].position);
        EXPECT_EQ(first[i].charge, second[i].charge);
    }

    const auto other = plan_or_die(9, 8U);
    bool       differs = false;
    for (std::size_t i = 0; i < first.size(); ++i)
    {
        differs = differs || first[i].position != other[i].position;
    }
    EXPECT_TRUE(differs);
}

TEST(Planner, MultiSourcePerturbationIsBounded)
{
    const auto plan = plan_or_die(12);
    // tetra vertices at ±0.2 × extent, octant rounds at ±0.1 and ±0.05 × extent
    const std::array<double, 12> fractions{0.2, 0.2, 0.2, 0.2, 0.1, 0.1, 0.1, 0.1, 0.1, 0.1, 0.1, 0.1};
    for (std::size_t i = 0; i < plan.size(); ++i)
    {
        for (std::size_t axis = 0; axis < 3U; ++axis)
        {
            const double nominal = fractions[i] * kExtents[axis];
            const double offset  = std::abs(plan[i].position[axis] - kCenter[axis]);
            const double bound   = psf::sources::MultiSourceStrategy::kJitterClamp *
                                 psf::sources::MultiSourceStrategy::kJitterFraction * kExtents[axis];
            EXPECT_NEAR(offset, nominal, bound + kEpsilon) << "source " << i << " axis " << axis;
        }
    }
}

TEST(Planner, MultiSourceStaysInsideTheBoundingBox)
{
    const auto plan = plan_or_die(40);
    for (const auto &source : plan)
    {
        for (std::size_t axis = 0; axis < 3U; ++axis)
        {
            EXPECT_LE(std::abs(source.position[axis] - kCenter[axis]), 0.5 * kExtents[axis]);
        }
    }
}

TEST(Planner, ReportOverloadHonorsOverride)
{
    psf::analysis::ComplexityReport report{};
    report.center              = kCenter;
    report.extents             = kExtents;
    report.recommended_sources = 3U;

    const auto recommended = psf::sources::plan_sources(report, {});
    ASSERT_TRUE(recommended.has_value());
    EXPECT_EQ(recommended->size(), 3U);

    psf::sources::PlannerOptions options{};
    options.count_override = 2;
    const auto overridden  = psf::sources::plan_sources(report, options);
    ASSERT_TRUE(overridden.has_value());
    EXPECT_EQ(overridden->size(), 2U);

    options.count_override = 0;
    const auto rejected    = psf::sources::plan_sources(report, options);
    ASSERT_FALSE(rejected.has_value());
    EXPECT_EQ(rejected.error().code, psf::ErrorCode::InvalidSourceCount);
}

TEST(Projector, ExactNodeCoordinateMapsToThatNode)
{
    const auto mesh = psf::test_support::make_grid_mesh({});
    for (std::uint32_t node = 0; node < mesh.nodes.size(); ++node)
    {
        const auto projected = psf::sources::nearest_node(mesh.nodes, mesh.nodes[node]);
        ASSERT_TRUE(projected.has_value());
        EXPECT_EQ(*projected, node);
    }
}

TEST(Projector, TiesResolveToTheLowestIndex)
{
    const std::vector<psf::common::Vec3> nodes{{2.0, 0.0, 0.0}, {0.0, 0.0, 0.0}, {1.0, 1.0, 0.0}, {1.0, -1.0, 0.0}};
    // equidistant (1.0) from all four
    const auto projected = psf::sources::nearest_node(nodes, {1.0, 0.0, 0.0});
    ASSERT_TRUE(projected.has_value());
    EXPECT_EQ(*projected, 0U);
}

TEST(Projector, CloseCandidatesMayCollapseOntoOneNode)
{
    const auto                     mesh = psf::test_support::make_grid_mesh({});
    const psf::sources::SourcePlan plan{{{1.05, 0.98, 1.0}, 1.0}, {{0.97, 1.01, 1.02}, -0.5}};
    const auto                     projected = psf::sources::project_sources(mesh, plan);
    ASSERT_TRUE(projected.has_value());
    ASSERT_EQ(projected->size(), 2U);
    EXPECT_EQ((*projected)[0].node, (*projected)[1].node);
    EXPECT_EQ((*projected)[0].node, psf::test_support::grid_node({}, 1U, 1U, 1U));
    EXPECT_DOUBLE_EQ((*projected)[0].charge, 1.0);
    EXPECT_DOUBLE_EQ((*projected)[1].charge, -0.5);
}

TEST(Projector, IsDeterministic)
{
    const auto                     mesh = psf::test_support::make_grid_mesh({});
    const psf::sources::SourcePlan plan{{{0.4, 1.6, 0.2}, 1.0}};
    const auto                     first  = psf::sources::project_sources(mesh, plan);
    const auto                     second = psf::sources::project_sources(mesh, plan);
    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ((*first)[0].node, (*second)[0].node);
}

TEST(Projector, EmptyMeshIsRejected)
{
    const psf::sources::SourcePlan plan{{{0.0, 0.0, 0.0}, 1.0}};
    const auto                     projected = psf::sources::project_sources(psf::mesh::Mesh{}, plan);
    ASSERT_FALSE(projected.has_value());
    EXPECT_EQ(projected.error().code, psf::ErrorCode::EmptyMesh);
}

TEST(ManualParsing, ParsesSingleAndMultipleSources)
{
    const auto single = psf::sources::parse_source_list(" 1.5, -2, 3e-1 ");
    ASSERT_TRUE(single.has_value());
    ASSERT_EQ(single->size(), 1U);
    EXPECT_THAT(single->front(), ElementsAre(1.5, -2.0, 0.3));

    const auto many = psf::sources::parse_source_list("0,0,0; 1,2,3 ;+4,5,6");
    ASSERT_TRUE(many.has_value());
    ASSERT_EQ(many->size(), 3U);
    EXPECT_THAT((*many)[2], ElementsAre(4.0, 5.0, 6.0));
}

TEST(ManualParsing, RejectsMalformedSources)
{
    const auto empty = psf::sources::parse_source_list("   ");
    ASSERT_FALSE(empty.has_value());
    EXPECT_EQ(empty.error().code, psf::ErrorCode::MismatchedInput);

    const auto arity = psf::sources::parse_source_list("1,2,3;4,5");
    ASSERT_FALSE(arity.has_value());
    EXPECT_EQ(arity.error().code, psf::ErrorCode::MismatchedInput);
    EXPECT_THAT(arity.error().message, HasSubstr("3 coordinates"));
    EXPECT_THAT(arity.error().context, ElementsAre("sources", "[1]"));

    const auto garbage = psf::sources::parse_source_list("1,two,3");
    ASSERT_FALSE(garbage.has_value());
    EXPECT_EQ(garbage.error().code, psf::ErrorCode::MismatchedInput);

    const auto non_finite = psf::sources::parse_source_list("1,nan,3");
    ASSERT_FALSE(non_finite.has_value());
    EXPECT_EQ(non_finite.error().code, psf::ErrorCode::NonFiniteInput);
}

TEST(ManualParsing, ParsesChargesWithEitherSeparator)
{
    EXPECT_THAT(psf::sources::parse_charge_list("1.0").value(), ElementsAre(1.0));
    EXPECT_THAT(psf::sources::parse_charge_list("1.0, -0.5").value(), ElementsAre(1.0, -0.5));
    EXPECT_THAT(psf::sources::parse_charge_list("1;-0.5;2").value(), ElementsAre(1.0, -0.5, 2.0));

    const auto bad = psf::sources::parse_charge_list("1;;2");
    ASSERT_FALSE(bad.has_value());
    EXPECT_EQ(bad.error().code, psf::ErrorCode::MismatchedInput);

    const auto inf = psf::sources::parse_charge_list("inf");
    ASSERT_FALSE(inf.has_value());
    EXPECT_EQ(inf.error().code, psf::ErrorCode::NonFiniteInput);
}

TEST(ManualParsing, ValidationChecksCountsBeforeFiniteness)
{
    const std::vector<psf::common::Vec3> points{{0.0, 0.0, 0.0}, {1.0, 0.0, 0.0}};
    const auto mismatch = psf::sources::validate_sources_charges(points, {1.0});
    ASSERT_FALSE(mismatch.has_value());
    EXPECT_EQ(mismatch.error().code, psf::ErrorCode::MismatchedInput);

    const auto nan = psf::sources::validate_sources_charges(points, {1.0, std::numeric_limits<double>::quiet_NaN()});
    ASSERT_FALSE(nan.has_value());
    EXPECT_EQ(nan.error().code, psf::ErrorCode::NonFiniteInput);
    EXPECT_THAT(nan.error().context, ElementsAre("charges", "[1]"));

    EXPECT_TRUE(psf::sources::validate_sources_charges(points, {1.0, -1.0}).has_value());
}

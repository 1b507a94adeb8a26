/**
 * @file config_validation_test.cpp
 * @brief exhaustive scenario config validation because parsing bugs are cringe uwu
 */
#include <filesystem>
#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <stdexcept>
#include <string>

#include "psf/config/config.hpp"
#include "psf/sources/planner.hpp"
#include "support/config_builder.hpp"
#include "test_config.hpp"

using testing::ElementsAre;
using testing::HasSubstr;

namespace
{

[[nodiscard]] auto test_data_path(std::string_view file) -> std::filesystem::path
{
    return std::filesystem::path{PSF_TEST_DATA_DIR} / file;
}

[[nodiscard]] auto make_good_config() -> psf::config::Config
{
    const auto result = psf::test_support::load_config();
    if (!result)
    {
        throw std::runtime_error("expected default builder to succeed");
    }
    return result.value();
}

[[nodiscard]] auto manual_options() -> psf::test_support::ConfigBuilderOptions
{
    psf::test_support::ConfigBuilderOptions options;
    options.mode    = "manual";
    options.points  = {{0.5, 0.5, 0.5}, {0.1, 0.2, 0.3}};
    options.charges = {1.0, -1.0};
    return options;
}

} // namespace

TEST(ConfigValidation, ParsesGoldenConfigFromBuilder)
{
    const auto config = make_good_config();
    EXPECT_EQ(config.mesh_path.generic_string(), "tests/data/tetra_cube.vtk");
    EXPECT_EQ(config.sources.mode, psf::config::SourceMode::Automatic);
    EXPECT_FALSE(config.sources.count.has_value());
    EXPECT_EQ(config.sources.seed, 42U);
    EXPECT_TRUE(config.sources.points.empty());
    EXPECT_DOUBLE_EQ(config.solver.dirichlet_value, 0.0);
    EXPECT_DOUBLE_EQ(config.solver.pivot_tolerance, 1.0e-10);
    ASSERT_TRUE(config.output.vtu.has_value());
    EXPECT_EQ(config.output.vtu->generic_string(), "out/potential.vtu");
    EXPECT_FALSE(config.logging.verbose);
}

TEST(ConfigValidation, MinimalDocumentFallsBackToDefaults)
{
    const auto parsed = psf::config::load_config_from_string("mesh:\n  path: cube.vtk\n");
    ASSERT_TRUE(parsed.has_value()) << parsed.error().message;
    EXPECT_EQ(parsed->sources.mode, psf::config::SourceMode::Automatic);
    EXPECT_EQ(parsed->sources.seed, 42U);
    EXPECT_DOUBLE_EQ(parsed->solver.pivot_tolerance, 1.0e-10);
    EXPECT_FALSE(parsed->output.vtu.has_value());
    EXPECT_FALSE(parsed->logging.verbose);
}

TEST(ConfigValidation, LoadsAutomaticScenarioFromFixture)
{
    const auto result = psf::config::load_config_from_file(test_data_path("scenario_auto.yaml"));
    ASSERT_TRUE(result.has_value()) << result.error().message;
    EXPECT_EQ(result->mesh_path.generic_string(), "tetra_cube.vtk");
    EXPECT_EQ(result->sources.seed, 7U);
    EXPECT_TRUE(result->logging.verbose);
}

TEST(ConfigValidation, LoadsManualScenarioFromFixture)
{
    const auto result = psf::config::load_config_from_file(test_data_path("scenario_manual.yaml"));
    ASSERT_TRUE(result.has_value()) << result.error().message;
    EXPECT_EQ(result->sources.mode, psf::config::SourceMode::Manual);
    ASSERT_EQ(result->sources.points.size(), 2U);
    EXPECT_THAT(result->sources.points[1], ElementsAre(0.25, 0.75, 0.5));
    EXPECT_THAT(result->sources.charges, ElementsAre(1.0, -0.5));
    EXPECT_DOUBLE_EQ(result->solver.dirichlet_value, 2.5);
    EXPECT_DOUBLE_EQ(result->solver.pivot_tolerance, 1.0e-12);
}

TEST(ConfigValidation, MissingFileReportsPath)
{
    const auto missing = test_data_path("definitely_missing.yaml");
    const auto result  = psf::config::load_config_from_file(missing);
    ASSERT_FALSE(result.has_value());
    EXPECT_THAT(result.error().message, HasSubstr("unable to open config file"));
    ASSERT_FALSE(result.error().context.empty());
    EXPECT_EQ(result.error().context.front(), missing.string());
}

TEST(ConfigValidation, RejectsMalformedYaml)
{
    const auto result = psf::config::load_config_from_string("mesh: [unterminated\n");
    ASSERT_FALSE(result.has_value());
    EXPECT_THAT(result.error().message, HasSubstr("YAML parse error"));
}

TEST(ConfigValidation, RequiresMeshSection)
{
    psf::test_support::ConfigBuilderOptions options;
    options.include_mesh = false;
    const auto result    = psf::test_support::load_config(options);
    ASSERT_FALSE(result.has_value());
    EXPECT_THAT(result.error().context, ElementsAre("mesh"));
}

TEST(ConfigValidation, RejectsUnknownSourceMode)
{
    psf::test_support::ConfigBuilderOptions options;
    options.mode      = "magnetic";
    const auto result = psf::test_support::load_config(options);
    ASSERT_FALSE(result.has_value());
    EXPECT_THAT(result.error().message, HasSubstr("'auto' or 'manual'"));
    EXPECT_THAT(result.error().context, ElementsAre("sources", "mode"));
}

TEST(ConfigValidation, SourceCountMustBePositive)
{
    psf::test_support::ConfigBuilderOptions options;
    options.count = 5;
    const auto ok = psf::test_support::load_config(options);
    ASSERT_TRUE(ok.has_value()) << ok.error().message;
    EXPECT_EQ(ok->sources.count, std::optional<std::int64_t>{5});

    for (const std::int64_t bad : {std::int64_t{0}, std::int64_t{-3}, psf::sources::kMaxSourceCount + 1})
    {
        options.count     = bad;
        const auto result = psf::test_support::load_config(options);
        ASSERT_FALSE(result.has_value());
        EXPECT_THAT(result.error().context, ElementsAre("sources", "count"));
    }
}

TEST(ConfigValidation, ParsesManualPointsAndCharges)
{
    const auto result = psf::test_support::load_config(manual_options());
    ASSERT_TRUE(result.has_value()) << result.error().message;
    EXPECT_EQ(result->sources.mode, psf::config::SourceMode::Manual);
    ASSERT_EQ(result->sources.points.size(), 2U);
    EXPECT_THAT(result->sources.points[0], ElementsAre(0.5, 0.5, 0.5));
    EXPECT_THAT(result->sources.charges, ElementsAre(1.0, -1.0));
}

TEST(ConfigValidation, ManualModeRequiresPoints)
{
    auto options = manual_options();
    options.points.clear();
    options.charges.clear();
    const auto result = psf::test_support::load_config(options);
    ASSERT_FALSE(result.has_value());
    EXPECT_THAT(result.error().message, HasSubstr("requires sources.points"));
}

TEST(ConfigValidation, ManualModeRejectsCountMismatch)
{
    auto options = manual_options();
    options.charges.pop_back();
    const auto result = psf::test_support::load_config(options);
    ASSERT_FALSE(result.has_value());
    EXPECT_THAT(result.error().message, HasSubstr("2 entries but sources.charges has 1"));
    EXPECT_THAT(result.error().context, ElementsAre("sources", "charges"));
}

TEST(ConfigValidation, RejectsPointsWithWrongArity)
{
    const auto yaml = std::string{"mesh:\n  path: cube.vtk\n"
                                  "sources:\n  mode: manual\n  points:\n    - [1.0, 2.0]\n  charges: [1.0]\n"};
    const auto result = psf::config::load_config_from_string(yaml);
    ASSERT_FALSE(result.has_value());
    EXPECT_THAT(result.error().message, HasSubstr("sequence[3]"));
    EXPECT_THAT(result.error().context, ElementsAre("sources", "points", "[0]"));
}

TEST(ConfigValidation, RejectsNonFiniteCharges)
{
    const auto yaml = std::string{"mesh:\n  path: cube.vtk\n"
                                  "sources:\n  mode: manual\n  points:\n    - [0, 0, 0]\n  charges: [.nan]\n"};
    const auto result = psf::config::load_config_from_string(yaml);
    ASSERT_FALSE(result.has_value());
    EXPECT_THAT(result.error().message, HasSubstr("finite"));
    EXPECT_THAT(result.error().context, ElementsAre("sources", "charges", "[0]"));
}

TEST(ConfigValidation, RejectsNonNumericCharge)
{
    const auto yaml = std::string{"mesh:\n  path: cube.vtk\n"
                                  "sources:\n  mode: manual\n  points:\n    - [0, 0, 0]\n  charges: [lots]\n"};
    const auto result = psf::config::load_config_from_string(yaml);
    ASSERT_FALSE(result.has_value());
    EXPECT_THAT(result.error().context, ElementsAre("sources", "charges", "[0]"));
}

TEST(ConfigValidation, PivotToleranceMustSitInOpenUnitInterval)
{
    psf::test_support::ConfigBuilderOptions options;
    for (const double bad : {0.0, -1.0e-8, 1.0, 2.0})
    {
        options.pivot_tolerance = bad;
        const auto result       = psf::test_support::load_config(options);
        ASSERT_FALSE(result.has_value()) << bad;
        EXPECT_THAT(result.error().context, ElementsAre("solver", "pivot_tolerance"));
    }
}

TEST(ConfigValidation, CarriesDirichletValue)
{
    psf::test_support::ConfigBuilderOptions options;
    options.dirichlet_value = -3.25;
    const auto result       = psf::test_support::load_config(options);
    ASSERT_TRUE(result.has_value()) << result.error().message;
    EXPECT_DOUBLE_EQ(result->solver.dirichlet_value, -3.25);
}

TEST(ConfigValidation, OutputAndLoggingAreOptional)
{
    psf::test_support::ConfigBuilderOptions options;
    options.output_vtu = std::nullopt;
    options.verbose    = true;
    const auto result  = psf::test_support::load_config(options);
    ASSERT_TRUE(result.has_value()) << result.error().message;
    EXPECT_FALSE(result->output.vtu.has_value());
    EXPECT_TRUE(result->logging.verbose);
}

TEST(ConfigValidation, SourceModeLabels)
{
    EXPECT_EQ(psf::config::to_string(psf::config::SourceMode::Automatic), "auto");
    EXPECT_EQ(psf::config::to_string(psf::config::SourceMode::Manual), "manual");
}

/**
 * @file preprocess_test.cpp
 * @brief preprocessing regression so volumes + gradients + adjacency stay sane uwu
 */
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <algorithm>
#include <filesystem>
#include <numeric>
#include <stdexcept>
#include <utility>

#include "test_config.hpp"
#include "psf/mesh/mesh.hpp"
#include "psf/mesh/preprocess.hpp"
#include "psf/mesh/vtk_reader.hpp"
#include "support/mesh_builder.hpp"

using testing::ElementsAre;
using testing::HasSubstr;

namespace {

constexpr double kTol = 1.0e-12;

[[nodiscard]] auto load_fixture_mesh() -> psf::mesh::Mesh
{
    const auto mesh_result = psf::mesh::load_vtk_file(std::filesystem::path{PSF_TEST_DATA_DIR} / "tetra_cube.vtk");
    if (!mesh_result) {
        throw std::runtime_error("tetra cube fixture failed to load");
    }
    return mesh_result.value();
}

}  // namespace

TEST(PreprocessPipeline, UnitTetHasReferenceVolumeAndGradients)
{
    const auto mesh = psf::test_support::make_unit_tet();
    const auto preprocess = psf::mesh::pre::run(mesh);
    ASSERT_TRUE(preprocess.has_value()) << preprocess.error().message;
    const auto &outputs = preprocess.value();

    ASSERT_EQ(outputs.element_volumes.size(), 1U);
    EXPECT_NEAR(outputs.element_volumes.front(), 1.0 / 6.0, kTol);

    ASSERT_EQ(outputs.shape_gradients.size(), 1U);
    const auto &grads = outputs.shape_gradients.front();
    EXPECT_THAT(grads[0], ElementsAre(-1.0, -1.0, -1.0));
    EXPECT_THAT(grads[1], ElementsAre(1.0, 0.0, 0.0));
    EXPECT_THAT(grads[2], ElementsAre(0.0, 1.0, 0.0));
    EXPECT_THAT(grads[3], ElementsAre(0.0, 0.0, 1.0));
}

TEST(PreprocessPipeline, GradientsFormPartitionOfUnityOnEveryElement)
{
    const auto mesh = psf::test_support::make_grid_mesh({.nx = 4U, .spacing = {0.5, 1.5, 2.0}});
    const auto preprocess = psf::mesh::pre::run(mesh);
    ASSERT_TRUE(preprocess.has_value()) << preprocess.error().message;

    for (const auto &grads : preprocess->shape_gradients) {
        for (std::size_t axis = 0; axis < 3U; ++axis) {
            EXPECT_NEAR(grads[0][axis] + grads[1][axis] + grads[2][axis] + grads[3][axis], 0.0, 1.0e-9);
        }
    }
}

TEST(PreprocessPipeline, OrientationDoesNotFlipVolumeSign)
{
    auto mesh = psf::test_support::make_unit_tet();
    std::swap(mesh.elements.front().nodes[1], mesh.elements.front().nodes[2]);
    const auto preprocess = psf::mesh::pre::run(mesh);
    ASSERT_TRUE(preprocess.has_value()) << preprocess.error().message;
    EXPECT_NEAR(preprocess->element_volumes.front(), 1.0 / 6.0, kTol);
    // slots 1 and 2 swapped, so do their gradients
    EXPECT_THAT(preprocess->shape_gradients.front()[1], ElementsAre(0.0, 1.0, 0.0));
}

TEST(PreprocessPipeline, CubeFixtureVolumesSumToOne)
{
    const auto mesh = load_fixture_mesh();
    const auto preprocess = psf::mesh::pre::run(mesh);
    ASSERT_TRUE(preprocess.has_value()) << preprocess.error().message;
    ASSERT_EQ(preprocess->element_volumes.size(), 6U);
    for (const auto volume : preprocess->element_volumes) {
        EXPECT_NEAR(volume, 1.0 / 6.0, kTol);
    }
    const double total = std::accumulate(preprocess->element_volumes.begin(), preprocess->element_volumes.end(), 0.0);
    EXPECT_NEAR(total, 1.0, kTol);
}

TEST(PreprocessPipeline, AdjacencyListsEveryIncidence)
{
    const auto mesh = load_fixture_mesh();
    const auto preprocess = psf::mesh::pre::run(mesh);
    ASSERT_TRUE(preprocess.has_value()) << preprocess.error().message;
    const auto &adjacency = preprocess->adjacency;

    ASSERT_EQ(adjacency.offsets.size(), mesh.nodes.size() + 1U);
    EXPECT_EQ(adjacency.offsets.back(), 24U);
    // the diagonal endpoints sit in every tet
    EXPECT_EQ(adjacency.offsets[1] - adjacency.offsets[0], 6U);
    EXPECT_EQ(adjacency.offsets[8] - adjacency.offsets[7], 6U);
    EXPECT_EQ(adjacency.offsets[2] - adjacency.offsets[1], 2U);

    for (std::size_t node = 0; node < mesh.nodes.size(); ++node) {
        for (auto slot = adjacency.offsets[node]; slot < adjacency.offsets[node + 1U]; ++slot) {
            const auto &element = mesh.elements[adjacency.element_indices[slot]];
            EXPECT_NE(std::find(element.nodes.begin(), element.nodes.end(), node), element.nodes.end());
        }
    }
}

TEST(PreprocessPipeline, RejectsEmptyMesh)
{
    const auto result = psf::mesh::pre::run(psf::mesh::Mesh{});
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, psf::ErrorCode::EmptyMesh);
}

TEST(PreprocessPipeline, RejectsMeshWithoutElements)
{
    const auto result = psf::mesh::pre::run(psf::test_support::make_point_cloud(5U));
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, psf::ErrorCode::InvalidMesh);
    EXPECT_THAT(result.error().message, HasSubstr("zero elements"));
}

TEST(PreprocessPipeline, RejectsDegenerateTetrahedron)
{
    auto mesh = psf::test_support::make_unit_tet();
    mesh.nodes[3] = {0.5, 0.5, 0.0};
    const auto result = psf::mesh::pre::run(mesh);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, psf::ErrorCode::InvalidMesh);
    EXPECT_THAT(result.error().message, HasSubstr("volume non-positive"));
    EXPECT_THAT(result.error().context, ElementsAre("elements", "[0]"));
}

TEST(PreprocessPipeline, RejectsOutOfRangeNode)
{
    auto mesh = psf::test_support::make_unit_tet();
    mesh.elements.front().nodes[2] = 17U;
    const auto result = psf::mesh::pre::run(mesh);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, psf::ErrorCode::InvalidMesh);
    EXPECT_THAT(result.error().message, HasSubstr("node 17 out of range"));
}

TEST(PreprocessPipeline, RejectsDuplicateElements)
{
    auto mesh = psf::test_support::make_unit_tet();
    mesh.elements.push_back(psf::mesh::Element{{3U, 2U, 1U, 0U}, 0U});
    const auto result = psf::mesh::pre::run(mesh);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, psf::ErrorCode::InvalidMesh);
    EXPECT_THAT(result.error().message, HasSubstr("element 0 and element 1"));
}

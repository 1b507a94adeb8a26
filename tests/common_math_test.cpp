/**
 * @file common_math_test.cpp
 * @brief Vec3 helpers + error naming sanity checks
 */
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <cmath>
#include <limits>

#include "psf/common/error.hpp"
#include "psf/common/math.hpp"

using ::testing::ElementsAre;

TEST(CommonMath, CrossFollowsRightHandRule)
{
    constexpr psf::common::Vec3 x{1.0, 0.0, 0.0};
    constexpr psf::common::Vec3 y{0.0, 1.0, 0.0};
    static_assert(psf::common::cross(x, y)[2] == 1.0);
    EXPECT_THAT(psf::common::cross(y, x), ElementsAre(0.0, 0.0, -1.0));
}

TEST(CommonMath, DistanceSquaredIsExactlyZeroOnCoincidentPoints)
{
    const psf::common::Vec3 p{0.1, 0.2, 0.3};
    EXPECT_EQ(psf::common::distance_squared(p, p), 0.0);
    EXPECT_DOUBLE_EQ(psf::common::distance_squared({0.0, 0.0, 0.0}, {1.0, 2.0, 2.0}), 9.0);
}

TEST(CommonMath, ArithmeticHelpers)
{
    EXPECT_THAT(psf::common::add({1.0, 2.0, 3.0}, {1.0, 1.0, 1.0}), ElementsAre(2.0, 3.0, 4.0));
    EXPECT_THAT(psf::common::subtract({1.0, 2.0, 3.0}, {1.0, 1.0, 1.0}), ElementsAre(0.0, 1.0, 2.0));
    EXPECT_THAT(psf::common::scale({1.0, -2.0, 3.0}, 2.0), ElementsAre(2.0, -4.0, 6.0));
    EXPECT_DOUBLE_EQ(psf::common::magnitude({3.0, 4.0, 12.0}), 13.0);
    EXPECT_EQ(psf::common::magnitude({0.0, 0.0, 0.0}), 0.0);
}

TEST(CommonMath, FinitenessCheck)
{
    EXPECT_TRUE(psf::common::is_finite({0.0, -1.0, 1.0e300}));
    EXPECT_FALSE(psf::common::is_finite({std::numeric_limits<double>::quiet_NaN(), 0.0, 0.0}));
    EXPECT_FALSE(psf::common::is_finite({0.0, std::numeric_limits<double>::infinity(), 0.0}));
}

TEST(CommonError, CodesHaveStableNames)
{
    EXPECT_EQ(psf::to_string(psf::ErrorCode::EmptyMesh), "EmptyMeshError");
    EXPECT_EQ(psf::to_string(psf::ErrorCode::MismatchedInput), "MismatchedInputError");
    EXPECT_EQ(psf::to_string(psf::ErrorCode::NoBoundaryNodes), "NoBoundaryNodesError");
    EXPECT_EQ(psf::to_string(psf::ErrorCode::SingularSystem), "SingularSystemError");

    const psf::Result<int> failed = psf::make_unexpected(psf::ErrorCode::InvalidMesh, "bad", {"elements", "[3]"});
    ASSERT_FALSE(failed.has_value());
    EXPECT_EQ(failed.error().code, psf::ErrorCode::InvalidMesh);
    EXPECT_THAT(failed.error().context, ElementsAre("elements", "[3]"));
}

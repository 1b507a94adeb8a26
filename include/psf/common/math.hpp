/**
 * @file math.hpp
 * @brief tiny Vec3 toolkit for tetra geometry + source placement uwu
 *
 * this header centralizes the slice of vector math the potential solver
 * needs: dot/cross for tetrahedron volumes and P1 gradients, plus the
 * add/subtract/scale/distance helpers the planner and projector lean on.
 * everything is header-only, constexpr where std allows it, and allocation
 * free so the optimizer can inline it all away.
 *
 * no Eigen, no GLM: plain std::array<double, 3> keeps the flat node arrays
 * trivially copyable and cache friendly ✨
 *
 * @author LukeFrankio
 * @date 2026-10-19
 * @version 1.0
 *
 * @note compiled in -std=c++23 mode
 *
 * example (basic usage):
 * @code
 * using namespace psf::common;
 * constexpr Vec3 a{1.0, 0.0, 0.0};
 * constexpr Vec3 b{0.0, 1.0, 0.0};
 * constexpr Vec3 c = cross(a, b);
 * // c == {0.0, 0.0, 1.0} and distance_squared(a, b) == 2.0 uwu
 * @endcode
 */
#pragma once

#include <array>
#include <cmath>
#include <limits>

namespace psf::common {

/**
 * @brief 3D vector alias that keeps STL friendly vibes
 *
 * plain aggregate, usable at compile time, zero drama fr fr
 */
using Vec3 = std::array<double, 3>;

/**
 * @brief 3D dot product in pure functional style
 *
 * ✨ PURE FUNCTION ✨
 *
 * this function is pure because:
 * - referential transparency applies (same inputs = same output)
 * - no side effects, no throws, just math uwu
 *
 * @param[in] lhs left vector operand
 * @param[in] rhs right vector operand
 * @return scalar dot product
 *
 * @complexity O(1) time, O(1) space
 */
[[nodiscard]] constexpr auto dot(const Vec3 &lhs, const Vec3 &rhs) noexcept -> double
{
    return (lhs[0] * rhs[0]) + (lhs[1] * rhs[1]) + (lhs[2] * rhs[2]);
}

/**
 * @brief right-handed cross product (tetra gradients live on this)
 *
 * ✨ PURE FUNCTION ✨
 *
 * @param[in] lhs first vector operand (defines the orientation)
 * @param[in] rhs second vector operand
 * @return Vec3 orthogonal vector following right-hand rule
 */
[[nodiscard]] constexpr auto cross(const Vec3 &lhs, const Vec3 &rhs) noexcept -> Vec3
{
    return Vec3{
        (lhs[1] * rhs[2]) - (lhs[2] * rhs[1]),
        (lhs[2] * rhs[0]) - (lhs[0] * rhs[2]),
        (lhs[0] * rhs[1]) - (lhs[1] * rhs[0])
    };
}

/**
 * @brief component-wise lhs - rhs
 */
[[nodiscard]] constexpr auto subtract(const Vec3 &lhs, const Vec3 &rhs) noexcept -> Vec3
{
    return Vec3{lhs[0] - rhs[0], lhs[1] - rhs[1], lhs[2] - rhs[2]};
}

/**
 * @brief component-wise lhs + rhs
 */
[[nodiscard]] constexpr auto add(const Vec3 &lhs, const Vec3 &rhs) noexcept -> Vec3
{
    return Vec3{lhs[0] + rhs[0], lhs[1] + rhs[1], lhs[2] + rhs[2]};
}

/**
 * @brief uniform scale (value * scalar)
 */
[[nodiscard]] constexpr auto scale(const Vec3 &value, double scalar) noexcept -> Vec3
{
    return Vec3{value[0] * scalar, value[1] * scalar, value[2] * scalar};
}

/**
 * @brief squared Euclidean distance, the projector's comparison key
 *
 * ✨ PURE FUNCTION ✨
 *
 * squared on purpose: nearest-node search only compares distances, so the
 * sqrt is pure overhead. an exact coordinate match returns exactly 0.0.
 *
 * @param[in] lhs first point
 * @param[in] rhs second point
 * @return |lhs - rhs|^2 (non-negative)
 */
[[nodiscard]] constexpr auto distance_squared(const Vec3 &lhs, const Vec3 &rhs) noexcept -> double
{
    const Vec3 delta = subtract(lhs, rhs);
    return dot(delta, delta);
}

/**
 * @brief Euclidean magnitude with a denormal clamp
 *
 * ✨ PURE FUNCTION ✨
 *
 * @param[in] value vector under inspection
 * @return non-negative magnitude (subnormal results snap to zero)
 *
 * @note leverages std::hypot for precision and overflow resilience
 * @warning NaN inputs propagate per IEEE 754
 */
[[nodiscard]] inline auto magnitude(const Vec3 &value) noexcept -> double
{
    const auto hypot = std::hypot(value[0], value[1], value[2]);
    if (hypot < std::numeric_limits<double>::denorm_min()) {
        return 0.0;
    }
    return hypot;
}

/**
 * @brief true when every component is finite (no NaN/inf sneaking in)
 */
[[nodiscard]] inline auto is_finite(const Vec3 &value) noexcept -> bool
{
    return std::isfinite(value[0]) && std::isfinite(value[1]) && std::isfinite(value[2]);
}

}  // namespace psf::common

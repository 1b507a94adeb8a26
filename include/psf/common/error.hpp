/**
 * @file error.hpp
 * @brief shared error payload for the potential-field core uwu
 *
 * every core stage (analyzer, planner, projector, assembler, pipeline) reports
 * failures through std::expected<T, psf::Error>. the code enum names the
 * failure category so callers can branch on it, while message + context keep
 * the breadcrumb vibes the loaders already use (e.g. {"sources", "[2]"}).
 *
 * nothing here throws; errors are plain values.
 *
 * @author LukeFrankio
 * @date 2026-10-19
 * @version 1.0
 */
#pragma once

#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace psf
{

/**
 * @brief failure categories surfaced by the core pipeline
 */
enum class ErrorCode : std::uint8_t
{
    EmptyMesh,          ///< mesh has zero nodes (center/extents undefined)
    InvalidSourceCount, ///< requested source count < 1
    MismatchedInput,    ///< manual sources/charges disagree in count or shape
    NonFiniteInput,     ///< NaN/inf in manual sources or charges
    NoBoundaryNodes,    ///< no boundary facets, Dirichlet condition impossible
    SingularSystem,     ///< reduced stiffness matrix not positive definite
    InvalidMesh         ///< bad node references or degenerate tetrahedra
};

/**
 * @brief error payload with code + breadcrumbs
 */
struct Error
{
    ErrorCode                code;    ///< machine-readable category
    std::string              message; ///< human-friendly vibe check for what failed
    std::vector<std::string> context; ///< breadcrumb trail (e.g. "elements", "[12]")
};

/**
 * @brief result alias used across the core (std::expected wrapper)
 */
template <typename T>
using Result = std::expected<T, Error>;

/**
 * @brief stable name for an ErrorCode (logs, CLI output, tests)
 *
 * ✨ PURE FUNCTION ✨
 */
[[nodiscard]] constexpr auto to_string(ErrorCode code) noexcept -> std::string_view
{
    switch (code)
    {
    case ErrorCode::EmptyMesh:
        return "EmptyMeshError";
    case ErrorCode::InvalidSourceCount:
        return "InvalidSourceCountError";
    case ErrorCode::MismatchedInput:
        return "MismatchedInputError";
    case ErrorCode::NonFiniteInput:
        return "NonFiniteInputError";
    case ErrorCode::NoBoundaryNodes:
        return "NoBoundaryNodesError";
    case ErrorCode::SingularSystem:
        return "SingularSystemError";
    case ErrorCode::InvalidMesh:
        return "InvalidMeshError";
    }
    return "UnknownError";
}

/**
 * @brief builds an unexpected Error in one line (keeps call sites tidy)
 */
[[nodiscard]] inline auto make_unexpected(ErrorCode code, std::string message,
                                          std::vector<std::string> context = {})
    -> std::unexpected<Error>
{
    return std::unexpected(Error{code, std::move(message), std::move(context)});
}

} // namespace psf

/**
 * @file parse.hpp
 * @brief manual source/charge string parsing + validation
 *
 * formats (whitespace around numbers is ignored):
 * - sources: `x,y,z` or `x,y,z;x,y,z;...` (exactly three numbers per group)
 * - charges: `q`, `q1,q2,...` or `q1;q2;...` (';' wins when both appear)
 *
 * malformed text maps to ErrorCode::MismatchedInput, NaN/inf values to
 * ErrorCode::NonFiniteInput.
 *
 * @author LukeFrankio
 * @date 2026-10-19
 * @version 1.0
 */
#pragma once

#include <string_view>
#include <vector>

#include "psf/common/error.hpp"
#include "psf/common/math.hpp"

namespace psf::sources
{

[[nodiscard]] auto parse_source_list(std::string_view text) -> Result<std::vector<common::Vec3>>;

[[nodiscard]] auto parse_charge_list(std::string_view text) -> Result<std::vector<double>>;

/**
 * @brief manual-override gate: equal counts, at least one source, all finite
 *
 * ✨ PURE FUNCTION ✨
 *
 * @return void, ErrorCode::MismatchedInput or ErrorCode::NonFiniteInput
 */
[[nodiscard]] auto validate_sources_charges(const std::vector<common::Vec3> &points,
                                            const std::vector<double> &charges) -> Result<void>;

} // namespace psf::sources

/**
 * @file parse.cpp
 * @brief from_chars based list parsing for manual sources/charges
 */
#include "psf/sources/parse.hpp"

#include <charconv>
#include <cmath>
#include <string>

#include <fmt/core.h>

namespace psf::sources
{
namespace
{

[[nodiscard]] auto trim(std::string_view value) -> std::string_view
{
    const auto start = value.find_first_not_of(" \t\r\n");
    if (start == std::string_view::npos)
    {
        return {};
    }
    const auto end = value.find_last_not_of(" \t\r\n");
    return value.substr(start, end - start + 1U);
}

[[nodiscard]] auto split(std::string_view text, char separator) -> std::vector<std::string_view>
{
    std::vector<std::string_view> parts;
    std::size_t                   begin = 0U;
    while (true)
    {
        const auto end = text.find(separator, begin);
        parts.push_back(trim(text.substr(begin, end == std::string_view::npos ? std::string_view::npos : end - begin)));
        if (end == std::string_view::npos)
        {
            break;
        }
        begin = end + 1U;
    }
    return parts;
}

[[nodiscard]] auto parse_number(std::string_view token, std::string context) -> Result<double>
{
    double value = 0.0;
    // from_chars rejects a leading '+', strip it to accept "+1.0"
    if (!token.empty() && token.front() == '+')
    {
        token.remove_prefix(1U);
    }
    const auto *first      = token.data();
    const auto *last       = token.data() + token.size();
    const auto [ptr, errc] = std::from_chars(first, last, value);
    if (token.empty() || errc != std::errc{} || ptr != last)
    {
        return make_unexpected(ErrorCode::MismatchedInput, fmt::format("'{}' is not a number", token),
                               {std::move(context)});
    }
    if (!std::isfinite(value))
    {
        return make_unexpected(ErrorCode::NonFiniteInput, fmt::format("'{}' is not finite", token),
                               {std::move(context)});
    }
    return value;
}

} // namespace

auto parse_source_list(std::string_view text) -> Result<std::vector<common::Vec3>>
{
    text = trim(text);
    if (text.empty())
    {
        return make_unexpected(ErrorCode::MismatchedInput, "source list is empty", {"sources"});
    }
    std::vector<common::Vec3> points;
    const auto                groups = split(text, ';');
    for (std::size_t g = 0; g < groups.size(); ++g)
    {
        const auto coords = split(groups[g], ',');
        if (coords.size() != 3U)
        {
            return make_unexpected(ErrorCode::MismatchedInput,
                                   fmt::format("each source needs 3 coordinates (x,y,z), found {}", coords.size()),
                                   {"sources", fmt::format("[{}]", g)});
        }
        common::Vec3 point{};
        for (std::size_t axis = 0; axis < 3; ++axis)
        {
            auto value = parse_number(coords[axis], fmt::format("sources[{}][{}]", g, axis));
            if (!value)
            {
                return std::unexpected(value.error());
            }
            point[axis] = *value;
        }
        points.push_back(point);
    }
    return points;
}

auto parse_charge_list(std::string_view text) -> Result<std::vector<double>>
{
    text = trim(text);
    if (text.empty())
    {
        return make_unexpected(ErrorCode::MismatchedInput, "charge list is empty", {"charges"});
    }
    const char separator = text.find(';') != std::string_view::npos ? ';' : ',';

    std::vector<double> charges;
    const auto          tokens = split(text, separator);
    for (std::size_t i = 0; i < tokens.size(); ++i)
    {
        auto value = parse_number(tokens[i], fmt::format("charges[{}]", i));
        if (!value)
        {
            return std::unexpected(value.error());
        }
        charges.push_back(*value);
    }
    return charges;
}

auto validate_sources_charges(const std::vector<common::Vec3> &points, const std::vector<double> &charges)
    -> Result<void>
{
    if (points.empty())
    {
        return make_unexpected(ErrorCode::MismatchedInput, "at least one source is required", {"sources"});
    }
    if (points.size() != charges.size())
    {
        return make_unexpected(ErrorCode::MismatchedInput,
                               fmt::format("{} sources but {} charges", points.size(), charges.size()),
                               {"sources", "charges"});
    }
    for (std::size_t i = 0; i < points.size(); ++i)
    {
        if (!common::is_finite(points[i]))
        {
            return make_unexpected(ErrorCode::NonFiniteInput, "source coordinate is not finite",
                                   {"sources", fmt::format("[{}]", i)});
        }
        if (!std::isfinite(charges[i]))
        {
            return make_unexpected(ErrorCode::NonFiniteInput, "charge is not finite",
                                   {"charges", fmt::format("[{}]", i)});
        }
    }
    return {};
}

} // namespace psf::sources

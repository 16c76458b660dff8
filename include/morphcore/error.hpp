#pragma once
#include <cstdint>
#include <format>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include "log.hpp"

namespace morphcore {

// ---------------------------------------------------------------------------
// ErrorCode -- every failure the library can report
// ---------------------------------------------------------------------------

enum class ErrorCode : std::uint8_t {
    invalid_weight_count,    // chamfer weight array has an unsupported length
    invalid_weight_value,    // zero, negative or non-finite chamfer weight
    rank_mismatch,           // 2D mask applied to 3D grid (or vice versa)
    size_mismatch,           // marker and mask grids differ in dimensions
    invalid_adjacency,       // adjacency not valid for the grid rank
    invalid_label_capacity,  // capacity larger than the label type can hold
    distance_overflow,       // distance does not fit the output type
    label_capacity_exceeded, // more components than the capacity allows
    preset_not_found,        // unknown chamfer preset label
    cancelled                // stop requested through ScanControl
};

[[nodiscard]] constexpr std::string_view error_code_name(ErrorCode code) noexcept
{
    switch (code) {
        case ErrorCode::invalid_weight_count:    return "invalid_weight_count";
        case ErrorCode::invalid_weight_value:    return "invalid_weight_value";
        case ErrorCode::rank_mismatch:           return "rank_mismatch";
        case ErrorCode::size_mismatch:           return "size_mismatch";
        case ErrorCode::invalid_adjacency:       return "invalid_adjacency";
        case ErrorCode::invalid_label_capacity:  return "invalid_label_capacity";
        case ErrorCode::distance_overflow:       return "distance_overflow";
        case ErrorCode::label_capacity_exceeded: return "label_capacity_exceeded";
        case ErrorCode::preset_not_found:        return "preset_not_found";
        case ErrorCode::cancelled:               return "cancelled";
    }
    return "unknown";
}

// ---------------------------------------------------------------------------
// Error -- exception thrown by all morphcore operations
// ---------------------------------------------------------------------------

class Error final : public std::runtime_error {
    ErrorCode code_;

public:
    Error(ErrorCode code, const std::string& message)
        : std::runtime_error(std::format("{}: {}", error_code_name(code), message))
        , code_{code}
    {
    }

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }
};

/// Format the message, log it at debug level and throw an Error.
template <typename... Args>
[[noreturn]] void raise(ErrorCode code, std::format_string<Args...> fmt, Args&&... args)
{
    auto message = std::format(fmt, std::forward<Args>(args)...);
    Logger::debug("{}: {}", error_code_name(code), message);
    throw Error(code, message);
}

} // namespace morphcore

#pragma once
#include <cstddef>
#include <functional>
#include <stop_token>
#include <string_view>

#include "error.hpp"

namespace morphcore {

// ---------------------------------------------------------------------------
// ScanControl -- cooperative cancellation and row-level progress
// ---------------------------------------------------------------------------

struct ScanControl {
    // Polled once per raster row; a stop request aborts the call with
    // ErrorCode::cancelled.
    std::stop_token stop_token{};

    // Called once per raster row with the stage name ("forward",
    // "backward", "labeling", ...), the row just started and the row count.
    std::function<void(std::string_view stage, std::size_t row, std::size_t rows)>
        on_progress = nullptr;

    /// Row checkpoint used by every sweep.
    void checkpoint(std::string_view stage, std::size_t row, std::size_t rows) const
    {
        if (stop_token.stop_requested()) {
            raise(ErrorCode::cancelled, "{} stopped at row {} of {}", stage, row, rows);
        }
        if (on_progress) {
            on_progress(stage, row, rows);
        }
    }
};

} // namespace morphcore

#pragma once
#include <cstddef>
#include <cstdint>
#include <limits>
#include <span>
#include <type_traits>
#include <vector>

#include "connectivity.hpp"
#include "error.hpp"
#include "grid.hpp"
#include "log.hpp"
#include "scan_control.hpp"

namespace morphcore {

// ---------------------------------------------------------------------------
// Label capacity
// ---------------------------------------------------------------------------

enum class LabelDepth : std::uint8_t {
    bits8 = 8,
    bits16 = 16,
    bits32 = 32
};

/// Largest number of labels a label image of the given depth can hold.
/// 32-bit labels stop at 2^23 - 1 so they stay exact when stored as float.
[[nodiscard]] constexpr std::size_t label_capacity(LabelDepth depth) noexcept
{
    switch (depth) {
        case LabelDepth::bits8:  return 255;
        case LabelDepth::bits16: return 65535;
        case LabelDepth::bits32: return (std::size_t{1} << 23) - 1;
    }
    return 0;
}

template <FieldValue Num>
[[nodiscard]] constexpr std::size_t max_label_count() noexcept
{
    if constexpr (std::is_same_v<Num, std::uint8_t>) return label_capacity(LabelDepth::bits8);
    else if constexpr (std::is_same_v<Num, std::uint16_t>) return label_capacity(LabelDepth::bits16);
    else return label_capacity(LabelDepth::bits32);
}

template <FieldValue Num>
struct LabelResult {
    Grid<Num> labels;
    std::size_t count = 0;
};

// ---------------------------------------------------------------------------
// Implementation details
// ---------------------------------------------------------------------------

namespace detail {

/// Scan in raster order; every unlabelled cell with in_region(i) starts a
/// new label which an explicit-stack flood fill spreads over its component.
template <FieldValue Num, GridValue T, typename InRegion>
[[nodiscard]] LabelResult<Num> flood_fill_labeling(const Grid<T>& image,
                                                   GridConnectivity adjacency,
                                                   std::size_t capacity,
                                                   const ScanControl& control,
                                                   InRegion&& in_region)
{
    check_connectivity(adjacency, image.rank());
    if (capacity > max_label_count<Num>()) {
        raise(ErrorCode::invalid_label_capacity,
              "capacity {} exceeds the {} labels a {}-byte label image can hold",
              capacity, max_label_count<Num>(), sizeof(Num));
    }

    LabelResult<Num> result{Grid<Num>::like(image), 0};
    auto& labels = result.labels;
    const auto neighbors = neighbor_offsets(adjacency);

    const std::size_t width = image.width();
    const std::size_t height = image.height();
    const std::size_t rows = height * image.depth();

    std::vector<std::size_t> stack;

    for (std::size_t row = 0; row < rows; ++row) {
        control.checkpoint("labeling", row, rows);
        const std::size_t z = row / height;
        const std::size_t y = row % height;

        for (std::size_t x = 0; x < width; ++x) {
            const std::size_t seed = image.index(x, y, z);
            if (labels[seed] != Num{0} || !in_region(seed)) continue;

            if (result.count == capacity) {
                raise(ErrorCode::label_capacity_exceeded,
                      "component starting at ({}, {}, {}) needs label {} but the capacity is {}",
                      x, y, z, result.count + 1, capacity);
            }
            const auto label = static_cast<Num>(++result.count);

            labels[seed] = label;
            stack.push_back(seed);
            while (!stack.empty()) {
                const std::size_t i = stack.back();
                stack.pop_back();

                const auto cx = static_cast<std::ptrdiff_t>(i % width);
                const auto cy = static_cast<std::ptrdiff_t>((i / width) % height);
                const auto cz = static_cast<std::ptrdiff_t>(i / (width * height));

                for (const auto& o : neighbors) {
                    const auto nx = cx + o.dx;
                    const auto ny = cy + o.dy;
                    const auto nz = cz + o.dz;
                    if (!image.contains(nx, ny, nz)) continue;

                    const std::size_t n = image.index(static_cast<std::size_t>(nx),
                                                      static_cast<std::size_t>(ny),
                                                      static_cast<std::size_t>(nz));
                    if (labels[n] != Num{0} || !in_region(n)) continue;
                    labels[n] = label;
                    stack.push_back(n);
                }
            }
        }
    }

    Logger::debug("labeling: {} components with {}-adjacency",
                  result.count, static_cast<unsigned>(adjacency));
    return result;
}

} // namespace detail

// ---------------------------------------------------------------------------
// Public API
// ---------------------------------------------------------------------------

/// Label the connected components of the foreground (nonzero cells).
///
/// Labels are 1..count in order of each component's first cell in raster
/// order; background stays 0.
///
/// @param adjacency  four/eight for 2D grids, six/eighteen/twenty_six for 3D
/// @param capacity   maximum number of labels; defaults to what Num can hold
///
/// @throws Error  invalid_adjacency, invalid_label_capacity,
///                label_capacity_exceeded, cancelled
template <FieldValue Num, GridValue T>
[[nodiscard]] LabelResult<Num> label_components(const Grid<T>& image,
                                                GridConnectivity adjacency,
                                                std::size_t capacity = max_label_count<Num>(),
                                                const ScanControl& control = {})
{
    return detail::flood_fill_labeling<Num>(
        image, adjacency, capacity, control,
        [&](std::size_t i) { return image[i] != T{0}; });
}

/// Label the connected components of the cells equal to @p region in an
/// existing label image, e.g. to split a region into its connected parts.
template <FieldValue Num, GridValue T>
[[nodiscard]] LabelResult<Num> label_region_components(const Grid<T>& labels,
                                                       std::type_identity_t<T> region,
                                                       GridConnectivity adjacency,
                                                       std::size_t capacity = max_label_count<Num>(),
                                                       const ScanControl& control = {})
{
    return detail::flood_fill_labeling<Num>(
        labels, adjacency, capacity, control,
        [&](std::size_t i) { return labels[i] == region; });
}

} // namespace morphcore

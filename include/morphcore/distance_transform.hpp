#pragma once
#include <cstddef>
#include <cstdint>
#include <limits>
#include <span>
#include <string_view>
#include <type_traits>
#include <vector>

#include "chamfer_mask.hpp"
#include "error.hpp"
#include "grid.hpp"
#include "log.hpp"
#include "scan_control.hpp"

namespace morphcore {

// ---------------------------------------------------------------------------
// Implementation details (shared with the geodesic transform)
// ---------------------------------------------------------------------------

namespace detail {

/// Integer outputs accumulate in 64 bits so no intermediate value wraps.
template <FieldValue Num>
using accumulator_t = std::conditional_t<std::is_floating_point_v<Num>, float, std::uint64_t>;

/// Integer outputs use the mask's integer weights, float outputs its float weights.
template <FieldValue Num>
using weight_t = std::conditional_t<std::is_floating_point_v<Num>, float, std::uint16_t>;

template <typename A>
[[nodiscard]] constexpr A unreached() noexcept
{
    if constexpr (std::is_floating_point_v<A>) return std::numeric_limits<A>::infinity();
    else return std::numeric_limits<A>::max();
}

/// Output value for cells that no source reaches.
template <FieldValue Num>
[[nodiscard]] constexpr Num sentinel() noexcept
{
    if constexpr (std::is_floating_point_v<Num>) return std::numeric_limits<Num>::infinity();
    else return std::numeric_limits<Num>::max();
}

template <GridValue T>
void check_rank(const Grid<T>& grid, const ChamferMask& mask)
{
    if (grid.rank() != mask.rank()) {
        raise(ErrorCode::rank_mismatch,
              "{}D chamfer mask applied to a {}D grid", mask.rank(), grid.rank());
    }
}

/// One raster sweep over @p shape. Forward visits rows and columns in
/// increasing order, backward in decreasing order.
///
/// @p active(i) selects the cells that are updated; @p cost(i, n, w) is the
/// candidate distance for cell i reached from neighbor n through weight w.
/// Returns true if any cell decreased.
template <bool Forward, GridValue T, typename A, ChamferWeight W,
          typename Active, typename Cost>
bool chamfer_sweep(const Grid<T>& shape, std::vector<A>& dist,
                   std::span<const ChamferOffset<W>> offsets,
                   const ScanControl& control, std::string_view stage,
                   Active&& active, Cost&& cost)
{
    const std::size_t width = shape.width();
    const std::size_t height = shape.height();
    const std::size_t rows = height * shape.depth();
    bool changed = false;

    for (std::size_t k = 0; k < rows; ++k) {
        control.checkpoint(stage, k, rows);

        const std::size_t row = Forward ? k : rows - 1 - k;
        const std::size_t z = row / height;
        const std::size_t y = row % height;

        for (std::size_t s = 0; s < width; ++s) {
            const std::size_t x = Forward ? s : width - 1 - s;
            const std::size_t i = shape.index(x, y, z);
            if (!active(i)) continue;

            A best = dist[i];
            for (const auto& o : offsets) {
                const auto nx = static_cast<std::ptrdiff_t>(x) + o.dx;
                const auto ny = static_cast<std::ptrdiff_t>(y) + o.dy;
                const auto nz = static_cast<std::ptrdiff_t>(z) + o.dz;
                if (!shape.contains(nx, ny, nz)) continue;

                const std::size_t n = shape.index(static_cast<std::size_t>(nx),
                                                  static_cast<std::size_t>(ny),
                                                  static_cast<std::size_t>(nz));
                const A candidate = cost(i, n, o.weight);
                if (candidate < best) best = candidate;
            }

            if (best < dist[i]) {
                dist[i] = best;
                changed = true;
            }
        }
    }
    return changed;
}

/// d[n] + w, or unreached if the neighbor has not been reached yet.
template <typename A, ChamferWeight W>
[[nodiscard]] constexpr A step(A from, W weight) noexcept
{
    return from == unreached<A>() ? from : from + static_cast<A>(weight);
}

/// Convert the working buffer to the output type.
///
/// Integer outputs: half-up rounding when normalizing, sentinel for
/// unreached cells, distance_overflow for values that collide with it.
/// @p outside(i) marks cells that are not part of the domain (NaN for
/// float outputs, sentinel for integer outputs).
template <FieldValue Num, GridValue T, typename A, typename Outside>
[[nodiscard]] Grid<Num> finalize_distances(const Grid<T>& shape, const std::vector<A>& dist,
                                           A norm, bool normalize, Outside&& outside)
{
    auto out = Grid<Num>::like(shape);
    for (std::size_t i = 0; i < dist.size(); ++i) {
        if (outside(i)) {
            if constexpr (std::is_floating_point_v<Num>) {
                out[i] = std::numeric_limits<Num>::quiet_NaN();
            } else {
                out[i] = sentinel<Num>();
            }
            continue;
        }

        const A d = dist[i];
        if (d == unreached<A>()) {
            out[i] = sentinel<Num>();
            continue;
        }

        if constexpr (std::is_floating_point_v<Num>) {
            out[i] = normalize ? d / norm : d;
        } else {
            const A value = normalize ? (2 * d + norm) / (2 * norm) : d;
            if (value >= static_cast<A>(sentinel<Num>())) {
                const std::size_t x = i % shape.width();
                const std::size_t y = (i / shape.width()) % shape.height();
                const std::size_t z = i / (shape.width() * shape.height());
                raise(ErrorCode::distance_overflow,
                      "distance {} at ({}, {}, {}) does not fit a {}-bit output",
                      value, x, y, z, sizeof(Num) * 8);
            }
            out[i] = static_cast<Num>(value);
        }
    }
    return out;
}

template <FieldValue Num, bool LabelMode, GridValue T>
[[nodiscard]] Grid<Num> distance_map_impl(const Grid<T>& image, const ChamferMask& mask,
                                          bool normalize, const ScanControl& control)
{
    using A = accumulator_t<Num>;
    using W = weight_t<Num>;

    check_rank(image, mask);

    // Background cells are sources at distance 0.
    std::vector<A> dist(image.size());
    for (std::size_t i = 0; i < image.size(); ++i) {
        dist[i] = image[i] == T{0} ? A{0} : unreached<A>();
    }

    auto active = [&](std::size_t i) { return image[i] != T{0}; };
    auto cost = [&]([[maybe_unused]] std::size_t i, std::size_t n, W w) -> A {
        if constexpr (LabelMode) {
            // A neighbor with another label sits at distance 0.
            if (image[n] != image[i]) return static_cast<A>(w);
        }
        return step(dist[n], w);
    };

    detail::chamfer_sweep<true>(image, dist, mask.forward_offsets<W>(),
                                control, "forward", active, cost);
    detail::chamfer_sweep<false>(image, dist, mask.backward_offsets<W>(),
                                 control, "backward", active, cost);

    Logger::debug("distance map: {}x{}x{} grid, {} weights, 2 passes",
                  image.width(), image.height(), image.depth(), mask.weight_count());

    const auto norm = static_cast<A>(mask.normalization_weight<W>());
    return finalize_distances<Num>(image, dist, norm, normalize,
                                   [](std::size_t) { return false; });
}

} // namespace detail

// ---------------------------------------------------------------------------
// Public API
// ---------------------------------------------------------------------------

/// Chamfer distance from every foreground (nonzero) cell to the nearest
/// background cell. Background cells are 0.
///
/// @param normalize  divide by the first weight so that one orthogonal step
///                   counts as 1 (integer outputs round half-up)
///
/// Cells with no background anywhere in the grid get the sentinel
/// (+inf for float, the type maximum for integers).
///
/// @throws Error  rank_mismatch, distance_overflow, cancelled
template <FieldValue Num, GridValue T>
[[nodiscard]] Grid<Num> distance_map(const Grid<T>& image, const ChamferMask& mask,
                                     bool normalize = true, const ScanControl& control = {})
{
    return detail::distance_map_impl<Num, false>(image, mask, normalize, control);
}

/// Distance from every labelled cell to the nearest cell carrying a
/// different label (including background 0).
template <FieldValue Num, GridValue T>
[[nodiscard]] Grid<Num> label_distance_map(const Grid<T>& labels, const ChamferMask& mask,
                                           bool normalize = true, const ScanControl& control = {})
{
    return detail::distance_map_impl<Num, true>(labels, mask, normalize, control);
}

} // namespace morphcore

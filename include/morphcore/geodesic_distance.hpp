#pragma once
#include <cstddef>
#include <vector>

#include "chamfer_mask.hpp"
#include "distance_transform.hpp"
#include "error.hpp"
#include "grid.hpp"
#include "log.hpp"
#include "scan_control.hpp"

namespace morphcore {

/// Chamfer distance from the marker cells, measured along paths that stay
/// inside the mask (nonzero cells of @p mask).
///
/// Marker cells outside the mask are ignored. Forward and backward sweeps
/// alternate until a full pair leaves every value unchanged, so the result
/// is exact for arbitrarily winding masks.
///
/// Mask cells that no marker reaches hold the sentinel (+inf, or the type
/// maximum for integers). Cells outside the mask hold NaN for float
/// outputs and the type maximum for integer outputs.
///
/// @throws Error  size_mismatch, rank_mismatch, distance_overflow, cancelled
template <FieldValue Num, GridValue M, GridValue T>
[[nodiscard]] Grid<Num> geodesic_distance_map(const Grid<M>& marker, const Grid<T>& mask,
                                              const ChamferMask& chamfer,
                                              bool normalize = true,
                                              const ScanControl& control = {})
{
    using A = detail::accumulator_t<Num>;
    using W = detail::weight_t<Num>;

    if (!marker.same_shape(mask)) {
        raise(ErrorCode::size_mismatch,
              "marker is {}x{}x{} but mask is {}x{}x{}",
              marker.width(), marker.height(), marker.depth(),
              mask.width(), mask.height(), mask.depth());
    }
    detail::check_rank(mask, chamfer);

    std::vector<A> dist(mask.size(), detail::unreached<A>());
    for (std::size_t i = 0; i < mask.size(); ++i) {
        if (mask[i] != T{0} && marker[i] != M{0}) {
            dist[i] = A{0};
        }
    }

    auto inside = [&](std::size_t i) { return mask[i] != T{0}; };
    auto cost = [&](std::size_t, std::size_t n, W w) -> A {
        if (mask[n] == T{0}) return detail::unreached<A>();
        return detail::step(dist[n], w);
    };

    const auto forward = chamfer.forward_offsets<W>();
    const auto backward = chamfer.backward_offsets<W>();

    std::size_t iterations = 0;
    bool changed = true;
    while (changed) {
        ++iterations;
        changed = detail::chamfer_sweep<true>(mask, dist, forward, control,
                                              "geodesic forward", inside, cost);
        changed |= detail::chamfer_sweep<false>(mask, dist, backward, control,
                                                "geodesic backward", inside, cost);
        Logger::trace("geodesic iteration {}: {}", iterations,
                      changed ? "updated" : "stable");
    }

    Logger::debug("geodesic distance map: {}x{}x{} grid converged after {} iterations",
                  mask.width(), mask.height(), mask.depth(), iterations);

    const auto norm = static_cast<A>(chamfer.normalization_weight<W>());
    return detail::finalize_distances<Num>(mask, dist, norm, normalize,
                                           [&](std::size_t i) { return !inside(i); });
}

} // namespace morphcore

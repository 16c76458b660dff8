#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <span>

#include "error.hpp"

namespace morphcore {

// ---------------------------------------------------------------------------
// GridConnectivity -- adjacency used by the flood-fill labeling
// ---------------------------------------------------------------------------

enum class GridConnectivity : std::uint8_t {
    four       = 4,   // 2D: cardinal only
    eight      = 8,   // 2D: cardinal + diagonal
    six        = 6,   // 3D: face-adjacent
    eighteen   = 18,  // 3D: face + edge-adjacent
    twenty_six = 26   // 3D: face + edge + corner-adjacent
};

[[nodiscard]] constexpr std::size_t connectivity_rank(GridConnectivity conn) noexcept
{
    return (conn == GridConnectivity::four || conn == GridConnectivity::eight) ? 2 : 3;
}

// ---------------------------------------------------------------------------
// Neighbor offset tables (all directions)
// ---------------------------------------------------------------------------

struct NeighborOffset {
    int dx, dy, dz;
};

namespace detail {

inline constexpr std::array<NeighborOffset, 4> table_4{{
    { 0, -1, 0}, {-1,  0, 0}, { 1,  0, 0}, { 0,  1, 0},
}};

inline constexpr std::array<NeighborOffset, 8> table_8{{
    {-1, -1, 0}, { 0, -1, 0}, { 1, -1, 0},
    {-1,  0, 0},              { 1,  0, 0},
    {-1,  1, 0}, { 0,  1, 0}, { 1,  1, 0},
}};

inline constexpr std::array<NeighborOffset, 6> table_6{{
    { 0,  0, -1},
    { 0, -1,  0}, {-1,  0,  0}, { 1,  0,  0}, { 0,  1,  0},
    { 0,  0,  1},
}};

inline constexpr std::array<NeighborOffset, 18> table_18{{
    // z - 1: face + edges
                  { 0, -1, -1},
    {-1,  0, -1}, { 0,  0, -1}, { 1,  0, -1},
                  { 0,  1, -1},
    // z: the 8-neighborhood
    {-1, -1,  0}, { 0, -1,  0}, { 1, -1,  0},
    {-1,  0,  0},               { 1,  0,  0},
    {-1,  1,  0}, { 0,  1,  0}, { 1,  1,  0},
    // z + 1: face + edges
                  { 0, -1,  1},
    {-1,  0,  1}, { 0,  0,  1}, { 1,  0,  1},
                  { 0,  1,  1},
}};

inline constexpr std::array<NeighborOffset, 26> table_26 = [] {
    std::array<NeighborOffset, 26> t{};
    std::size_t i = 0;
    for (int dz = -1; dz <= 1; ++dz)
        for (int dy = -1; dy <= 1; ++dy)
            for (int dx = -1; dx <= 1; ++dx)
                if (dx != 0 || dy != 0 || dz != 0)
                    t[i++] = {dx, dy, dz};
    return t;
}();

} // namespace detail

[[nodiscard]] constexpr std::span<const NeighborOffset>
neighbor_offsets(GridConnectivity conn) noexcept
{
    switch (conn) {
        case GridConnectivity::four:       return detail::table_4;
        case GridConnectivity::eight:      return detail::table_8;
        case GridConnectivity::six:        return detail::table_6;
        case GridConnectivity::eighteen:   return detail::table_18;
        case GridConnectivity::twenty_six: return detail::table_26;
    }
    return detail::table_8;
}

/// Throws ErrorCode::invalid_adjacency unless @p conn applies to @p rank.
inline void check_connectivity(GridConnectivity conn, std::size_t rank)
{
    const auto value = static_cast<unsigned>(conn);
    const bool known = value == 4 || value == 8 || value == 6 ||
                       value == 18 || value == 26;
    if (!known || connectivity_rank(conn) != rank) {
        raise(ErrorCode::invalid_adjacency,
              "connectivity {} is not valid for a rank-{} grid", value, rank);
    }
}

} // namespace morphcore

#pragma once
#include <algorithm>
#include <array>
#include <cmath>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <numbers>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "error.hpp"

namespace morphcore {

// ---------------------------------------------------------------------------
// Weight types
// ---------------------------------------------------------------------------

/// Integer weights are fixed-point shorts; float weights are real-valued.
template <typename W>
concept ChamferWeight = std::same_as<W, std::uint16_t> || std::same_as<W, float>;

// ---------------------------------------------------------------------------
// ChamferOffset -- one neighbor of a chamfer mask
// ---------------------------------------------------------------------------

template <ChamferWeight W>
struct ChamferOffset {
    int dx, dy, dz;
    W weight;

    [[nodiscard]] constexpr ChamferOffset operator-() const noexcept
    {
        return {-dx, -dy, -dz, weight};
    }

    friend constexpr bool operator==(const ChamferOffset&, const ChamferOffset&) = default;
};

namespace detail {

/// True if (dx, dy, dz) is visited before the origin in raster order.
[[nodiscard]] constexpr bool precedes_origin(int dx, int dy, int dz) noexcept
{
    if (dz != 0) return dz < 0;
    if (dy != 0) return dy < 0;
    return dx < 0;
}

/// Index into the weight array for an offset, or -1 if the offset is not
/// part of a mask with @p count weights.
///
/// 2D: orthogonal (0,1) -> w0, diagonal (1,1) -> w1, knight (1,2) -> w2.
/// 3D: face (0,0,1) -> w0, edge (0,1,1) -> w1, corner (1,1,1) -> w2,
///     (1,1,2) permutations -> w3.
[[nodiscard]] constexpr int weight_slot(std::size_t rank, std::size_t count,
                                        int dx, int dy, int dz) noexcept
{
    std::array<int, 3> a{dx < 0 ? -dx : dx, dy < 0 ? -dy : dy, dz < 0 ? -dz : dz};
    std::ranges::sort(a);

    if (rank == 2) {
        if (a == std::array{0, 0, 1}) return 0;
        if (a == std::array{0, 1, 1}) return 1;
        if (a == std::array{0, 1, 2} && count >= 3) return 2;
        return -1;
    }
    if (a == std::array{0, 0, 1}) return 0;
    if (a == std::array{0, 1, 1}) return 1;
    if (a == std::array{1, 1, 1}) return 2;
    if (a == std::array{1, 1, 2} && count >= 4) return 3;
    return -1;
}

template <ChamferWeight W>
[[nodiscard]] std::vector<ChamferOffset<W>> forward_table(
    std::size_t rank, std::span<const W> weights)
{
    std::vector<ChamferOffset<W>> table;
    const int zr = rank == 3 ? 2 : 0;
    for (int dz = -zr; dz <= 0; ++dz) {
        for (int dy = -2; dy <= 2; ++dy) {
            for (int dx = -2; dx <= 2; ++dx) {
                if (!precedes_origin(dx, dy, dz)) continue;
                const int slot = weight_slot(rank, weights.size(), dx, dy, dz);
                if (slot < 0) continue;
                table.push_back({dx, dy, dz, weights[static_cast<std::size_t>(slot)]});
            }
        }
    }
    return table;
}

template <ChamferWeight W>
[[nodiscard]] std::vector<ChamferOffset<W>> negated(
    const std::vector<ChamferOffset<W>>& table)
{
    std::vector<ChamferOffset<W>> out;
    out.reserve(table.size());
    for (const auto& o : table) {
        out.push_back(-o);
    }
    return out;
}

} // namespace detail

// ---------------------------------------------------------------------------
// ChamferMask -- immutable forward/backward offset tables
// ---------------------------------------------------------------------------

class ChamferMask final {
    std::size_t rank_ = 2;
    std::vector<std::uint16_t> int_weights_;
    std::vector<float> float_weights_;

    std::vector<ChamferOffset<std::uint16_t>> forward_int_;
    std::vector<ChamferOffset<std::uint16_t>> backward_int_;
    std::vector<ChamferOffset<float>> forward_float_;
    std::vector<ChamferOffset<float>> backward_float_;

    ChamferMask(std::size_t rank, std::span<const std::uint16_t> int_weights,
                std::span<const float> float_weights)
        : rank_{rank},
          int_weights_(int_weights.begin(), int_weights.end()),
          float_weights_(float_weights.begin(), float_weights.end())
    {
        forward_int_ = detail::forward_table<std::uint16_t>(rank_, int_weights_);
        backward_int_ = detail::negated(forward_int_);
        forward_float_ = detail::forward_table<float>(rank_, float_weights_);
        backward_float_ = detail::negated(forward_float_);
    }

    static void validate(std::size_t rank, std::span<const std::uint16_t> int_weights,
                         std::span<const float> float_weights)
    {
        const std::size_t lo = rank == 2 ? 2 : 3;
        const std::size_t hi = rank == 2 ? 3 : 4;
        const std::size_t n = int_weights.size();
        if (n < lo || n > hi) {
            raise(ErrorCode::invalid_weight_count,
                  "a {}D chamfer mask takes {} to {} weights, got {}", rank, lo, hi, n);
        }
        if (float_weights.size() != n) {
            raise(ErrorCode::invalid_weight_count,
                  "{} integer weights but {} float weights", n, float_weights.size());
        }
        for (std::size_t i = 0; i < n; ++i) {
            if (int_weights[i] == 0) {
                raise(ErrorCode::invalid_weight_value, "integer weight {} is zero", i);
            }
            if (!std::isfinite(float_weights[i]) || float_weights[i] <= 0.0f) {
                raise(ErrorCode::invalid_weight_value,
                      "float weight {} is {}, expected a positive finite value",
                      i, float_weights[i]);
            }
        }
    }

    [[nodiscard]] static std::vector<float> to_float(std::span<const std::uint16_t> w)
    {
        return {w.begin(), w.end()};
    }

    [[nodiscard]] static std::vector<std::uint16_t> to_fixed_point(std::span<const float> w)
    {
        // One decimal digit of precision, e.g. sqrt(2) -> 14.
        std::vector<std::uint16_t> out;
        out.reserve(w.size());
        for (float v : w) {
            const double scaled = std::isfinite(v) ? std::round(static_cast<double>(v) * 10.0) : 0.0;
            out.push_back(static_cast<std::uint16_t>(std::clamp(scaled, 0.0, 65535.0)));
        }
        return out;
    }

    [[nodiscard]] static ChamferMask make(std::size_t rank,
                                          std::span<const std::uint16_t> int_weights,
                                          std::span<const float> float_weights)
    {
        validate(rank, int_weights, float_weights);
        return ChamferMask(rank, int_weights, float_weights);
    }

public:
    // --- Factories ---

    /// 2D mask from 2 (3x3) or 3 (5x5, knight moves) integer weights.
    [[nodiscard]] static ChamferMask make_2d(std::span<const std::uint16_t> weights)
    {
        const auto fw = to_float(weights);
        return make(2, weights, fw);
    }

    [[nodiscard]] static ChamferMask make_2d(std::span<const std::uint16_t> int_weights,
                                             std::span<const float> float_weights)
    {
        return make(2, int_weights, float_weights);
    }

    /// 3D mask from 3 (3x3x3) or 4 (adds (2,1,1) offsets) integer weights.
    [[nodiscard]] static ChamferMask make_3d(std::span<const std::uint16_t> weights)
    {
        const auto fw = to_float(weights);
        return make(3, weights, fw);
    }

    [[nodiscard]] static ChamferMask make_3d(std::span<const std::uint16_t> int_weights,
                                             std::span<const float> float_weights)
    {
        return make(3, int_weights, float_weights);
    }

    /// Float weights; the integer variant uses round(10 * w).
    [[nodiscard]] static ChamferMask from_float_weights_2d(std::span<const float> weights)
    {
        const auto iw = to_fixed_point(weights);
        return make(2, iw, weights);
    }

    [[nodiscard]] static ChamferMask from_float_weights_3d(std::span<const float> weights)
    {
        const auto iw = to_fixed_point(weights);
        return make(3, iw, weights);
    }

    // --- Accessors ---

    [[nodiscard]] std::size_t rank() const noexcept { return rank_; }
    [[nodiscard]] std::size_t weight_count() const noexcept { return int_weights_.size(); }
    [[nodiscard]] std::span<const std::uint16_t> int_weights() const noexcept { return int_weights_; }
    [[nodiscard]] std::span<const float> float_weights() const noexcept { return float_weights_; }

    /// Largest |offset| component: 1 for 3x3(x3) masks, 2 for 5x5(x5).
    [[nodiscard]] int radius() const noexcept
    {
        int r = 0;
        for (const auto& o : forward_int_) {
            r = std::max({r, std::abs(o.dx), std::abs(o.dy), std::abs(o.dz)});
        }
        return r;
    }

    template <ChamferWeight W>
    [[nodiscard]] std::span<const ChamferOffset<W>> forward_offsets() const noexcept
    {
        if constexpr (std::same_as<W, float>) return forward_float_;
        else return forward_int_;
    }

    template <ChamferWeight W>
    [[nodiscard]] std::span<const ChamferOffset<W>> backward_offsets() const noexcept
    {
        if constexpr (std::same_as<W, float>) return backward_float_;
        else return backward_int_;
    }

    /// Forward offsets followed by backward offsets.
    template <ChamferWeight W>
    [[nodiscard]] std::vector<ChamferOffset<W>> offsets() const
    {
        const auto fwd = forward_offsets<W>();
        const auto bwd = backward_offsets<W>();
        std::vector<ChamferOffset<W>> all(fwd.begin(), fwd.end());
        all.insert(all.end(), bwd.begin(), bwd.end());
        return all;
    }

    /// Divisor that expresses distances in orthogonal steps.
    template <ChamferWeight W>
    [[nodiscard]] W normalization_weight() const noexcept
    {
        if constexpr (std::same_as<W, float>) return float_weights_.front();
        else return int_weights_.front();
    }

    friend bool operator==(const ChamferMask& a, const ChamferMask& b) noexcept
    {
        return a.rank_ == b.rank_ && a.int_weights_ == b.int_weights_ &&
               a.float_weights_ == b.float_weights_;
    }
};

// ---------------------------------------------------------------------------
// Named presets
// ---------------------------------------------------------------------------

enum class ChamferPreset : std::uint8_t {
    chessboard_2d,
    city_block_2d,
    quasi_euclidean_2d,
    borgefors_2d,
    weights_2_3,
    weights_5_7,
    chessknight,
    chessboard_3d,
    city_block_3d,
    quasi_euclidean_3d,
    borgefors_3d,
    svensson_3_4_5_7
};

struct ChamferPresetInfo {
    ChamferPreset id;
    std::string_view label;
    std::size_t rank;
    std::size_t weight_count;
    std::array<std::uint16_t, 4> int_weights;
    std::array<float, 4> float_weights;
};

namespace detail {

inline constexpr float sqrt2f = std::numbers::sqrt2_v<float>;
inline constexpr float sqrt3f = std::numbers::sqrt3_v<float>;

inline constexpr std::array<ChamferPresetInfo, 12> preset_table{{
    {ChamferPreset::chessboard_2d,      "Chessboard (1,1)",              2, 2, {1, 1},           {1, 1}},
    {ChamferPreset::city_block_2d,      "City-Block (1,2)",              2, 2, {1, 2},           {1, 2}},
    {ChamferPreset::quasi_euclidean_2d, "Quasi-Euclidean (1,1.41)",      2, 2, {10, 14},         {1, sqrt2f}},
    {ChamferPreset::borgefors_2d,       "Borgefors (3,4)",               2, 2, {3, 4},           {3, 4}},
    {ChamferPreset::weights_2_3,        "Weights (2,3)",                 2, 2, {2, 3},           {2, 3}},
    {ChamferPreset::weights_5_7,        "Weights (5,7)",                 2, 2, {5, 7},           {5, 7}},
    {ChamferPreset::chessknight,        "Chessknight (5,7,11)",          2, 3, {5, 7, 11},       {5, 7, 11}},
    {ChamferPreset::chessboard_3d,      "Chessboard (1,1,1)",            3, 3, {1, 1, 1},        {1, 1, 1}},
    {ChamferPreset::city_block_3d,      "City-Block (1,2,3)",            3, 3, {1, 2, 3},        {1, 2, 3}},
    {ChamferPreset::quasi_euclidean_3d, "Quasi-Euclidean (1,1.41,1.73)", 3, 3, {10, 14, 17},     {1, sqrt2f, sqrt3f}},
    {ChamferPreset::borgefors_3d,       "Borgefors (3,4,5)",             3, 3, {3, 4, 5},        {3, 4, 5}},
    {ChamferPreset::svensson_3_4_5_7,   "Svensson <3,4,5,7>",            3, 4, {3, 4, 5, 7},     {3, 4, 5, 7}},
}};

[[nodiscard]] constexpr char ascii_lower(char c) noexcept
{
    return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
}

[[nodiscard]] constexpr bool iequals(std::string_view a, std::string_view b) noexcept
{
    return std::ranges::equal(a, b, [](char x, char y) {
        return ascii_lower(x) == ascii_lower(y);
    });
}

} // namespace detail

[[nodiscard]] constexpr const ChamferPresetInfo& preset_info(ChamferPreset preset) noexcept
{
    return detail::preset_table[static_cast<std::size_t>(preset)];
}

[[nodiscard]] constexpr std::string_view preset_label(ChamferPreset preset) noexcept
{
    return preset_info(preset).label;
}

/// Process-wide mask for a preset, built once on first use.
[[nodiscard]] inline const ChamferMask& preset_mask(ChamferPreset preset)
{
    static const std::vector<ChamferMask> masks = [] {
        std::vector<ChamferMask> out;
        out.reserve(detail::preset_table.size());
        for (const auto& p : detail::preset_table) {
            std::span<const std::uint16_t> iw(p.int_weights.data(), p.weight_count);
            std::span<const float> fw(p.float_weights.data(), p.weight_count);
            out.push_back(p.rank == 2 ? ChamferMask::make_2d(iw, fw)
                                      : ChamferMask::make_3d(iw, fw));
        }
        return out;
    }();
    return masks[static_cast<std::size_t>(preset)];
}

/// Case-insensitive lookup by user-facing label, e.g. "Borgefors (3,4,5)".
[[nodiscard]] inline ChamferPreset preset_from_label(std::string_view label)
{
    for (const auto& p : detail::preset_table) {
        if (detail::iequals(p.label, label)) {
            return p.id;
        }
    }
    raise(ErrorCode::preset_not_found, "no chamfer preset labelled '{}'", label);
}

/// Labels of every preset for the given rank, in declaration order.
[[nodiscard]] inline std::vector<std::string_view> preset_labels(std::size_t rank)
{
    std::vector<std::string_view> labels;
    for (const auto& p : detail::preset_table) {
        if (p.rank == rank) {
            labels.push_back(p.label);
        }
    }
    return labels;
}

} // namespace morphcore

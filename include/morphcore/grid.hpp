#pragma once
#include <algorithm>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <format>
#include <span>
#include <stdexcept>
#include <type_traits>
#include <vector>

namespace morphcore {

// ---------------------------------------------------------------------------
// Element type constraints
// ---------------------------------------------------------------------------

/// Any scalar usable as a grid element (input grids: nonzero = foreground).
template <typename T>
concept GridValue = std::is_arithmetic_v<T> && !std::same_as<T, bool>;

/// Output types for distance and label fields.
template <typename T>
concept FieldValue = std::same_as<T, std::uint8_t>
                  || std::same_as<T, std::uint16_t>
                  || std::same_as<T, std::uint32_t>
                  || std::same_as<T, float>;

// ---------------------------------------------------------------------------
// Grid -- dense 2D or 3D array, x fastest, then y, then z
// ---------------------------------------------------------------------------

template <GridValue T>
class Grid final {
    std::size_t width_ = 0;
    std::size_t height_ = 0;
    std::size_t depth_ = 1;
    std::size_t rank_ = 2;
    std::vector<T> data_;

public:
    using value_type = T;

    /// Zero-filled 2D grid. Use fill() for another initial value.
    Grid(std::size_t width, std::size_t height)
        : width_{width}, height_{height}, depth_{1}, rank_{2},
          data_(width * height, T{})
    {
    }

    /// Zero-filled 3D grid.
    Grid(std::size_t width, std::size_t height, std::size_t depth)
        : width_{width}, height_{height}, depth_{depth}, rank_{3},
          data_(width * height * depth, T{})
    {
    }

    /// Grid with the same shape as @p other, filled with @p fill.
    template <GridValue U>
    [[nodiscard]] static Grid like(const Grid<U>& other, T fill = T{})
    {
        auto grid = other.rank() == 3
            ? Grid(other.width(), other.height(), other.depth())
            : Grid(other.width(), other.height());
        if (fill != T{}) {
            grid.fill(fill);
        }
        return grid;
    }

    [[nodiscard]] std::size_t rank() const noexcept { return rank_; }
    [[nodiscard]] std::size_t width() const noexcept { return width_; }
    [[nodiscard]] std::size_t height() const noexcept { return height_; }
    [[nodiscard]] std::size_t depth() const noexcept { return depth_; }
    [[nodiscard]] std::size_t size() const noexcept { return data_.size(); }
    [[nodiscard]] bool empty() const noexcept { return data_.empty(); }

    [[nodiscard]] bool contains(std::ptrdiff_t x, std::ptrdiff_t y,
                                std::ptrdiff_t z = 0) const noexcept
    {
        return x >= 0 && y >= 0 && z >= 0 &&
               static_cast<std::size_t>(x) < width_ &&
               static_cast<std::size_t>(y) < height_ &&
               static_cast<std::size_t>(z) < depth_;
    }

    /// Flat index of (x, y, z). No bounds check.
    [[nodiscard]] std::size_t index(std::size_t x, std::size_t y,
                                    std::size_t z = 0) const noexcept
    {
        return (z * height_ + y) * width_ + x;
    }

    template <GridValue U>
    [[nodiscard]] bool same_shape(const Grid<U>& other) const noexcept
    {
        return rank_ == other.rank() && width_ == other.width() &&
               height_ == other.height() && depth_ == other.depth();
    }

    // --- Checked accessors: out-of-range is a programming error ---

    [[nodiscard]] T get(std::size_t x, std::size_t y) const
    {
        return data_[checked_index(x, y, 0, 2)];
    }

    [[nodiscard]] T get(std::size_t x, std::size_t y, std::size_t z) const
    {
        return data_[checked_index(x, y, z, 3)];
    }

    void set(std::size_t x, std::size_t y, T value)
    {
        data_[checked_index(x, y, 0, 2)] = value;
    }

    void set(std::size_t x, std::size_t y, std::size_t z, T value)
    {
        data_[checked_index(x, y, z, 3)] = value;
    }

    // --- Flat access for the raster algorithms ---

    [[nodiscard]] T& operator[](std::size_t i) noexcept { return data_[i]; }
    [[nodiscard]] const T& operator[](std::size_t i) const noexcept { return data_[i]; }

    [[nodiscard]] std::span<T> values() noexcept { return data_; }
    [[nodiscard]] std::span<const T> values() const noexcept { return data_; }

    void fill(T value) { std::ranges::fill(data_, value); }

    friend bool operator==(const Grid&, const Grid&) = default;

private:
    [[nodiscard]] std::size_t checked_index(std::size_t x, std::size_t y,
                                            std::size_t z, std::size_t rank) const
    {
        if (rank != rank_) {
            throw std::out_of_range(std::format(
                "grid: rank-{} accessor used on a rank-{} grid", rank, rank_));
        }
        if (x >= width_ || y >= height_ || z >= depth_) {
            throw std::out_of_range(std::format(
                "grid: ({}, {}, {}) outside {}x{}x{}",
                x, y, z, width_, height_, depth_));
        }
        return index(x, y, z);
    }
};

using BinaryGrid = Grid<std::uint8_t>;

template <FieldValue Num>
using ValueGrid = Grid<Num>;

} // namespace morphcore

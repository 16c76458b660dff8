#include <morphcore/test.hpp>
#include <morphcore/connected_components.hpp>
#include <array>
#include <cstdint>
#include <initializer_list>
#include <set>

using namespace morphcore;

static_assert(max_label_count<std::uint8_t>() == 255);
static_assert(max_label_count<std::uint16_t>() == 65535);
static_assert(max_label_count<std::uint32_t>() == (1u << 23) - 1);
static_assert(max_label_count<float>() == (1u << 23) - 1);
static_assert(label_capacity(LabelDepth::bits8) == 255);
static_assert(label_capacity(LabelDepth::bits16) == 65535);
static_assert(label_capacity(LabelDepth::bits32) == 8388607);

namespace {

BinaryGrid from_rows(std::size_t w, std::size_t h, std::initializer_list<int> cells)
{
    BinaryGrid img(w, h);
    std::size_t i = 0;
    for (int v : cells)
        img[i++] = static_cast<std::uint8_t>(v);
    return img;
}

/// Nine 2x2x2 cubes in a 10^3 volume; the central one touches the eight
/// others only at corners.
BinaryGrid nine_cubes()
{
    BinaryGrid vol(10, 10, 10);
    const std::array<std::array<std::size_t, 3>, 9> origins{{
        {2, 2, 2}, {2, 6, 2}, {6, 2, 2}, {6, 6, 2},
        {4, 4, 4},
        {2, 2, 6}, {2, 6, 6}, {6, 2, 6}, {6, 6, 6},
    }};
    for (const auto& o : origins)
        for (std::size_t z = 0; z < 2; ++z)
            for (std::size_t y = 0; y < 2; ++y)
                for (std::size_t x = 0; x < 2; ++x)
                    vol.set(o[0] + x, o[1] + y, o[2] + z, 255);
    return vol;
}

} // namespace

// ---- 2D --------------------------------------------------------------------

TEST_CASE("cc 2D 4-adjacency separates diagonals") {
    auto img = from_rows(3, 3, {
        1, 0, 0,
        0, 1, 0,
        0, 0, 1,
    });
    auto r = label_components<std::uint8_t>(img, GridConnectivity::four);
    REQUIRE_EQ(r.count, std::size_t{3});
    CHECK_EQ(r.labels.get(0, 0), 1);
    CHECK_EQ(r.labels.get(1, 1), 2);
    CHECK_EQ(r.labels.get(2, 2), 3);
    CHECK_EQ(r.labels.get(1, 0), 0);
}

TEST_CASE("cc 2D 8-adjacency joins diagonals") {
    auto img = from_rows(3, 3, {
        1, 0, 0,
        0, 1, 0,
        0, 0, 1,
    });
    auto r = label_components<std::uint16_t>(img, GridConnectivity::eight);
    REQUIRE_EQ(r.count, std::size_t{1});
    CHECK_EQ(r.labels.get(2, 2), 1);
}

TEST_CASE("cc 2D labels follow raster order of first cells") {
    auto img = from_rows(6, 4, {
        0, 0, 0, 0, 1, 1,
        1, 1, 0, 0, 0, 1,
        0, 1, 0, 1, 0, 1,
        0, 1, 1, 1, 0, 0,
    });
    auto r = label_components<std::uint8_t>(img, GridConnectivity::four);
    REQUIRE_EQ(r.count, std::size_t{2});
    CHECK_EQ(r.labels.get(4, 0), 1);
    CHECK_EQ(r.labels.get(5, 2), 1);
    CHECK_EQ(r.labels.get(0, 1), 2);
    CHECK_EQ(r.labels.get(3, 2), 2);
}

TEST_CASE("cc 2D concave region is one component") {
    // U-shape: the flood fill must climb back up the right arm.
    auto img = from_rows(5, 4, {
        1, 0, 0, 0, 1,
        1, 0, 0, 0, 1,
        1, 0, 0, 0, 1,
        1, 1, 1, 1, 1,
    });
    auto r = label_components<std::uint8_t>(img, GridConnectivity::four);
    REQUIRE_EQ(r.count, std::size_t{1});
    CHECK_EQ(r.labels.get(4, 0), 1);
}

TEST_CASE("cc 2D single block in a 10x10 grid") {
    BinaryGrid img(10, 10);
    for (std::size_t y = 4; y < 6; ++y)
        for (std::size_t x = 4; x < 6; ++x)
            img.set(x, y, 1);
    for (auto adj : {GridConnectivity::four, GridConnectivity::eight}) {
        auto r = label_components<std::uint8_t>(img, adj);
        CHECK_EQ(r.count, std::size_t{1});
        CHECK_EQ(r.labels.get(5, 5), 1);
        CHECK_EQ(r.labels.get(0, 0), 0);
    }
}

TEST_CASE("cc empty image has no labels") {
    BinaryGrid img(7, 5);
    auto r = label_components<float>(img, GridConnectivity::eight);
    CHECK_EQ(r.count, std::size_t{0});
    for (auto v : r.labels.values())
        CHECK_EQ(v, 0.0f);
}

TEST_CASE("cc nonzero values of any type are foreground") {
    Grid<float> img(4, 1);
    img.set(0, 0, 0.5f);
    img.set(1, 0, -3.0f);
    img.set(3, 0, 7.0f);
    auto r = label_components<std::uint32_t>(img, GridConnectivity::four);
    REQUIRE_EQ(r.count, std::size_t{2});
    CHECK_EQ(r.labels.get(1, 0), 1u);
    CHECK_EQ(r.labels.get(3, 0), 2u);
}

TEST_CASE("cc labeling is idempotent") {
    auto img = from_rows(6, 5, {
        1, 1, 0, 0, 1, 0,
        0, 1, 0, 1, 1, 0,
        0, 0, 0, 0, 0, 0,
        1, 0, 1, 1, 0, 1,
        1, 0, 0, 1, 0, 1,
    });
    auto first = label_components<std::uint16_t>(img, GridConnectivity::eight);
    auto second = label_components<std::uint16_t>(first.labels, GridConnectivity::eight);
    CHECK_EQ(first.count, second.count);
    CHECK(first.labels == second.labels);
}

// ---- Capacity --------------------------------------------------------------

TEST_CASE("cc 256 isolated cells overflow 8-bit labels") {
    BinaryGrid img(32, 32);
    for (std::size_t y = 0; y < 32; y += 2)
        for (std::size_t x = 0; x < 32; x += 2)
            img.set(x, y, 1);

    REQUIRE_ERROR(label_components<std::uint8_t>(img, GridConnectivity::eight),
                  ErrorCode::label_capacity_exceeded);

    auto r = label_components<std::uint16_t>(img, GridConnectivity::eight);
    REQUIRE_EQ(r.count, std::size_t{256});
    CHECK_EQ(r.labels.get(30, 30), 256);

    const auto values = r.labels.values();
    std::set<std::uint16_t> seen(values.begin(), values.end());
    CHECK_EQ(seen.size(), std::size_t{257});  // 256 labels plus background
}

TEST_CASE("cc 255 components fit 8-bit labels") {
    BinaryGrid img(510, 1);
    for (std::size_t x = 0; x < 510; x += 2)
        img.set(x, 0, 1);
    auto r = label_components<std::uint8_t>(img, GridConnectivity::four);
    CHECK_EQ(r.count, std::size_t{255});
    CHECK_EQ(r.labels.get(508, 0), 255);
}

TEST_CASE("cc explicit capacity") {
    auto img = from_rows(5, 1, {1, 0, 1, 0, 1});
    REQUIRE_ERROR(label_components<std::uint8_t>(img, GridConnectivity::four, 2),
                  ErrorCode::label_capacity_exceeded);
    auto r = label_components<std::uint8_t>(img, GridConnectivity::four, 3);
    CHECK_EQ(r.count, std::size_t{3});
}

TEST_CASE("cc capacity beyond the label type") {
    BinaryGrid img(3, 3);
    REQUIRE_ERROR(label_components<std::uint8_t>(img, GridConnectivity::four, 256),
                  ErrorCode::invalid_label_capacity);
    REQUIRE_ERROR(label_components<std::uint16_t>(img, GridConnectivity::four,
                                                  label_capacity(LabelDepth::bits32)),
                  ErrorCode::invalid_label_capacity);
    auto r = label_components<float>(img, GridConnectivity::four,
                                     label_capacity(LabelDepth::bits32));
    CHECK_EQ(r.count, std::size_t{0});
}

// ---- Adjacency validation --------------------------------------------------

TEST_CASE("cc adjacency must match rank") {
    BinaryGrid flat(3, 3);
    BinaryGrid vol(3, 3, 3);
    REQUIRE_ERROR(label_components<std::uint8_t>(flat, GridConnectivity::six),
                  ErrorCode::invalid_adjacency);
    REQUIRE_ERROR(label_components<std::uint8_t>(flat, GridConnectivity::twenty_six),
                  ErrorCode::invalid_adjacency);
    REQUIRE_ERROR(label_components<std::uint8_t>(vol, GridConnectivity::four),
                  ErrorCode::invalid_adjacency);
    REQUIRE_ERROR(label_components<std::uint8_t>(vol, static_cast<GridConnectivity>(10)),
                  ErrorCode::invalid_adjacency);
}

// ---- 3D --------------------------------------------------------------------

TEST_CASE("cc 3D nine cubes") {
    auto vol = nine_cubes();

    auto r6 = label_components<std::uint8_t>(vol, GridConnectivity::six);
    CHECK_EQ(r6.count, std::size_t{9});
    CHECK_EQ(r6.labels.get(2, 2, 2), 1);
    CHECK_EQ(r6.labels.get(4, 4, 4), 5);
    CHECK_EQ(r6.labels.get(7, 7, 7), 9);

    auto r18 = label_components<std::uint16_t>(vol, GridConnectivity::eighteen);
    CHECK_EQ(r18.count, std::size_t{9});

    auto r26 = label_components<std::uint8_t>(vol, GridConnectivity::twenty_six);
    CHECK_EQ(r26.count, std::size_t{1});
    CHECK_EQ(r26.labels.get(7, 7, 7), 1);
}

TEST_CASE("cc 3D edge contact needs 18-adjacency") {
    BinaryGrid vol(3, 3, 2);
    vol.set(0, 0, 0, 1);
    vol.set(0, 1, 1, 1);  // shares an edge with (0, 0, 0)
    CHECK_EQ(label_components<std::uint8_t>(vol, GridConnectivity::six).count, std::size_t{2});
    CHECK_EQ(label_components<std::uint8_t>(vol, GridConnectivity::eighteen).count, std::size_t{1});
    CHECK_EQ(label_components<std::uint8_t>(vol, GridConnectivity::twenty_six).count, std::size_t{1});
}

TEST_CASE("cc 3D separate slices") {
    BinaryGrid vol(2, 2, 3);
    for (std::size_t y = 0; y < 2; ++y)
        for (std::size_t x = 0; x < 2; ++x) {
            vol.set(x, y, 0, 1);
            vol.set(x, y, 2, 1);
        }
    auto r = label_components<std::uint32_t>(vol, GridConnectivity::twenty_six);
    CHECK_EQ(r.count, std::size_t{2});
    CHECK_EQ(r.labels.get(1, 1, 2), 2u);
}

TEST_CASE("cc large single component does not recurse") {
    BinaryGrid vol(64, 64, 64);
    vol.fill(1);
    auto r = label_components<std::uint8_t>(vol, GridConnectivity::six);
    CHECK_EQ(r.count, std::size_t{1});
    CHECK_EQ(r.labels.get(63, 63, 63), 1);
}

// ---- Region labeling -------------------------------------------------------

TEST_CASE("cc region components split one label") {
    Grid<std::uint16_t> labels(5, 3);
    // label 2 forms two separate parts, label 3 one part
    const std::uint16_t cells[] = {
        2, 2, 0, 3, 3,
        0, 0, 0, 0, 3,
        2, 0, 2, 2, 3,
    };
    for (std::size_t i = 0; i < labels.size(); ++i)
        labels[i] = cells[i];

    auto r2 = label_region_components<std::uint8_t>(labels, 2, GridConnectivity::four);
    CHECK_EQ(r2.count, std::size_t{3});
    CHECK_EQ(r2.labels.get(0, 0), 1);
    CHECK_EQ(r2.labels.get(0, 2), 2);
    CHECK_EQ(r2.labels.get(3, 2), 3);
    CHECK_EQ(r2.labels.get(3, 0), 0);

    auto r3 = label_region_components<std::uint8_t>(labels, 3, GridConnectivity::four);
    CHECK_EQ(r3.count, std::size_t{1});

    auto r8 = label_region_components<std::uint8_t>(labels, 2, GridConnectivity::eight);
    CHECK_EQ(r8.count, std::size_t{3});
}

TEST_CASE("cc region components of the background") {
    auto img = from_rows(3, 3, {
        0, 1, 0,
        1, 1, 1,
        0, 1, 0,
    });
    auto r = label_region_components<std::uint8_t>(img, 0, GridConnectivity::four);
    CHECK_EQ(r.count, std::size_t{4});
    CHECK_EQ(r.labels.get(2, 2), 4);
    CHECK_EQ(r.labels.get(1, 1), 0);
}

MORPHCORE_TEST_MAIN()

#include <morphcore/test.hpp>
#include <morphcore/morphcore.hpp>
#include <stop_token>
#include <string>
#include <vector>

using namespace morphcore;

namespace {

struct ProgressEvent {
    std::string stage;
    std::size_t row;
    std::size_t rows;
};

ScanControl recording(std::vector<ProgressEvent>& events)
{
    ScanControl control;
    control.on_progress = [&events](std::string_view stage, std::size_t row, std::size_t rows) {
        events.push_back({std::string(stage), row, rows});
    };
    return control;
}

} // namespace

// ---- Progress --------------------------------------------------------------

TEST_CASE("distance map reports one event per row and pass") {
    BinaryGrid img(6, 5);
    img.fill(1);
    img.set(0, 0, 0);

    std::vector<ProgressEvent> events;
    auto d = distance_map<std::uint8_t>(img, preset_mask(ChamferPreset::chessboard_2d), true,
                                        recording(events));
    CHECK_EQ(d.get(5, 4), 5);

    REQUIRE_EQ(events.size(), std::size_t{10});
    for (std::size_t i = 0; i < 5; ++i) {
        CHECK_EQ(events[i].stage, std::string("forward"));
        CHECK_EQ(events[i].row, i);
        CHECK_EQ(events[i].rows, std::size_t{5});
        CHECK_EQ(events[5 + i].stage, std::string("backward"));
        CHECK_EQ(events[5 + i].row, i);
    }
}

TEST_CASE("3D sweeps count every (z, y) row") {
    BinaryGrid vol(4, 3, 2);
    vol.fill(1);
    vol.set(0, 0, 0, 0);

    std::vector<ProgressEvent> events;
    auto d = distance_map<float>(vol, preset_mask(ChamferPreset::borgefors_3d), true,
                                 recording(events));
    CHECK_NEAR(d.get(3, 0, 0), 3.0, 1e-6);
    REQUIRE_EQ(events.size(), std::size_t{12});
    CHECK_EQ(events.front().rows, std::size_t{6});
}

TEST_CASE("geodesic progress repeats until stable") {
    BinaryGrid mask(5, 3);
    mask.fill(1);
    BinaryGrid marker(5, 3);
    marker.set(0, 0, 1);

    std::vector<ProgressEvent> events;
    auto g = geodesic_distance_map<std::uint16_t>(marker, mask,
                                                  preset_mask(ChamferPreset::chessboard_2d),
                                                  true, recording(events));
    CHECK_EQ(g.get(4, 2), 4);

    // At least one changing pair and one confirming pair.
    REQUIRE_GE(events.size(), std::size_t{12});
    REQUIRE_EQ(events.size() % 6, std::size_t{0});
    CHECK_EQ(events[0].stage, std::string("geodesic forward"));
    CHECK_EQ(events[3].stage, std::string("geodesic backward"));
}

TEST_CASE("labeling reports rows") {
    BinaryGrid img(3, 4);
    std::vector<ProgressEvent> events;
    auto r = label_components<std::uint8_t>(img, GridConnectivity::four, 255, recording(events));
    CHECK_EQ(r.count, std::size_t{0});
    REQUIRE_EQ(events.size(), std::size_t{4});
    CHECK_EQ(events[0].stage, std::string("labeling"));
    CHECK_EQ(events[3].row, std::size_t{3});
}

// ---- Cancellation ----------------------------------------------------------

TEST_CASE("stop before start cancels every operation") {
    std::stop_source source;
    source.request_stop();
    ScanControl control{source.get_token()};

    BinaryGrid img(4, 4);
    img.fill(1);
    REQUIRE_ERROR(distance_map<float>(img, preset_mask(ChamferPreset::borgefors_2d), true, control),
                  ErrorCode::cancelled);
    REQUIRE_ERROR(label_distance_map<float>(img, preset_mask(ChamferPreset::borgefors_2d), true, control),
                  ErrorCode::cancelled);
    REQUIRE_ERROR(geodesic_distance_map<float>(img, img, preset_mask(ChamferPreset::borgefors_2d),
                                               true, control),
                  ErrorCode::cancelled);
    REQUIRE_ERROR(label_components<std::uint8_t>(img, GridConnectivity::four, 255, control),
                  ErrorCode::cancelled);
}

TEST_CASE("stop requested mid-sweep aborts at the next row") {
    std::stop_source source;
    ScanControl control{source.get_token()};
    std::size_t calls = 0;
    control.on_progress = [&](std::string_view, std::size_t row, std::size_t) {
        ++calls;
        if (row == 2) source.request_stop();
    };

    BinaryGrid img(8, 8);
    img.fill(1);
    img.set(0, 0, 0);
    REQUIRE_ERROR(distance_map<std::uint16_t>(img, preset_mask(ChamferPreset::city_block_2d),
                                              true, control),
                  ErrorCode::cancelled);
    CHECK_EQ(calls, std::size_t{3});
}

TEST_CASE("default control never cancels") {
    ScanControl control;
    control.checkpoint("forward", 0, 1);
    CHECK(!control.stop_token.stop_possible());
}

MORPHCORE_TEST_MAIN()

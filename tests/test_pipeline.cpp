#include "ocrprep/pipeline.hpp"
#include "test_helpers.hpp"

#include <catch2/catch.hpp>

#include <climits>
#include <vector>

using ocp::PixelBuffer;
using ocp::PreprocessOptions;
using namespace ocp_test;

namespace {

// 深色底、淺色「字」的小圖
PixelBuffer make_dark_page(int h, int w)
{
    PixelBuffer img = make_solid(h, w, 25, 30, 35);
    for (int y = h / 4; y < h / 2; ++y)
        for (int x = w / 5; x < (4 * w) / 5; ++x)
            set_px(img, y, x, 230, 225, 220);
    return img;
}

// 淺色紙、深色字
PixelBuffer make_light_page(int h, int w)
{
    PixelBuffer img = make_solid(h, w, 235, 232, 228);
    for (int y = h / 3; y < h / 3 + 3; ++y)
        for (int x = 2; x < w - 2; ++x)
            set_px(img, y, x, 20, 20, 30);
    return img;
}

void require_binary(const PixelBuffer& img)
{
    const uint8_t* p = img.data();
    for (std::size_t i = 0; i < img.size(); i += PixelBuffer::kChannels) {
        REQUIRE((p[i] == 0 || p[i] == 255));
        REQUIRE(p[i + 1] == p[i]);
        REQUIRE(p[i + 2] == p[i]);
    }
}

} // namespace

TEST_CASE("pipeline: uniform mid-gray image ends up all white", "[pipeline]")
{
    const std::vector<uint8_t> input = ocp::encode_png(make_solid(100, 100, 127, 127, 127));

    const ocp::PreprocessResult res = ocp::run_preprocess(input);

    REQUIRE_FALSE(res.stats.fell_back);
    CHECK(res.stats.scale == 20);
    CHECK(res.stats.threshold == 128);
    CHECK(res.stats.inverted);
    CHECK(res.stats.black == 0);
    CHECK(res.stats.white == 2000u * 2000u);

    PixelBuffer out = ocp::decode_image(res.bytes);
    REQUIRE(out.w() == 2000);
    REQUIRE(out.h() == 2000);
    CHECK(count_white(out) == out.pixel_count());
}

TEST_CASE("pipeline: corrupt input is returned byte for byte", "[pipeline][fallback]")
{
    const std::vector<uint8_t> junk = {0x89, 'P', 'N', 'G', 0x0d, 0x0a, 0x1a, 0x0a, 0x00, 0x13, 0x37};

    const ocp::PreprocessResult res = ocp::run_preprocess(junk);
    CHECK(res.stats.fell_back);
    CHECK(res.bytes == junk);
    CHECK(ocp::preprocess_for_ocr(junk) == junk);

    SECTION("empty input stays empty")
    {
        CHECK(ocp::preprocess_for_ocr(std::vector<uint8_t>{}).empty());
    }
}

TEST_CASE("pipeline: invalid options fall back instead of throwing", "[pipeline][fallback]")
{
    const std::vector<uint8_t> input = ocp::encode_png(make_solid(4, 4, 127, 127, 127));

    PreprocessOptions opts;
    opts.target_min_dim = 4;
    opts.fallback_threshold = 300;

    const ocp::PreprocessResult res = ocp::run_preprocess(input, opts);
    CHECK(res.stats.fell_back);
    CHECK(res.bytes == input);
}

TEST_CASE("pipeline: allocation failure on a huge target falls back", "[pipeline][fallback]")
{
    // 1000 px 長邊放大到 INT_MAX 等級，配置必定失敗
    PreprocessOptions opts;
    opts.target_min_dim = INT_MAX;

    const std::vector<uint8_t> input = ocp::encode_png(make_light_page(1000, 1000));
    const ocp::PreprocessResult res = ocp::run_preprocess(input, opts);

    CHECK(res.stats.fell_back);
    CHECK(res.bytes == input);
}

TEST_CASE("pipeline: 500 px image is upscaled exactly 4x", "[pipeline][scale]")
{
    const std::vector<uint8_t> input = ocp::encode_png(make_light_page(200, 500));
    PixelBuffer out = ocp::decode_image(ocp::preprocess_for_ocr(input));
    CHECK(out.w() == 2000);
    CHECK(out.h() == 800);
}

TEST_CASE("pipeline: dark background is normalized to light", "[pipeline][polarity]")
{
    PreprocessOptions opts;
    opts.target_min_dim = 120;

    const std::vector<uint8_t> input = ocp::encode_png(make_dark_page(40, 60));
    const ocp::PreprocessResult res = ocp::run_preprocess(input, opts);
    REQUIRE_FALSE(res.stats.fell_back);
    CHECK(res.stats.inverted);

    PixelBuffer out = ocp::decode_image(res.bytes);
    require_binary(out);
    const std::uint64_t white = count_white(out);
    CHECK(out.pixel_count() - white <= white);
    CHECK(white == res.stats.white);

    SECTION("disabled polarity correction keeps the dark majority")
    {
        opts.correct_polarity = false;
        const ocp::PreprocessResult raw = ocp::run_preprocess(input, opts);
        CHECK_FALSE(raw.stats.inverted);
        CHECK(raw.stats.black > raw.stats.white);
    }
}

TEST_CASE("pipeline: light page is not inverted and alpha survives", "[pipeline]")
{
    PreprocessOptions opts;
    opts.target_min_dim = 1;

    PixelBuffer page = make_light_page(20, 30);
    for (std::size_t i = 3; i < page.size(); i += PixelBuffer::kChannels) page.data()[i] = 77;

    const ocp::PreprocessResult res = ocp::run_preprocess(ocp::encode_png(page), opts);
    REQUIRE_FALSE(res.stats.fell_back);
    CHECK_FALSE(res.stats.inverted);
    CHECK(res.stats.scale == 1);

    PixelBuffer out = ocp::decode_image(res.bytes);
    require_binary(out);
    for (std::size_t i = 3; i < out.size(); i += PixelBuffer::kChannels) REQUIRE(out.data()[i] == 77);
    CHECK(px(out, 0, 0)[0] == 255);
    CHECK(px(out, 20 / 3, 10)[0] == 0);
}

TEST_CASE("pipeline: rerunning on its own output is stable", "[pipeline][idempotence]")
{
    PreprocessOptions opts;
    opts.target_min_dim = 90;

    const ocp::PreprocessResult first  = ocp::run_preprocess(ocp::encode_png(make_dark_page(30, 45)), opts);
    const ocp::PreprocessResult second = ocp::run_preprocess(first.bytes, opts);
    const ocp::PreprocessResult third  = ocp::run_preprocess(second.bytes, opts);

    REQUIRE_FALSE(second.stats.fell_back);
    CHECK(second.stats.scale == 1);
    CHECK(second.stats.white == first.stats.white);
    CHECK(second.stats.black == first.stats.black);
    CHECK_FALSE(second.stats.inverted);
    CHECK(third.stats.threshold == second.stats.threshold);
    CHECK(third.bytes == second.bytes);
}

TEST_CASE("pipeline: preprocess_pixels works without the codec", "[pipeline]")
{
    PreprocessOptions opts;
    opts.target_min_dim = 50;

    PixelBuffer img = make_light_page(10, 25);
    const ocp::PreprocessStats st = ocp::preprocess_pixels(img, opts);

    CHECK(st.scale == 2);
    CHECK(img.w() == 50);
    CHECK(img.h() == 20);
    CHECK(st.white + st.black == img.pixel_count());
    CHECK(count_white(img) == st.white);
}

TEST_CASE("pipeline: async variant matches the synchronous one", "[pipeline]")
{
    PreprocessOptions opts;
    opts.target_min_dim = 64;

    const std::vector<uint8_t> input = ocp::encode_png(make_dark_page(16, 32));
    auto fut = ocp::preprocess_for_ocr_async(input, opts);
    CHECK(fut.get() == ocp::preprocess_for_ocr(input, opts));
}

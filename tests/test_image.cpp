#include "ocrprep/image.hpp"
#include "ocrprep/errors.hpp"
#include "test_helpers.hpp"

#include <catch2/catch.hpp>

#include <stdexcept>
#include <vector>

using ocp::PixelBuffer;
using namespace ocp_test;

TEST_CASE("PixelBuffer: shape and ownership", "[image]")
{
    SECTION("allocates w*h*4 zeroed bytes")
    {
        PixelBuffer img(3, 5);
        CHECK(img.h() == 3);
        CHECK(img.w() == 5);
        CHECK(img.pixel_count() == 15);
        CHECK(img.size() == 60);
        CHECK(img.size() % PixelBuffer::kChannels == 0);
        for (std::size_t i = 0; i < img.size(); ++i) REQUIRE(img.data()[i] == 0);
    }

    SECTION("rejects non-positive dimensions")
    {
        CHECK_THROWS_AS(PixelBuffer(0, 4), std::invalid_argument);
        CHECK_THROWS_AS(PixelBuffer(4, -1), std::invalid_argument);
    }

    SECTION("clone is a deep copy")
    {
        PixelBuffer a = make_solid(2, 2, 10, 20, 30, 40);
        PixelBuffer b = a.clone();
        REQUIRE(b.data() != a.data());
        b.data()[0] = 99;
        CHECK(a.data()[0] == 10);
        CHECK(b.w() == 2);
        CHECK(b.h() == 2);
    }

    SECTION("default-constructed buffer is empty")
    {
        PixelBuffer img;
        CHECK(img.empty());
        CHECK(img.clone().empty());
    }
}

TEST_CASE("decode_image / encode_png", "[image][codec]")
{
    SECTION("PNG keeps size, color and alpha")
    {
        PixelBuffer src = make_solid(7, 9, 200, 100, 50, 128);
        set_px(src, 3, 4, 1, 2, 3, 4);

        const std::vector<uint8_t> png = ocp::encode_png(src);
        REQUIRE(png.size() > 8);
        CHECK(png[0] == 0x89);
        CHECK(png[1] == 'P');

        PixelBuffer back = ocp::decode_image(png);
        REQUIRE(back.w() == 9);
        REQUIRE(back.h() == 7);
        for (std::size_t i = 0; i < src.size(); ++i) REQUIRE(back.data()[i] == src.data()[i]);
    }

    SECTION("garbage bytes raise DecodeError")
    {
        const std::vector<uint8_t> junk = {0xde, 0xad, 0xbe, 0xef, 0x00, 0x01, 0x02};
        CHECK_THROWS_AS(ocp::decode_image(junk), ocp::DecodeError);
    }

    SECTION("empty input raises DecodeError")
    {
        CHECK_THROWS_AS(ocp::decode_image(std::vector<uint8_t>{}), ocp::DecodeError);
    }

    SECTION("encoding an empty buffer raises EncodeError")
    {
        CHECK_THROWS_AS(ocp::encode_png(PixelBuffer()), ocp::EncodeError);
    }
}

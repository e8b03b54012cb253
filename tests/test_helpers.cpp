#include "test_helpers.hpp"

#include <atomic>
#include <chrono>
#include <system_error>

namespace fs = std::filesystem;

namespace ocp_test {

ocp::PixelBuffer make_solid(int h, int w,
                            std::uint8_t r, std::uint8_t g, std::uint8_t b,
                            std::uint8_t a)
{
    ocp::PixelBuffer img(h, w);
    std::uint8_t* p = img.data();
    for (std::size_t i = 0; i < img.size(); i += ocp::PixelBuffer::kChannels) {
        p[i + 0] = r;
        p[i + 1] = g;
        p[i + 2] = b;
        p[i + 3] = a;
    }
    return img;
}

void set_px(ocp::PixelBuffer& img, int y, int x,
            std::uint8_t r, std::uint8_t g, std::uint8_t b, std::uint8_t a)
{
    std::uint8_t* p = img.data() + (static_cast<std::size_t>(y) * img.w() + x) * ocp::PixelBuffer::kChannels;
    p[0] = r;
    p[1] = g;
    p[2] = b;
    p[3] = a;
}

const std::uint8_t* px(const ocp::PixelBuffer& img, int y, int x)
{
    return img.data() + (static_cast<std::size_t>(y) * img.w() + x) * ocp::PixelBuffer::kChannels;
}

std::uint64_t count_white(const ocp::PixelBuffer& img)
{
    std::uint64_t n = 0;
    const std::uint8_t* p = img.data();
    for (std::size_t i = 0; i < img.size(); i += ocp::PixelBuffer::kChannels)
        if (p[i] == 255) ++n;
    return n;
}

TempDir::TempDir()
{
    static std::atomic<int> counter{0};
    const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
    path_ = fs::temp_directory_path()
          / ("ocrprep_test_" + std::to_string(stamp) + "_" + std::to_string(counter++));
    fs::create_directories(path_);
}

TempDir::~TempDir()
{
    std::error_code ec;
    fs::remove_all(path_, ec);
}

} // namespace ocp_test

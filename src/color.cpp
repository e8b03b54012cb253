#include "ocrprep/color.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace ocp {

constexpr double wr = 0.299;
constexpr double wg = 0.587;
constexpr double wb = 0.114;

static inline uint8_t luma(const uint8_t* px) {
    double v = wr * px[0] + wg * px[1] + wb * px[2];
    v = std::clamp(std::round(v), 0.0, 255.0);
    return static_cast<uint8_t>(v);
}

// =========================
//   single-thread 版本實作
// =========================

static Histogram to_grayscale_single(PixelBuffer& img) {
    if (img.empty()) {
        throw std::invalid_argument("to_grayscale: empty image");
    }

    Histogram hist{};
    uint8_t* p = img.data();
    const std::size_t total = img.size();

    for (std::size_t i = 0; i < total; i += PixelBuffer::kChannels) {
        const uint8_t g = luma(p + i);
        p[i + 0] = g;
        p[i + 1] = g;
        p[i + 2] = g;
        ++hist[g];
    }

    return hist;
}

static Histogram to_grayscale_openmp(PixelBuffer& img) {
    if (img.empty()) throw std::invalid_argument("to_grayscale: empty image");

    Histogram hist{};
    uint8_t* p = img.data();
    const std::int64_t n = static_cast<std::int64_t>(img.pixel_count());

#ifdef OCP_HAS_OPENMP
#pragma omp parallel
#endif
    {
        // 每個執行緒各自累計，最後再合併
        Histogram local{};

#ifdef OCP_HAS_OPENMP
#pragma omp for nowait
#endif
        for (std::int64_t k = 0; k < n; ++k) {
            uint8_t* px = p + k * PixelBuffer::kChannels;
            const uint8_t g = luma(px);
            px[0] = px[1] = px[2] = g;
            ++local[g];
        }

#ifdef OCP_HAS_OPENMP
#pragma omp critical(ocp_histogram_merge)
#endif
        for (int i = 0; i < 256; ++i) hist[i] += local[i];
    }
    return hist;
}

static void invert_single(PixelBuffer& img) {
    if (img.empty()) {
        throw std::invalid_argument("invert: empty image");
    }

    uint8_t* p = img.data();
    const std::size_t total = img.size();
    for (std::size_t i = 0; i < total; i += PixelBuffer::kChannels) {
        p[i + 0] = static_cast<uint8_t>(255 - p[i + 0]);
        p[i + 1] = static_cast<uint8_t>(255 - p[i + 1]);
        p[i + 2] = static_cast<uint8_t>(255 - p[i + 2]);
    }
}

static void invert_openmp(PixelBuffer& img) {
    if (img.empty()) throw std::invalid_argument("invert: empty image");

    uint8_t* p = img.data();
    const std::int64_t n = static_cast<std::int64_t>(img.pixel_count());

#ifdef OCP_HAS_OPENMP
#pragma omp parallel for
#endif
    for (std::int64_t k = 0; k < n; ++k) {
        uint8_t* px = p + k * PixelBuffer::kChannels;
        px[0] = static_cast<uint8_t>(255 - px[0]);
        px[1] = static_cast<uint8_t>(255 - px[1]);
        px[2] = static_cast<uint8_t>(255 - px[2]);
    }
}

// =========================
//   對外 API：帶 Backend
// =========================

Histogram to_grayscale_inplace(PixelBuffer& img, Backend backend)
{
    switch (resolve_backend(backend)) {
    case Backend::OpenMP:
        return to_grayscale_openmp(img);
    case Backend::Single:
    default:
        return to_grayscale_single(img);
    }
}

void invert_inplace(PixelBuffer& img, Backend backend)
{
    switch (resolve_backend(backend)) {
    case Backend::OpenMP:
        invert_openmp(img);
        break;
    case Backend::Single:
    default:
        invert_single(img);
        break;
    }
}

} // namespace ocp

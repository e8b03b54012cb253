#include "ocrprep/threshold.hpp"

#include <spdlog/spdlog.h>

#include <stdexcept>

namespace ocp {

int otsu_threshold(const Histogram& hist, std::uint64_t total, int fallback)
{
    if (fallback < 0 || fallback > 255)
        throw std::invalid_argument("otsu_threshold: fallback must be in [0, 255]");

    double sum = 0.0;
    for (int t = 0; t < 256; ++t) sum += static_cast<double>(t) * hist[t];

    double sum_b = 0.0;
    double max_var = 0.0;
    std::uint64_t w_b = 0;
    int threshold = fallback;

    for (int t = 0; t < 256; ++t) {
        w_b += hist[t];
        if (w_b == 0) continue;
        if (w_b >= total) break;   // 前景已空
        const std::uint64_t w_f = total - w_b;

        sum_b += static_cast<double>(t) * hist[t];
        const double m_b = sum_b / static_cast<double>(w_b);
        const double m_f = (sum - sum_b) / static_cast<double>(w_f);
        const double d = m_b - m_f;
        const double variance = static_cast<double>(w_b) * static_cast<double>(w_f) * d * d;

        if (variance > max_var) {
            max_var = variance;
            threshold = t;
        }
    }
    return threshold;
}

static std::uint64_t binarize_single(PixelBuffer& img, uint8_t threshold) {
    uint8_t* p = img.data();
    const std::size_t total = img.size();
    std::uint64_t white = 0;

    for (std::size_t i = 0; i < total; i += PixelBuffer::kChannels) {
        const uint8_t bw = p[i] > threshold ? 255 : 0;
        p[i + 0] = p[i + 1] = p[i + 2] = bw;
        if (bw) ++white;
    }
    return white;
}

static std::uint64_t binarize_openmp(PixelBuffer& img, uint8_t threshold) {
    uint8_t* p = img.data();
    const std::int64_t n = static_cast<std::int64_t>(img.pixel_count());
    std::uint64_t white = 0;

#ifdef OCP_HAS_OPENMP
#pragma omp parallel for reduction(+:white)
#endif
    for (std::int64_t k = 0; k < n; ++k) {
        uint8_t* px = p + k * PixelBuffer::kChannels;
        const uint8_t bw = px[0] > threshold ? 255 : 0;
        px[0] = px[1] = px[2] = bw;
        if (bw) ++white;
    }
    return white;
}

std::uint64_t binarize_inplace(PixelBuffer& img, int threshold, Backend backend)
{
    if (img.empty()) throw std::invalid_argument("binarize: empty image");
    if (threshold < 0 || threshold > 255)
        throw std::invalid_argument("binarize: threshold must be in [0, 255]");

    const auto t = static_cast<uint8_t>(threshold);
    switch (resolve_backend(backend)) {
    case Backend::OpenMP:
        return binarize_openmp(img, t);
    case Backend::Single:
    default:
        return binarize_single(img, t);
    }
}

bool correct_polarity(PixelBuffer& img,
                      std::uint64_t white,
                      std::uint64_t total,
                      Backend backend)
{
    if (white > total)
        throw std::invalid_argument("correct_polarity: white count exceeds total");
    if (!is_dark_background(white, total)) return false;

    spdlog::info("preprocess: dark background detected ({} black vs {} white), inverting",
                 total - white, white);
    invert_inplace(img, backend);
    return true;
}

} // namespace ocp

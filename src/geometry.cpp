#include "ocrprep/geometry.hpp"

#include <algorithm>
#include <climits>
#include <cmath>
#include <stdexcept>
#include <vector>

namespace ocp {

static inline std::size_t idx(int y, int x, int c, int W) {
    return (static_cast<std::size_t>(y) * W + x) * PixelBuffer::kChannels + c;
}

static inline uint8_t to_u8(float v) {
    v = std::round(v);
    v = std::clamp(v, 0.0f, 255.0f);
    return static_cast<uint8_t>(v);
}

// ======================
//  Bilinear
// ======================
static void resize_bilinear_rows(const PixelBuffer& src, PixelBuffer& dst,
                                 int y_begin, int y_end) {
    const int H = src.h();
    const int W = src.w();
    const int new_h = dst.h();
    const int new_w = dst.w();
    const uint8_t* in = src.data();
    uint8_t* out = dst.data();

    const float scale_y = static_cast<float>(H) / static_cast<float>(new_h);
    const float scale_x = static_cast<float>(W) / static_cast<float>(new_w);

    for (int y = y_begin; y < y_end; ++y) {
        float sy = (y + 0.5f) * scale_y - 0.5f;
        int   y0 = static_cast<int>(std::floor(sy));
        float fy = sy - y0;
        int   y1 = y0 + 1;

        y0 = std::clamp(y0, 0, H - 1);
        y1 = std::clamp(y1, 0, H - 1);

        for (int x = 0; x < new_w; ++x) {
            float sx = (x + 0.5f) * scale_x - 0.5f;
            int   x0 = static_cast<int>(std::floor(sx));
            float fx = sx - x0;
            int   x1 = x0 + 1;

            x0 = std::clamp(x0, 0, W - 1);
            x1 = std::clamp(x1, 0, W - 1);

            for (int c = 0; c < PixelBuffer::kChannels; ++c) {
                float v00 = static_cast<float>(in[idx(y0, x0, c, W)]);
                float v10 = static_cast<float>(in[idx(y0, x1, c, W)]);
                float v01 = static_cast<float>(in[idx(y1, x0, c, W)]);
                float v11 = static_cast<float>(in[idx(y1, x1, c, W)]);

                float v0 = v00 + (v10 - v00) * fx;
                float v1 = v01 + (v11 - v01) * fx;
                out[idx(y, x, c, new_w)] = to_u8(v0 + (v1 - v0) * fy);
            }
        }
    }
}

// ======================
//  Bicubic (Keys, a = -0.5)
// ======================
struct Taps {
    int   at[4];
    float wt[4];
};

static inline float cubic_weight(float t) {
    constexpr float a = -0.5f;
    t = std::fabs(t);
    if (t <= 1.0f) return ((a + 2.0f) * t - (a + 3.0f)) * t * t + 1.0f;
    if (t <  2.0f) return ((a * t - 5.0f * a) * t + 8.0f * a) * t - 4.0f * a;
    return 0.0f;
}

// 每個輸出座標對應的 4 個來源座標與權重，行列各算一次
static std::vector<Taps> build_taps(int src_len, int dst_len) {
    std::vector<Taps> taps(static_cast<std::size_t>(dst_len));
    const float scale = static_cast<float>(src_len) / static_cast<float>(dst_len);

    for (int d = 0; d < dst_len; ++d) {
        float s  = (d + 0.5f) * scale - 0.5f;
        int   s0 = static_cast<int>(std::floor(s));
        float f  = s - s0;

        Taps& t = taps[d];
        float sum = 0.0f;
        for (int k = 0; k < 4; ++k) {
            t.at[k] = std::clamp(s0 - 1 + k, 0, src_len - 1);
            t.wt[k] = cubic_weight(f - static_cast<float>(k - 1));
            sum += t.wt[k];
        }
        for (int k = 0; k < 4; ++k) t.wt[k] /= sum;
    }
    return taps;
}

static void resize_bicubic_rows(const PixelBuffer& src, PixelBuffer& dst,
                                const std::vector<Taps>& ty,
                                const std::vector<Taps>& tx,
                                int y_begin, int y_end) {
    const int W = src.w();
    const int new_w = dst.w();
    const uint8_t* in = src.data();
    uint8_t* out = dst.data();

    for (int y = y_begin; y < y_end; ++y) {
        const Taps& vy = ty[y];
        for (int x = 0; x < new_w; ++x) {
            const Taps& vx = tx[x];
            for (int c = 0; c < PixelBuffer::kChannels; ++c) {
                float acc = 0.0f;
                for (int j = 0; j < 4; ++j) {
                    float row = 0.0f;
                    for (int i = 0; i < 4; ++i)
                        row += vx.wt[i] * static_cast<float>(in[idx(vy.at[j], vx.at[i], c, W)]);
                    acc += vy.wt[j] * row;
                }
                out[idx(y, x, c, new_w)] = to_u8(acc);
            }
        }
    }
}

// ======================
//  Public APIs with Backend
// ======================

Resample parse_resample(const std::string& s) {
    if (s == "bilinear") return Resample::Bilinear;
    if (s == "bicubic")  return Resample::Bicubic;
    throw std::invalid_argument("resample must be one of: bilinear, bicubic");
}

int upscale_factor(int w, int h, int target_min_dim) {
    const int max_dim = std::max(w, h);
    if (max_dim <= 0 || max_dim >= target_min_dim) return 1;
    // ceil 寫成這樣避免 target + max_dim 溢位；再把倍率壓在 int 範圍內
    const int scale = 1 + (target_min_dim - 1) / max_dim;
    return std::min(scale, INT_MAX / max_dim);
}

PixelBuffer resize(const PixelBuffer& src,
                   int new_h,
                   int new_w,
                   Resample filter,
                   Backend backend) {
    if (src.empty()) {
        throw std::invalid_argument("resize: empty image");
    }
    if (new_h <= 0 || new_w <= 0) {
        throw std::invalid_argument("resize: invalid new size");
    }

    PixelBuffer dst(new_h, new_w);
    const bool parallel = resolve_backend(backend) == Backend::OpenMP;

    if (filter == Resample::Bilinear) {
        if (parallel) {
#ifdef OCP_HAS_OPENMP
#pragma omp parallel for
#endif
            for (int y = 0; y < new_h; ++y)
                resize_bilinear_rows(src, dst, y, y + 1);
        } else {
            resize_bilinear_rows(src, dst, 0, new_h);
        }
        return dst;
    }

    const std::vector<Taps> ty = build_taps(src.h(), new_h);
    const std::vector<Taps> tx = build_taps(src.w(), new_w);
    if (parallel) {
#ifdef OCP_HAS_OPENMP
#pragma omp parallel for
#endif
        for (int y = 0; y < new_h; ++y)
            resize_bicubic_rows(src, dst, ty, tx, y, y + 1);
    } else {
        resize_bicubic_rows(src, dst, ty, tx, 0, new_h);
    }
    return dst;
}

PixelBuffer upscale_for_ocr(PixelBuffer src,
                            int target_min_dim,
                            Resample filter,
                            Backend backend) {
    if (src.empty()) throw std::invalid_argument("upscale_for_ocr: empty image");

    const int scale = upscale_factor(src.w(), src.h(), target_min_dim);
    if (scale == 1) return src;
    return resize(src, src.h() * scale, src.w() * scale, filter, backend);
}

} // namespace ocp

#pragma once

#include <string>
#include "ocrprep/image.hpp"
#include "ocrprep/backend.hpp"

namespace ocp {

// 放大用的取樣濾波器；刻意不提供 nearest-neighbour
enum class Resample {
    Bilinear,
    Bicubic,
};

// "bilinear" / "bicubic"
Resample parse_resample(const std::string& s);

// CLI / bindings 接受的 target 上限
constexpr int kMaxTargetMinDim = 1 << 16;

// 長邊小於 target 時回傳 ceil(target / max(w, h))，否則回傳 1
// 回傳值必 >= 1，且 max(w, h) * 倍率不超過 INT_MAX
int upscale_factor(int w, int h, int target_min_dim = 2000);

// resize：輸出 new_h x new_w
PixelBuffer resize(const PixelBuffer& src,
                   int new_h,
                   int new_w,
                   Resample filter = Resample::Bicubic,
                   Backend backend = Backend::Single);

// 依 upscale_factor 放大；倍率為 1 時直接把 src 交回，不重新配置
PixelBuffer upscale_for_ocr(PixelBuffer src,
                            int target_min_dim = 2000,
                            Resample filter = Resample::Bicubic,
                            Backend backend = Backend::Single);

} // namespace ocp

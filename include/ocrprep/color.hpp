#pragma once

#include <array>
#include <cstdint>
#include "image.hpp"
#include "backend.hpp"

namespace ocp {

using std::uint8_t;

// 每個灰階值 (0..255) 一格
using Histogram = std::array<std::uint64_t, 256>;

// 原地轉灰階（BT.601：0.299 R + 0.587 G + 0.114 B，四捨五入）
// 結果寫回 R/G/B，alpha 不動；同一趟掃描順便累計直方圖
Histogram to_grayscale_inplace(PixelBuffer& img,
                               Backend backend = Backend::Single);

// 負片：R/G/B -> 255 - v，alpha 不動
void invert_inplace(PixelBuffer& img,
                    Backend backend = Backend::Single);

} // namespace ocp

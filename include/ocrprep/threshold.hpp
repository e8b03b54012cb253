#pragma once

#include <cstdint>
#include "ocrprep/image.hpp"
#include "ocrprep/color.hpp"

namespace ocp {

// 找不到有效切分時使用的門檻（中點）
constexpr int kFallbackThreshold = 128;

// Otsu：掃過 0..255，取 between-class variance 最大的第一個 t
// total 為像素總數（= 直方圖總和）；回傳值必在 [0, 255]
int otsu_threshold(const Histogram& hist,
                   std::uint64_t total,
                   int fallback = kFallbackThreshold);

// 二值化：灰階值 > threshold → 255，否則 0；alpha 不動
// 讀取 R 通道作為灰階值（需先經過 to_grayscale_inplace）
// 回傳白色像素數
std::uint64_t binarize_inplace(PixelBuffer& img,
                               int threshold,
                               Backend backend = Backend::Single);

// 黑色像素嚴格多於白色才算深色背景；平手不算
inline bool is_dark_background(std::uint64_t white, std::uint64_t total) {
    return total - white > white;
}

// 深色背景時反相，回傳是否有反相
bool correct_polarity(PixelBuffer& img,
                      std::uint64_t white,
                      std::uint64_t total,
                      Backend backend = Backend::Single);

} // namespace ocp

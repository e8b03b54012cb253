#pragma once

#include <cstdint>
#include <future>
#include <vector>
#include "ocrprep/image.hpp"
#include "ocrprep/backend.hpp"
#include "ocrprep/geometry.hpp"
#include "ocrprep/threshold.hpp"

namespace ocp {

struct PreprocessOptions {
    int      target_min_dim     = 2000;              // 長邊至少放大到這個尺寸
    Resample resample           = Resample::Bicubic;
    Backend  backend            = Backend::Single;
    int      fallback_threshold = kFallbackThreshold;
    bool     correct_polarity   = true;
};

struct PreprocessStats {
    int           scale     = 1;
    int           out_w     = 0;
    int           out_h     = 0;
    int           threshold = kFallbackThreshold;
    std::uint64_t white     = 0;
    std::uint64_t black     = 0;
    bool          inverted  = false;
    bool          fell_back = false;  // 回傳的是原始輸入
};

struct PreprocessResult {
    std::vector<uint8_t> bytes;
    PreprocessStats      stats;
};

// 記憶體內的四趟處理：放大 → 灰階+直方圖 → Otsu → 二值化 → 極性校正
// img 可能被換成放大後的新緩衝區
PreprocessStats preprocess_pixels(PixelBuffer& img,
                                  const PreprocessOptions& opts = {});

// 完整流程：decode → preprocess_pixels → encode PNG
// 解碼 / 配置 / 編碼失敗時回傳原始位元組，不丟例外
// （只有連輸入的複本都配置不到時才會丟 std::bad_alloc）
PreprocessResult run_preprocess(const std::vector<uint8_t>& input,
                                const PreprocessOptions& opts = {});

std::vector<uint8_t> preprocess_for_ocr(const std::vector<uint8_t>& input,
                                        const PreprocessOptions& opts = {});

std::future<std::vector<uint8_t>> preprocess_for_ocr_async(std::vector<uint8_t> input,
                                                           PreprocessOptions opts = {});

} // namespace ocp

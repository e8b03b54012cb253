#include "ocrprep/pipeline.hpp"
#include "ocrprep/color.hpp"
#include "ocrprep/errors.hpp"

#include <spdlog/spdlog.h>

#include <new>
#include <stdexcept>
#include <utility>

namespace ocp {

PreprocessStats preprocess_pixels(PixelBuffer& img, const PreprocessOptions& opts)
{
    PreprocessStats st;
    st.scale = upscale_factor(img.w(), img.h(), opts.target_min_dim);
    img = upscale_for_ocr(std::move(img), opts.target_min_dim, opts.resample, opts.backend);
    st.out_w = img.w();
    st.out_h = img.h();

    // Pass 1：灰階 + 直方圖
    const Histogram hist = to_grayscale_inplace(img, opts.backend);
    const std::uint64_t total = img.pixel_count();

    st.threshold = otsu_threshold(hist, total, opts.fallback_threshold);

    // Pass 2：二值化，順便數白點
    st.white = binarize_inplace(img, st.threshold, opts.backend);
    st.black = total - st.white;

    // Pass 3：深色背景才反相；統計值一律對應最終輸出
    if (opts.correct_polarity) {
        st.inverted = correct_polarity(img, st.white, total, opts.backend);
        if (st.inverted) std::swap(st.white, st.black);
    }
    return st;
}

PreprocessResult run_preprocess(const std::vector<uint8_t>& input,
                                const PreprocessOptions& opts)
{
    // 退路先準備好：catch 裡只做 move，不再配置記憶體
    // 唯一可能逃出的例外是這份複本本身配置失敗
    PreprocessResult original;
    original.bytes = input;
    original.stats.fell_back = true;

    PreprocessResult res;
    const auto fall_back = [&](const char* why) {
        spdlog::warn("preprocess: image preprocessing failed, using original: {}", why);
        return std::move(original);
    };

    try {
        PixelBuffer img = decode_image(input);
        res.stats = preprocess_pixels(img, opts);
        res.bytes = encode_png(img);
    } catch (const ImageError& e) {
        return fall_back(e.what());
    } catch (const std::invalid_argument& e) {
        return fall_back(e.what());
    } catch (const std::bad_alloc&) {
        return fall_back("out of memory");
    }

    spdlog::debug("preprocess: scale={} size={}x{} threshold={} white={} black={} inverted={}",
                  res.stats.scale, res.stats.out_w, res.stats.out_h, res.stats.threshold,
                  res.stats.white, res.stats.black, res.stats.inverted);
    return res;
}

std::vector<uint8_t> preprocess_for_ocr(const std::vector<uint8_t>& input,
                                        const PreprocessOptions& opts)
{
    return run_preprocess(input, opts).bytes;
}

std::future<std::vector<uint8_t>> preprocess_for_ocr_async(std::vector<uint8_t> input,
                                                           PreprocessOptions opts)
{
    return std::async(std::launch::async,
                      [in = std::move(input), opts]() {
                          return preprocess_for_ocr(in, opts);
                      });
}

} // namespace ocp

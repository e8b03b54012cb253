#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "ocrprep/pipeline.hpp"

namespace ocp {

struct EngineConfig {
    std::vector<std::string> languages = {"kor", "eng"};
    bool preserve_interword_spaces     = true;
    int  user_defined_dpi              = 300;
};

struct RecognitionResult {
    std::string text;
    float       mean_confidence = 0.0f;
    std::map<std::string, std::string> metadata;
};

// 外部辨識引擎（不透明）；失敗時丟 RecognitionError
class RecognitionEngine {
public:
    virtual ~RecognitionEngine() = default;
    virtual RecognitionResult recognize(const std::vector<uint8_t>& png_bytes) = 0;
};

using EngineFactory = std::function<std::unique_ptr<RecognitionEngine>(const EngineConfig&)>;

// 由宿主程式建立一次、以參考傳遞
// engine() 第一次呼叫時才建立引擎，之後重複使用同一個實例
class EngineContext {
public:
    explicit EngineContext(EngineFactory factory, EngineConfig config = {});

    EngineContext(const EngineContext&)            = delete;
    EngineContext& operator=(const EngineContext&) = delete;

    RecognitionEngine& engine();
    bool initialized() const;
    const EngineConfig& config() const { return config_; }

private:
    EngineFactory factory_;
    EngineConfig  config_;
    std::unique_ptr<RecognitionEngine> engine_;
    std::once_flag once_;
    std::atomic<bool> ready_{false};
};

// 前處理 + 辨識
class OcrService {
public:
    explicit OcrService(EngineContext& ctx, PreprocessOptions opts = {})
        : ctx_(ctx), opts_(opts) {}

    RecognitionResult recognize(const std::vector<uint8_t>& image_bytes);

    // ctx 必須活得比回傳的 future 久
    std::future<RecognitionResult> recognize_async(std::vector<uint8_t> image_bytes);

private:
    EngineContext&    ctx_;
    PreprocessOptions opts_;
};

} // namespace ocp

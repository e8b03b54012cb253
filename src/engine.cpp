#include "ocrprep/engine.hpp"
#include "ocrprep/errors.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/fmt/ranges.h>

#include <stdexcept>
#include <utility>

namespace ocp {

EngineContext::EngineContext(EngineFactory factory, EngineConfig config)
    : factory_(std::move(factory)), config_(std::move(config))
{
    if (!factory_) throw std::invalid_argument("EngineContext: null engine factory");
}

RecognitionEngine& EngineContext::engine()
{
    // 建立失敗（丟例外）時 once_flag 不會被設起，下次呼叫會重試
    std::call_once(once_, [this] {
        spdlog::info("ocr: initializing recognition engine (languages={}, dpi={})",
                     config_.languages, config_.user_defined_dpi);
        auto created = factory_(config_);
        if (!created) throw RecognitionError("engine factory returned no engine");
        engine_ = std::move(created);
        ready_ = true;
    });
    return *engine_;
}

bool EngineContext::initialized() const
{
    return ready_;
}

RecognitionResult OcrService::recognize(const std::vector<uint8_t>& image_bytes)
{
    RecognitionEngine& eng = ctx_.engine();

    const std::vector<uint8_t> processed = preprocess_for_ocr(image_bytes, opts_);
    spdlog::info("ocr: preprocessed {} -> {} bytes", image_bytes.size(), processed.size());

    RecognitionResult result = eng.recognize(processed);
    spdlog::info("ocr: result: {}", result.text.substr(0, 200));
    return result;
}

std::future<RecognitionResult> OcrService::recognize_async(std::vector<uint8_t> image_bytes)
{
    return std::async(std::launch::async,
                      [this, bytes = std::move(image_bytes)]() {
                          return recognize(bytes);
                      });
}

} // namespace ocp

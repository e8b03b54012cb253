#pragma once
#include <cstddef>
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace ocp {

// RGBA 交錯排列，每像素固定 4 bytes
class PixelBuffer {
public:
    static constexpr int kChannels = 4;

    PixelBuffer() = default;

    // 自行配置（內容歸零）
    PixelBuffer(int h, int w)
        : h_(h), w_(w)
    {
        if (h <= 0 || w <= 0)
            throw std::invalid_argument("PixelBuffer: invalid shape");
        data_ = std::shared_ptr<uint8_t[]>(new uint8_t[size()](), std::default_delete<uint8_t[]>());
    }

    // 接管外部緩衝區（例如 decoder 配置的記憶體，deleter 由呼叫端決定）
    PixelBuffer(int h, int w, std::shared_ptr<uint8_t[]> external)
        : h_(h), w_(w), data_(std::move(external))
    {
        if (!data_) throw std::invalid_argument("PixelBuffer: null external buffer");
        if (h <= 0 || w <= 0)
            throw std::invalid_argument("PixelBuffer: invalid shape");
    }

    // 不允許隱式複製，需要時用 clone()
    PixelBuffer(const PixelBuffer&)            = delete;
    PixelBuffer& operator=(const PixelBuffer&) = delete;

    PixelBuffer(PixelBuffer&&)            = default;
    PixelBuffer& operator=(PixelBuffer&&) = default;

    int  h() const { return h_; }
    int  w() const { return w_; }
    bool empty() const { return !data_; }

    std::size_t pixel_count() const { return static_cast<std::size_t>(h_) * w_; }
    std::size_t size() const { return pixel_count() * kChannels; }

    uint8_t*       data()       { return data_.get(); }
    const uint8_t* data() const { return data_.get(); }

    const std::shared_ptr<uint8_t[]>& shared() const { return data_; }

    PixelBuffer clone() const;

private:
    int h_ = 0, w_ = 0;
    std::shared_ptr<uint8_t[]> data_;
};

// 解碼 JPEG / PNG 等格式為 RGBA；失敗丟 DecodeError
PixelBuffer decode_image(const uint8_t* bytes, std::size_t len);
PixelBuffer decode_image(const std::vector<uint8_t>& bytes);

// 無損編碼為 PNG；失敗丟 EncodeError
std::vector<uint8_t> encode_png(const PixelBuffer& img);

} // namespace ocp

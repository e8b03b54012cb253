#include "ocrprep/image.hpp"
#include "ocrprep/backend.hpp"
#include "ocrprep/errors.hpp"

#include <algorithm>
#include <climits>
#include <string>

// stb
#define STB_IMAGE_IMPLEMENTATION
#define STB_IMAGE_WRITE_IMPLEMENTATION
#include "stb_image.h"
#include "stb_image_write.h"

namespace ocp {

PixelBuffer PixelBuffer::clone() const
{
    if (empty()) return PixelBuffer();
    PixelBuffer dst(h_, w_);
    std::copy(data(), data() + size(), dst.data());
    return dst;
}

// 零拷貝：直接接管 stb 配置的像素，deleter 用 stbi_image_free
// 一律要求 4 通道輸出，灰階 / RGB 來源由 stb 補齊 alpha
PixelBuffer decode_image(const uint8_t* bytes, std::size_t len)
{
    if (!bytes || len == 0)
        throw DecodeError("decode_image: empty input");
    if (len > static_cast<std::size_t>(INT_MAX))
        throw DecodeError("decode_image: input too large");

    int w = 0, h = 0, ch_in = 0;
    stbi_uc* raw = stbi_load_from_memory(bytes, static_cast<int>(len),
                                         &w, &h, &ch_in, PixelBuffer::kChannels);
    if (!raw) {
        const char* why = stbi_failure_reason();
        throw DecodeError(std::string("stb_image: ") + (why ? why : "unknown failure"));
    }

    std::shared_ptr<uint8_t[]> sp(
        reinterpret_cast<uint8_t*>(raw),
        [](uint8_t* p){ stbi_image_free(p); }
    );

    if (w <= 0 || h <= 0)
        throw DecodeError("decode_image: decoded image has no pixels");

    return PixelBuffer(h, w, std::move(sp));
}

PixelBuffer decode_image(const std::vector<uint8_t>& bytes)
{
    return decode_image(bytes.data(), bytes.size());
}

static void append_to_vector(void* context, void* data, int size)
{
    auto* out = static_cast<std::vector<uint8_t>*>(context);
    const auto* p = static_cast<const uint8_t*>(data);
    out->insert(out->end(), p, p + size);
}

std::vector<uint8_t> encode_png(const PixelBuffer& img)
{
    if (img.empty())
        throw EncodeError("encode_png: empty image");

    std::vector<uint8_t> out;
    const int stride = img.w() * PixelBuffer::kChannels; // bytes per row
    if (!stbi_write_png_to_func(append_to_vector, &out, img.w(), img.h(),
                                PixelBuffer::kChannels, img.data(), stride))
        throw EncodeError("stb_image_write: failed to encode png");
    if (out.empty())
        throw EncodeError("stb_image_write: png encoder produced no data");
    return out;
}

Backend parse_backend(const std::string& s)
{
    if (s == "auto")   return Backend::Auto;
    if (s == "single") return Backend::Single;
    if (s == "openmp" || s == "omp") return Backend::OpenMP;
    throw std::invalid_argument("backend must be one of: auto, single, openmp");
}

} // namespace ocp

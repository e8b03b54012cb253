#include <pybind11/pybind11.h>
#include <pybind11/numpy.h>
#include <pybind11/stl.h>

#include "ocrprep/image.hpp"
#include "ocrprep/color.hpp"
#include "ocrprep/geometry.hpp"
#include "ocrprep/threshold.hpp"
#include "ocrprep/pipeline.hpp"
#include <array>
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace py = pybind11;

namespace ocppy {

using ocp::PixelBuffer;
using ocp::Backend;

// ------------------------------------------------------------
// 共用：檢查 numpy array (uint8, C-contiguous, HxWx4)
// ------------------------------------------------------------
struct ShapeInfo {
    int h;
    int w;
};

static ShapeInfo check_uint8_hw4(const py::buffer_info& info) {
    if (info.ndim != 3 || info.shape[2] != PixelBuffer::kChannels) {
        throw std::runtime_error("expected HxWx4 (RGBA) uint8 array");
    }
    if (info.itemsize != 1) {
        throw std::runtime_error("expected dtype=uint8");
    }

    const int h = static_cast<int>(info.shape[0]);
    const int w = static_cast<int>(info.shape[1]);

    // H x W x 4: strides = [W*4, 4, 1]
    if (!(info.strides[0] == static_cast<ssize_t>(w) * PixelBuffer::kChannels &&
          info.strides[1] == PixelBuffer::kChannels &&
          info.strides[2] == 1)) {
        throw std::runtime_error("expected C-contiguous array (HxWx4)");
    }

    return {h, w};
}

// ------------------------------------------------------------
// numpy.ndarray -> PixelBuffer（零拷貝，原地修改會反映到 numpy）
// ------------------------------------------------------------
static PixelBuffer numpy_to_pixels_zero_copy(py::array& array) {
    py::buffer_info info = array.request(/*writable=*/true);
    auto shape = check_uint8_hw4(info);

    auto* ptr = static_cast<uint8_t*>(info.ptr);

    // 持有原始 numpy 陣列，確保其生命週期 >= PixelBuffer
    py::object owner = array;
    std::shared_ptr<uint8_t[]> sp(ptr, [owner](uint8_t*) mutable {
        // numpy 擁有這塊記憶體，不 delete
    });

    return PixelBuffer(shape.h, shape.w, std::move(sp));
}

// ------------------------------------------------------------
// PixelBuffer -> numpy.ndarray（零拷貝）
// ------------------------------------------------------------
static py::array pixels_to_numpy(const PixelBuffer& img) {
    if (img.empty()) {
        throw std::runtime_error("Image is empty");
    }

    std::vector<ssize_t> shape   = {img.h(), img.w(), PixelBuffer::kChannels};
    std::vector<ssize_t> strides = {static_cast<ssize_t>(img.w()) * PixelBuffer::kChannels,
                                    PixelBuffer::kChannels,
                                    1};

    // shared_ptr 副本放進 capsule，讓 numpy 管理一份 ref 計數
    auto* sp_copy = new std::shared_ptr<uint8_t[]>(img.shared());
    py::capsule base(sp_copy, [](void* p) {
        delete reinterpret_cast<std::shared_ptr<uint8_t[]>*>(p);
    });

    return py::array(py::dtype::of<uint8_t>(), shape, strides, img.shared().get(), base);
}

static std::vector<uint8_t> bytes_to_vector(const py::bytes& b) {
    const std::string s = b;
    return std::vector<uint8_t>(s.begin(), s.end());
}

static py::bytes vector_to_bytes(const std::vector<uint8_t>& v) {
    return py::bytes(reinterpret_cast<const char*>(v.data()), v.size());
}

} // namespace ocppy

// ------------------------------------------------------------
// pybind11 module
// ------------------------------------------------------------
PYBIND11_MODULE(_core, m) {
    using namespace ocppy;

    m.doc() = "OcrPrep core (OCR image preprocessing: upscale, Otsu binarization, polarity)";

    m.def("decode_image",
          [](const py::bytes& data) {
              return pixels_to_numpy(ocp::decode_image(bytes_to_vector(data)));
          },
          py::arg("data"),
          "Decode JPEG/PNG bytes into an HxWx4 uint8 numpy array.");

    m.def("encode_png",
          [](py::array img) {
              PixelBuffer px = numpy_to_pixels_zero_copy(img);
              return vector_to_bytes(ocp::encode_png(px));
          },
          py::arg("img"),
          "Encode an HxWx4 uint8 numpy array as PNG bytes.");

    m.def("preprocess_for_ocr",
          [](const py::bytes& data,
             int target,
             const std::string& backend,
             const std::string& resample,
             bool polarity)
          {
              ocp::PreprocessOptions opts;
              opts.target_min_dim   = target;
              opts.backend          = ocp::parse_backend(backend);
              opts.resample         = ocp::parse_resample(resample);
              opts.correct_polarity = polarity;

              const std::vector<uint8_t> in = bytes_to_vector(data);
              std::vector<uint8_t> out;
              {
                  py::gil_scoped_release release;
                  out = ocp::preprocess_for_ocr(in, opts);
              }
              return vector_to_bytes(out);
          },
          py::arg("data"),
          py::arg("target")   = 2000,
          py::arg("backend")  = "single",
          py::arg("resample") = "bicubic",
          py::arg("polarity") = true,
          "Full preprocessing; returns PNG bytes, or the input unchanged on failure.");

    m.def("upscale_factor", &ocp::upscale_factor,
          py::arg("w"), py::arg("h"), py::arg("target") = 2000,
          "Integer upscale factor so that the longer side reaches target.");

    m.def("to_grayscale_inplace",
          [](py::array img, const std::string& backend) {
              PixelBuffer px = numpy_to_pixels_zero_copy(img);
              return ocp::to_grayscale_inplace(px, ocp::parse_backend(backend));
          },
          py::arg("img"), py::arg("backend") = "single",
          "Convert RGBA array to gray in place; returns the 256-bin histogram.");

    m.def("otsu_threshold",
          [](const std::array<std::uint64_t, 256>& hist, std::uint64_t total) {
              return ocp::otsu_threshold(hist, total);
          },
          py::arg("hist"), py::arg("total"),
          "Otsu threshold in [0, 255]; 128 when no split exists.");

    m.def("binarize_inplace",
          [](py::array img, int threshold, const std::string& backend) {
              PixelBuffer px = numpy_to_pixels_zero_copy(img);
              return ocp::binarize_inplace(px, threshold, ocp::parse_backend(backend));
          },
          py::arg("img"), py::arg("threshold"), py::arg("backend") = "single",
          "Binarize a gray RGBA array in place; returns the white pixel count.");

    m.def("invert_inplace",
          [](py::array img, const std::string& backend) {
              PixelBuffer px = numpy_to_pixels_zero_copy(img);
              ocp::invert_inplace(px, ocp::parse_backend(backend));
          },
          py::arg("img"), py::arg("backend") = "single",
          "Invert R/G/B in place, alpha untouched.");
}

#pragma once
#include <stdexcept>
#include <string>

namespace ocp {

class ImageError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// 輸入位元組無法解碼（格式錯誤或不支援）
class DecodeError : public ImageError {
public:
    using ImageError::ImageError;
};

class EncodeError : public ImageError {
public:
    using ImageError::ImageError;
};

// 辨識引擎回報的錯誤，交由呼叫端處理
class RecognitionError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

} // namespace ocp

#pragma once

#include <cstdint>
#include <filesystem>
#include <future>
#include <string>
#include <vector>

namespace ocp {

struct InputFile {
    std::string          name;
    std::vector<uint8_t> bytes;
};

// .jpg / .jpeg / .png（不分大小寫）
bool is_accepted_image_name(const std::string& name);

// 讀取使用者選的檔案；沒有選任何檔案時回傳空 vector
class FileSource {
public:
    // 不接受的副檔名略過並記 warning；讀不到的檔案丟 std::runtime_error
    std::vector<InputFile> load(const std::vector<std::string>& paths) const;
};

// 寫出檔案：先寫 <name>.part 再 rename，失敗時刪掉 .part
class FileSink {
public:
    explicit FileSink(std::filesystem::path dir);

    // 不阻塞呼叫端；錯誤透過 future 回報
    std::future<void> save(std::vector<uint8_t> bytes,
                           std::string filename,
                           std::string mime_type) const;

    // filename 沒有副檔名時依 mime type 補上
    static std::string with_extension(const std::string& filename,
                                      const std::string& mime_type);

    const std::filesystem::path& dir() const { return dir_; }

private:
    std::filesystem::path dir_;
};

} // namespace ocp

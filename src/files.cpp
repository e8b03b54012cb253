#include "ocrprep/files.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <system_error>

namespace fs = std::filesystem;

namespace ocp {

static std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
    return s;
}

bool is_accepted_image_name(const std::string& name)
{
    const std::string ext = lower(fs::path(name).extension().string());
    return ext == ".jpg" || ext == ".jpeg" || ext == ".png";
}

std::vector<InputFile> FileSource::load(const std::vector<std::string>& paths) const
{
    std::vector<InputFile> files;
    for (const std::string& p : paths) {
        if (!is_accepted_image_name(p)) {
            spdlog::warn("files: skipping {} (expected .jpg, .jpeg or .png)", p);
            continue;
        }

        std::ifstream in(p, std::ios::binary);
        if (!in) throw std::runtime_error("files: cannot open " + p);

        InputFile f;
        f.name = fs::path(p).filename().string();
        f.bytes.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
        if (in.bad()) throw std::runtime_error("files: read error on " + p);

        spdlog::debug("files: loaded {} ({} bytes)", f.name, f.bytes.size());
        files.push_back(std::move(f));
    }
    return files;
}

namespace {

// .part 暫存檔：沒有 commit 就在解構時刪掉
class PartFile {
public:
    explicit PartFile(fs::path path) : path_(std::move(path)) {}
    ~PartFile() {
        if (committed_) return;
        std::error_code ec;
        fs::remove(path_, ec);
        if (ec) spdlog::warn("files: cannot remove {}: {}", path_.string(), ec.message());
    }

    PartFile(const PartFile&)            = delete;
    PartFile& operator=(const PartFile&) = delete;

    const fs::path& path() const { return path_; }
    void commit() { committed_ = true; }

private:
    fs::path path_;
    bool committed_ = false;
};

} // namespace

FileSink::FileSink(fs::path dir)
    : dir_(std::move(dir))
{
    if (dir_.empty()) dir_ = fs::current_path();
}

std::string FileSink::with_extension(const std::string& filename,
                                     const std::string& mime_type)
{
    if (fs::path(filename).has_extension()) return filename;

    const std::string mime = lower(mime_type.substr(0, mime_type.find(';')));
    if (mime == "image/png")  return filename + ".png";
    if (mime == "image/jpeg") return filename + ".jpg";
    if (mime == "text/csv")   return filename + ".csv";
    if (mime == "text/plain") return filename + ".txt";
    if (mime == "application/pdf") return filename + ".pdf";
    return filename;
}

std::future<void> FileSink::save(std::vector<uint8_t> bytes,
                                 std::string filename,
                                 std::string mime_type) const
{
    if (filename.empty()) throw std::invalid_argument("FileSink: empty filename");

    const fs::path target = dir_ / with_extension(fs::path(filename).filename().string(), mime_type);

    return std::async(std::launch::async,
                      [target, data = std::move(bytes)]() {
        std::error_code ec;
        fs::create_directories(target.parent_path(), ec);
        if (ec)
            throw std::runtime_error("files: cannot create " + target.parent_path().string()
                                     + ": " + ec.message());

        PartFile part(fs::path(target.string() + ".part"));
        {
            std::ofstream out(part.path(), std::ios::binary | std::ios::trunc);
            if (!out) throw std::runtime_error("files: cannot write " + part.path().string());
            out.write(reinterpret_cast<const char*>(data.data()),
                      static_cast<std::streamsize>(data.size()));
            out.close();
            if (!out) throw std::runtime_error("files: write failed on " + part.path().string());
        }

        fs::rename(part.path(), target, ec);
        if (ec)
            throw std::runtime_error("files: cannot rename to " + target.string()
                                     + ": " + ec.message());
        part.commit();
        spdlog::info("files: saved {} ({} bytes)", target.string(), data.size());
    });
}

} // namespace ocp

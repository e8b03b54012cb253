#include "ocrprep/files.hpp"
#include "ocrprep/pipeline.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/cfg/env.h>

#include <cstdio>
#include <exception>
#include <filesystem>
#include <future>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace fs = std::filesystem;

namespace {

struct CliArgs {
    std::string              out_dir = ".";
    ocp::PreprocessOptions   opts;
    std::vector<std::string> inputs;
};

void print_usage(const char* argv0)
{
    std::fprintf(stderr,
        "usage: %s [-o DIR] [--target N] [--backend auto|single|openmp]\n"
        "          [--resample bicubic|bilinear] [--no-polarity] [-v|-q] FILE...\n",
        argv0);
}

// 需要值的選項缺值時丟 invalid_argument
std::string take_value(int& i, int argc, char** argv)
{
    if (i + 1 >= argc)
        throw std::invalid_argument(std::string("missing value for ") + argv[i]);
    return argv[++i];
}

CliArgs parse_args(int argc, char** argv)
{
    CliArgs a;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "-o" || arg == "--out") {
            a.out_dir = take_value(i, argc, argv);
        } else if (arg == "--target") {
            a.opts.target_min_dim = std::stoi(take_value(i, argc, argv));
            if (a.opts.target_min_dim <= 0 || a.opts.target_min_dim > ocp::kMaxTargetMinDim)
                throw std::invalid_argument("--target must be in [1, "
                                            + std::to_string(ocp::kMaxTargetMinDim) + "]");
        } else if (arg == "--backend") {
            a.opts.backend = ocp::parse_backend(take_value(i, argc, argv));
        } else if (arg == "--resample") {
            a.opts.resample = ocp::parse_resample(take_value(i, argc, argv));
        } else if (arg == "--no-polarity") {
            a.opts.correct_polarity = false;
        } else if (arg == "-v" || arg == "--verbose") {
            spdlog::set_level(spdlog::level::debug);
        } else if (arg == "-q" || arg == "--quiet") {
            spdlog::set_level(spdlog::level::warn);
        } else if (!arg.empty() && arg[0] == '-') {
            throw std::invalid_argument("unknown option " + arg);
        } else {
            a.inputs.push_back(arg);
        }
    }
    return a;
}

} // namespace

int main(int argc, char** argv)
{
    spdlog::cfg::load_env_levels();

    CliArgs args;
    try {
        args = parse_args(argc, argv);
    } catch (const std::exception& e) {
        spdlog::error("{}", e.what());
        print_usage(argv[0]);
        return 2;
    }

    std::vector<ocp::InputFile> files;
    try {
        files = ocp::FileSource().load(args.inputs);
    } catch (const std::runtime_error& e) {
        spdlog::error("{}", e.what());
        return 1;
    }
    if (files.empty()) {
        spdlog::info("no input images");
        return 0;
    }

    const ocp::FileSink sink(args.out_dir);
    std::vector<std::pair<std::string, std::future<void>>> pending;

    for (ocp::InputFile& f : files) {
        const ocp::PreprocessResult res = ocp::run_preprocess(f.bytes, args.opts);
        if (res.stats.fell_back) {
            spdlog::warn("{}: preprocessing skipped, writing original bytes", f.name);
        } else {
            spdlog::info("{}: {}x{} threshold={} inverted={}", f.name,
                         res.stats.out_w, res.stats.out_h, res.stats.threshold, res.stats.inverted);
        }

        // 退回原檔時保留原本的副檔名
        const fs::path src_name(f.name);
        std::string out_name = src_name.stem().string() + "_ocr";
        if (res.stats.fell_back) out_name += src_name.extension().string();
        pending.emplace_back(out_name, sink.save(res.bytes, out_name, "image/png"));
    }

    int rc = 0;
    for (auto& p : pending) {
        try {
            p.second.get();
        } catch (const std::exception& e) {
            spdlog::error("{}: {}", p.first, e.what());
            rc = 1;
        }
    }
    return rc;
}

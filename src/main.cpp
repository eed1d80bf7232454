#define _FILE_OFFSET_BITS 64

#include "cache/hash_cache.hpp"
#include "system/signals.hpp"
#include "transfer/image_pipeline.hpp"
#include "transfer/progress_sinks.hpp"
#include "util/config.hpp"
#include "util/image_descriptor.hpp"
#include "util/logger.hpp"

#include <cstdio>
#include <getopt.h>
#include <string>

namespace {

constexpr int kExitOk = 0;
constexpr int kExitFailure = 1;
constexpr int kExitUsage = 2;
constexpr int kExitAborted = 130;

void PrintUsage(const char *argv) {
    std::fprintf(stderr,
        "Usage:\n"
        "   %s -d <descriptor.json> -t <device> [-c <config>] [-q] [-v]\n"
        "   %s --verify <file> --sha256 <hex> [-c <config>]\n"
        "\n"
        "Options:\n"
        "  -d, --descriptor       Image descriptor (JSON object with name, url, ...)\n"
        "  -t, --target           Device to write the image to (e.g. /dev/sdb)\n"
        "  -c, --config           Config file (default %s)\n"
        "  -q, --quiet            No progress line, warnings and errors only\n"
        "  -v, --verbose          Debug logging\n"
        "      --verify <file>    Check <file> against --sha256 using its cached digest\n"
        "      --sha256 <hex>     Expected digest for --verify\n"
        "  -h, --help             Show this help\n",
        argv,
        argv,
        imagine::config::kDefaultConfigPath);
}

int ExitCodeFor(const imagine::Result &r) {
    if (r.is_ok()) return kExitOk;
    if (r.aborted()) return kExitAborted;
    return kExitFailure;
}

} // namespace

int main(int argc, char **argv) {
    imagine::CancelToken cancel;
    imagine::InstallSignalHandlers(cancel);

    std::string descriptor_path;
    std::string target;
    std::string config_path = imagine::config::kDefaultConfigPath;
    bool config_given = false;
    std::string verify_path;
    std::string verify_sha;
    bool quiet = false;
    bool verbose = false;

    enum { kOptVerify = 1000, kOptSha256 };

    static option long_opts[] = {
        {"descriptor", required_argument, nullptr, 'd'},
        {"target", required_argument, nullptr, 't'},
        {"config", required_argument, nullptr, 'c'},
        {"quiet", no_argument, nullptr, 'q'},
        {"verbose", no_argument, nullptr, 'v'},
        {"verify", required_argument, nullptr, kOptVerify},
        {"sha256", required_argument, nullptr, kOptSha256},
        {"help", no_argument, nullptr, 'h'},
        {nullptr, 0, nullptr, 0},
    };

    int idx = 0;
    int c;
    while ((c = getopt_long(argc, argv, "hd:t:c:qv", long_opts, &idx)) != -1) {
        switch (c) {
            case 'h':
                PrintUsage(argv[0]);
                return kExitOk;
            case 'd':
                descriptor_path = optarg;
                break;
            case 't':
                target = optarg;
                break;
            case 'c':
                config_path = optarg;
                config_given = true;
                break;
            case 'q':
                quiet = true;
                break;
            case 'v':
                verbose = true;
                break;
            case kOptVerify:
                verify_path = optarg;
                break;
            case kOptSha256:
                verify_sha = optarg;
                break;
            default:
                PrintUsage(argv[0]);
                return kExitUsage;
        }
    }

    const bool verify_mode = !verify_path.empty();
    if (optind != argc ||
        (verify_mode && (verify_sha.empty() || !descriptor_path.empty() || !target.empty())) ||
        (!verify_mode && (descriptor_path.empty() || target.empty()))) {
        PrintUsage(argv[0]);
        return kExitUsage;
    }

    imagine::config::ImagineConfig cfg;
    if (auto r = cfg.LoadFile(config_path, config_given); !r.is_ok()) {
        std::fprintf(stderr, "ERROR: %s\n", r.msg.c_str());
        return kExitFailure;
    }

    auto &logger = imagine::Logger::Instance();
    if (cfg.log_level) logger.SetLevel(*cfg.log_level);
    if (quiet) logger.SetLevel(imagine::LogLevel::Warn);
    if (verbose) logger.SetLevel(imagine::LogLevel::Debug);

    if (verify_mode) {
        imagine::HashCache cache(static_cast<std::size_t>(cfg.chunk_size));
        const bool ok = cache.IsValid(verify_path, verify_sha);
        std::printf("%s: %s\n", verify_path.c_str(), ok ? "OK" : "FAILED");
        return ok ? kExitOk : kExitFailure;
    }

    auto descriptor = imagine::ImageDescriptorParser{}.ParseFile(descriptor_path);
    if (!descriptor) {
        std::fprintf(stderr, "ERROR: descriptor: %s\n", descriptor.error().c_str());
        return kExitFailure;
    }

    imagine::ConsoleProgressSink console;
    imagine::ImagePipeline pipeline(cfg);
    pipeline.SetPhaseCallback([&console](imagine::Phase phase) { console.SetLabel(imagine::ToString(phase)); });

    auto res = pipeline.Install(*descriptor, target, &cancel, quiet ? nullptr : &console);
    imagine::ClearProgressLine();

    if (!res.is_ok()) {
        std::fprintf(stderr, "%s: %s\n", res.aborted() ? "ABORTED" : "ERROR", res.msg.c_str());
    }
    return ExitCodeFor(res);
}

#include "cloner/channel.hpp"
#include "cloner/clone_target.hpp"
#include "cloner/device_streamer.hpp"
#include "cloner/tar_stream_extractor.hpp"
#include "metrics/registry.hpp"
#include "metrics/sink.hpp"
#include "system/signals.hpp"
#include "util/config_parser.hpp"
#include "util/logger.hpp"

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <getopt.h>
#include <memory>
#include <optional>
#include <string>

namespace {

constexpr const char *kOwnerUidEnv = "OWNER_UID";

void PrintUsage(const char *argv) {
    std::fprintf(stderr,
        "Usage:\n"
        "   %s -p <named pipe> [-u <owner uid>] [-c <config.json>] [-b <block path>]\n"
        "      [-d <target dir>] [-m <metrics file>] [-v <level>]\n"
        "\n"
        "Options:\n"
        "  -p, --pipedir        Name and directory of the named pipe to read from (required)\n"
        "  -u, --owner-uid      Owner identifier used as the progress metric label (default $OWNER_UID)\n"
        "  -c, --config         JSON config file\n"
        "  -b, --block-path     Block volume path; its presence selects raw device mode\n"
        "                       (default /dev/cdi-block-volume)\n"
        "  -d, --target-dir     Directory the archive is unpacked into (default .)\n"
        "  -m, --metrics-file   Write progress metrics in Prometheus text format to this file\n"
        "  -v, --verbosity      debug|info|warn|error|none (default info)\n"
        "  -h, --help           Show this help\n",
        argv);
}

int Fail(const cloner::Result &r) {
    LogError("%s: %s", cloner::ErrorKindName(r.kind), r.msg.c_str());
    return 1;
}

} // namespace

int main(int argc, char **argv) {
    cloner::InstallSignalHandlers();

    std::optional<std::string> pipe_path;
    std::optional<std::string> owner_cli;
    std::optional<std::string> config_path;
    std::optional<std::string> block_path_cli;
    std::optional<std::string> target_dir_cli;
    std::optional<std::string> metrics_file_cli;
    std::optional<std::string> verbosity_cli;

    static option long_opts[] = {
        {"pipedir", required_argument, nullptr, 'p'},
        {"owner-uid", required_argument, nullptr, 'u'},
        {"config", required_argument, nullptr, 'c'},
        {"block-path", required_argument, nullptr, 'b'},
        {"target-dir", required_argument, nullptr, 'd'},
        {"metrics-file", required_argument, nullptr, 'm'},
        {"verbosity", required_argument, nullptr, 'v'},
        {"help", no_argument, nullptr, 'h'},
        {nullptr, 0, nullptr, 0},
    };

    int idx = 0;
    int c;
    while ((c = getopt_long(argc, argv, "hp:u:c:b:d:m:v:", long_opts, &idx)) != -1) {
        switch (c) {
            case 'h':
                PrintUsage(argv[0]);
                return 0;
            case 'p':
                pipe_path = optarg;
                break;
            case 'u':
                owner_cli = optarg;
                break;
            case 'c':
                config_path = optarg;
                break;
            case 'b':
                block_path_cli = optarg;
                break;
            case 'd':
                target_dir_cli = optarg;
                break;
            case 'm':
                metrics_file_cli = optarg;
                break;
            case 'v':
                verbosity_cli = optarg;
                break;
            default:
                PrintUsage(argv[0]);
                return Fail(cloner::Result::Fail(cloner::ErrorKind::ConfigError, -1, "invalid command line"));
        }
    }

    if (optind < argc) {
        PrintUsage(argv[0]);
        return Fail(cloner::Result::Fail(cloner::ErrorKind::ConfigError,
                                         -1,
                                         std::string("unexpected argument: ") + argv[optind]));
    }

    cloner::config::ClonerConfigFromFile cfg;
    if (config_path) {
        if (auto r = cfg.LoadFile(*config_path); !r.ok) return Fail(r);
    }

    const std::optional<std::string> level_name = verbosity_cli ? verbosity_cli : cfg.log_level;
    if (level_name) {
        const auto level = cloner::ParseLogLevel(*level_name);
        if (!level) {
            return Fail(cloner::Result::Fail(cloner::ErrorKind::ConfigError,
                                             -1,
                                             "unknown log level: " + *level_name));
        }
        cloner::Logger::Instance().SetLevel(*level);
    }

    LogInfo("Starting cloner target");

    if (!pipe_path || pipe_path->empty()) {
        return Fail(cloner::Result::Fail(cloner::ErrorKind::ConfigError, -1, "Missed named pipe flag"));
    }

    cloner::CloneTargetOptions opt;
    if (owner_cli) {
        opt.owner_uid = *owner_cli;
    } else if (cfg.owner_uid) {
        opt.owner_uid = *cfg.owner_uid;
    } else if (const char *env = std::getenv(kOwnerUidEnv)) {
        opt.owner_uid = env;
    }
    if (opt.owner_uid.empty()) {
        LogWarn("No owner UID given; progress is reported under an empty label");
    }

    const std::string block_path =
        block_path_cli ? *block_path_cli : cfg.block_device_path.value_or(cloner::kDefaultBlockDevicePath);
    opt.marker_path = block_path;
    opt.block_device_path = block_path;
    opt.target_dir = target_dir_cli ? *target_dir_cli : cfg.target_dir.value_or(".");
    if (cfg.progress_interval_ms) {
        opt.progress.interval = std::chrono::milliseconds(*cfg.progress_interval_ms);
    }

    cloner::metrics::Registry registry;
    std::unique_ptr<cloner::metrics::FileMetricsSink> sink;
    const std::optional<std::string> metrics_file = metrics_file_cli ? metrics_file_cli : cfg.metrics_file;
    if (metrics_file && !metrics_file->empty()) {
        sink = std::make_unique<cloner::metrics::FileMetricsSink>(*metrics_file);
        opt.progress.sink = sink.get();
    }

    cloner::DeviceStreamer::Options stream_opt{};
    if (cfg.fsync_interval_bytes) {
        stream_opt.fsync_interval_bytes = *cfg.fsync_interval_bytes;
    }
    cloner::DestinationDispatcher dispatcher(std::make_shared<cloner::DeviceStreamer>(stream_opt),
                                             std::make_shared<cloner::TarStreamExtractor>());

    cloner::NamedPipeChannel channel(*pipe_path);
    cloner::CloneTarget target(channel, dispatcher, registry, opt);
    if (auto r = target.Run(); !r.ok) return Fail(r);

    return 0;
}

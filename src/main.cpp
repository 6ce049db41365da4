#include "io/file_store.hpp"
#include "sync/directory_remote_store.hpp"
#include "sync/member_filter.hpp"
#include "sync/sync_orchestrator.hpp"
#include "util/config_parser.hpp"
#include "util/logger.hpp"
#include "util/path_utils.hpp"

#include <cstdio>
#include <cstring>
#include <getopt.h>
#include <optional>
#include <string>
#include <sys/stat.h>

namespace {

void PrintUsage(const char *argv) {
    std::fprintf(stderr,
        "Usage:\n"
        "   %s <pull|push> [-p <sourcepath>] [-m <members>] [-s <store>] [-c <config>]\n"
        "\n"
        "Options:\n"
        "  -p, --sourcepath       Local source tree (default 'source')\n"
        "  -m, --members          Comma-separated [kind:]model[:definition] list,\n"
        "                         kind is ui, config-ui or pml (default: everything)\n"
        "  -s, --store            Remote store directory\n"
        "  -c, --config           Config file (default uisync.conf)\n"
        "  -f, --folder           Folder for created documents (default velo_product_models)\n"
        "  -v, --verbose          Debug logging\n"
        "  -q, --quiet            Errors only\n"
        "  -h, --help             Show this help\n",
        argv);
}

bool FileExists(const std::string &path) {
    struct stat st {};
    return ::stat(path.c_str(), &st) == 0;
}

} // namespace

int main(int argc, char **argv) {
    std::optional<std::string> source_cli;
    std::optional<std::string> members_cli;
    std::optional<std::string> store_cli;
    std::optional<std::string> folder_cli;
    std::optional<uisync::LogLevel> level_cli;
    std::string config_path = uisync::config::kDefaultConfigPath;
    bool config_given = false;

    static option long_opts[] = {
        {"sourcepath", required_argument, nullptr, 'p'},
        {"members", required_argument, nullptr, 'm'},
        {"store", required_argument, nullptr, 's'},
        {"config", required_argument, nullptr, 'c'},
        {"folder", required_argument, nullptr, 'f'},
        {"verbose", no_argument, nullptr, 'v'},
        {"quiet", no_argument, nullptr, 'q'},
        {"help", no_argument, nullptr, 'h'},
        {nullptr, 0, nullptr, 0},
    };

    int idx = 0;
    int c;
    while ((c = getopt_long(argc, argv, "hp:m:s:c:f:vq", long_opts, &idx)) != -1) {
        switch (c) {
            case 'h':
                PrintUsage(argv[0]);
                return 0;

            case 'p':
                source_cli = optarg;
                break;

            case 'm':
                members_cli = optarg;
                break;

            case 's':
                store_cli = optarg;
                break;

            case 'c':
                config_path = optarg;
                config_given = true;
                break;

            case 'f':
                folder_cli = optarg;
                break;

            case 'v':
                level_cli = uisync::LogLevel::Debug;
                break;

            case 'q':
                level_cli = uisync::LogLevel::Error;
                break;

            default:
                PrintUsage(argv[0]);
                return 2;
        }
    }

    if (optind + 1 != argc) {
        PrintUsage(argv[0]);
        return 2;
    }
    const std::string command = argv[optind];
    if (command != "pull" && command != "push") {
        std::fprintf(stderr, "Unknown command: %s\n", command.c_str());
        PrintUsage(argv[0]);
        return 2;
    }

    uisync::config::SyncConfigFromFile cfg;
    if (config_given || FileExists(config_path)) {
        if (auto r = cfg.LoadFile(config_path); !r.ok) {
            std::fprintf(stderr, "ERROR: %s\n", r.msg.c_str());
            return 2;
        }
    }

    auto &logger = uisync::Logger::Instance();
    if (level_cli) {
        logger.SetLevel(*level_cli);
    } else if (cfg.log_level) {
        // validated when the config was loaded
        if (auto lvl = uisync::ParseLogLevel(*cfg.log_level)) logger.SetLevel(*lvl);
    }

    uisync::SyncOptions opt;
    opt.source_path = uisync::TrimTrailingSlash(
        source_cli.value_or(cfg.source_path.value_or(uisync::config::kDefaultSourcePath)));
    opt.folder_name = folder_cli.value_or(cfg.folder_name.value_or(uisync::config::kDefaultFolderName));

    const std::optional<std::string> store_path = store_cli ? store_cli : cfg.store_path;
    if (!store_path || store_path->empty()) {
        std::fprintf(stderr, "ERROR: no remote store given (-s or StorePath in %s)\n", config_path.c_str());
        return 2;
    }

    auto filter = uisync::MemberFilter::Parse(members_cli.value_or(cfg.members.value_or("")));
    if (!filter) {
        std::fprintf(stderr, "ERROR: invalid members: %s\n", filter.error().c_str());
        return 2;
    }

    uisync::DirectoryRemoteStore store(*store_path);
    uisync::FileStore files;
    uisync::SyncOrchestrator orchestrator(store, files, opt);

    auto report = command == "pull" ? orchestrator.Pull(*filter) : orchestrator.Push(*filter);
    if (!report) {
        LogError("%s failed: %s", command.c_str(), report.error().c_str());
        return 1;
    }

    if (report->HasFailures()) {
        std::string names;
        for (const auto &n : report->FailedRecords()) {
            if (!names.empty()) names += ", ";
            names += n;
        }
        std::fprintf(stderr, "ERROR: %zu record(s) failed: %s\n", report->FailedRecords().size(), names.c_str());
        return 1;
    }

    LogInfo("Done.");
    return 0;
}

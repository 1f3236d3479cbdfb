/// @file main.cpp
/// @brief laxy command-line entry point

#include <getopt.h>
#include <signal.h>

#include <atomic>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <fmt/chrono.h>
#include <fmt/format.h>

#include "core/archive/archive_entry.hpp"
#include "core/batch/batch_operation.hpp"
#include "core/config/settings_manager.hpp"
#include "core/engine/engine.hpp"
#include "core/util/logger.hpp"
#include "core/util/retry.hpp"
#include "core/util/string_utils.hpp"

namespace {

constexpr int kExitOk = 0;
constexpr int kExitFailed = 1;
constexpr int kExitUsage = 2;
constexpr int kExitInterrupted = 130;

std::atomic<bool> g_interrupted{false};

void on_interrupt(int) {
    g_interrupted.store(true);
}

struct CliOptions {
    std::filesystem::path config_file;
    std::filesystem::path log_file;
    bool verbose = false;
    bool permanent = false;
    bool overwrite = false;
    bool no_verify = false;
    bool batch = false;
    std::optional<laxy::config::BatchStrategy> strategy;
    std::optional<laxy::archive::ArchiveFormat> format;
    std::optional<laxy::archive::CompressionLevel> level;
    int retries = 0;
    bool show_hidden = false;
    std::vector<std::string> positional;
};

void print_usage(const char* argv0) {
    std::fprintf(stderr,
                 "Usage: %s [OPTIONS] COMMAND ARGS...\n"
                 "\n"
                 "Commands:\n"
                 "  copy SOURCE... DEST          Copy into directory DEST\n"
                 "  move SOURCE... DEST          Move into directory DEST\n"
                 "  delete PATH...               Move to trash (or delete with --permanent)\n"
                 "  rename PATH NEW_NAME         Rename within the parent directory\n"
                 "  mkdir PATH                   Create a directory\n"
                 "  touch PATH                   Create an empty file\n"
                 "  ls [PATH]                    List a directory\n"
                 "  archive create ARCHIVE FILE...\n"
                 "  archive extract ARCHIVE DEST\n"
                 "  archive list ARCHIVE\n"
                 "  archive info ARCHIVE\n"
                 "  archive test ARCHIVE\n"
                 "  archive formats\n"
                 "\n"
                 "Options:\n"
                 "  -c, --config FILE      Settings file (default: %s)\n"
                 "  -l, --log-file FILE    Write a debug log to FILE\n"
                 "  -v, --verbose          Log progress to stderr\n"
                 "  -p, --permanent        Delete without the trash\n"
                 "  -f, --overwrite        Replace existing destinations\n"
                 "      --no-verify        Skip copy verification\n"
                 "  -b, --batch            Run copy/move/delete as a batch\n"
                 "  -s, --strategy NAME    Batch strategy: sequential, parallel, adaptive\n"
                 "  -F, --format NAME      Archive format: zip, tar, tar.gz, tar.bz2, tar.xz, 7z\n"
                 "  -L, --level N          Compression level 0-9\n"
                 "  -r, --retries N        Retry N times when an operation cannot start\n"
                 "                         because of an I/O error; failed items are not retried\n"
                 "  -a, --all              Include hidden entries in ls\n"
                 "  -h, --help             Show this help\n",
                 argv0, laxy::pathToUtf8(laxy::config::SettingsManager::defaultPath()).c_str());
}

/// @return false on a malformed command line
bool parse_args(int argc, char** argv, CliOptions& options) {
    enum { kNoVerify = 1000 };
    static struct option long_opts[] = {{"config", required_argument, nullptr, 'c'},
                                        {"log-file", required_argument, nullptr, 'l'},
                                        {"verbose", no_argument, nullptr, 'v'},
                                        {"permanent", no_argument, nullptr, 'p'},
                                        {"overwrite", no_argument, nullptr, 'f'},
                                        {"no-verify", no_argument, nullptr, kNoVerify},
                                        {"batch", no_argument, nullptr, 'b'},
                                        {"strategy", required_argument, nullptr, 's'},
                                        {"format", required_argument, nullptr, 'F'},
                                        {"level", required_argument, nullptr, 'L'},
                                        {"retries", required_argument, nullptr, 'r'},
                                        {"all", no_argument, nullptr, 'a'},
                                        {"help", no_argument, nullptr, 'h'},
                                        {nullptr, 0, nullptr, 0}};

    int opt;
    while ((opt = getopt_long(argc, argv, "c:l:vpfbs:F:L:r:ah", long_opts, nullptr)) != -1) {
        switch (opt) {
        case 'c':
            options.config_file = laxy::utf8ToPath(optarg);
            break;
        case 'l':
            options.log_file = laxy::utf8ToPath(optarg);
            break;
        case 'v':
            options.verbose = true;
            break;
        case 'p':
            options.permanent = true;
            break;
        case 'f':
            options.overwrite = true;
            break;
        case kNoVerify:
            options.no_verify = true;
            break;
        case 'b':
            options.batch = true;
            break;
        case 's': {
            std::string_view name = optarg;
            if (name != "sequential" && name != "parallel" && name != "adaptive") {
                std::fprintf(stderr, "laxy: unknown strategy: %s\n", optarg);
                return false;
            }
            options.strategy = laxy::config::batchStrategyFromString(name);
            options.batch = true;
            break;
        }
        case 'F': {
            auto format = laxy::archive::format_from_string(optarg);
            if (!format) {
                std::fprintf(stderr, "laxy: unknown archive format: %s\n", optarg);
                return false;
            }
            options.format = *format;
            break;
        }
        case 'L': {
            char* end = nullptr;
            long value = std::strtol(optarg, &end, 10);
            if (*end != '\0' || value < 0 || value > 9) {
                std::fprintf(stderr, "laxy: level must be 0-9\n");
                return false;
            }
            options.level = laxy::archive::compression_level_from_int(static_cast<int>(value));
            break;
        }
        case 'r': {
            char* end = nullptr;
            long value = std::strtol(optarg, &end, 10);
            if (*end != '\0' || value < 0 || value > 10) {
                std::fprintf(stderr, "laxy: retries must be 0-10\n");
                return false;
            }
            options.retries = static_cast<int>(value);
            break;
        }
        case 'a':
            options.show_hidden = true;
            break;
        case 'h':
            print_usage(argv[0]);
            std::exit(kExitOk);
        default:
            return false;
        }
    }

    for (int i = optind; i < argc; ++i) {
        options.positional.emplace_back(argv[i]);
    }
    if (options.positional.empty()) {
        std::fprintf(stderr, "laxy: missing command\n");
        return false;
    }
    return true;
}

laxy::config::EngineSettings load_settings(const CliOptions& options) {
    if (options.config_file.empty()) {
        return laxy::config::SettingsManager::loadOrDefault();
    }
    auto loaded = laxy::config::SettingsManager::loadFrom(options.config_file);
    if (!loaded) {
        LOG_WARN("Cannot load {}: {}, using defaults", laxy::pathToUtf8(options.config_file),
                 laxy::config::to_string(loaded.error()));
        return laxy::config::EngineSettings::defaults();
    }
    return *loaded;
}

std::vector<std::filesystem::path> to_paths(std::span<const std::string> args) {
    std::vector<std::filesystem::path> paths;
    paths.reserve(args.size());
    for (const auto& arg : args) {
        paths.push_back(laxy::utf8ToPath(arg));
    }
    return paths;
}

laxy::progress::ProgressCallback progress_logger() {
    return laxy::progress::adaptPercentCallback([](double percentage, std::string_view message) {
        LOG_INFO("{:5.1f}% {}", percentage, message);
    });
}

/// @brief Wait for a submitted operation, cancelling it on SIGINT
laxy::OperationOutcome await(laxy::OperationTask task) {
    while (!task.waitFor(std::chrono::milliseconds(100))) {
        if (g_interrupted.load() && !task.cancelRequested()) {
            LOG_WARN("Interrupted, cancelling {}", task.id());
            task.cancel();
        }
    }
    return task.get();
}

laxy::OperationOutcome with_retries(const CliOptions& options,
                                    const std::function<laxy::OperationOutcome()>& operation) {
    if (options.retries == 0) {
        return operation();
    }
    laxy::RetryPolicy policy;
    policy.max_retries = options.retries;
    return laxy::retry(policy, operation, &laxy::isRetryable);
}

int report(const laxy::OperationOutcome& outcome) {
    if (!outcome) {
        std::fprintf(stderr, "laxy: %s\n", outcome.error().describe().c_str());
        return kExitFailed;
    }
    std::printf("%s (%s)\n", outcome->message.c_str(),
                laxy::formatDuration(outcome->duration).c_str());
    for (const auto& error : outcome->errors) {
        std::fprintf(stderr, "  %s\n", error.c_str());
    }
    if (outcome->cancelled) {
        return kExitInterrupted;
    }
    return outcome->success ? kExitOk : kExitFailed;
}

int run_transfer(laxy::Engine& engine, const CliOptions& options, laxy::OperationType type,
                 std::span<const std::string> args) {
    if (args.size() < 2) {
        std::fprintf(stderr, "laxy: expected SOURCE... DEST\n");
        return kExitUsage;
    }
    auto sources = to_paths(args.first(args.size() - 1));
    auto dest = laxy::utf8ToPath(args.back());

    auto outcome = with_retries(options, [&]() {
        if (options.batch) {
            auto strategy = options.strategy.value_or(engine.settings().batch.default_strategy);
            auto batch = type == laxy::OperationType::Copy
                             ? laxy::batch::batchCopy(sources, dest, strategy)
                             : laxy::batch::batchMove(sources, dest, strategy);
            return await(engine.submitBatch(std::move(batch), progress_logger()));
        }
        laxy::fs::CopyOptions copy_options;
        copy_options.overwrite_existing = options.overwrite;
        if (options.no_verify) {
            copy_options.verify = false;
        }
        return type == laxy::OperationType::Copy
                   ? await(engine.submitCopy(sources, dest, copy_options, progress_logger()))
                   : await(engine.submitMove(sources, dest, copy_options, progress_logger()));
    });
    return report(outcome);
}

int run_delete(laxy::Engine& engine, const CliOptions& options,
               std::span<const std::string> args) {
    if (args.empty()) {
        std::fprintf(stderr, "laxy: expected PATH...\n");
        return kExitUsage;
    }
    auto paths = to_paths(args);
    auto outcome = with_retries(options, [&]() {
        if (options.batch) {
            auto strategy = options.strategy.value_or(engine.settings().batch.default_strategy);
            return await(engine.submitBatch(
                laxy::batch::batchDelete(paths, options.permanent, strategy), progress_logger()));
        }
        return await(engine.submitDelete(paths, laxy::fs::DeleteOptions{options.permanent},
                                         progress_logger()));
    });
    return report(outcome);
}

int run_list(laxy::Engine& engine, const CliOptions& options, std::span<const std::string> args) {
    auto path = args.empty() ? std::filesystem::path(".") : laxy::utf8ToPath(args.front());
    laxy::fs::ListingOptions listing;
    listing.include_hidden = options.show_hidden;

    auto entries = engine.listDirectory(path, listing);
    if (!entries) {
        std::fprintf(stderr, "laxy: %s: %s\n", laxy::pathToUtf8(path).c_str(),
                     std::string(laxy::to_string(entries.error())).c_str());
        return kExitFailed;
    }
    for (const auto& entry : *entries) {
        std::printf("%s\n",
                    fmt::format("{:<9} {:>10}  {:%Y-%m-%d %H:%M}  {}{}",
                                laxy::fs::to_string(entry.kind),
                                entry.is_directory ? "-" : laxy::formatSize(entry.size),
                                std::chrono::floor<std::chrono::seconds>(entry.modified_time),
                                entry.name, entry.is_directory ? "/" : "")
                        .c_str());
    }
    return kExitOk;
}

int run_archive(laxy::Engine& engine, const CliOptions& options,
                std::span<const std::string> args) {
    if (args.empty()) {
        std::fprintf(stderr, "laxy: expected an archive subcommand\n");
        return kExitUsage;
    }
    const auto& sub = args.front();
    auto rest = args.subspan(1);

    if (sub == "formats") {
        for (const auto& support : laxy::archive::ArchiveCodec::supportedFormats()) {
            std::printf("%-8s create=%s extract=%s\n",
                        std::string(laxy::archive::to_string(support.format)).c_str(),
                        support.can_create ? "yes" : "no", support.can_extract ? "yes" : "no");
        }
        std::printf("7-Zip library: %s\n",
                    engine.archives().isAvailable() ? "found" : "not found");
        return kExitOk;
    }

    if (rest.empty()) {
        std::fprintf(stderr, "laxy: expected ARCHIVE\n");
        return kExitUsage;
    }
    auto archive_path = laxy::utf8ToPath(rest.front());

    if (sub == "create") {
        if (rest.size() < 2) {
            std::fprintf(stderr, "laxy: expected ARCHIVE FILE...\n");
            return kExitUsage;
        }
        auto files = to_paths(rest.subspan(1));
        auto format = options.format.value_or(laxy::archive::ArchiveFormat::Unknown);
        return report(with_retries(options, [&]() {
            return await(engine.submitCreateArchive(files, archive_path, format, options.level,
                                                    progress_logger()));
        }));
    }
    if (sub == "extract") {
        if (rest.size() != 2) {
            std::fprintf(stderr, "laxy: expected ARCHIVE DEST\n");
            return kExitUsage;
        }
        auto dest = laxy::utf8ToPath(rest[1]);
        return report(with_retries(options, [&]() {
            return await(engine.submitExtractArchive(archive_path, dest, progress_logger()));
        }));
    }
    if (sub == "list") {
        auto entries = engine.archives().listContents(archive_path);
        if (!entries) {
            std::fprintf(stderr, "laxy: %s\n",
                         std::string(laxy::archive::to_string(entries.error())).c_str());
            return kExitFailed;
        }
        for (const auto& entry : *entries) {
            std::printf("%12s  %s%s\n",
                        entry.is_directory ? "-" : laxy::formatSize(entry.uncompressed_size).c_str(),
                        entry.path.c_str(), entry.is_directory ? "/" : "");
        }
        return kExitOk;
    }
    if (sub == "info") {
        auto info = engine.archives().info(archive_path);
        if (!info) {
            std::fprintf(stderr, "laxy: %s\n",
                         std::string(laxy::archive::to_string(info.error())).c_str());
            return kExitFailed;
        }
        std::printf("%s\n",
                    fmt::format("{}: {}, {} files, {} directories, {} -> {} ({:.1f}%){}{}",
                                laxy::pathToUtf8(info->path),
                                laxy::archive::to_string(info->format), info->file_count,
                                info->directory_count,
                                laxy::formatSize(info->total_uncompressed_size),
                                laxy::formatSize(info->archive_size),
                                info->compression_ratio() * 100.0,
                                info->is_encrypted ? ", encrypted" : "",
                                info->is_solid ? ", solid" : "")
                        .c_str());
        return kExitOk;
    }
    if (sub == "test") {
        auto tested = engine.archives().test(archive_path);
        if (!tested) {
            std::fprintf(stderr, "laxy: %s\n",
                         std::string(laxy::archive::to_string(tested.error())).c_str());
            return kExitFailed;
        }
        std::printf("%s: OK\n", laxy::pathToUtf8(archive_path).c_str());
        return kExitOk;
    }

    std::fprintf(stderr, "laxy: unknown archive subcommand: %s\n", sub.c_str());
    return kExitUsage;
}

int dispatch(laxy::Engine& engine, const CliOptions& options) {
    const auto& command = options.positional.front();
    auto args = std::span<const std::string>(options.positional).subspan(1);

    if (command == "copy") {
        return run_transfer(engine, options, laxy::OperationType::Copy, args);
    }
    if (command == "move") {
        return run_transfer(engine, options, laxy::OperationType::Move, args);
    }
    if (command == "delete") {
        return run_delete(engine, options, args);
    }
    if (command == "rename") {
        if (args.size() != 2) {
            std::fprintf(stderr, "laxy: expected PATH NEW_NAME\n");
            return kExitUsage;
        }
        return report(engine.rename(laxy::utf8ToPath(args[0]), args[1]));
    }
    if (command == "mkdir") {
        if (args.size() != 1) {
            std::fprintf(stderr, "laxy: expected PATH\n");
            return kExitUsage;
        }
        return report(engine.createDirectory(laxy::utf8ToPath(args[0])));
    }
    if (command == "touch") {
        if (args.size() != 1) {
            std::fprintf(stderr, "laxy: expected PATH\n");
            return kExitUsage;
        }
        return report(engine.createFile(laxy::utf8ToPath(args[0])));
    }
    if (command == "ls") {
        return run_list(engine, options, args);
    }
    if (command == "archive") {
        return run_archive(engine, options, args);
    }

    std::fprintf(stderr, "laxy: unknown command: %s\n", command.c_str());
    return kExitUsage;
}

}  // namespace

int main(int argc, char** argv) {
    CliOptions options;
    if (!parse_args(argc, argv, options)) {
        print_usage(argv[0]);
        return kExitUsage;
    }

    if (!laxy::init_logging(options.log_file, true)) {
        std::fprintf(stderr, "laxy: cannot initialize logging\n");
        return kExitFailed;
    }

    auto settings = load_settings(options);
    auto validation = laxy::config::SettingsManager::validate(settings);
    for (const auto& warning : validation.warnings) {
        LOG_WARN("Settings: {}", warning);
    }
    if (!validation.valid) {
        for (const auto& error : validation.errors) {
            LOG_ERROR("Settings: {}", error);
        }
        LOG_WARN("Invalid settings, using defaults");
        settings = laxy::config::EngineSettings::defaults();
    }
    if (options.log_file.empty() && !settings.logging.file.empty()) {
        if (!laxy::init_logging(settings.logging.file, true)) {
            std::fprintf(stderr, "laxy: cannot open log file %s\n",
                         laxy::pathToUtf8(settings.logging.file).c_str());
        }
    }
    laxy::set_log_level(settings.logging.level);
    if (options.verbose) {
        spdlog::default_logger()->sinks().back()->set_level(spdlog::level::info);
    }
    LOG_DEBUG("laxy starting, log level {}", settings.logging.level);

    struct sigaction sa = {};
    sa.sa_handler = on_interrupt;
    sigemptyset(&sa.sa_mask);
    sigaction(SIGINT, &sa, nullptr);

    int status = kExitFailed;
    {
        laxy::Engine engine(settings);
        status = dispatch(engine, options);
    }

    laxy::shutdown_logging();
    return status;
}

/**
 * @file parallel_copy.cpp
 * @brief Parallel local copy with manifest and resume support
 *
 * This example demonstrates:
 * - Expanding a directory tree into a stream of transfer requests
 * - Running them with bounded concurrency and retries
 * - Splitting large files into byte ranges copied in parallel
 * - Recording every result in a CSV manifest and resuming from it
 * - Cancelling the batch on Ctrl+C
 */

#include <kcenon/transfer_engine/transfer_engine.h>

#include <atomic>
#include <charconv>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

using namespace kcenon::transfer_engine;

namespace {

std::atomic<bool> interrupted{false};

void signal_handler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        interrupted.store(true);
    }
}

/**
 * @brief Command line options
 */
struct options {
    std::string source;
    std::string destination;
    bool recursive = false;
    std::optional<std::filesystem::path> manifest;
    bool resume = false;
    std::size_t jobs = 4;
    uint32_t retries = 3;
    std::optional<uint64_t> slice_threshold;
    bool no_clobber = false;
    bool verbose = false;
};

/**
 * @brief Lazily walks a source directory, one request per regular file
 */
class tree_walker {
public:
    tree_walker(std::filesystem::path source_root, std::filesystem::path destination_root)
        : source_root_(std::move(source_root)),
          destination_root_(std::move(destination_root)),
          it_(source_root_, std::filesystem::directory_options::skip_permission_denied) {}

    auto next() -> std::optional<transfer_request> {
        std::error_code ec;
        while (it_ != std::filesystem::recursive_directory_iterator()) {
            auto entry = *it_;
            it_.increment(ec);
            if (ec) {
                std::cerr << "Warning: cannot list " << entry.path() << ": " << ec.message()
                          << std::endl;
                return std::nullopt;
            }
            if (!entry.is_regular_file(ec)) {
                continue;
            }
            auto relative = std::filesystem::relative(entry.path(), source_root_);
            return transfer_request(entry.path().string(),
                                    (destination_root_ / relative).string());
        }
        return std::nullopt;
    }

private:
    std::filesystem::path source_root_;
    std::filesystem::path destination_root_;
    std::filesystem::recursive_directory_iterator it_;
};

void print_usage(const char* program) {
    std::cout << "Parallel Copy Example - Transfer Engine" << std::endl;
    std::cout << std::endl;
    std::cout << "Usage: " << program << " [options] <source> <destination>" << std::endl;
    std::cout << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  -r, --recursive          Copy every file below <source>" << std::endl;
    std::cout << "  -m, --manifest <path>    Record results in a CSV manifest" << std::endl;
    std::cout << "  --resume                 Skip work the manifest records as completed"
              << std::endl;
    std::cout << "  -j, --jobs <n>           Concurrent transfers (default: 4)" << std::endl;
    std::cout << "  --retries <n>            Retries per transfer (default: 3)" << std::endl;
    std::cout << "  --slice-threshold <b>    Split files of at least <b> bytes into ranges"
              << std::endl;
    std::cout << "  --no-clobber             Skip destinations that already exist" << std::endl;
    std::cout << "  -v, --verbose            Debug logging" << std::endl;
    std::cout << "  --help                   Show this help message" << std::endl;
    std::cout << std::endl;
    std::cout << "Examples:" << std::endl;
    std::cout << "  " << program << " data.bin /backup/data.bin" << std::endl;
    std::cout << "  " << program << " -r -j 8 -m copy.csv ./photos /backup/photos" << std::endl;
    std::cout << "  " << program << " -r -m copy.csv --resume ./photos /backup/photos" << std::endl;
}

auto parse_number(const std::string& flag, const char* value) -> std::optional<uint64_t> {
    std::string_view text(value);
    uint64_t parsed = 0;
    auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), parsed);
    if (ec == std::errc() && end == text.data() + text.size() && !text.empty()) {
        return parsed;
    }
    std::cerr << "Error: " << flag << " expects a number, got '" << value << "'" << std::endl;
    return std::nullopt;
}

/**
 * @return options, or nullopt after printing an error (or help)
 */
auto parse_arguments(int argc, char* argv[], int& exit_code) -> std::optional<options> {
    options opts;
    std::vector<std::string> positional;
    exit_code = 1;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        auto value = [&]() -> const char* {
            if (++i >= argc) {
                std::cerr << "Error: " << arg << " requires an argument" << std::endl;
                return nullptr;
            }
            return argv[i];
        };

        if (arg == "--help") {
            print_usage(argv[0]);
            exit_code = 0;
            return std::nullopt;
        } else if (arg == "-r" || arg == "--recursive") {
            opts.recursive = true;
        } else if (arg == "-m" || arg == "--manifest") {
            auto v = value();
            if (!v) return std::nullopt;
            opts.manifest = v;
        } else if (arg == "--resume") {
            opts.resume = true;
        } else if (arg == "-j" || arg == "--jobs") {
            auto v = value();
            if (!v) return std::nullopt;
            auto n = parse_number(arg, v);
            if (!n) return std::nullopt;
            opts.jobs = static_cast<std::size_t>(*n);
        } else if (arg == "--retries") {
            auto v = value();
            if (!v) return std::nullopt;
            auto n = parse_number(arg, v);
            if (!n) return std::nullopt;
            opts.retries = static_cast<uint32_t>(*n);
        } else if (arg == "--slice-threshold") {
            auto v = value();
            if (!v) return std::nullopt;
            opts.slice_threshold = parse_number(arg, v);
            if (!opts.slice_threshold) return std::nullopt;
        } else if (arg == "--no-clobber") {
            opts.no_clobber = true;
        } else if (arg == "-v" || arg == "--verbose") {
            opts.verbose = true;
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Error: unknown option " << arg << std::endl;
            return std::nullopt;
        } else {
            positional.push_back(arg);
        }
    }

    if (positional.size() != 2) {
        print_usage(argv[0]);
        return std::nullopt;
    }
    opts.source = positional[0];
    opts.destination = positional[1];
    return opts;
}

}  // namespace

int main(int argc, char* argv[]) {
    int parse_exit = 1;
    auto parsed = parse_arguments(argc, argv, parse_exit);
    if (!parsed) {
        return parse_exit;
    }
    const auto& opts = *parsed;

    get_logger().set_level(opts.verbose ? log_level::debug : log_level::warn);

    std::error_code ec;
    auto source_path = local_storage_backend::to_path(opts.source);
    bool source_is_dir = std::filesystem::is_directory(source_path, ec);
    if (source_is_dir && !opts.recursive) {
        std::cerr << "Error: " << opts.source << " is a directory (use --recursive)" << std::endl;
        return 1;
    }

    auto backend = std::make_shared<local_storage_backend>();

    retry_policy retry;
    retry.max_retries = opts.retries;

    auto builder = batch_coordinator::builder(backend, backend);
    builder.with_max_concurrency(opts.jobs)
        .with_retry_policy(retry)
        .with_no_clobber(opts.no_clobber)
        .with_resume(opts.resume)
        .with_progress_interval(std::chrono::milliseconds(1000))
        .with_progress_callback([](const progress_snapshot& snapshot) {
            std::cerr << "\r" << format_progress_line(snapshot) << "   " << std::flush;
        });
    if (opts.manifest) {
        builder.with_manifest(*opts.manifest);
    }
    if (opts.slice_threshold) {
        range_split_policy split;
        split.threshold = *opts.slice_threshold;
        builder.with_range_split(split);
    }

    auto coordinator = builder.build();
    if (!coordinator) {
        std::cerr << "Error: " << coordinator.error().describe() << std::endl;
        return 1;
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    // The handler only sets a flag; cancellation happens on this watcher.
    std::atomic<bool> done{false};
    auto* running = &coordinator.value();
    std::thread watcher([&done, running] {
        while (!done.load()) {
            if (interrupted.load()) {
                std::cerr << "\nInterrupt received, cancelling..." << std::endl;
                running->cancel();
                return;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
    });

    auto summary = [&]() -> result<batch_summary> {
        if (source_is_dir) {
            tree_walker walker(source_path, local_storage_backend::to_path(opts.destination));
            return running->run([&walker] { return walker.next(); });
        }
        auto destination = local_storage_backend::to_path(opts.destination);
        if (std::filesystem::is_directory(destination, ec)) {
            destination /= source_path.filename();
        }
        return running->run({transfer_request(source_path.string(), destination.string())});
    }();

    done.store(true);
    watcher.join();
    std::cerr << std::endl;

    if (!summary) {
        std::cerr << "Batch aborted: " << summary.error().describe() << std::endl;
        return 2;
    }

    std::cout << summary.value().format_summary();
    return summary.value().exit_code();
}

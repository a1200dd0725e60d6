#include <iostream>
#include <algorithm>
#include <filesystem>
#include <csignal>
#include <clocale>
#include <chrono>
#include <iomanip>
#include <mutex>
#include <thread>
#include <vector>
#include <CLI/CLI.hpp>
#include "../utils/color.hpp"
#include "../utils/console_log_sink.hpp"
#include "../utils/file_log_sink.hpp"
#include "cli/cli_parser.hpp"
#include "report/report_generator.hpp"
#include "../../libflashsync/include/flashsync.hpp"
#include "../../libflashsync/include/logger.hpp"

// exit codes
constexpr int EXIT_OK = 0;
constexpr int EXIT_FILES_FAILED = 1;
constexpr int EXIT_SETUP_ERROR = 2;
constexpr int EXIT_INTERRUPTED = 130;

// simple progress bar printer
inline void print_progress_bar(const size_t done, const size_t total, const double elapsed_seconds) {
    const unsigned term_width = get_terminal_width();
    const unsigned int bar_width = std::max(10u, term_width > 40u ? term_width - 40u : 20u);

    const double progress = total ? static_cast<double>(done) / static_cast<double>(total) : 1.0;
    const unsigned pos = static_cast<unsigned>(bar_width * progress);

    double percent = progress * 100.0;
    if (done < total && percent >= 99.95) {
        percent = 99.9;
    }

    std::cerr << "\r[";
    for (unsigned i = 0; i < bar_width; ++i) {
        if (i < pos) std::cerr << "=";
        else if (i == pos && done < total) std::cerr << ">";
        else std::cerr << " ";
    }
    std::cerr << "] "
              << std::setw(5) << std::fixed << std::setprecision(1) << percent << "%"
              << " (" << done << "/" << total << ")"
              << " elapsed: " << std::fixed << std::setprecision(1) << elapsed_seconds << "s"
              << std::flush;
}

using namespace flashsync;
namespace fs = std::filesystem;

static volatile std::sig_atomic_t interrupted = 0;

// handle ctrl+c or termination signals
extern "C" void signal_handler(const int sig) {
    if (sig == SIGINT || sig == SIGTERM) {
        interrupted = 1;
    }
}

inline void init_utf8_locale() {
    std::setlocale(LC_ALL, "");

    const char *cur = std::setlocale(LC_CTYPE, nullptr);
    if (cur && std::string(cur).find("UTF-8") != std::string::npos) {
        Logger::log(LogLevel::Debug, std::string("Current locale: ") + cur, "LocaleInit");
        return; // ok
    }

    constexpr const char *fallbacks[] = {"C.UTF-8", "en_US.UTF-8", ".UTF-8" /* Windows */};
    for (const auto fb: fallbacks) {
        if (std::setlocale(LC_ALL, fb)) {
            Logger::log(LogLevel::Info, std::string("Locale set to ") + fb, "LocaleInit");
            return;
        }
    }

    Logger::log(LogLevel::Warning, "UTF-8 locale not available; non-ASCII file names may be problematic.",
                "LocaleInit");
}

// collects one report row per finished file
class ReportObserver final : public SyncObserver {
public:
    explicit ReportObserver(const bool quiet) : quiet_(quiet) {}

    void onFileRetry(const fs::path& relative,
                     const int failed_attempt,
                     const std::chrono::milliseconds delay,
                     const std::string& error) override {
        if (quiet_) return;
        std::cerr << YELLOW << "\n[RETRY] " << relative.string()
                  << " attempt " << failed_attempt << " failed (" << error << "), retrying in "
                  << delay.count() << "ms" << RESET << std::endl;
    }

    void onFileFinish(const FileOutcome& outcome,
                      const bool,
                      const std::chrono::milliseconds duration) override {
        Result r;
        r.relative = outcome.relative;
        r.action = outcome.action;
        r.attempts = outcome.attempts;
        r.seconds = static_cast<double>(duration.count()) / 1000.0;
        r.error_msg = outcome.error.value_or("");

        std::lock_guard lock(mtx_);
        results_.push_back(std::move(r));
    }

    std::vector<Result> take() {
        std::lock_guard lock(mtx_);
        return std::move(results_);
    }

private:
    const bool quiet_;
    std::mutex mtx_;
    std::vector<Result> results_;
};

int main(int argc, char* argv[]) {

    CLI::App app{"flashsync: one-way, pattern-filtered directory synchronizer."};
    Settings settings;
    setup_cli_parser(app, settings);

    try {
        app.parse(argc, argv);
    }
    catch (const CLI::CallForHelp &e) {
        return app.exit(e);
    }
    catch (const CLI::CallForVersion &e) {
        return app.exit(e);
    }
    catch (const CLI::ParseError &e) {
        std::cerr << RED << "Parse error: " << e.what() << RESET << std::endl;
        app.exit(e);
        return EXIT_SETUP_ERROR;
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    Logger::clear_sinks();
    if (!settings.log_file.empty()) {
        auto fileSink = std::make_unique<FileLogSink>(settings.log_file, false);
        if (!fileSink->is_open()) {
            std::cerr << RED << "Cannot open log file: " << settings.log_file.string() << RESET << std::endl;
            return EXIT_SETUP_ERROR;
        }
        Logger::add_sink(std::move(fileSink));
    }

    if (settings.log_level != "NONE") {
        auto consoleSink = std::make_unique<ConsoleLogSink>();
        consoleSink->log_level = Logger::string_to_level(settings.log_level);
        // quiet keeps errors only
        if (settings.quiet) consoleSink->log_level = LogLevel::Error;
        Logger::add_sink(std::move(consoleSink));
    }

    init_utf8_locale();

    Synchronizer synchronizer(settings.num_threads);
    ReportObserver observer(settings.quiet);
    synchronizer.setObserver(&observer);

    // the signal handler only flags; stop() takes locks and runs here
    std::jthread interrupt_watcher([&synchronizer](const std::stop_token& st) {
        while (!st.stop_requested()) {
            if (interrupted) {
                std::cerr << CYAN
                          << "\n[INTERRUPT] Stop detected. Waiting for in-flight files to finish..."
                          << RESET << std::endl;
                synchronizer.stop();
                return;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        }
    });

    SyncRequest request;
    request.origin = settings.source.string();
    request.destination = settings.destination.string();
    request.patterns = settings.patterns;
    request.max_retries = settings.max_retries;
    request.dry_run = settings.dry_run;

    const auto start_total = std::chrono::steady_clock::now();
    auto on_progress = [&](const SyncProgress& p) {
        if (settings.quiet) return;
        const double elapsed = std::chrono::duration<double>(
            std::chrono::steady_clock::now() - start_total).count();
        print_progress_bar(p.processed_files, p.total_files, elapsed);
    };

    SyncResult result;
    try {
        result = synchronizer.synchronize(request, on_progress);
    } catch (const SyncCancelled& e) {
        std::cerr << CYAN << "\n[INTERRUPT] " << e.what() << RESET << std::endl;
        synchronizer.setObserver(nullptr);
        return EXIT_INTERRUPTED;
    } catch (const ValidationError& e) {
        std::cerr << RED << "Invalid arguments: " << e.what() << RESET << std::endl;
        synchronizer.setObserver(nullptr);
        return EXIT_SETUP_ERROR;
    } catch (const std::exception& e) {
        std::cerr << RED << "\nSynchronization failed: " << e.what() << RESET << std::endl;
        synchronizer.setObserver(nullptr);
        return EXIT_SETUP_ERROR;
    }
    synchronizer.setObserver(nullptr);
    interrupt_watcher.request_stop();

    const double total_seconds = std::chrono::duration<double>(
        std::chrono::steady_clock::now() - start_total).count();
    auto results = observer.take();

    if (!settings.quiet) {
        std::cerr << std::endl;
        print_console_report(results, result, synchronizer.max_concurrency(), total_seconds);
    } else if (!result.is_success()) {
        for (const auto& err : result.errors) {
            std::cerr << RED << err << RESET << "\n";
        }
    }

    if (!settings.report_path.empty()) {
        if (export_csv_report(results, settings.report_path, result.dry_run)) {
            Logger::log(LogLevel::Info, "Report written to " + settings.report_path.string(), "main");
        } else {
            Logger::log(LogLevel::Error, "Cannot write report to " + settings.report_path.string(), "main");
        }
    }

    return result.is_success() ? EXIT_OK : EXIT_FILES_FAILED;
}

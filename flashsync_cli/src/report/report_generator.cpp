#include "report_generator.hpp"
#include "../../utils/color.hpp"
#include <iostream>
#include <algorithm>
#include <fstream>
#include <sstream>
#include <iomanip>
#include <string_view>

#ifdef _WIN32

#include <windows.h>
#include <io.h>      // _isatty, _fileno
#define isatty _isatty
#define fileno _fileno

#else

#include <sys/ioctl.h>
#include <unistd.h>

#endif

using flashsync::SyncAction;

static bool is_stderr_a_tty() {
    return isatty(fileno(stderr)) != 0;
}

unsigned get_terminal_width() {
#ifdef _WIN32
    CONSOLE_SCREEN_BUFFER_INFO csbi;
    if (GetConsoleScreenBufferInfo(GetStdHandle(STD_ERROR_HANDLE), &csbi))
        return csbi.srWindow.Right - csbi.srWindow.Left + 1;
    return 80;
#else
    winsize w{};
    if (ioctl(STDERR_FILENO, TIOCGWINSZ, &w) == 0 && w.ws_col > 0)
        return w.ws_col;
    return 80;
#endif
}

static std::string csv_escape(const std::string& data) {
    if (data.find_first_of(",\"\n\r") == std::string::npos) {
        return data;
    }
    std::string result;
    result.reserve(data.size() + 4);
    result.push_back('"');
    for (char c : data) {
        if (c == '"') {
            result.push_back('"'); // escape quote with another quote
        }
        result.push_back(c);
    }
    result.push_back('"');
    return result;
}

static const char* action_color(const SyncAction action) {
    switch (action) {
        case SyncAction::Created: return GREEN;
        case SyncAction::Updated: return CYAN;
        case SyncAction::Failed:  return RED;
        case SyncAction::Skipped: break;
    }
    return YELLOW;
}

std::string outcome_label(const SyncAction action, const bool dry_run) {
    constexpr std::string_view prefix = "[DRY RUN] ";
    std::string label = flashsync::action_label(action, dry_run);
    if (label.starts_with(prefix)) label.erase(0, prefix.size());
    return label;
}

void print_console_report(const std::vector<Result>& results,
                          const flashsync::SyncResult& summary,
                          const unsigned num_threads,
                          const double total_seconds) {
    const unsigned term_width = get_terminal_width();
    const bool use_colors = is_stderr_a_tty();

    size_t max_result = 10;
    size_t max_attempts = 10;
    size_t max_time = 10;
    #ifdef max
    #undef max
    #endif
    for (const auto& r : results) {
        max_result = std::max(max_result, outcome_label(r.action, summary.dry_run).size() + 2);
        max_attempts = std::max(max_attempts, std::to_string(r.attempts).size() + 2);
    }

    const unsigned fixed_cols_width = static_cast<unsigned>(max_result + max_attempts + max_time);
    const unsigned file_col_width = term_width > fixed_cols_width + 15
                                ? term_width - fixed_cols_width
                                : 15;

    auto truncate = [](const std::string& s, const size_t max_len) {
        return s.size() <= max_len ? s : "..." + s.substr(s.size() - (max_len - 4));
    };

    auto sorted = results;
    std::ranges::sort(sorted, [](const auto& a, const auto& b) {
        return a.relative < b.relative;
    });

    if (!sorted.empty()) {
        std::cerr << "\n"
                  << std::left << std::setw(file_col_width) << "File"
                  << std::setw(max_result) << "Result"
                  << std::setw(max_attempts) << "Attempts"
                  << std::setw(max_time) << "Time(s)"
                  << "\n";
    }

    for (const auto& r : sorted) {
        std::ostringstream osst;
        osst << std::fixed << std::setprecision(2) << r.seconds;

        const std::string outcome = outcome_label(r.action, summary.dry_run);
        std::cerr << std::left << std::setw(file_col_width) << truncate(r.relative.string(), file_col_width - 1);
        if (use_colors) std::cerr << action_color(r.action);
        std::cerr << std::setw(max_result) << outcome;
        if (use_colors) std::cerr << RESET;
        std::cerr << std::setw(max_attempts) << r.attempts
                  << std::setw(max_time) << osst.str()
                  << "\n";
    }

    if (!summary.errors.empty()) {
        std::cerr << "\n=== Failures ===\n";
        for (const auto& err : summary.errors) {
            std::cerr << "  " << err << "\n";
        }
    }

    std::cerr << "\n" << summary.to_string() << "\n";
    if (summary.total_retry_attempts > 0) {
        std::cerr << "Retry attempts: " << summary.total_retry_attempts << "\n";
    }
    std::cerr << "Total time: " << std::fixed << std::setprecision(2)
              << total_seconds << " s (" << num_threads << " thread"
              << (num_threads > 1U ? "s" : "") << ")\n";
}

bool export_csv_report(const std::vector<Result>& results,
                       const std::filesystem::path& output_path,
                       const bool dry_run) {
    std::ofstream out(output_path);
    if (!out) return false;

    out << "File,Result,DryRun,Attempts,Time(s),Error\n";

    auto sorted = results;
    std::ranges::sort(sorted, [](const auto& a, const auto& b) {
        return a.relative < b.relative;
    });

    for (const auto& r : sorted) {
        out << csv_escape(r.relative.generic_string()) << ","
            << flashsync::action_to_string(r.action) << ","
            << (dry_run ? "yes" : "no") << ","
            << r.attempts << ","
            << std::fixed << std::setprecision(2) << r.seconds << ","
            << csv_escape(r.error_msg)
            << "\n";
    }
    return static_cast<bool>(out);
}

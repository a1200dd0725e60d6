#include <filesystem>
#include "../../include/file_utils.hpp"
#include "../../include/logger.hpp"
#include "../../include/sync_errors.hpp"
#include <cerrno>
#include <chrono>
#include <string>
#include <system_error>
#include <vector>

namespace flashsync {

    FILE* open_file(const std::filesystem::path& path, const char* mode) {
#ifdef _WIN32
        // On Windows, convert mode to wstring and use _wfopen, which accepts
        // wide-char paths (UTF-16), supporting Unicode and long paths.
        std::wstring wmode;
        for (const char* p = mode; *p; ++p) wmode += static_cast<wchar_t>(*p);

        std::error_code ec;
        auto abs_path = std::filesystem::absolute(path, ec);
        if (ec) {
            return _wfopen(path.wstring().c_str(), wmode.c_str());
        }

        // prepend the magic prefix to bypass MAX_PATH
        std::wstring long_path = L"\\\\?\\" + abs_path.wstring();
        return _wfopen(long_path.c_str(), wmode.c_str());
#else
        return std::fopen(path.string().c_str(), mode);
#endif
    }

    namespace {
        [[noreturn]] void throw_errno(const int err, const std::string& what) {
            throw std::system_error(err ? err : EIO, std::generic_category(), what);
        }

        // A failed copy must not leave a destination that looks up to date.
        // A new file is removed; a file that existed is backdated below the source
        // so the next attempt still resolves to an update.
        void discard_partial(const std::filesystem::path& source,
                             const std::filesystem::path& destination,
                             const bool existed) {
            std::error_code ec;
            if (existed) {
                const auto src_time = std::filesystem::last_write_time(source, ec);
                if (!ec) {
                    std::filesystem::last_write_time(destination, src_time - std::chrono::seconds(1), ec);
                    if (!ec) return;
                }
            }
            std::filesystem::remove(destination, ec);
            if (ec) {
                Logger::log(LogLevel::Warning,
                    "Cannot discard partial copy " + destination.string() + " (" + ec.message() + ")",
                    "file_utils");
            }
        }
    } // namespace

    std::uintmax_t copy_file_contents(const std::filesystem::path& source,
                                      const std::filesystem::path& destination,
                                      const std::stop_token& stop) {
        errno = 0;
        FilePtr in(open_file(source, "rb"));
        if (!in) {
            throw_errno(errno, "Cannot open source " + source.string());
        }
        std::error_code exists_ec;
        const bool existed = std::filesystem::exists(destination, exists_ec);

        errno = 0;
        FilePtr out(open_file(destination, "wb"));
        if (!out) {
            throw_errno(errno, "Cannot open destination " + destination.string());
        }

        std::vector<char> buffer(COPY_BUFFER_SIZE);
        std::uintmax_t copied = 0;
        try {
            for (;;) {
                if (stop.stop_requested()) {
                    throw SyncCancelled("Copy of " + source.string() + " cancelled");
                }
                const std::size_t got = std::fread(buffer.data(), 1, buffer.size(), in.get());
                if (got > 0) {
                    if (std::fwrite(buffer.data(), 1, got, out.get()) != got) {
                        throw_errno(errno, "Write failed on " + destination.string());
                    }
                    copied += got;
                }
                if (got < buffer.size()) {
                    if (std::ferror(in.get())) {
                        throw_errno(errno, "Read failed on " + source.string());
                    }
                    break; // eof
                }
            }

            // close explicitly so buffered write errors are not lost
            FILE* raw = out.release();
            if (std::fclose(raw) != 0) {
                throw_errno(errno, "Close failed on " + destination.string());
            }
        } catch (const SyncCancelled&) {
            throw;
        } catch (const std::system_error&) {
            out.reset();
            discard_partial(source, destination, existed);
            throw;
        }
        return copied;
    }

    void ensure_directory(const std::filesystem::path& dir) {
        if (dir.empty()) return;
        std::error_code ec;
        std::filesystem::create_directories(dir, ec);
        if (ec) {
            Logger::log(LogLevel::Debug,
                "Failed to create directory: " + dir.string() + " (" + ec.message() + ")",
                "file_utils");
            throw std::filesystem::filesystem_error("Cannot create directory", dir, ec);
        }
    }

} // namespace flashsync

#ifndef FLASHSYNC_FILE_UTILS_HPP
#define FLASHSYNC_FILE_UTILS_HPP

#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <memory>
#include <stop_token>

namespace flashsync {

    /// Buffer size used by copy_file_contents.
    inline constexpr std::size_t COPY_BUFFER_SIZE = 64 * 1024;

    struct FileCloser {
        void operator()(FILE* f) const noexcept {
            if (f) std::fclose(f);
        }
    };

    /// Owning FILE handle, closed on every exit path.
    using FilePtr = std::unique_ptr<FILE, FileCloser>;

    /**
     * @brief Opens a file using a filesystem path, handling Windows Unicode correctly.
     * @param path The path to the file.
     * @param mode The standard C fopen mode string (e.g., "rb", "wb").
     * @return FILE* pointer or nullptr if open failed.
     */
    FILE *open_file(const std::filesystem::path &path, const char *mode);

    /**
     * @brief Stream @p source into @p destination through a fixed-size buffer.
     *
     * The destination is truncated before writing. Memory use does not grow
     * with the file size. @p stop is checked between chunks.
     *
     * On a read, write or close failure the partial destination is removed, or
     * backdated below the source if it existed before the copy.
     *
     * @return Number of bytes copied.
     * @throws std::system_error on open, read, write or close failures.
     * @throws SyncCancelled if @p stop is triggered mid-copy.
     */
    std::uintmax_t copy_file_contents(const std::filesystem::path &source,
                                      const std::filesystem::path &destination,
                                      const std::stop_token &stop = {});

    /**
     * @brief Create @p dir and its parents if missing.
     * @throws std::filesystem::filesystem_error if it cannot be created.
     */
    void ensure_directory(const std::filesystem::path &dir);

} // namespace flashsync

#endif // FLASHSYNC_FILE_UTILS_HPP

/**
 * @file Writer.hpp
 * @brief Crash-safe replacement of a file's contents
 *
 * Write protocol:
 * 1. Optionally copy the current file to `<path><backup_ext>`
 * 2. Open `<path>.yedit` with the target's permission bits
 * 3. Take an exclusive, non-blocking flock() on it (contention fails
 *    immediately with IoError)
 * 4. Truncate, write, fsync, unlock, close
 * 5. rename() the temporary file over the target
 * 6. fsync the containing directory (best effort)
 *
 * At every instant either the old or the new complete file is visible
 * at the target path. If anything fails before step 5 the target is left
 * untouched and the temporary file is removed.
 */

#ifndef YEDIT_WRITER_HPP
#define YEDIT_WRITER_HPP

#include <functional>
#include <string>

namespace yedit {

/**
 * @brief Options for write_file_durable()
 */
struct WriteOptions {
    bool backup = false;
    std::string backup_ext;  ///< Empty: process_start_suffix()

    /// Called with the temporary path after it is synced, before rename.
    /// An exception thrown here aborts the write.
    std::function<void(const std::string&)> before_rename;
};

/**
 * @brief Suffix of the temporary file written next to the target
 */
constexpr const char* TEMP_SUFFIX = ".yedit";

/**
 * @brief Temporary path used for `path`
 */
std::string temp_path_for(const std::string& path);

/**
 * @brief Copy `path` to `path + ext`
 *
 * @return The backup path
 * @throws IoError if the copy fails
 */
std::string backup_file(const std::string& path, const std::string& ext);

/**
 * @brief Replace the contents of `path` following the write protocol
 *
 * @param path Target file (created if absent)
 * @param contents Bytes to store
 * @param opts Backup and hook options
 * @throws IoError on open, lock, write, fsync, close or rename failure
 */
void write_file_durable(const std::string& path, const std::string& contents,
                        const WriteOptions& opts = WriteOptions());

} // namespace yedit

#endif // YEDIT_WRITER_HPP

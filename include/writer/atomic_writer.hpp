#pragma once

#include "core/error.hpp"
#include "core/types.hpp"

#include <functional>
#include <string>
#include <vector>

namespace logcleaner {

/**
 * @brief Backup & atomic replace of a log file
 *
 * commit() runs these stages in order; a failing stage stops the rest:
 *   BACKUP      copy original to <file>.<YYYYMMDDTHHMMSSZ><suffix>, verify size
 *   STAGE_WRITE write cleaned lines to <file>.tmp-<uuid> (same directory)
 *   VERIFY      staged size must match what was written and its line count
 *               the count the caller derived from its report
 *   RENAME      rename(2) the staged file over the original
 *
 * The original file is only ever touched by the final rename, so any failure
 * leaves it byte-identical. The staged file is removed on failure; the
 * backup is always kept on failure and its path is reported. After a
 * successful rename the backup is deleted only if retain_backup is false.
 *
 * No file locking: callers must ensure nothing else writes the file during
 * a commit.
 */
class AtomicWriter {
public:
    enum class Stage { BACKUP, STAGE_WRITE, VERIFY, RENAME };

    struct Config {
        bool retain_backup = true;
        std::string backup_suffix = ".bak";
        // Test hook: return true to make the given stage fail
        std::function<bool(Stage)> fault_injector;
    };

    struct CommitResult {
        bool success = false;
        ErrorCategory error_category = ErrorCategory::NONE;
        std::string error_message;
        BackupHandle backup;      // backup_path empty if no backup was made
        uintmax_t bytes_written = 0;

        static CommitResult ok(BackupHandle handle, uintmax_t bytes) {
            CommitResult result;
            result.success = true;
            result.backup = std::move(handle);
            result.bytes_written = bytes;
            return result;
        }

        static CommitResult error(ErrorCategory category, std::string message,
                                  BackupHandle handle = {}) {
            CommitResult result;
            result.success = false;
            result.error_category = category;
            result.error_message = std::move(message);
            result.backup = std::move(handle);
            return result;
        }
    };

    AtomicWriter() = default;
    explicit AtomicWriter(Config config);

    /**
     * @brief Replace input_path with lines (each followed by '\n')
     */
    [[nodiscard]] CommitResult commit(const std::string& input_path,
                                      const std::vector<std::string>& lines) const;

    /**
     * @brief As above, verifying the staged file holds expected_lines lines
     */
    [[nodiscard]] CommitResult commit(const std::string& input_path,
                                      const std::vector<std::string>& lines,
                                      size_t expected_lines) const;

    /// Backup file name for input_path at the given instant (before disambiguation)
    [[nodiscard]] std::string backup_path_for(const std::string& input_path, Instant stamp) const;

    [[nodiscard]] static const char* stage_name(Stage stage);

private:
    [[nodiscard]] bool should_fail(Stage stage) const {
        return config_.fault_injector && config_.fault_injector(stage);
    }

    [[nodiscard]] std::string unique_backup_path(const std::string& input_path) const;

    Config config_;
};

} // namespace logcleaner

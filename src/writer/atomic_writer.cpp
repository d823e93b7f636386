#include "writer/atomic_writer.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <filesystem>
#include <format>
#include <fstream>
#include <iterator>

namespace fs = std::filesystem;

namespace logcleaner {

AtomicWriter::AtomicWriter(Config config)
    : config_(std::move(config)) {}

const char* AtomicWriter::stage_name(Stage stage) {
    switch (stage) {
        case Stage::BACKUP:      return "backup";
        case Stage::STAGE_WRITE: return "stage_write";
        case Stage::VERIFY:      return "verify";
        case Stage::RENAME:      return "rename";
    }
    return "unknown";
}

std::string AtomicWriter::backup_path_for(const std::string& input_path, Instant stamp) const {
    return std::format("{}.{}{}", input_path, utils::format_compact_instant(stamp),
                       config_.backup_suffix);
}

std::string AtomicWriter::unique_backup_path(const std::string& input_path) const {
    const std::string base = backup_path_for(input_path, utils::now_instant());
    std::error_code ec;
    if (!fs::exists(base, ec)) return base;

    for (int i = 1;; ++i) {
        auto candidate = std::format("{}.{}", base, i);
        if (!fs::exists(candidate, ec)) return candidate;
    }
}

AtomicWriter::CommitResult AtomicWriter::commit(
    const std::string& input_path,
    const std::vector<std::string>& lines) const {
    return commit(input_path, lines, lines.size());
}

AtomicWriter::CommitResult AtomicWriter::commit(
    const std::string& input_path,
    const std::vector<std::string>& lines,
    size_t expected_lines) const {

    std::error_code ec;

    // ---- BACKUP ------------------------------------------------------------

    if (!fs::is_regular_file(input_path, ec)) {
        return CommitResult::error(ErrorCategory::BACKUP_FAILURE,
            std::format("Cannot back up {}: not a regular file", input_path));
    }
    const auto original_size = fs::file_size(input_path, ec);
    if (ec) {
        return CommitResult::error(ErrorCategory::BACKUP_FAILURE,
            std::format("Cannot stat {}: {}", input_path, ec.message()));
    }

    BackupHandle handle;
    handle.original_path = input_path;
    handle.bytes = original_size;

    if (should_fail(Stage::BACKUP)) {
        return CommitResult::error(ErrorCategory::BACKUP_FAILURE,
            std::format("Backup of {} failed: injected fault", input_path));
    }

    const std::string backup_path = unique_backup_path(input_path);
    if (!fs::copy_file(input_path, backup_path, fs::copy_options::none, ec) || ec) {
        return CommitResult::error(ErrorCategory::BACKUP_FAILURE,
            std::format("Backup of {} to {} failed: {}", input_path, backup_path,
                        ec ? ec.message() : "not copied"));
    }

    const auto backup_size = fs::file_size(backup_path, ec);
    if (ec || backup_size != original_size) {
        std::error_code rm_ec;
        fs::remove(backup_path, rm_ec);
        return CommitResult::error(ErrorCategory::BACKUP_FAILURE,
            std::format("Backup {} is incomplete ({} of {} bytes)", backup_path,
                        ec ? 0 : backup_size, original_size));
    }
    handle.backup_path = backup_path;
    utils::log::debug(std::format("Backup created: {} ({} bytes)", backup_path, original_size));

    // ---- STAGE_WRITE -------------------------------------------------------

    const std::string staged_path = std::format("{}.tmp-{}", input_path, utils::generate_uuid());

    auto fail = [&](ErrorCategory category, const std::string& message) {
        std::error_code rm_ec;
        fs::remove(staged_path, rm_ec);
        return CommitResult::error(category,
            std::format("{}; original untouched, backup at {}", message, handle.backup_path),
            handle);
    };

    uintmax_t expected_bytes = 0;
    for (const auto& line : lines) {
        expected_bytes += line.size() + 1;
    }

    {
        std::ofstream out(staged_path, std::ios::out | std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            return fail(ErrorCategory::COMMIT_FAILURE,
                std::format("Cannot create staging file {}", staged_path));
        }
        for (const auto& line : lines) {
            out.write(line.data(), static_cast<std::streamsize>(line.size()));
            out.put('\n');
        }
        out.flush();
        if (!out.good()) {
            return fail(ErrorCategory::COMMIT_FAILURE,
                std::format("Write to staging file {} failed", staged_path));
        }
        out.close();
        if (out.fail()) {
            return fail(ErrorCategory::COMMIT_FAILURE,
                std::format("Close of staging file {} failed", staged_path));
        }
    }

    if (should_fail(Stage::STAGE_WRITE)) {
        return fail(ErrorCategory::COMMIT_FAILURE, "Staging write failed: injected fault");
    }

    fs::permissions(staged_path, fs::status(input_path, ec).permissions(),
                    fs::perm_options::replace, ec);
    if (ec) {
        utils::log::warn(std::format("Could not copy permissions of {} to staged file: {}",
                                     input_path, ec.message()));
    }

    // ---- VERIFY ------------------------------------------------------------

    const auto staged_size = fs::file_size(staged_path, ec);
    if (ec || staged_size != expected_bytes) {
        return fail(ErrorCategory::COMMIT_FAILURE,
            std::format("Staged file {} has {} bytes, expected {}", staged_path,
                        ec ? 0 : staged_size, expected_bytes));
    }

    size_t staged_lines = 0;
    {
        std::ifstream in(staged_path, std::ios::in | std::ios::binary);
        if (!in.is_open()) {
            return fail(ErrorCategory::COMMIT_FAILURE,
                std::format("Cannot reopen staged file {}", staged_path));
        }
        staged_lines = static_cast<size_t>(std::count(
            std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>(), '\n'));
    }
    if (staged_lines != expected_lines) {
        return fail(ErrorCategory::COMMIT_FAILURE,
            std::format("Staged file {} has {} lines, expected {}", staged_path,
                        staged_lines, expected_lines));
    }

    if (should_fail(Stage::VERIFY)) {
        return fail(ErrorCategory::COMMIT_FAILURE, "Verification failed: injected fault");
    }

    // ---- RENAME ------------------------------------------------------------

    if (should_fail(Stage::RENAME)) {
        return fail(ErrorCategory::RENAME_FAILURE, "Rename failed: injected fault");
    }

    fs::rename(staged_path, input_path, ec);
    if (ec) {
        return fail(ErrorCategory::RENAME_FAILURE,
            std::format("Rename {} -> {} failed: {}", staged_path, input_path, ec.message()));
    }

    if (!config_.retain_backup) {
        fs::remove(handle.backup_path, ec);
        if (ec) {
            utils::log::warn(std::format("Could not remove backup {}: {}",
                                         handle.backup_path, ec.message()));
        } else {
            handle.retained = false;
        }
    }

    return CommitResult::ok(std::move(handle), expected_bytes);
}

} // namespace logcleaner

#include "cleaner/input_discovery.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <filesystem>
#include <format>
#include <regex>

namespace fs = std::filesystem;

namespace logcleaner {

Result<std::vector<std::string>> discover_inputs(const InputConfig& input) {
    std::vector<std::string> files = input.paths;

    if (!input.directory.empty()) {
        std::error_code ec;
        if (!fs::is_directory(input.directory, ec)) {
            return Result<std::vector<std::string>>::error(ErrorCategory::IO_ERROR,
                std::format("Input directory not found: {}", input.directory));
        }

        std::regex pattern;
        try {
            pattern = std::regex(input.pattern);
        } catch (const std::regex_error& e) {
            return Result<std::vector<std::string>>::error(ErrorCategory::CONFIG_ERROR,
                std::format("Invalid input pattern '{}': {}", input.pattern, e.what()));
        }

        fs::directory_iterator it(input.directory, ec);
        if (ec) {
            return Result<std::vector<std::string>>::error(ErrorCategory::IO_ERROR,
                std::format("Cannot list {}: {}", input.directory, ec.message()));
        }
        for (const auto& entry : it) {
            if (!entry.is_regular_file(ec)) continue;
            if (std::regex_match(entry.path().filename().string(), pattern)) {
                files.push_back(entry.path().string());
            }
        }
    }

    std::sort(files.begin(), files.end());
    files.erase(std::unique(files.begin(), files.end()), files.end());

    utils::log::debug(std::format("Discovered {} input file(s)", files.size()));
    return Result<std::vector<std::string>>::ok(std::move(files));
}

} // namespace logcleaner

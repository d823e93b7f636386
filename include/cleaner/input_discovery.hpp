#pragma once

#include "core/error.hpp"

#include <string>
#include <vector>

namespace logcleaner {

struct InputConfig {
    std::vector<std::string> paths;
    std::string directory;
    // Full match against the file name (not the path)
    std::string pattern = R"(.*\.log)";
};

/**
 * @brief Resolve the set of files one invocation cleans
 *
 * Explicit paths plus every regular file directly inside `directory` whose
 * name matches `pattern`. The result is sorted and free of duplicates so no
 * file is ever cleaned twice concurrently.
 */
[[nodiscard]] Result<std::vector<std::string>> discover_inputs(const InputConfig& input);

} // namespace logcleaner

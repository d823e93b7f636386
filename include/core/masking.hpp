#pragma once

#include "core/types.hpp"
#include <string>
#include <string_view>
#include <unordered_map>

namespace logcleaner {

/**
 * @brief Data masking engine - applies masking strategies to record fields
 *
 * Strategies:
 * - REDACT:   Replace entire value with "***REDACTED***"
 * - PARTIAL:  Show prefix + "***" + suffix (e.g., "ali***com")
 * - HASH:     SHA256 first 16 hex chars (deterministic pseudonymization)
 * - NULLIFY:  Replace with "NULL"
 */
class MaskingEngine {
public:
    /**
     * @brief Mask a single value
     */
    [[nodiscard]] static std::string mask_value(
        std::string_view value,
        MaskingAction action,
        int prefix_len = 3,
        int suffix_len = 3);

    /**
     * @brief Compute masked values for the fields an ANONYMIZE decision names
     * @param record Record being anonymized (not modified)
     * @param decision Decision carrying fields and masking parameters
     * @return field name -> masked value, only for fields the record carries
     */
    [[nodiscard]] static std::unordered_map<std::string, std::string> mask_fields(
        const Record& record,
        const Decision& decision);

private:
    static std::string partial_mask(std::string_view value, int prefix_len, int suffix_len);
    static std::string hash_value(std::string_view value);
};

} // namespace logcleaner

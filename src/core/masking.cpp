#include "core/masking.hpp"

#include <openssl/evp.h>

#include <format>

namespace logcleaner {

static constexpr std::string_view kRedacted = "***REDACTED***";
static constexpr std::string_view kMaskFill = "***";

std::string MaskingEngine::mask_value(
    std::string_view value,
    MaskingAction action,
    int prefix_len,
    int suffix_len) {

    switch (action) {
        case MaskingAction::NONE:
            return std::string(value);

        case MaskingAction::REDACT:
            return std::string(kRedacted);

        case MaskingAction::PARTIAL:
            return partial_mask(value, prefix_len, suffix_len);

        case MaskingAction::HASH:
            return hash_value(value);

        case MaskingAction::NULLIFY:
            return "NULL";
    }
    return std::string(kRedacted);
}

std::string MaskingEngine::partial_mask(
    std::string_view value, int prefix_len, int suffix_len) {

    const auto len = static_cast<int>(value.size());

    // Too short to show anything without revealing the whole value
    if (prefix_len < 0 || suffix_len < 0 || len <= prefix_len + suffix_len) {
        return std::string(kRedacted);
    }

    std::string result;
    result.reserve(prefix_len + kMaskFill.size() + suffix_len);
    result.append(value.data(), prefix_len);
    result.append(kMaskFill);
    result.append(value.data() + len - suffix_len, suffix_len);
    return result;
}

std::string MaskingEngine::hash_value(std::string_view value) {
    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hash_len = 0;
    if (EVP_Digest(value.data(), value.size(), hash, &hash_len, EVP_sha256(), nullptr) != 1
        || hash_len < 8) {
        // Fail closed
        return std::string(kRedacted);
    }

    // First 16 hex chars (8 bytes)
    std::string result;
    result.reserve(16);
    for (int i = 0; i < 8; ++i) {
        result += std::format("{:02x}", hash[i]);
    }
    return result;
}

std::unordered_map<std::string, std::string> MaskingEngine::mask_fields(
    const Record& record,
    const Decision& decision) {

    std::unordered_map<std::string, std::string> masked;
    if (decision.kind != DecisionKind::ANONYMIZE || decision.masking == MaskingAction::NONE) {
        return masked;
    }

    for (const auto& field : decision.fields) {
        if (field == "account_id") {
            masked[field] = mask_value(record.account_id, decision.masking,
                                       decision.prefix_len, decision.suffix_len);
            continue;
        }
        const auto it = record.attributes.find(field);
        if (it == record.attributes.end()) continue;
        masked[field] = mask_value(it->second, decision.masking,
                                   decision.prefix_len, decision.suffix_len);
    }
    return masked;
}

} // namespace logcleaner

#include <catch2/catch_test_macros.hpp>
#include "core/masking.hpp"

using namespace logcleaner;

namespace {

Record make_record() {
    Record r;
    r.account_id = "acct-1234567";
    r.event_type = "login";
    r.attributes = {{"email", "alice@example.com"}, {"ip", "10.0.0.1"}};
    r.line_number = 1;
    return r;
}

} // namespace

// ============================================================================
// MaskingEngine::mask_value tests
// ============================================================================

TEST_CASE("Masking NONE returns original value", "[masking]") {
    CHECK(MaskingEngine::mask_value("hello@example.com", MaskingAction::NONE) == "hello@example.com");
    CHECK(MaskingEngine::mask_value("", MaskingAction::NONE).empty());
}

TEST_CASE("Masking REDACT replaces entire value", "[masking]") {
    CHECK(MaskingEngine::mask_value("hello@example.com", MaskingAction::REDACT) == "***REDACTED***");
    CHECK(MaskingEngine::mask_value("", MaskingAction::REDACT) == "***REDACTED***");
}

TEST_CASE("Masking PARTIAL shows prefix and suffix", "[masking]") {
    // "hello@example.com" (17 chars) with prefix=3, suffix=3 => "hel***com"
    CHECK(MaskingEngine::mask_value("hello@example.com", MaskingAction::PARTIAL, 3, 3) == "hel***com");
    CHECK(MaskingEngine::mask_value("alice@company.org", MaskingAction::PARTIAL, 5, 4) == "alice***.org");
    CHECK(MaskingEngine::mask_value("acct-1234567", MaskingAction::PARTIAL, 0, 2) == "***67");
}

TEST_CASE("Masking PARTIAL falls back to REDACT for short values", "[masking]") {
    CHECK(MaskingEngine::mask_value("abc", MaskingAction::PARTIAL, 3, 3) == "***REDACTED***");
    CHECK(MaskingEngine::mask_value("abcdef", MaskingAction::PARTIAL, 3, 3) == "***REDACTED***");
    CHECK(MaskingEngine::mask_value("abcdefg", MaskingAction::PARTIAL, -1, 3) == "***REDACTED***");
}

TEST_CASE("Masking HASH produces deterministic 16-hex output", "[masking]") {
    auto hash1 = MaskingEngine::mask_value("test@example.com", MaskingAction::HASH);
    auto hash2 = MaskingEngine::mask_value("test@example.com", MaskingAction::HASH);

    CHECK(hash1 == hash2);
    CHECK(hash1.size() == 16);
    for (char c : hash1) {
        CHECK(((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f')));
    }

    CHECK(hash1 != MaskingEngine::mask_value("other@example.com", MaskingAction::HASH));

    // SHA-256("abc") = ba7816bf8f01cfea414140de5dae2223...
    CHECK(MaskingEngine::mask_value("abc", MaskingAction::HASH) == "ba7816bf8f01cfea");
}

TEST_CASE("Masking NULLIFY replaces with NULL", "[masking]") {
    CHECK(MaskingEngine::mask_value("anything", MaskingAction::NULLIFY) == "NULL");
}

// ============================================================================
// MaskingEngine::mask_fields tests
// ============================================================================

TEST_CASE("Masking fields only for ANONYMIZE decisions", "[masking]") {
    const auto record = make_record();
    CHECK(MaskingEngine::mask_fields(record, Decision::keep()).empty());
    CHECK(MaskingEngine::mask_fields(record, Decision::remove()).empty());
}

TEST_CASE("Masking fields masks attributes and account_id", "[masking]") {
    const auto record = make_record();
    const auto masked = MaskingEngine::mask_fields(
        record, Decision::anonymize({"email", "account_id"}, MaskingAction::REDACT));

    REQUIRE(masked.size() == 2);
    CHECK(masked.at("email") == "***REDACTED***");
    CHECK(masked.at("account_id") == "***REDACTED***");
}

TEST_CASE("Masking fields skips fields the record does not carry", "[masking]") {
    const auto record = make_record();
    const auto masked = MaskingEngine::mask_fields(
        record, Decision::anonymize({"phone", "ip"}, MaskingAction::NULLIFY));

    REQUIRE(masked.size() == 1);
    CHECK(masked.at("ip") == "NULL");
}

TEST_CASE("Masking fields passes prefix and suffix lengths", "[masking]") {
    const auto record = make_record();
    const auto masked = MaskingEngine::mask_fields(
        record, Decision::anonymize({"email"}, MaskingAction::PARTIAL, 2, 4));

    CHECK(masked.at("email") == "al***.com");
}

TEST_CASE("Masking fields with NONE leaves record untouched", "[masking]") {
    const auto record = make_record();
    CHECK(MaskingEngine::mask_fields(record, Decision::anonymize({"email"}, MaskingAction::NONE)).empty());
}

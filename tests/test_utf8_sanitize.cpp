// Tests for UTF-8 sanitation of upstream text.

#include <iostream>
#include <string>

#include "mcp/mcp_content.hpp"
#include "utils/utf8_sanitize.hpp"

namespace test_utf8_sanitize {

static const std::string REPLACEMENT = "\xEF\xBF\xBD";

// Test: Valid text, including multibyte characters, passes through unchanged.
static bool test_valid_text_unchanged() {
    const std::string text = "Ring Nebula \xC2\xB0 \xE2\x82\xAC \xF0\x9F\x9A\x80";
    bool success = utf8_sanitize::is_valid(text) && utf8_sanitize::sanitize(text) == text;

    if (success) {
        std::cout << "  OK: Valid UTF-8 unchanged" << std::endl;
    } else {
        std::cout << "  FAIL: Valid UTF-8 was modified" << std::endl;
    }
    return success;
}

// Test: Stray, truncated, overlong and surrogate sequences are replaced.
static bool test_invalid_sequences_replaced() {
    bool success = utf8_sanitize::sanitize(std::string("a\xFF" "b")) == "a" + REPLACEMENT + "b" &&
                   utf8_sanitize::sanitize(std::string("end\xE2\x82")) == "end" + REPLACEMENT + REPLACEMENT &&
                   utf8_sanitize::sanitize(std::string("\xC0\xAF")) == REPLACEMENT + REPLACEMENT &&
                   utf8_sanitize::sanitize(std::string("\xED\xA0\x80")) == REPLACEMENT + REPLACEMENT + REPLACEMENT &&
                   !utf8_sanitize::is_valid(std::string("\xF4\x90\x80\x80"));

    if (success) {
        std::cout << "  OK: Invalid sequences replaced with U+FFFD" << std::endl;
    } else {
        std::cout << "  FAIL: Invalid sequences not replaced as expected" << std::endl;
    }
    return success;
}

// Test: Text content blocks are sanitized on construction.
static bool test_text_blocks_sanitized() {
    mcp_content::ContentBlock block = mcp_content::make_text(std::string("caption \xFE"));
    nlohmann::json serialized = mcp_content::to_json(block);
    bool success = serialized["type"] == "text" && serialized["text"] == "caption " + REPLACEMENT &&
                   !serialized.dump().empty();

    if (success) {
        std::cout << "  OK: Text blocks carry sanitized text" << std::endl;
    } else {
        std::cout << "  FAIL: Text block was not sanitized" << std::endl;
    }
    return success;
}

bool run_all_tests() {
    bool all_passed = true;
    all_passed &= test_valid_text_unchanged();
    all_passed &= test_invalid_sequences_replaced();
    all_passed &= test_text_blocks_sanitized();
    return all_passed;
}

} // namespace test_utf8_sanitize

/*
 * AirGap C++ - Preview redaction
 *
 * Stateless string-to-string masking of common secrets (API keys, tokens,
 * passwords, private keys, connection-string passwords, card numbers,
 * SSNs). Reads no files and keeps no state between calls.
 */
#ifndef airgap_CORE_REDACT_HPP
#define airgap_CORE_REDACT_HPP

#include "json.hpp"
#include <string>
#include <vector>
#include <cstdint>

namespace airgap {

struct RedactionResult {
    int64_t original_length;    // in code points
    int64_t redacted_length;
    int64_t redactions_applied;
    std::vector<std::string> redaction_types;   // first-seen order, unique
    std::string content;

    RedactionResult() : original_length(0), redacted_length(0), redactions_applied(0) {}

    Json to_json() const;
};

// Rules run over segments of at most 2 KiB cut at line breaks (or whitespace
// inside longer lines), so a secret straddling a cut is not masked. Private
// key blocks are matched across the whole text. May throw std::regex_error
// if an expression exceeds the engine's limits.
RedactionResult redact_preview(const std::string& content);

} // namespace airgap

#endif // airgap_CORE_REDACT_HPP

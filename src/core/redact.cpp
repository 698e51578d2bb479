/*
 * AirGap C++ - Preview redaction Implementation
 */
#include <airgap/core/redact.hpp>

#include <algorithm>
#include <iterator>
#include <regex>

namespace airgap {

Json RedactionResult::to_json() const {
    Json j;
    j["original_length"] = original_length;
    j["redacted_length"] = redacted_length;
    j["redactions_applied"] = redactions_applied;
    j["redaction_types"] = redaction_types;
    j["content"] = content;
    return j;
}

namespace {

// Longest slice of text handed to std::regex. The libstdc++ matcher
// recurses per consumed character, so longer input can exhaust the stack.
const size_t MAX_SEGMENT_BYTES = 2048;

bool is_space(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

size_t skip_space(const std::string& text, size_t i) {
    while (i < text.size() && is_space(text[i])) ++i;
    return i;
}

// Matches "-----<kind> [RSA ]PRIVATE KEY-----" at `pos`, where each gap is
// one or more whitespace characters. On success `end` is set past the marker.
bool pem_marker_at(const std::string& text, size_t pos, const std::string& kind, size_t& end) {
    std::string head = "-----" + kind;
    if (text.compare(pos, head.size(), head) != 0) return false;

    size_t i = pos + head.size();
    size_t j = skip_space(text, i);
    if (j == i) return false;
    i = j;

    if (text.compare(i, 3, "RSA") == 0) {
        j = skip_space(text, i + 3);
        if (j > i + 3) i = j;
    }

    if (text.compare(i, 7, "PRIVATE") != 0) return false;
    i += 7;
    j = skip_space(text, i);
    if (j == i) return false;
    i = j;

    static const std::string tail = "KEY-----";
    if (text.compare(i, tail.size(), tail) != 0) return false;
    end = i + tail.size();
    return true;
}

// PEM private key blocks can span many lines, so they are located by a
// plain scan rather than a regex over the whole text
int64_t redact_private_keys(std::string& text) {
    static const std::string replacement = "<REDACTED_PRIVATE_KEY>";

    int64_t hits = 0;
    size_t from = 0;
    while ((from = text.find("-----BEGIN", from)) != std::string::npos) {
        size_t body = 0;
        if (!pem_marker_at(text, from, "BEGIN", body)) {
            ++from;
            continue;
        }

        size_t stop = 0;
        size_t at = body;
        while ((at = text.find("-----END", at)) != std::string::npos) {
            if (pem_marker_at(text, at, "END", stop)) break;
            ++at;
        }
        // No terminator after this header means none after any later one either
        if (at == std::string::npos) break;

        text.replace(from, stop - from, replacement);
        from += replacement.size();
        ++hits;
    }
    return hits;
}

struct RedactionRule {
    std::regex pattern;
    std::string replacement;
    std::string type;
    int64_t (*scanner)(std::string& text);  // replaces the regex when set

    RedactionRule(const char* expr, std::regex::flag_type flags,
                  const char* repl, const char* name)
        : pattern(expr, flags), replacement(repl), type(name), scanner(NULL) {}

    RedactionRule(int64_t (*scan)(std::string&), const char* name)
        : type(name), scanner(scan) {}
};

// Applied in order; later rules see the output of earlier ones
const std::vector<RedactionRule>& redaction_rules() {
    static const std::regex::flag_type plain = std::regex::ECMAScript;
    static const std::regex::flag_type nocase = std::regex::ECMAScript | std::regex::icase;

    static const std::vector<RedactionRule> rules = {
        RedactionRule("(api[_-]?key|apikey)\\s*[:=]\\s*[\"']?([a-zA-Z0-9_-]{20,})[\"']?",
                      nocase, "$1=<REDACTED_API_KEY>", "api_key"),
        RedactionRule("(bearer)\\s+([a-zA-Z0-9_.-]+)",
                      nocase, "$1 <REDACTED_BEARER_TOKEN>", "bearer_token"),
        RedactionRule("(aws[_-]?(?:access[_-]?key[_-]?id|secret[_-]?access[_-]?key))"
                      "\\s*[:=]\\s*[\"']?([A-Z0-9/+=]{16,})[\"']?",
                      nocase, "$1=<REDACTED_AWS_KEY>", "aws_key"),
        RedactionRule("(password|passwd|pwd|secret|token)\\s*[:=]\\s*[\"']?([^\\s\"']{8,})[\"']?",
                      nocase, "$1=<REDACTED>", "password"),
        RedactionRule(redact_private_keys, "private_key"),
        RedactionRule("((?:mongodb|postgres|mysql|redis|amqp)(?:\\+\\w+)?://[^:]+:)([^@]+)(@.+)",
                      nocase, "$1<REDACTED>$3", "connection_string"),
        RedactionRule("eyJ[a-zA-Z0-9_-]+\\.eyJ[a-zA-Z0-9_-]+\\.[a-zA-Z0-9_-]+",
                      plain, "<REDACTED_JWT>", "jwt"),
        RedactionRule("gh[pousr]_[a-zA-Z0-9]{36,}",
                      plain, "<REDACTED_GITHUB_TOKEN>", "github_token"),
        RedactionRule("xox[baprs]-[a-zA-Z0-9-]+",
                      plain, "<REDACTED_SLACK_TOKEN>", "slack_token"),
        RedactionRule("\\b(?:\\d{4}[- ]?){3}\\d{4}\\b",
                      plain, "<REDACTED_CARD_NUMBER>", "credit_card"),
        RedactionRule("\\b\\d{3}-\\d{2}-\\d{4}\\b",
                      plain, "<REDACTED_SSN>", "ssn"),
    };
    return rules;
}

// Length of the segment starting at `pos`: whole lines while they fit in
// MAX_SEGMENT_BYTES, else the longest run ending in whitespace, else a cut
// on a code point boundary
size_t segment_length(const std::string& text, size_t pos) {
    size_t remaining = text.size() - pos;
    if (remaining <= MAX_SEGMENT_BYTES) return remaining;

    size_t limit = pos + MAX_SEGMENT_BYTES;
    size_t nl = text.rfind('\n', limit - 1);
    if (nl != std::string::npos && nl >= pos) return nl - pos + 1;

    for (size_t i = limit; i > pos; --i) {
        if (is_space(text[i - 1])) return i - pos;
    }

    size_t cut = limit;
    while (cut > pos && (static_cast<unsigned char>(text[cut]) & 0xC0) == 0x80) --cut;
    return cut > pos ? cut - pos : MAX_SEGMENT_BYTES;
}

// Runs one rule over `text` segment by segment; returns the number of matches
int64_t apply_rule(const RedactionRule& rule, std::string& text) {
    if (rule.scanner) return rule.scanner(text);

    int64_t hits = 0;
    std::string out;
    out.reserve(text.size());

    size_t pos = 0;
    while (pos < text.size()) {
        size_t len = segment_length(text, pos);
        std::string segment = text.substr(pos, len);
        pos += len;

        std::sregex_iterator it(segment.begin(), segment.end(), rule.pattern);
        std::sregex_iterator last;
        int64_t n = static_cast<int64_t>(std::distance(it, last));
        if (n == 0) {
            out += segment;
            continue;
        }
        hits += n;
        out += std::regex_replace(segment, rule.pattern, rule.replacement);
    }

    if (hits > 0) text.swap(out);
    return hits;
}

// Number of UTF-8 code points (continuation bytes are not counted)
int64_t code_point_count(const std::string& s) {
    int64_t count = 0;
    for (size_t i = 0; i < s.size(); ++i) {
        if ((static_cast<unsigned char>(s[i]) & 0xC0) != 0x80) ++count;
    }
    return count;
}

} // anonymous namespace

RedactionResult redact_preview(const std::string& content) {
    RedactionResult result;
    result.original_length = code_point_count(content);

    std::string text = content;
    const std::vector<RedactionRule>& rules = redaction_rules();

    for (size_t i = 0; i < rules.size(); ++i) {
        const RedactionRule& rule = rules[i];

        int64_t hits = apply_rule(rule, text);
        if (hits == 0) continue;

        result.redactions_applied += hits;
        if (std::find(result.redaction_types.begin(), result.redaction_types.end(), rule.type)
                == result.redaction_types.end()) {
            result.redaction_types.push_back(rule.type);
        }
    }

    result.redacted_length = code_point_count(text);
    result.content = text;
    return result;
}

} // namespace airgap

/*
 * AirGap C++ - Configuration document
 *
 * JSON-backed configuration with dotted-key lookup:
 *   cfg.get_int("airgap.max_results", 100)
 *
 * Getters never throw. A key that is missing, or present with the wrong
 * type, yields the default; has() / is_type() let callers tell the two
 * apart when they need to reject malformed input.
 */
#ifndef airgap_CORE_CONFIG_HPP
#define airgap_CORE_CONFIG_HPP

#include "json.hpp"
#include <string>
#include <vector>
#include <cstdint>

namespace airgap {

class Config {
public:
    Config();
    explicit Config(const Json& data);

    // Load from file / string. On failure returns false, keeps the previous
    // document and stores a message retrievable through last_error().
    bool load_file(const std::string& path);
    bool load_string(const std::string& text);

    bool has(const std::string& key) const;

    std::string get_string(const std::string& key, const std::string& def = "") const;
    int64_t get_int(const std::string& key, int64_t def = 0) const;
    double get_double(const std::string& key, double def = 0.0) const;
    bool get_bool(const std::string& key, bool def = false) const;
    std::vector<std::string> get_string_list(const std::string& key,
                                             const std::vector<std::string>& def) const;

    void set_string(const std::string& key, const std::string& value);
    void set_int(const std::string& key, int64_t value);
    void set_bool(const std::string& key, bool value);

    // Raw node for `key`, or NULL if absent
    const Json* find(const std::string& key) const;

    const Json& data() const { return data_; }
    const std::string& last_error() const { return last_error_; }

private:
    Json* find_or_create(const std::string& key);

    Json data_;
    std::string last_error_;
};

} // namespace airgap

#endif // airgap_CORE_CONFIG_HPP

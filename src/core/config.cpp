/*
 * AirGap C++ - Configuration document implementation
 */
#include <airgap/core/config.hpp>
#include <airgap/core/logger.hpp>
#include <airgap/core/utils.hpp>

#include <fstream>
#include <sstream>

namespace airgap {

Config::Config() : data_(Json::object()) {}

Config::Config(const Json& data) : data_(data.is_object() ? data : Json::object()) {}

bool Config::load_file(const std::string& path) {
    std::ifstream file(path.c_str());
    if (!file.is_open()) {
        last_error_ = "Cannot open config file: " + path;
        return false;
    }

    std::ostringstream content;
    content << file.rdbuf();

    if (!load_string(content.str())) {
        last_error_ = path + ": " + last_error_;
        return false;
    }

    LOG_DEBUG("Loaded config from %s", path.c_str());
    return true;
}

bool Config::load_string(const std::string& text) {
    Json parsed;
    try {
        parsed = Json::parse(text);
    } catch (const Json::parse_error& e) {
        last_error_ = std::string("Invalid JSON: ") + e.what();
        return false;
    }

    if (!parsed.is_object()) {
        last_error_ = "Config root must be a JSON object";
        return false;
    }

    data_ = parsed;
    last_error_.clear();
    return true;
}

const Json* Config::find(const std::string& key) const {
    const Json* node = &data_;
    std::vector<std::string> parts = split(key, '.');
    for (size_t i = 0; i < parts.size(); ++i) {
        if (!node->is_object()) return NULL;
        Json::const_iterator it = node->find(parts[i]);
        if (it == node->end()) return NULL;
        node = &(*it);
    }
    return node;
}

Json* Config::find_or_create(const std::string& key) {
    Json* node = &data_;
    std::vector<std::string> parts = split(key, '.');
    for (size_t i = 0; i < parts.size(); ++i) {
        if (!node->is_object()) {
            *node = Json::object();
        }
        node = &(*node)[parts[i]];
    }
    return node;
}

bool Config::has(const std::string& key) const {
    return find(key) != NULL;
}

std::string Config::get_string(const std::string& key, const std::string& def) const {
    const Json* node = find(key);
    if (!node || !node->is_string()) return def;
    return node->get<std::string>();
}

int64_t Config::get_int(const std::string& key, int64_t def) const {
    const Json* node = find(key);
    if (!node || !node->is_number_integer()) return def;
    return node->get<int64_t>();
}

double Config::get_double(const std::string& key, double def) const {
    const Json* node = find(key);
    if (!node || !node->is_number()) return def;
    return node->get<double>();
}

bool Config::get_bool(const std::string& key, bool def) const {
    const Json* node = find(key);
    if (!node || !node->is_boolean()) return def;
    return node->get<bool>();
}

std::vector<std::string> Config::get_string_list(const std::string& key,
                                                 const std::vector<std::string>& def) const {
    const Json* node = find(key);
    if (!node || !node->is_array()) return def;

    std::vector<std::string> result;
    for (Json::const_iterator it = node->begin(); it != node->end(); ++it) {
        if (it->is_string()) {
            result.push_back(it->get<std::string>());
        }
    }
    return result;
}

void Config::set_string(const std::string& key, const std::string& value) {
    *find_or_create(key) = value;
}

void Config::set_int(const std::string& key, int64_t value) {
    *find_or_create(key) = value;
}

void Config::set_bool(const std::string& key, bool value) {
    *find_or_create(key) = value;
}

} // namespace airgap

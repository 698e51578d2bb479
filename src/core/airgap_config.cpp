/*
 * AirGap C++ - Sandbox configuration loading and validation
 */
#include <airgap/core/airgap_config.hpp>
#include <airgap/core/logger.hpp>

namespace airgap {

const std::vector<std::string>& default_blocked_patterns() {
    static const std::vector<std::string> patterns = {
        // Environment and secrets
        ".env", ".env.*",
        // Private keys
        "*.pem", "*.key", "*.p12", "*.pfx", "*.jks",
        "id_rsa", "id_rsa.*", "id_ed25519", "id_ed25519.*", "id_ecdsa", "id_ecdsa.*",
        "authorized_keys", "known_hosts",
        // Credentials files
        "credentials", "credentials.*", "secrets", "secrets.*",
        "*_SECRET", "*_KEY", "*_TOKEN", "*_PASSWORD",
        // Databases
        "*.db", "*.sqlite", "*.sqlite3", "*.kdb", "*.kdbx",
        // Config files that commonly embed credentials
        ".git/config", ".npmrc", ".pypirc", ".docker/config.json",
        ".aws/credentials", ".aws/config",
        // Kubernetes
        "*.kubeconfig", "kubeconfig",
    };
    return patterns;
}

AirGapConfig::AirGapConfig()
    : max_file_size_bytes(1048576)      // 1 MiB
    , max_response_bytes(524288)        // 512 KiB
    , max_results(100)
    , max_files_scanned(10000)
    , timeout_seconds(30.0)
    , redact_paths_in_audit(true)
    , blocked_patterns(default_blocked_patterns())
    , prefer_ripgrep(true) {}

bool AirGapConfig::validate(std::string& error) const {
    if (max_file_size_bytes <= 0) {
        error = "max_file_size_bytes must be positive";
        return false;
    }
    if (max_response_bytes <= 0) {
        error = "max_response_bytes must be positive";
        return false;
    }
    if (max_results <= 0) {
        error = "max_results must be positive";
        return false;
    }
    if (max_files_scanned <= 0) {
        error = "max_files_scanned must be positive";
        return false;
    }
    if (!(timeout_seconds > 0.0)) {
        error = "timeout_seconds must be positive";
        return false;
    }
    return true;
}

namespace {

// Reads typed keys from one section and records the first type mismatch
class SectionReader {
public:
    SectionReader(const Config& cfg, const std::string& prefix)
        : cfg_(cfg), prefix_(prefix) {}

    void read_int(const char* name, int64_t& out) {
        const Json* node = cfg_.find(prefix_ + name);
        if (!node || node->is_null()) return;
        if (!node->is_number_integer()) {
            fail(name, "an integer");
            return;
        }
        out = node->get<int64_t>();
    }

    void read_double(const char* name, double& out) {
        const Json* node = cfg_.find(prefix_ + name);
        if (!node || node->is_null()) return;
        if (!node->is_number()) {
            fail(name, "a number");
            return;
        }
        out = node->get<double>();
    }

    void read_bool(const char* name, bool& out) {
        const Json* node = cfg_.find(prefix_ + name);
        if (!node || node->is_null()) return;
        if (!node->is_boolean()) {
            fail(name, "a boolean");
            return;
        }
        out = node->get<bool>();
    }

    void read_string(const char* name, std::string& out) {
        const Json* node = cfg_.find(prefix_ + name);
        if (!node || node->is_null()) return;
        if (!node->is_string()) {
            fail(name, "a string");
            return;
        }
        out = node->get<std::string>();
    }

    void read_string_list(const char* name, std::vector<std::string>& out) {
        const Json* node = cfg_.find(prefix_ + name);
        if (!node || node->is_null()) return;
        if (!node->is_array()) {
            fail(name, "an array of strings");
            return;
        }
        std::vector<std::string> values;
        for (Json::const_iterator it = node->begin(); it != node->end(); ++it) {
            if (!it->is_string()) {
                fail(name, "an array of strings");
                return;
            }
            values.push_back(it->get<std::string>());
        }
        out = values;
    }

    bool ok() const { return error_.empty(); }
    const std::string& error() const { return error_; }

private:
    void fail(const char* name, const char* expected) {
        if (error_.empty()) {
            error_ = prefix_ + name + " must be " + expected;
        }
    }

    const Config& cfg_;
    std::string prefix_;
    std::string error_;
};

} // anonymous namespace

bool AirGapConfig::load(const Config& cfg, AirGapConfig& out, std::string& error) {
    AirGapConfig loaded;

    const Json* section = cfg.find("airgap");
    std::string prefix = (section && section->is_object()) ? "airgap." : "";

    SectionReader reader(cfg, prefix);
    reader.read_string_list("allowed_roots", loaded.allowed_roots);
    reader.read_int("max_file_size_bytes", loaded.max_file_size_bytes);
    reader.read_int("max_response_bytes", loaded.max_response_bytes);
    reader.read_int("max_results", loaded.max_results);
    reader.read_int("max_files_scanned", loaded.max_files_scanned);
    reader.read_double("timeout_seconds", loaded.timeout_seconds);
    reader.read_string("audit_log_path", loaded.audit_log_path);
    reader.read_bool("redact_paths_in_audit", loaded.redact_paths_in_audit);
    reader.read_string_list("blocked_patterns", loaded.blocked_patterns);

    SectionReader search(cfg, "search.");
    search.read_bool("prefer_ripgrep", loaded.prefer_ripgrep);
    search.read_string("ripgrep_path", loaded.ripgrep_path);

    if (!reader.ok()) {
        error = reader.error();
        return false;
    }
    if (!search.ok()) {
        error = search.error();
        return false;
    }
    if (!loaded.validate(error)) {
        return false;
    }

    if (loaded.allowed_roots.empty()) {
        LOG_WARN("No allowed_roots configured: every access will be denied");
    }

    out = loaded;
    return true;
}

} // namespace airgap

/*
 * AirGap C++ - Sandbox tools provider
 *
 * Exposes the audited read-only operations to the dispatch layer:
 * - read_file: Read a byte range of a file
 * - list_dir: List a directory
 * - search_text: Regex search under a directory
 * - redact_preview: Mask secrets in a string (no file access)
 */
#ifndef airgap_CORE_AIRGAP_TOOLS_HPP
#define airgap_CORE_AIRGAP_TOOLS_HPP

#include "tool.hpp"
#include "airgap_config.hpp"
#include "filesystem.hpp"
#include "path_security.hpp"
#include "audit.hpp"
#include "search_text.hpp"
#include <string>
#include <memory>

namespace airgap {

class AirGapTools : public ToolProvider {
public:
    // `fs` must outlive the provider
    explicit AirGapTools(const FileSystem& fs = default_filesystem());
    virtual ~AirGapTools();

    const char* name() const override { return "airgap"; }
    const char* description() const override {
        return "Read-only, audited filesystem access";
    }
    const char* version() const override { return "1.0.0"; }

    // Fails on invalid configuration; the message is kept in last_error()
    bool init(const Config& cfg) override;
    void shutdown() override;

    std::vector<std::string> actions() const override;
    ToolResult execute(const std::string& action, const Json& params) override;
    std::vector<ToolDescriptor> descriptors() const override;

    const AirGapConfig& config() const { return config_; }
    const std::string& last_error() const { return last_error_; }

private:
    ToolResult do_read_file(const Json& params);
    ToolResult do_list_dir(const Json& params);
    ToolResult do_search_text(const Json& params);
    ToolResult do_redact_preview(const Json& params) const;

    const FileSystem& fs_;
    AirGapConfig config_;
    std::unique_ptr<PathSecurityContext> security_;
    std::unique_ptr<AuditLogger> audit_;
    std::unique_ptr<TextSearcher> searcher_;
    std::string last_error_;
};

} // namespace airgap

#endif // airgap_CORE_AIRGAP_TOOLS_HPP

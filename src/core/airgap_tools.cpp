/*
 * AirGap C++ - Sandbox tools provider Implementation
 */
#include <airgap/core/airgap_tools.hpp>
#include <airgap/core/read_file.hpp>
#include <airgap/core/list_dir.hpp>
#include <airgap/core/redact.hpp>
#include <airgap/core/logger.hpp>

#include <regex>

namespace airgap {

AirGapTools::AirGapTools(const FileSystem& fs)
    : fs_(fs) {}

AirGapTools::~AirGapTools() {
    shutdown();
}

bool AirGapTools::init(const Config& cfg) {
    AirGapConfig loaded;
    std::string error;
    if (!AirGapConfig::load(cfg, loaded, error)) {
        last_error_ = "Invalid configuration: " + error;
        LOG_ERROR("%s", last_error_.c_str());
        return false;
    }

    // Teardown in reverse dependency order before rebuilding
    searcher_.reset();
    audit_.reset();
    security_.reset();

    config_ = loaded;
    security_.reset(new PathSecurityContext(config_, fs_));
    audit_.reset(new AuditLogger(config_));
    searcher_.reset(new TextSearcher(config_, *security_, *audit_));

    LOG_INFO("AirGap tools initialized (roots=%zu, max_results=%lld, timeout=%.1fs, ripgrep=%s)",
             security_->allowed_roots().size(),
             static_cast<long long>(config_.max_results),
             config_.timeout_seconds,
             searcher_->ripgrep_available() ? "yes" : "no");

    initialized_ = true;
    return true;
}

void AirGapTools::shutdown() {
    searcher_.reset();
    audit_.reset();
    security_.reset();
    initialized_ = false;
}

std::vector<std::string> AirGapTools::actions() const {
    std::vector<std::string> acts;
    acts.push_back("read_file");
    acts.push_back("list_dir");
    acts.push_back("search_text");
    acts.push_back("redact_preview");
    return acts;
}

std::vector<ToolDescriptor> AirGapTools::descriptors() const {
    std::vector<ToolDescriptor> tools;

    {
        ToolDescriptor tool("read_file",
                            "Read a file inside the allowed roots. Returns at most "
                            "max_file_size_bytes starting at a byte offset.");
        tool.params.push_back(ToolParamSchema("path", "string", "Path of the file to read", true));
        tool.params.push_back(ToolParamSchema("offset", "integer",
                                              "Byte offset to start reading from (default 0)"));
        tool.params.push_back(ToolParamSchema("limit", "integer",
                                              "Maximum bytes to read (clamped to the configured maximum)"));
        tools.push_back(tool);
    }

    {
        ToolDescriptor tool("list_dir",
                            "List a directory inside the allowed roots. Entries outside "
                            "the roots are reported as inaccessible.");
        tool.params.push_back(ToolParamSchema("path", "string", "Directory to list", true));
        tools.push_back(tool);
    }

    {
        ToolDescriptor tool("search_text",
                            "Search files under a directory for a regular expression. "
                            "Results are bounded by count, files scanned and time.");
        tool.params.push_back(ToolParamSchema("root_path", "string", "Directory to search in", true));
        tool.params.push_back(ToolParamSchema("pattern", "string", "Regular expression to search for", true));
        tools.push_back(tool);
    }

    {
        ToolDescriptor tool("redact_preview",
                            "Mask API keys, tokens, passwords and similar secrets in a string. "
                            "Does not access any file.");
        tool.params.push_back(ToolParamSchema("content", "string", "Text to redact", true));
        tools.push_back(tool);
    }

    return tools;
}

ToolResult AirGapTools::execute(const std::string& action, const Json& params) {
    std::vector<ToolDescriptor> tools = descriptors();
    const ToolDescriptor* descriptor = NULL;
    for (size_t i = 0; i < tools.size(); ++i) {
        if (tools[i].name == action) {
            descriptor = &tools[i];
            break;
        }
    }
    if (!descriptor) {
        return ToolResult::fail("Unknown action: " + action);
    }

    std::string error = check_params(descriptor->params, params);
    if (!error.empty()) {
        return ToolResult::fail(error);
    }

    if (action == "redact_preview") {
        return do_redact_preview(params);
    }

    if (!initialized_) {
        return ToolResult::fail("AirGap tools are not initialized");
    }

    if (action == "read_file") {
        return do_read_file(params);
    } else if (action == "list_dir") {
        return do_list_dir(params);
    }
    return do_search_text(params);
}

ToolResult AirGapTools::do_read_file(const Json& params) {
    std::string path = params["path"].get<std::string>();

    int64_t offset = 0;
    if (params.contains("offset") && params["offset"].is_number_integer()) {
        offset = params["offset"].get<int64_t>();
    }

    int64_t limit = -1;
    if (params.contains("limit") && params["limit"].is_number_integer()) {
        limit = params["limit"].get<int64_t>();
        if (limit < 0) {
            return ToolResult::fail("limit must be non-negative");
        }
    }

    ReadFileResult result = read_file(config_, *security_, *audit_, path, offset, limit);
    if (!result.success) {
        return ToolResult::fail(result.error);
    }
    return ToolResult::ok(result.to_json());
}

ToolResult AirGapTools::do_list_dir(const Json& params) {
    ListDirResult result = list_dir(config_, *security_, *audit_,
                                    params["path"].get<std::string>());
    if (!result.success) {
        return ToolResult::fail(result.error);
    }
    return ToolResult::ok(result.to_json());
}

ToolResult AirGapTools::do_search_text(const Json& params) {
    SearchResult result = searcher_->search_text(params["root_path"].get<std::string>(),
                                                 params["pattern"].get<std::string>());
    if (!result.success) {
        return ToolResult::fail(result.error);
    }
    return ToolResult::ok(result.to_json());
}

ToolResult AirGapTools::do_redact_preview(const Json& params) const {
    try {
        RedactionResult result = redact_preview(params["content"].get<std::string>());
        return ToolResult::ok(result.to_json());
    } catch (const std::regex_error& e) {
        LOG_WARN("redact_preview failed: %s", e.what());
        return ToolResult::fail(std::string("Redaction failed: ") + e.what());
    }
}

} // namespace airgap

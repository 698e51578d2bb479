/*
 * AirGap C++ - Tool Provider interface
 *
 * A provider exposes named actions taking a JSON object of arguments and
 * returning a ToolResult. Descriptors advertise each action's parameters
 * to the dispatch layer.
 */
#ifndef airgap_CORE_TOOL_HPP
#define airgap_CORE_TOOL_HPP

#include "config.hpp"
#include "json.hpp"
#include <string>
#include <vector>

namespace airgap {

struct ToolParamSchema {
    std::string name;
    std::string type;       // "string", "integer", "number", "boolean", "array", "object"
    std::string description;
    bool required;

    ToolParamSchema() : required(false) {}
    ToolParamSchema(const std::string& n, const std::string& t, const std::string& d, bool r = false)
        : name(n), type(t), description(d), required(r) {}
};

struct ToolDescriptor {
    std::string name;
    std::string description;
    std::vector<ToolParamSchema> params;

    ToolDescriptor() {}
    ToolDescriptor(const std::string& n, const std::string& d) : name(n), description(d) {}

    Json to_json() const;
};

struct ToolResult {
    bool success;
    Json data;
    std::string error;

    ToolResult() : success(false) {}

    static ToolResult ok(const Json& data) {
        ToolResult r;
        r.success = true;
        r.data = data;
        return r;
    }

    static ToolResult fail(const std::string& err) {
        ToolResult r;
        r.success = false;
        r.error = err;
        return r;
    }
};

// Check `params` is an object carrying every required parameter with the
// declared type. Returns "" when valid, else a message naming the field.
std::string check_params(const std::vector<ToolParamSchema>& schema, const Json& params);

class ToolProvider {
public:
    ToolProvider() : initialized_(false) {}
    virtual ~ToolProvider() {}

    virtual const char* name() const = 0;
    virtual const char* description() const = 0;
    virtual const char* version() const = 0;

    virtual bool init(const Config& cfg) = 0;
    virtual void shutdown() = 0;

    virtual std::vector<std::string> actions() const = 0;
    virtual ToolResult execute(const std::string& action, const Json& params) = 0;

    // One descriptor per action, in actions() order
    virtual std::vector<ToolDescriptor> descriptors() const = 0;

    bool is_initialized() const { return initialized_; }

protected:
    bool initialized_;
};

} // namespace airgap

#endif // airgap_CORE_TOOL_HPP

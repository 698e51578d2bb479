/*
 * AirGap C++ - Tool Provider Implementation
 */
#include <airgap/core/tool.hpp>

namespace airgap {

Json ToolDescriptor::to_json() const {
    Json properties = Json::object();
    Json required = Json::array();

    for (size_t i = 0; i < params.size(); ++i) {
        Json prop;
        prop["type"] = params[i].type;
        prop["description"] = params[i].description;
        properties[params[i].name] = prop;
        if (params[i].required) {
            required.push_back(params[i].name);
        }
    }

    Json j;
    j["name"] = name;
    j["description"] = description;
    j["parameters"]["type"] = "object";
    j["parameters"]["properties"] = properties;
    j["parameters"]["required"] = required;
    return j;
}

static bool has_type(const Json& value, const std::string& type) {
    if (type == "string") return value.is_string();
    if (type == "integer") return value.is_number_integer();
    if (type == "number") return value.is_number();
    if (type == "boolean") return value.is_boolean();
    if (type == "array") return value.is_array();
    if (type == "object") return value.is_object();
    return true;
}

std::string check_params(const std::vector<ToolParamSchema>& schema, const Json& params) {
    if (!params.is_object()) {
        return "arguments must be an object";
    }

    for (size_t i = 0; i < schema.size(); ++i) {
        const ToolParamSchema& p = schema[i];
        Json::const_iterator it = params.find(p.name);

        if (it == params.end() || it->is_null()) {
            if (p.required) return "Missing required parameter: " + p.name;
            continue;
        }
        if (!has_type(*it, p.type)) {
            return "Parameter '" + p.name + "' must be of type " + p.type;
        }
    }
    return "";
}

} // namespace airgap

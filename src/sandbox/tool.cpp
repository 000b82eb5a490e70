/*
 * Warden C++ - Host Tool Registry Implementation
 */
#include <warden/sandbox/tool.hpp>
#include <warden/core/logger.hpp>

namespace warden {

Json HostTool::to_json() const {
    Json j = Json::object();
    j["name"] = name;
    j["identifier"] = ToolRegistry::to_guest_identifier(name);
    j["description"] = description;

    Json params_json = Json::array();
    for (size_t i = 0; i < params.size(); ++i) {
        Json p = Json::object();
        p["name"] = params[i].name;
        p["type"] = params[i].type;
        p["description"] = params[i].description;
        p["required"] = params[i].required;
        params_json.push_back(p);
    }
    j["params"] = params_json;
    return j;
}

std::string ToolRegistry::to_guest_identifier(const std::string& host_name) {
    std::string id = host_name;
    for (size_t i = 0; i < id.size(); ++i) {
        char c = id[i];
        if (c == '.' || c == '/' || c == '-' || c == ':') {
            id[i] = '_';
        }
    }
    return id;
}

void ToolRegistry::register_tool(const HostTool& tool) {
    if (tool.name.empty()) {
        throw ToolRegistryError("tool name must not be empty");
    }

    std::string id = to_guest_identifier(tool.name);
    std::map<std::string, std::string>::const_iterator existing = identifiers_.find(id);
    if (existing != identifiers_.end()) {
        if (existing->second == tool.name) {
            throw ToolRegistryError("tool '" + tool.name + "' is already registered");
        }
        throw ToolRegistryError("tools '" + existing->second + "' and '" + tool.name +
                                "' both map to identifier '" + id + "'");
    }

    identifiers_[id] = tool.name;
    tools_[tool.name] = tool;
    LOG_DEBUG("[ToolRegistry] Registered %s as %s", tool.name.c_str(), id.c_str());
}

void ToolRegistry::register_tool(const std::string& name, const std::string& desc, ToolHandler handler) {
    register_tool(HostTool(name, desc, handler));
}

const HostTool* ToolRegistry::find(const std::string& name) const {
    std::map<std::string, HostTool>::const_iterator it = tools_.find(name);
    if (it == tools_.end()) return nullptr;
    return &it->second;
}

ToolBindings ToolRegistry::bindings() const {
    return identifiers_;
}

} // namespace warden

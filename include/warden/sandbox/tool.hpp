/*
 * warden C++17 - Host Tools
 *
 * Tools are implemented by the host and exposed to guests under a
 * normalized identifier: every '.', '/', '-' or ':' in the host name
 * becomes '_' ("stripe/charges.create" -> "stripe_charges_create").
 * Two host names that normalize to the same identifier cannot both be
 * registered.
 */
#ifndef warden_SANDBOX_TOOL_HPP
#define warden_SANDBOX_TOOL_HPP

#include <warden/core/json.hpp>
#include <warden/runtime/environment.hpp>
#include <functional>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

namespace warden {

// Result of running a host tool
struct ToolOutcome {
    bool success;
    Json value;
    std::string error;

    ToolOutcome() : success(false) {}

    static ToolOutcome ok(const Json& value) {
        ToolOutcome r;
        r.success = true;
        r.value = value;
        return r;
    }

    static ToolOutcome fail(const std::string& err) {
        ToolOutcome r;
        r.success = false;
        r.error = err;
        return r;
    }
};

// (host method, args) -> outcome. May also throw; the sandbox converts
// exceptions into tool errors.
typedef std::function<ToolOutcome(const std::string& method, const Json& args)> ToolHandler;

struct ToolParamSchema {
    std::string name;
    std::string type;       // "string", "number", "boolean", "array", "object"
    std::string description;
    bool required;

    ToolParamSchema() : required(false) {}
    ToolParamSchema(const std::string& n, const std::string& t, const std::string& d, bool r = false)
        : name(n), type(t), description(d), required(r) {}
};

struct HostTool {
    std::string name;
    std::string description;
    std::vector<ToolParamSchema> params;
    ToolHandler execute;    // optional; falls back to the sandbox handler

    HostTool() {}
    HostTool(const std::string& n, const std::string& d, ToolHandler e = ToolHandler())
        : name(n), description(d), execute(e) {}

    Json to_json() const;
};

class ToolRegistryError : public std::runtime_error {
public:
    explicit ToolRegistryError(const std::string& what) : std::runtime_error(what) {}
};

class ToolRegistry {
public:
    ToolRegistry() {}

    // Throws ToolRegistryError on an empty name or identifier collision
    void register_tool(const HostTool& tool);
    void register_tool(const std::string& name, const std::string& desc,
                       ToolHandler handler = ToolHandler());

    // Lookup by host name
    const HostTool* find(const std::string& name) const;

    // Guest identifier -> host name for every registered tool
    ToolBindings bindings() const;

    const std::map<std::string, HostTool>& tools() const { return tools_; }
    size_t size() const { return tools_.size(); }

    static std::string to_guest_identifier(const std::string& host_name);

private:
    std::map<std::string, HostTool> tools_;         // host name -> tool
    std::map<std::string, std::string> identifiers_; // guest id -> host name
};

} // namespace warden

#endif // warden_SANDBOX_TOOL_HPP

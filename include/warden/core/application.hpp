/*
 * warden C++17 - Command Line Application
 *
 * Usage:
 *   warden [--config FILE] [--session ID] [--session-db PATH] <command> [args]
 *
 * Commands:
 *   caps                          list capabilities and remaining calls
 *   authorize <method> [args]     show the decision for one call (no quota used)
 *   run <plan.json>               execute a plan against the configured tools
 */
#ifndef warden_CORE_APPLICATION_HPP
#define warden_CORE_APPLICATION_HPP

#include <warden/core/config.hpp>
#include <warden/sandbox/sandbox.hpp>
#include <warden/store/session_store.hpp>
#include <memory>
#include <string>
#include <vector>

namespace warden {

struct AppInfo {
    static constexpr const char* NAME = "warden";
    static constexpr const char* VERSION = "0.3.0";
};

void print_usage(const char* prog);
void print_version();

// Fixture tools declared under "tools" in the config:
//   {"name": "weather.get", "response": {...}}   answer with a fixed value
//   {"name": "echo", "echo": true}               answer with the call args
//   {"name": "flaky", "error": "upstream down"}  fail with a tool error
ToolRegistry load_fixture_tools(const Json& tools);

class Application {
public:
    static Application& instance();

    // Parse arguments, load config, configure logging. Returns false when
    // the process should exit right away (see exit_code()).
    bool init(int argc, char* argv[]);
    int run();
    void shutdown();

    // Signal-safe: cancels the running execution
    void stop();

    int exit_code() const { return exit_code_; }
    const Config& config() const { return config_; }

private:
    Application();
    Application(const Application&);
    Application& operator=(const Application&);

    bool parse_args(int argc, char* argv[]);
    void setup_logging();
    bool setup_sandbox();
    bool open_store();

    int cmd_caps();
    int cmd_authorize();
    int cmd_run();

    Config config_;
    std::string config_file_;
    std::string session_id_;
    std::string session_db_;
    std::string command_;
    std::vector<std::string> args_;
    std::unique_ptr<Sandbox> sandbox_;
    std::unique_ptr<SessionStore> store_;
    int exit_code_;
};

} // namespace warden

#endif // warden_CORE_APPLICATION_HPP

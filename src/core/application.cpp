/*
 * Warden C++ - Application Implementation
 *
 * Config-driven front end over Sandbox for trying capability lists and
 * plans from the shell.
 */
#include <warden/core/application.hpp>
#include <warden/capability/pattern.hpp>
#include <warden/core/logger.hpp>
#include <warden/core/utils.hpp>
#include <warden/runtime/task.hpp>

#include <iostream>
#include <fstream>
#include <sstream>
#include <csignal>
#include <cstring>
#include <unistd.h>

namespace warden {

// ============================================================================
// Utility Functions
// ============================================================================

void print_usage(const char* prog) {
    std::cout << AppInfo::NAME << " - capability-checked guest execution\n\n"
              << "Usage: " << prog << " [options] <command> [args]\n\n"
              << "Commands:\n"
              << "  caps                        List capabilities and remaining calls\n"
              << "  authorize <method> [args]   Decide one call without using quota\n"
              << "  run <plan.json>             Execute a plan against the configured tools\n\n"
              << "Options:\n"
              << "  --config FILE      Configuration file (default: config.json)\n"
              << "  --session ID       Session id for --session-db\n"
              << "  --session-db PATH  Restore and save session state in PATH\n"
              << "  -h, --help         Show this help message\n"
              << "  -v, --version      Show version\n\n"
              << "Example:\n"
              << "  " << prog << " --config config.json authorize stripe/charges/create '{\"amount\": 500}'\n";
}

void print_version() {
    std::cout << AppInfo::NAME << " v" << AppInfo::VERSION << "\n";
}

ToolRegistry load_fixture_tools(const Json& tools) {
    ToolRegistry registry;
    if (!tools.is_array()) {
        return registry;
    }

    for (size_t i = 0; i < tools.size(); ++i) {
        const Json& t = tools[i];
        if (!t.is_object() || !t.contains("name") || !t["name"].is_string()) {
            LOG_WARN("[App] Skipping tools[%zu]: missing 'name'", i);
            continue;
        }

        std::string name = t["name"].get<std::string>();
        std::string desc = t.value("description", std::string("fixture tool"));
        ToolHandler handler;

        if (t.contains("error")) {
            std::string message = t["error"].is_string() ? t["error"].get<std::string>() : t["error"].dump();
            handler = [message](const std::string&, const Json&) {
                return ToolOutcome::fail(message);
            };
        } else if (t.value("echo", false)) {
            handler = [](const std::string&, const Json& args) {
                return ToolOutcome::ok(args);
            };
        } else {
            Json response = t.contains("response") ? t["response"] : Json();
            handler = [response](const std::string&, const Json&) {
                return ToolOutcome::ok(response);
            };
        }

        registry.register_tool(name, desc, handler);
    }
    return registry;
}

namespace {

bool read_text_file(const std::string& path, std::string& out) {
    std::ifstream file(path.c_str(), std::ios::in | std::ios::binary);
    if (!file) return false;
    std::ostringstream ss;
    ss << file.rdbuf();
    out = ss.str();
    return true;
}

std::string pretty(const Json& j) {
    return j.dump(2, ' ', false, Json::error_handler_t::replace);
}

void signal_handler(int sig) {
    (void)sig;
    Application::instance().stop();
}

} // anonymous namespace

// ============================================================================
// Application Implementation
// ============================================================================

Application& Application::instance() {
    static Application app;
    return app;
}

Application::Application()
    : config_file_("config.json")
    , exit_code_(0)
{}

bool Application::parse_args(int argc, char* argv[]) {
    for (int i = 1; i < argc; ++i) {
        if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
            print_usage(argv[0]);
            return false;
        }
        if (strcmp(argv[i], "-v") == 0 || strcmp(argv[i], "--version") == 0) {
            print_version();
            return false;
        }
        if (strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            config_file_ = std::string(argv[++i]);
            continue;
        }
        if (strcmp(argv[i], "--session") == 0 && i + 1 < argc) {
            session_id_ = std::string(argv[++i]);
            continue;
        }
        if (strcmp(argv[i], "--session-db") == 0 && i + 1 < argc) {
            session_db_ = std::string(argv[++i]);
            continue;
        }
        if (command_.empty()) {
            command_ = argv[i];
        } else {
            args_.push_back(argv[i]);
        }
    }

    if (command_.empty()) {
        print_usage(argv[0]);
        exit_code_ = 2;
        return false;
    }
    return true;
}

void Application::setup_logging() {
    Logger::instance().set_level(log_level_from_string(config_.get_string("log_level", "info")));
    Logger::instance().set_color(isatty(STDERR_FILENO) != 0);
}

bool Application::setup_sandbox() {
    std::vector<MethodCapability> caps;
    ToolRegistry tools;
    try {
        caps = parse_capabilities(config_.get_json("capabilities"),
                                  config_.get_int("default_max_calls", UNLIMITED_CALLS));
        tools = load_fixture_tools(config_.get_json("tools"));

        SandboxConfig sandbox_config = SandboxConfig::from_config(config_);
        if (!session_id_.empty()) {
            sandbox_config.session_id = session_id_;
        }
        sandbox_.reset(new Sandbox(tools, caps, ToolHandler(), sandbox_config));
    } catch (const PatternConfigError& e) {
        LOG_ERROR("Invalid capability configuration: %s", e.what());
        return false;
    } catch (const ToolRegistryError& e) {
        LOG_ERROR("Invalid tool configuration: %s", e.what());
        return false;
    }
    return true;
}

bool Application::open_store() {
    std::string path = session_db_.empty() ? config_.get_string("store.path", "") : session_db_;
    if (path.empty()) {
        return true;
    }

    store_.reset(new SessionStore());
    if (!store_->open(path)) {
        LOG_ERROR("Cannot open session store %s: %s", path.c_str(), store_->last_error().c_str());
        return false;
    }
    if (!store_->load_session(sandbox_->session().id(), sandbox_->session())) {
        LOG_ERROR("Cannot restore session %s: %s",
                  sandbox_->session().id().c_str(), store_->last_error().c_str());
        return false;
    }
    return true;
}

bool Application::init(int argc, char* argv[]) {
    if (!parse_args(argc, argv)) {
        return false;
    }

    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);

    if (!config_.load_file(config_file_)) {
        LOG_ERROR("Failed to load config from %s: %s", config_file_.c_str(), config_.last_error().c_str());
        exit_code_ = 2;
        return false;
    }
    setup_logging();
    LOG_DEBUG("%s v%s, config %s", AppInfo::NAME, AppInfo::VERSION, config_file_.c_str());

    if (!setup_sandbox() || !open_store()) {
        exit_code_ = 2;
        return false;
    }
    return true;
}

int Application::run() {
    if (command_ == "caps") {
        return cmd_caps();
    }
    if (command_ == "authorize") {
        return cmd_authorize();
    }
    if (command_ == "run") {
        return cmd_run();
    }

    std::cerr << "Unknown command: " << command_ << "\n";
    return 2;
}

void Application::stop() {
    if (sandbox_) {
        sandbox_->cancel();
    }
}

void Application::shutdown() {
    if (store_ && sandbox_) {
        if (!store_->save_session(sandbox_->session())) {
            LOG_ERROR("Failed to save session %s: %s",
                      sandbox_->session().id().c_str(), store_->last_error().c_str());
        }
    }
    if (store_) {
        store_->close();
    }
    sandbox_.reset();
    LOG_DEBUG("Shut down");
}

// ============================================================================
// Commands
// ============================================================================

int Application::cmd_caps() {
    const std::vector<MethodCapability>& caps = sandbox_->session().capabilities().capabilities();

    Json out = Json::array();
    for (size_t i = 0; i < caps.size(); ++i) {
        Json entry = caps[i].to_json();
        entry["key"] = caps[i].key();
        int64_t remaining = 0;
        if (sandbox_->remaining_calls(caps[i].key(), remaining)) {
            entry["remaining"] = remaining == UNLIMITED_CALLS ? Json() : Json(remaining);
        }
        out.push_back(entry);
    }

    std::cout << pretty(out) << std::endl;
    return 0;
}

int Application::cmd_authorize() {
    if (args_.empty()) {
        std::cerr << "authorize: missing <method>\n";
        return 2;
    }

    const std::string& method = args_[0];
    Json args = Json::object();
    if (args_.size() > 1) {
        args = Json::parse(args_[1], nullptr, false);
        if (args.is_discarded() || !args.is_object()) {
            std::cerr << "authorize: arguments must be a JSON object\n";
            return 2;
        }
    }

    AuthorizationResult auth = sandbox_->check(method, args);

    Json out = Json::object();
    out["method"] = method;
    out["allowed"] = auth.success;
    if (auth.success) {
        Json grant = Json::object();
        grant["capability"] = auth.grant.capability_key;
        grant["calls_used"] = auth.grant.calls_used;
        grant["remaining"] = auth.grant.remaining == UNLIMITED_CALLS ? Json() : Json(auth.grant.remaining);
        out["grant"] = grant;
    } else {
        out["error"] = auth.error.to_json();
    }

    std::cout << pretty(out) << std::endl;
    return auth.success ? 0 : 1;
}

int Application::cmd_run() {
    if (args_.empty()) {
        std::cerr << "run: missing <plan.json>\n";
        return 2;
    }

    std::string text;
    if (!read_text_file(args_[0], text)) {
        LOG_ERROR("Cannot read plan %s", args_[0].c_str());
        return 2;
    }
    Json plan_json = Json::parse(text, nullptr, false);
    if (plan_json.is_discarded()) {
        LOG_ERROR("Plan %s is not valid JSON", args_[0].c_str());
        return 2;
    }

    Plan plan;
    std::string error;
    if (!Plan::from_json(plan_json, plan, error)) {
        LOG_ERROR("Invalid plan %s: %s", args_[0].c_str(), error.c_str());
        return 2;
    }

    LOG_INFO("Running %zu step plan in session %s",
             plan.steps.size(), sandbox_->session().id().c_str());
    ExecutionResult result = sandbox_->execute(make_plan_task(plan));

    Json out = result.to_json();
    out["session_id"] = sandbox_->session().id();
    std::cout << pretty(out) << std::endl;
    return result.success ? 0 : 1;
}

} // namespace warden

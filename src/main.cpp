/*
 * Warden C++17 - Capability-checked guest execution
 *
 * Usage:
 *   ./warden [--config config.json] caps
 *   ./warden [--config config.json] authorize <method> [args-json]
 *   ./warden [--config config.json] [--session-db sessions.db] run plan.json
 */
#include <warden/core/application.hpp>

int main(int argc, char* argv[]) {
    auto& app = warden::Application::instance();

    if (!app.init(argc, argv)) {
        // init returns false for --help/--version or fatal errors
        return app.exit_code();
    }

    int result = app.run();
    app.shutdown();

    return result;
}

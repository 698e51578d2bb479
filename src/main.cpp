/*
 * AirGap C++ - Read-only, audited filesystem access
 *
 * Usage:
 *   ./airgap --config airgap.json < requests.jsonl
 *   ./airgap --config airgap.json --call list_dir '{"path": "/srv/docs"}'
 */
#include <airgap/core/application.hpp>

int main(int argc, char* argv[]) {
    auto& app = airgap::Application::instance();

    if (!app.init(argc, argv)) {
        // init returns false for --help/--version or fatal errors
        return app.exit_code();
    }

    int result = app.run();
    app.shutdown();

    return result;
}

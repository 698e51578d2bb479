/*
 * AirGap C++ - Application
 *
 * Process lifecycle for the `airgap` command: argument parsing, config and
 * logging setup, and the JSON-lines request loop.
 *
 * Request:  {"tool": "read_file", "arguments": {"path": "..."}}
 * Response: {"tool": "read_file", "success": true, "result": {...}}
 *           {"tool": "read_file", "success": false, "error": "..."}
 */
#ifndef airgap_CORE_APPLICATION_HPP
#define airgap_CORE_APPLICATION_HPP

#include "config.hpp"
#include "airgap_tools.hpp"
#include "json.hpp"
#include <string>
#include <iosfwd>

namespace airgap {

struct AppInfo {
    static constexpr const char* NAME = "airgap";
    static constexpr const char* VERSION = "1.0.0";
};

void print_usage(const char* prog);
void print_version();

class Application {
public:
    static Application& instance();

    // Returns false when the process should exit without run():
    // after --help/--version (exit_code 0) or on a fatal error (exit_code 1)
    bool init(int argc, char* argv[]);
    int run();
    void shutdown();

    // Handle one request line and build the response object
    Json handle_request(const std::string& line);

    // Serve requests from `in` until EOF, one response line per request
    int serve(std::istream& in, std::ostream& out);

    int exit_code() const { return exit_code_; }
    AirGapTools& tools() { return tools_; }

private:
    Application();
    Application(const Application&);
    Application& operator=(const Application&);

    bool parse_args(int argc, char* argv[]);
    bool setup_logging();

    Config config_;
    AirGapTools tools_;

    std::string config_file_;
    std::string log_level_;         // --log-level overrides config "log_level"
    bool list_tools_;
    bool single_call_;
    std::string call_tool_;
    std::string call_arguments_;
    int exit_code_;
};

} // namespace airgap

#endif // airgap_CORE_APPLICATION_HPP

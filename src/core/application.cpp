/*
 * AirGap C++ - Application Implementation
 */
#include <airgap/core/application.hpp>
#include <airgap/core/logger.hpp>
#include <airgap/core/utils.hpp>

#include <iostream>
#include <csignal>
#include <cstring>

namespace airgap {

// ============================================================================
// Utility Functions
// ============================================================================

void print_usage(const char* prog) {
    std::cout << AppInfo::NAME << " - Read-only audited filesystem access\n\n"
              << "Usage: " << prog << " [options]\n\n"
              << "Options:\n"
              << "  --config FILE        Load configuration from FILE (JSON)\n"
              << "  --log-level LEVEL    debug, info, warn or error\n"
              << "  --list-tools         Print tool descriptors and exit\n"
              << "  --call TOOL JSON     Run one tool with JSON arguments and exit\n"
              << "  -h, --help           Show this help message\n"
              << "  -v, --version        Show version\n\n"
              << "Without --call, requests are read from stdin, one JSON object per line:\n"
              << "  {\"tool\": \"list_dir\", \"arguments\": {\"path\": \"/srv/docs\"}}\n";
}

void print_version() {
    std::cout << AppInfo::NAME << " v" << AppInfo::VERSION << "\n";
}

// ============================================================================
// Application Implementation
// ============================================================================

Application& Application::instance() {
    static Application app;
    return app;
}

Application::Application()
    : list_tools_(false)
    , single_call_(false)
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
        if (strcmp(argv[i], "--log-level") == 0 && i + 1 < argc) {
            log_level_ = std::string(argv[++i]);
            continue;
        }
        if (strcmp(argv[i], "--list-tools") == 0) {
            list_tools_ = true;
            continue;
        }
        if (strcmp(argv[i], "--call") == 0 && i + 2 < argc) {
            single_call_ = true;
            call_tool_ = std::string(argv[++i]);
            call_arguments_ = std::string(argv[++i]);
            continue;
        }

        std::cerr << "Unknown or incomplete option: " << argv[i] << "\n\n";
        print_usage(argv[0]);
        exit_code_ = 1;
        return false;
    }
    return true;
}

bool Application::setup_logging() {
    std::string name = log_level_.empty() ? config_.get_string("log_level", "info") : log_level_;

    LogLevel level;
    if (!parse_log_level(name, level)) {
        LOG_ERROR("Invalid log level: %s", name.c_str());
        return false;
    }
    Logger::instance().set_level(level);
    return true;
}

bool Application::init(int argc, char* argv[]) {
    if (!parse_args(argc, argv)) {
        return false;
    }

    // A closed stdout must surface as a write error, not kill the process
    signal(SIGPIPE, SIG_IGN);

    if (!config_file_.empty()) {
        if (!config_.load_file(config_file_)) {
            LOG_ERROR("Failed to load config from %s: %s",
                      config_file_.c_str(), config_.last_error().c_str());
            exit_code_ = 1;
            return false;
        }
    }

    if (!setup_logging()) {
        exit_code_ = 1;
        return false;
    }

    LOG_INFO("%s v%s starting...", AppInfo::NAME, AppInfo::VERSION);
    if (!config_file_.empty()) {
        LOG_INFO("Loaded config from %s", config_file_.c_str());
    }

    if (list_tools_) {
        return true;
    }

    if (!tools_.init(config_)) {
        exit_code_ = 1;
        return false;
    }
    LOG_INFO("Loaded tool provider: %s v%s (%s)",
             tools_.name(), tools_.version(), tools_.description());
    return true;
}

Json Application::handle_request(const std::string& line) {
    Json response;
    response["tool"] = Json();

    Json request;
    try {
        request = Json::parse(line);
    } catch (const Json::parse_error& e) {
        response["success"] = false;
        response["error"] = std::string("Invalid JSON: ") + e.what();
        return response;
    }

    if (!request.is_object() || !request.contains("tool") || !request["tool"].is_string()) {
        response["success"] = false;
        response["error"] = "Request must be an object with a string \"tool\" field";
        return response;
    }

    std::string tool = request["tool"].get<std::string>();
    response["tool"] = tool;

    Json arguments = Json::object();
    if (request.contains("arguments") && !request["arguments"].is_null()) {
        arguments = request["arguments"];
    }

    LOG_DEBUG("[App] Request: %s", tool.c_str());
    ToolResult result = tools_.execute(tool, arguments);

    response["success"] = result.success;
    if (result.success) {
        response["result"] = result.data;
    } else {
        response["error"] = result.error;
    }
    return response;
}

int Application::serve(std::istream& in, std::ostream& out) {
    std::string line;
    size_t served = 0;

    while (std::getline(in, line)) {
        if (trim(line).empty()) continue;

        Json response = handle_request(line);
        out << response.dump(-1, ' ', false, Json::error_handler_t::replace) << "\n";
        out.flush();
        if (!out) {
            LOG_ERROR("Failed to write response, stopping");
            return 1;
        }
        ++served;
    }

    LOG_DEBUG("[App] Input closed after %zu requests", served);
    return 0;
}

int Application::run() {
    if (list_tools_) {
        Json list = Json::array();
        std::vector<ToolDescriptor> tools = tools_.descriptors();
        for (size_t i = 0; i < tools.size(); ++i) {
            list.push_back(tools[i].to_json());
        }
        std::cout << list.dump(2) << std::endl;
        return 0;
    }

    if (single_call_) {
        Json request;
        request["tool"] = call_tool_;
        try {
            request["arguments"] = Json::parse(call_arguments_);
        } catch (const Json::parse_error& e) {
            LOG_ERROR("Invalid JSON arguments for --call: %s", e.what());
            return 1;
        }

        Json response = handle_request(request.dump());
        std::cout << response.dump(2, ' ', false, Json::error_handler_t::replace) << std::endl;
        return response["success"].get<bool>() ? 0 : 1;
    }

    LOG_INFO("Serving requests on stdin");
    return serve(std::cin, std::cout);
}

void Application::shutdown() {
    tools_.shutdown();
    LOG_INFO("Goodbye!");
}

} // namespace airgap

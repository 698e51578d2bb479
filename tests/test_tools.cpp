#include <airgap/core/airgap_tools.hpp>
#include <airgap/core/application.hpp>
#include "test_helpers.hpp"

#include <gtest/gtest.h>

#include <sstream>

using namespace airgap;
using namespace airgap::test;

namespace {

Config make_config(const std::string& root, const std::string& audit_path) {
    Json doc;
    doc["airgap"]["allowed_roots"] = Json::array({root});
    doc["airgap"]["audit_log_path"] = audit_path;
    doc["search"]["prefer_ripgrep"] = false;

    Config cfg;
    EXPECT_TRUE(cfg.load_string(doc.dump()));
    return cfg;
}

} // anonymous namespace

class AirGapToolsTest : public ::testing::Test {
protected:
    void SetUp() override {
        tree_.make_dir("root");
        root_ = tree_.path("root");
        tree_.write_file("root/notes.txt", "alpha\nbeta\n");
        ASSERT_TRUE(tools_.init(make_config(root_, tree_.path("audit.jsonl"))))
            << tools_.last_error();
    }

    void TearDown() override {
        tools_.shutdown();
    }

    QuietLogs quiet_;
    TempTree tree_;
    std::string root_;
    AirGapTools tools_;
};

TEST_F(AirGapToolsTest, InitAppliesConfiguration) {
    EXPECT_TRUE(tools_.is_initialized());
    ASSERT_EQ(tools_.config().allowed_roots.size(), 1u);
    EXPECT_EQ(tools_.config().allowed_roots[0], root_);
    EXPECT_FALSE(tools_.config().prefer_ripgrep);
    EXPECT_STREQ(tools_.name(), "airgap");
}

TEST_F(AirGapToolsTest, AdvertisesFourActions) {
    std::vector<std::string> actions = tools_.actions();
    ASSERT_EQ(actions.size(), 4u);
    EXPECT_EQ(actions[0], "read_file");
    EXPECT_EQ(actions[3], "redact_preview");

    std::vector<ToolDescriptor> descriptors = tools_.descriptors();
    ASSERT_EQ(descriptors.size(), actions.size());
    for (size_t i = 0; i < actions.size(); ++i) {
        EXPECT_EQ(descriptors[i].name, actions[i]);
    }

    Json j = descriptors[2].to_json();
    EXPECT_EQ(j["name"], "search_text");
    EXPECT_EQ(j["parameters"]["type"], "object");
    EXPECT_EQ(j["parameters"]["properties"]["pattern"]["type"], "string");
    ASSERT_EQ(j["parameters"]["required"].size(), 2u);
}

TEST_F(AirGapToolsTest, ReadFile) {
    Json params;
    params["path"] = root_ + "/notes.txt";
    params["offset"] = 6;

    ToolResult r = tools_.execute("read_file", params);
    ASSERT_TRUE(r.success) << r.error;
    EXPECT_EQ(r.data["content"], "beta\n");
    EXPECT_EQ(r.data["bytes_read"], 5);
    EXPECT_TRUE(r.data["error"].is_null());
}

TEST_F(AirGapToolsTest, ReadFileRejectsNegativeLimit) {
    Json params;
    params["path"] = root_ + "/notes.txt";
    params["limit"] = -5;

    ToolResult r = tools_.execute("read_file", params);
    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.error, "limit must be non-negative");
}

TEST_F(AirGapToolsTest, DeniedReadReportsError) {
    Json params;
    params["path"] = "/etc/passwd";

    ToolResult r = tools_.execute("read_file", params);
    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.error.find("Access denied"), 0u);
}

TEST_F(AirGapToolsTest, ListDir) {
    Json params;
    params["path"] = root_;

    ToolResult r = tools_.execute("list_dir", params);
    ASSERT_TRUE(r.success) << r.error;
    ASSERT_EQ(r.data["entries"].size(), 1u);
    EXPECT_EQ(r.data["entries"][0]["name"], "notes.txt");
    EXPECT_EQ(r.data["entries"][0]["size"], 11);
}

TEST_F(AirGapToolsTest, SearchText) {
    Json params;
    params["root_path"] = root_;
    params["pattern"] = "be.a";

    ToolResult r = tools_.execute("search_text", params);
    ASSERT_TRUE(r.success) << r.error;
    EXPECT_EQ(r.data["method"], "embedded");
    ASSERT_EQ(r.data["matches"].size(), 1u);
    EXPECT_EQ(r.data["matches"][0]["line_number"], 2);
}

TEST_F(AirGapToolsTest, RedactPreview) {
    Json params;
    params["content"] = "ssn 123-45-6789";

    ToolResult r = tools_.execute("redact_preview", params);
    ASSERT_TRUE(r.success);
    EXPECT_EQ(r.data["content"], "ssn <REDACTED_SSN>");
    EXPECT_EQ(r.data["redactions_applied"], 1);
}

TEST_F(AirGapToolsTest, RejectsBadArguments) {
    ToolResult r = tools_.execute("read_file", Json::object());
    EXPECT_EQ(r.error, "Missing required parameter: path");

    Json params;
    params["path"] = 42;
    r = tools_.execute("read_file", params);
    EXPECT_EQ(r.error, "Parameter 'path' must be of type string");

    params["path"] = root_ + "/notes.txt";
    params["offset"] = "zero";
    r = tools_.execute("read_file", params);
    EXPECT_EQ(r.error, "Parameter 'offset' must be of type integer");

    r = tools_.execute("list_dir", Json::array());
    EXPECT_EQ(r.error, "arguments must be an object");

    r = tools_.execute("write_file", Json::object());
    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.error, "Unknown action: write_file");
}

TEST(AirGapToolsInitTest, InvalidConfigurationFails) {
    QuietLogs quiet;
    Config cfg;
    ASSERT_TRUE(cfg.load_string(R"({"airgap": {"max_results": -1}})"));

    AirGapTools tools;
    EXPECT_FALSE(tools.init(cfg));
    EXPECT_FALSE(tools.is_initialized());
    EXPECT_NE(tools.last_error().find("max_results"), std::string::npos);
}

TEST(AirGapToolsInitTest, FileToolsNeedInit) {
    AirGapTools tools;

    Json params;
    params["path"] = "/tmp";
    ToolResult r = tools.execute("list_dir", params);
    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.error, "AirGap tools are not initialized");

    Json text;
    text["content"] = "nothing secret";
    r = tools.execute("redact_preview", text);
    EXPECT_TRUE(r.success);
    EXPECT_EQ(r.data["redactions_applied"], 0);
}

class ApplicationTest : public ::testing::Test {
protected:
    void SetUp() override {
        tree_.make_dir("root");
        root_ = tree_.path("root");
        tree_.write_file("root/a.txt", "hello\n");
        ASSERT_TRUE(app().tools().init(make_config(root_, "")));
    }

    void TearDown() override {
        app().tools().shutdown();
    }

    static Application& app() { return Application::instance(); }

    QuietLogs quiet_;
    TempTree tree_;
    std::string root_;
};

TEST_F(ApplicationTest, HandlesToolRequest) {
    Json request;
    request["tool"] = "read_file";
    request["arguments"]["path"] = root_ + "/a.txt";

    Json response = app().handle_request(request.dump());
    EXPECT_EQ(response["tool"], "read_file");
    EXPECT_TRUE(response["success"].get<bool>());
    EXPECT_EQ(response["result"]["content"], "hello\n");
    EXPECT_FALSE(response.contains("error"));
}

TEST_F(ApplicationTest, ReportsToolFailure) {
    Json request;
    request["tool"] = "read_file";
    request["arguments"]["path"] = root_ + "/missing.txt";

    Json response = app().handle_request(request.dump());
    EXPECT_FALSE(response["success"].get<bool>());
    EXPECT_TRUE(response["error"].is_string());
    EXPECT_FALSE(response.contains("result"));
}

TEST_F(ApplicationTest, RejectsMalformedRequests) {
    Json response = app().handle_request("{not json");
    EXPECT_FALSE(response["success"].get<bool>());
    EXPECT_TRUE(response["tool"].is_null());
    EXPECT_EQ(response["error"].get<std::string>().find("Invalid JSON"), 0u);

    response = app().handle_request(R"({"arguments": {}})");
    EXPECT_FALSE(response["success"].get<bool>());
    EXPECT_EQ(response["error"], "Request must be an object with a string \"tool\" field");

    response = app().handle_request("[1, 2]");
    EXPECT_FALSE(response["success"].get<bool>());
}

TEST_F(ApplicationTest, ServesOneResponsePerRequestLine) {
    std::string input =
        "{\"tool\": \"redact_preview\", \"arguments\": {\"content\": \"x\"}}\n"
        "\n"
        "garbage\n"
        "{\"tool\": \"list_dir\", \"arguments\": {\"path\": \"" + root_ + "\"}}\n";
    std::istringstream in(input);
    std::ostringstream out;

    EXPECT_EQ(app().serve(in, out), 0);

    std::vector<std::string> lines;
    std::istringstream reader(out.str());
    std::string line;
    while (std::getline(reader, line)) lines.push_back(line);

    ASSERT_EQ(lines.size(), 3u);
    EXPECT_TRUE(Json::parse(lines[0])["success"].get<bool>());
    EXPECT_FALSE(Json::parse(lines[1])["success"].get<bool>());
    EXPECT_EQ(Json::parse(lines[2])["tool"], "list_dir");
    EXPECT_TRUE(Json::parse(lines[2])["success"].get<bool>());
}

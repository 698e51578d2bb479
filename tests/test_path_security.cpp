#include <airgap/core/path_security.hpp>
#include "test_helpers.hpp"

#include <gtest/gtest.h>

#include <unistd.h>

using namespace airgap;
using namespace airgap::test;

class PathSecurityTest : public ::testing::Test {
protected:
    void SetUp() override {
        tree_.make_dir("root");
        tree_.make_dir("root/sub");
        tree_.make_dir("outside");
        tree_.make_dir("root2");
        tree_.write_file("root/readme.txt", "hello\n");
        tree_.write_file("root/sub/notes.md", "notes\n");
        tree_.write_file("outside/secret.txt", "secret\n");
        tree_.write_file("root2/other.txt", "other\n");

        root_ = tree_.path("root");
        config_ = config_for(root_);
    }

    TempTree tree_;
    std::string root_;
    AirGapConfig config_;
};

TEST_F(PathSecurityTest, NoRootsDeniesEverything) {
    QuietLogs quiet;
    AirGapConfig empty;
    PathSecurityContext ctx(empty);

    PathValidationResult r = ctx.validate_path(root_ + "/readme.txt");
    EXPECT_FALSE(r.allowed);
    EXPECT_EQ(r.denial_reason, PathDenialReason::OUTSIDE_ALLOWED_ROOTS);
    EXPECT_EQ(r.denial_detail, "no allowed roots configured");
    EXPECT_FALSE(ctx.is_path_accessible("/"));
}

TEST_F(PathSecurityTest, DropsRootsThatAreNotDirectories) {
    QuietLogs quiet;
    AirGapConfig cfg;
    cfg.allowed_roots.push_back(tree_.path("does-not-exist"));
    cfg.allowed_roots.push_back(tree_.path("root/readme.txt"));
    cfg.allowed_roots.push_back(root_);

    PathSecurityContext ctx(cfg);
    ASSERT_EQ(ctx.allowed_roots().size(), 1u);
    EXPECT_EQ(ctx.allowed_roots()[0], root_);
}

TEST_F(PathSecurityTest, AllowsPathsInsideRoot) {
    PathSecurityContext ctx(config_);

    PathValidationResult r = ctx.validate_path(root_ + "/sub/notes.md");
    EXPECT_TRUE(r.allowed);
    EXPECT_EQ(r.canonical_path, root_ + "/sub/notes.md");
    EXPECT_EQ(r.denial_reason, PathDenialReason::NONE);

    EXPECT_TRUE(ctx.is_path_accessible(root_));
    EXPECT_TRUE(ctx.is_path_accessible(root_ + "/./sub//notes.md"));
}

TEST_F(PathSecurityTest, MissingPathInsideRootIsAllowed) {
    PathSecurityContext ctx(config_);
    PathValidationResult r = ctx.validate_path(root_ + "/sub/not-yet/file.txt");
    EXPECT_TRUE(r.allowed);
    EXPECT_EQ(r.canonical_path, root_ + "/sub/not-yet/file.txt");
}

TEST_F(PathSecurityTest, TraversalIsDetectedBeforeAnythingElse) {
    PathSecurityContext ctx(config_);

    PathValidationResult r = ctx.validate_path(root_ + "/sub/../readme.txt");
    EXPECT_FALSE(r.allowed);
    EXPECT_EQ(r.denial_reason, PathDenialReason::TRAVERSAL_DETECTED);

    r = ctx.validate_path("../../etc/passwd");
    EXPECT_EQ(r.denial_reason, PathDenialReason::TRAVERSAL_DETECTED);

    r = ctx.validate_path_no_follow(root_ + "/..");
    EXPECT_EQ(r.denial_reason, PathDenialReason::TRAVERSAL_DETECTED);

    // Dots inside a name are not traversal
    EXPECT_TRUE(ctx.validate_path(root_ + "/file..txt").allowed);
}

TEST_F(PathSecurityTest, OutsideRootsIsDenied) {
    PathSecurityContext ctx(config_);

    PathValidationResult r = ctx.validate_path(tree_.path("outside/secret.txt"));
    EXPECT_FALSE(r.allowed);
    EXPECT_EQ(r.denial_reason, PathDenialReason::OUTSIDE_ALLOWED_ROOTS);
    EXPECT_EQ(r.denial_detail, "path is outside allowed roots");

    EXPECT_FALSE(ctx.is_path_accessible("/etc/hostname"));
}

TEST_F(PathSecurityTest, PrefixSiblingIsNotInsideRoot) {
    tree_.make_dir("rootling");
    tree_.write_file("rootling/x.txt", "x");
    PathSecurityContext ctx(config_);

    PathValidationResult r = ctx.validate_path(tree_.path("rootling/x.txt"));
    EXPECT_FALSE(r.allowed);
    EXPECT_EQ(r.denial_reason, PathDenialReason::OUTSIDE_ALLOWED_ROOTS);
    EXPECT_FALSE(ctx.is_under_allowed_root(root_ + "ling"));
    EXPECT_TRUE(ctx.is_under_allowed_root(root_));
}

TEST_F(PathSecurityTest, MultipleRoots) {
    config_.allowed_roots.push_back(tree_.path("root2"));
    PathSecurityContext ctx(config_);

    EXPECT_TRUE(ctx.is_path_accessible(tree_.path("root2/other.txt")));
    EXPECT_TRUE(ctx.is_path_accessible(root_ + "/readme.txt"));
    EXPECT_FALSE(ctx.is_path_accessible(tree_.path("outside/secret.txt")));
}

TEST_F(PathSecurityTest, RelativePathsResolveAgainstWorkingDirectory) {
    char saved[PATH_MAX];
    ASSERT_NE(getcwd(saved, sizeof(saved)), (char*)NULL);
    ASSERT_EQ(chdir(root_.c_str()), 0);

    PathSecurityContext ctx(config_);
    PathValidationResult r = ctx.validate_path("sub/notes.md");
    EXPECT_TRUE(r.allowed);
    EXPECT_EQ(r.canonical_path, root_ + "/sub/notes.md");

    ASSERT_EQ(chdir(saved), 0);
}

TEST_F(PathSecurityTest, BlockedPatternsMatchBasename) {
    tree_.write_file("root/.env", "KEY=1");
    tree_.write_file("root/server.pem", "pem");
    PathSecurityContext ctx(config_);

    PathValidationResult r = ctx.validate_path(root_ + "/.env");
    EXPECT_FALSE(r.allowed);
    EXPECT_EQ(r.denial_reason, PathDenialReason::BLOCKED_PATTERN);
    EXPECT_EQ(r.denial_detail, "matches blocked pattern: .env");

    EXPECT_EQ(ctx.validate_path(root_ + "/server.pem").denial_reason,
              PathDenialReason::BLOCKED_PATTERN);
    EXPECT_EQ(ctx.validate_path(root_ + "/sub/id_rsa.pub").denial_reason,
              PathDenialReason::BLOCKED_PATTERN);
    EXPECT_EQ(ctx.validate_path(root_ + "/.env.production").denial_reason,
              PathDenialReason::BLOCKED_PATTERN);

    // Case-sensitive: "*.pem" does not match ".PEM"
    EXPECT_TRUE(ctx.validate_path(root_ + "/server.PEM").allowed);
}

TEST_F(PathSecurityTest, SlashPatternsMatchAsSubstring) {
    PathSecurityContext ctx(config_);

    PathValidationResult r = ctx.validate_path(root_ + "/project/.git/config");
    EXPECT_FALSE(r.allowed);
    EXPECT_EQ(r.denial_reason, PathDenialReason::BLOCKED_PATTERN);
    EXPECT_EQ(ctx.match_blocked_pattern("/home/u/.aws/credentials"), "credentials");
    EXPECT_EQ(ctx.match_blocked_pattern("/home/u/.docker/config.json"), ".docker/config.json");
    EXPECT_EQ(ctx.match_blocked_pattern("/home/u/notes.txt"), "");
}

TEST_F(PathSecurityTest, BlockedPatternWinsOverBoundary) {
    PathSecurityContext ctx(config_);
    PathValidationResult r = ctx.validate_path("/definitely/elsewhere/.env");
    EXPECT_EQ(r.denial_reason, PathDenialReason::BLOCKED_PATTERN);
}

TEST_F(PathSecurityTest, CustomBlockedPatterns) {
    config_.blocked_patterns.clear();
    config_.blocked_patterns.push_back("*.log");
    tree_.write_file("root/.env", "KEY=1");
    PathSecurityContext ctx(config_);

    EXPECT_TRUE(ctx.validate_path(root_ + "/.env").allowed);
    EXPECT_EQ(ctx.validate_path(root_ + "/app.log").denial_reason,
              PathDenialReason::BLOCKED_PATTERN);
}

TEST_F(PathSecurityTest, SymlinkInsideRootIsFollowed) {
    tree_.make_symlink(root_ + "/sub/notes.md", "root/link-to-notes");
    PathSecurityContext ctx(config_);

    PathValidationResult r = ctx.validate_path(root_ + "/link-to-notes");
    EXPECT_TRUE(r.allowed);
    EXPECT_EQ(r.canonical_path, root_ + "/sub/notes.md");
}

TEST_F(PathSecurityTest, SymlinkEscapingRootIsDenied) {
    tree_.make_symlink(tree_.path("outside/secret.txt"), "root/escape");
    tree_.make_symlink("../outside", "root/escape-dir");
    PathSecurityContext ctx(config_);

    PathValidationResult r = ctx.validate_path(root_ + "/escape");
    EXPECT_FALSE(r.allowed);
    EXPECT_EQ(r.canonical_path, tree_.path("outside/secret.txt"));

    EXPECT_FALSE(ctx.validate_path(root_ + "/escape-dir/secret.txt").allowed);
}

TEST_F(PathSecurityTest, SymlinkToBlockedTargetIsDenied) {
    tree_.write_file("root/.env", "KEY=1");
    tree_.make_symlink(root_ + "/.env", "root/innocent.txt");
    PathSecurityContext ctx(config_);

    PathValidationResult r = ctx.validate_path(root_ + "/innocent.txt");
    EXPECT_FALSE(r.allowed);
    EXPECT_EQ(r.denial_reason, PathDenialReason::BLOCKED_PATTERN);
}

TEST_F(PathSecurityTest, NoFollowDoesNotDereference) {
    tree_.make_symlink(tree_.path("outside/secret.txt"), "root/escape");
    RecordingFileSystem fs;
    PathSecurityContext ctx(config_, fs);
    fs.clear();

    PathValidationResult r = ctx.validate_path_no_follow(root_ + "/escape");
    EXPECT_TRUE(r.allowed);
    EXPECT_EQ(r.canonical_path, root_ + "/escape");
    EXPECT_TRUE(fs.lstat_calls.empty());
    EXPECT_TRUE(fs.stat_calls.empty());
    EXPECT_TRUE(fs.readlink_calls.empty());

    EXPECT_TRUE(ctx.is_entry_in_allowed_scope(root_ + "/escape"));
    EXPECT_FALSE(ctx.is_path_accessible(root_ + "/escape"));
}

TEST_F(PathSecurityTest, SymlinkLoopDoesNotHang) {
    tree_.make_symlink(root_ + "/loop-b", "root/loop-a");
    tree_.make_symlink(root_ + "/loop-a", "root/loop-b");
    PathSecurityContext ctx(config_);

    PathValidationResult r = ctx.validate_path(root_ + "/loop-a");
    EXPECT_TRUE(r.canonical_path.find(root_) == 0);
}

TEST_F(PathSecurityTest, RootThroughSymlinkIsCanonicalized) {
    tree_.make_symlink(root_, "root-alias");
    AirGapConfig cfg = config_for(tree_.path("root-alias"));
    PathSecurityContext ctx(cfg);

    ASSERT_EQ(ctx.allowed_roots().size(), 1u);
    EXPECT_EQ(ctx.allowed_roots()[0], root_);
    EXPECT_TRUE(ctx.is_path_accessible(tree_.path("root-alias/readme.txt")));
}

TEST(PathDenialReasonTest, WireNames) {
    EXPECT_STREQ(denial_reason_str(PathDenialReason::OUTSIDE_ALLOWED_ROOTS), "outside_allowed_roots");
    EXPECT_STREQ(denial_reason_str(PathDenialReason::TRAVERSAL_DETECTED), "traversal_detected");
    EXPECT_STREQ(denial_reason_str(PathDenialReason::SYMLINK_ESCAPE), "symlink_escape");
    EXPECT_STREQ(denial_reason_str(PathDenialReason::BLOCKED_PATTERN), "blocked_pattern");
    EXPECT_STREQ(denial_reason_str(PathDenialReason::NOT_EXISTS), "not_exists");
    EXPECT_STREQ(denial_reason_str(PathDenialReason::PERMISSION_DENIED), "permission_denied");
    EXPECT_STREQ(denial_reason_str(PathDenialReason::NONE), "");
}

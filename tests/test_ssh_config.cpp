#include <gtest/gtest.h>
#include <ssh/ssh_config.hpp>
#include <core/config.hpp>
#include <platform/platform.hpp>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

class SshConfigTest : public ::testing::Test {
protected:
    fs::path test_dir;
    fs::path config_path;

    void SetUp() override {
        test_dir = fs::temp_directory_path() / "data_stream_ssh_config_test";
        fs::create_directories(test_dir);
        config_path = test_dir / "config";
    }

    void TearDown() override {
        fs::remove_all(test_dir);
    }

    void write_config(const std::string& content) {
        std::ofstream(config_path) << content;
    }
};

// ── Parsing ───────────────────────────────────────────────────

TEST(SshConfigParse, KeywordForms) {
    std::istringstream in(
        "# comment\n"
        "Host box\n"
        "    HostName box.example.org\n"
        "    user=alice\n"
        "    Port = 2222\n"
        "    IdentityFile \"/keys/with space\"\n");
    auto cfg = SshConfigFile::parse(in);
    auto opts = cfg.lookup("box");

    EXPECT_EQ(opts.get("HostName").value_or(""), "box.example.org");
    EXPECT_EQ(opts.get("user").value_or(""), "alice");
    EXPECT_EQ(opts.get("port").value_or(""), "2222");
    ASSERT_EQ(opts.identity_files.size(), 1u);
    EXPECT_EQ(opts.identity_files[0], "/keys/with space");
}

TEST(SshConfigParse, FirstValueWins) {
    std::istringstream in(
        "Host gpu-*\n"
        "    User first\n"
        "    IdentityFile /keys/a\n"
        "Host *\n"
        "    User fallback\n"
        "    Port 2200\n"
        "    IdentityFile /keys/b\n");
    auto opts = SshConfigFile::parse(in).lookup("gpu-01");

    EXPECT_EQ(opts.get("user").value_or(""), "first");
    EXPECT_EQ(opts.get("port").value_or(""), "2200");
    ASSERT_EQ(opts.identity_files.size(), 2u);
    EXPECT_EQ(opts.identity_files[0], "/keys/a");
    EXPECT_EQ(opts.identity_files[1], "/keys/b");
}

TEST(SshConfigParse, MatchBlocksSkipped) {
    std::istringstream in(
        "Match host box\n"
        "    User matched\n"
        "Host box\n"
        "    User plain\n");
    auto opts = SshConfigFile::parse(in).lookup("box");
    EXPECT_EQ(opts.get("user").value_or(""), "plain");
}

TEST(SshConfigParse, UnmatchedHost) {
    std::istringstream in("Host other\n    User x\n");
    auto opts = SshConfigFile::parse(in).lookup("box");
    EXPECT_FALSE(opts.get("user").has_value());
    EXPECT_TRUE(opts.identity_files.empty());
}

TEST(SshConfigParse, PatternNegation) {
    EXPECT_TRUE(host_patterns_match({"*.example.org"}, "a.example.org"));
    EXPECT_TRUE(host_patterns_match({"node?"}, "node7"));
    EXPECT_FALSE(host_patterns_match({"node?"}, "node10"));
    EXPECT_FALSE(host_patterns_match({"*", "!bastion"}, "bastion"));
    EXPECT_TRUE(host_patterns_match({"*", "!bastion"}, "worker"));
    EXPECT_FALSE(host_patterns_match({"!bastion"}, "worker"));
}

// ── Resolution ────────────────────────────────────────────────

TEST_F(SshConfigTest, AliasFromConfig) {
    write_config(
        "Host gpu-box\n"
        "    HostName 10.1.2.3\n"
        "    User researcher\n"
        "    Port 2022\n"
        "    IdentityFile ~/.ssh/id_%h\n");

    SshConfigResolver resolver(config_path);
    auto r = resolver.resolve_alias("gpu-box");
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.hostname, "10.1.2.3");
    EXPECT_EQ(r.value.username, "researcher");
    EXPECT_EQ(r.value.port, 2022);
    ASSERT_TRUE(r.value.key_path.has_value());
    EXPECT_EQ(*r.value.key_path, (platform::home_dir() / ".ssh" / "id_10.1.2.3").string());
    EXPECT_TRUE(r.value.from_ssh_config);
    EXPECT_EQ(r.value.alias, "gpu-box");
}

TEST_F(SshConfigTest, AliasHostnameDefaultsToAlias) {
    write_config("Host lab\n    User bob\n");

    SshConfigResolver resolver(config_path);
    auto r = resolver.resolve_alias("lab");
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.hostname, "lab");
    EXPECT_EQ(r.value.port, 22);
    EXPECT_FALSE(r.value.key_path.has_value());
}

TEST_F(SshConfigTest, MissingConfigFileIsNotFatal) {
    SshConfigResolver resolver(test_dir / "does-not-exist");
    auto r = resolver.resolve_alias("lab");
    if (platform::current_user().empty()) {
        EXPECT_TRUE(r.is_err());
    } else {
        ASSERT_TRUE(r.is_ok()) << r.error;
        EXPECT_EQ(r.value.hostname, "lab");
        EXPECT_EQ(r.value.username, platform::current_user());
    }
}

TEST_F(SshConfigTest, InvalidPort) {
    write_config("Host lab\n    User bob\n    Port ssh\n");
    SshConfigResolver resolver(config_path);
    auto r = resolver.resolve_alias("lab");
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::Config);
}

TEST_F(SshConfigTest, ExplicitParameters) {
    SshConfigResolver resolver(config_path);
    auto r = resolver.resolve_explicit("h.example", "carol", std::string("/keys/id_rsa"));
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.hostname, "h.example");
    EXPECT_EQ(r.value.username, "carol");
    EXPECT_EQ(r.value.key_path.value_or(""), "/keys/id_rsa");
    EXPECT_EQ(r.value.port, 22);
    EXPECT_FALSE(r.value.from_ssh_config);
}

TEST_F(SshConfigTest, ExplicitRequiresHostAndUser) {
    SshConfigResolver resolver(config_path);
    EXPECT_TRUE(resolver.resolve_explicit("", "carol", std::nullopt).is_err());
    EXPECT_TRUE(resolver.resolve_explicit("h.example", "", std::nullopt).is_err());
}

TEST_F(SshConfigTest, ResolveFromSettings) {
    write_config("Host lab\n    HostName lab.example.org\n    User bob\n");
    SshConfigResolver resolver(config_path);

    ProxySettings alias;
    alias.ssh_host_alias = "lab";
    auto a = resolver.resolve(alias);
    ASSERT_TRUE(a.is_ok()) << a.error;
    EXPECT_EQ(a.value.hostname, "lab.example.org");

    ProxySettings direct;
    direct.ssh_host = "direct.example.org";
    direct.ssh_username = "dave";
    direct.ssh_port = 2201;
    auto d = resolver.resolve(direct);
    ASSERT_TRUE(d.is_ok()) << d.error;
    EXPECT_EQ(d.value.hostname, "direct.example.org");
    EXPECT_EQ(d.value.port, 2201);

    ProxySettings neither;
    auto n = resolver.resolve(neither);
    ASSERT_TRUE(n.is_err());
    EXPECT_EQ(n.kind, ErrorKind::Config);
}

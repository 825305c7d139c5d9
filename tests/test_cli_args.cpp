#include <gtest/gtest.h>
#include <cli/args.hpp>
#include <vector>

static Result<CliOptions> parse(std::vector<const char*> args) {
    args.insert(args.begin(), "data-stream");
    return parse_args(static_cast<int>(args.size()), args.data());
}

TEST(CliArgs, AliasMode) {
    auto r = parse({"--ssh-host-alias", "gpu-box", "--data-path", "/srv/data"});
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_TRUE(r.value.alias_given);
    EXPECT_FALSE(r.value.host_given);

    ProxySettings s;
    ASSERT_TRUE(apply_cli(s, r.value).is_ok());
    EXPECT_EQ(s.ssh_host_alias.value_or(""), "gpu-box");
    EXPECT_EQ(s.data_path, "/srv/data");
}

TEST(CliArgs, ExplicitModeWithPorts) {
    auto r = parse({"--ssh-host", "h.example", "--ssh-username=carol",
                    "--ssh-key-path", "/keys/id", "--data-path", "/d",
                    "--local-port", "9100", "--remote-port", "9101", "--fastapi-port", "9102"});
    ASSERT_TRUE(r.is_ok()) << r.error;

    ProxySettings s;
    ASSERT_TRUE(apply_cli(s, r.value).is_ok());
    EXPECT_EQ(s.ssh_host.value_or(""), "h.example");
    EXPECT_EQ(s.ssh_username.value_or(""), "carol");
    EXPECT_EQ(s.ssh_key_path.value_or(""), "/keys/id");
    EXPECT_EQ(s.local_port, 9100);
    EXPECT_EQ(s.remote_port, 9101);
    EXPECT_EQ(s.listen_port, 9102);
}

TEST(CliArgs, AliasAndHostAreExclusive) {
    auto r = parse({"--ssh-host-alias", "a", "--ssh-host", "b"});
    ASSERT_TRUE(r.is_err());
    EXPECT_NE(r.error.find("not allowed"), std::string::npos);
}

TEST(CliArgs, MissingValue) {
    EXPECT_TRUE(parse({"--data-path"}).is_err());
}

TEST(CliArgs, UnknownFlag) {
    auto r = parse({"--frobnicate"});
    ASSERT_TRUE(r.is_err());
    EXPECT_NE(r.error.find("--frobnicate"), std::string::npos);
}

TEST(CliArgs, SwitchesAndConfig) {
    auto r = parse({"--verbose", "--strict-host-key-checking", "--config", "/etc/ds.yaml", "-h"});
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_TRUE(r.value.show_help);
    EXPECT_EQ(r.value.config_path.value_or(""), "/etc/ds.yaml");

    ProxySettings s;
    ASSERT_TRUE(apply_cli(s, r.value).is_ok());
    EXPECT_TRUE(s.verbose);
    EXPECT_TRUE(s.strict_host_key_checking);
}

TEST(CliArgs, CommandLineModeReplacesLowerLayers) {
    ProxySettings s;
    s.ssh_host = "from-env.example";
    s.ssh_username = "envuser";

    auto r = parse({"--ssh-host-alias", "gpu-box"});
    ASSERT_TRUE(r.is_ok());
    ASSERT_TRUE(apply_cli(s, r.value).is_ok());
    EXPECT_EQ(s.ssh_host_alias.value_or(""), "gpu-box");
    EXPECT_FALSE(s.ssh_host.has_value());
    EXPECT_FALSE(s.ssh_username.has_value());
}

TEST(CliArgs, AliasDropsPortFromLowerLayers) {
    ProxySettings s;
    s.ssh_host = "from-env.example";
    s.ssh_username = "envuser";
    s.ssh_port = 2222;
    s.data_path = "/srv/data";

    auto r = parse({"--ssh-host-alias", "gpu-box"});
    ASSERT_TRUE(r.is_ok());
    ASSERT_TRUE(apply_cli(s, r.value).is_ok());
    EXPECT_FALSE(s.ssh_port.has_value());
    EXPECT_TRUE(validate_settings(s).is_ok());
}

TEST(CliArgs, AliasWithPortFlagRejected) {
    auto r = parse({"--ssh-host-alias", "gpu-box", "--ssh-port", "2222", "--data-path", "/d"});
    ASSERT_TRUE(r.is_ok()) << r.error;

    ProxySettings s;
    ASSERT_TRUE(apply_cli(s, r.value).is_ok());
    auto v = validate_settings(s);
    ASSERT_TRUE(v.is_err());
    EXPECT_NE(v.error.find("ssh_port"), std::string::npos);
}

TEST(CliArgs, InvalidPortValue) {
    auto r = parse({"--local-port", "abc"});
    ASSERT_TRUE(r.is_ok());
    ProxySettings s;
    EXPECT_TRUE(apply_cli(s, r.value).is_err());
}

TEST(CliArgs, UsageMentionsModes) {
    auto text = usage_text("data-stream");
    EXPECT_NE(text.find("--ssh-host-alias"), std::string::npos);
    EXPECT_NE(text.find("--fastapi-port"), std::string::npos);
}

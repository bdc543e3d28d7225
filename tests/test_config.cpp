#include <gtest/gtest.h>
#include <core/config.hpp>
#include <platform/platform.hpp>
#include <fstream>

TEST(Config, EmptyTextUsesDefaults) {
    auto r = Config::parse("");
    ASSERT_TRUE(r.is_ok()) << r.error;
    const Config& c = r.value;
    EXPECT_EQ(c.default_pod_name(), "podtun");
    EXPECT_EQ(c.default_namespace(), "default");
    EXPECT_EQ(c.timeout_secs(), 15);
    EXPECT_EQ(c.ssh_port(), 22);
    EXPECT_EQ(c.ssh_user(), "root");
    EXPECT_FALSE(c.ssh_private_key_path().has_value());
    EXPECT_TRUE(c.port_mappings().empty());
    EXPECT_EQ(c.tunnel().drain_deadline_secs, 5);
    EXPECT_EQ(c.tunnel().reaper_interval_secs, 5);
    EXPECT_EQ(c.provider().kind, ProviderKind::Direct);
    EXPECT_EQ(c.provider().host_template, "{pod}.{namespace}");
    EXPECT_EQ(c.log().level, LogLevel::Info);
    EXPECT_TRUE(c.log().console);
}

TEST(Config, FullDocument) {
    auto r = Config::parse(R"(
defaultPodName: "api"
defaultNamespace: "staging"
timeoutSeconds: 30
sshPort: 2222
sshUser: "deploy"
sshPrivateKeyFilePath: "/keys/id_ed25519"
portMappings:
  - "127.0.0.1:7070:8080"
  - "::1:5432:5432"
tunnel:
  drainDeadlineSeconds: 0
  reaperIntervalSeconds: 1
provider:
  kind: "ssh-gateway"
  hostTemplate: "{pod}.{namespace}.pod.cluster.local"
  gateway:
    host: "bastion.example.com"
    port: 2200
    user: "ops"
log:
  level: "debug"
  console: false
  filePath: "/var/log/podtun.log"
)");
    ASSERT_TRUE(r.is_ok()) << r.error;
    const Config& c = r.value;
    EXPECT_EQ(c.default_pod_name(), "api");
    EXPECT_EQ(c.default_namespace(), "staging");
    EXPECT_EQ(c.timeout_secs(), 30);
    EXPECT_EQ(c.ssh_port(), 2222);
    EXPECT_EQ(c.ssh_user(), "deploy");
    EXPECT_EQ(*c.ssh_private_key_path(), "/keys/id_ed25519");

    ASSERT_EQ(c.port_mappings().size(), 2u);
    EXPECT_EQ(c.port_mappings()[0].container_port, 8080);
    EXPECT_EQ(c.port_mappings()[1].address, "::1");

    EXPECT_EQ(c.tunnel().drain_deadline_secs, 0);
    EXPECT_EQ(c.tunnel().reaper_interval_secs, 1);

    EXPECT_EQ(c.provider().kind, ProviderKind::SshGateway);
    EXPECT_EQ(c.provider().gateway.host, "bastion.example.com");
    EXPECT_EQ(c.provider().gateway.port, 2200);
    EXPECT_EQ(c.provider().gateway.user, "ops");
    EXPECT_FALSE(c.provider().gateway.private_key_path.has_value());

    EXPECT_EQ(c.log().level, LogLevel::Debug);
    EXPECT_FALSE(c.log().console);
    EXPECT_EQ(c.log().file_path, "/var/log/podtun.log");
}

TEST(Config, HomeIsExpanded) {
    auto r = Config::parse("sshPrivateKeyFilePath: \"~/.ssh/id_rsa\"\n");
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(*r.value.ssh_private_key_path(),
              (platform::home_dir() / ".ssh/id_rsa").string());
}

// Each invalid document must name the offending key.
static void expect_error(const std::string& yaml, const std::string& fragment) {
    auto r = Config::parse(yaml);
    ASSERT_TRUE(r.is_err()) << "accepted: " << yaml;
    EXPECT_NE(r.error.find(fragment), std::string::npos) << r.error;
}

TEST(Config, ValidationErrors) {
    expect_error("- a\n- b\n", "mapping");
    expect_error("timeoutSeconds: 0\n", "timeoutSeconds");
    expect_error("sshPort: 70000\n", "sshPort");
    expect_error("portMappings: \"127.0.0.1:1:2\"\n", "portMappings");
    expect_error("portMappings:\n  - \"localhost:1:2\"\n", "portMappings: Invalid IP address");
    expect_error("tunnel:\n  drainDeadlineSeconds: -1\n", "tunnel.drainDeadlineSeconds");
    expect_error("tunnel:\n  reaperIntervalSeconds: 0\n", "tunnel.reaperIntervalSeconds");
    expect_error("provider:\n  kind: \"kubectl\"\n", "provider.kind");
    expect_error("provider:\n  hostTemplate: \"{pod}.{zone}\"\n", "provider.hostTemplate");
    expect_error("provider:\n  kind: \"ssh-gateway\"\n", "provider.gateway.host");
    expect_error("provider:\n  kind: \"ssh-gateway\"\n  gateway:\n    host: \"b\"\n",
                 "provider.gateway.user");
    expect_error("log:\n  level: \"loud\"\n", "log.level");
}

TEST(Config, MalformedYaml) {
    auto r = Config::parse("defaultPodName: [unclosed\n");
    ASSERT_TRUE(r.is_err());
    EXPECT_NE(r.error.find("Failed to parse config"), std::string::npos);
}

TEST(Config, LoadFileMissing) {
    auto r = Config::load_file(platform::temp_dir() / "podtun-test-does-not-exist.yaml");
    ASSERT_TRUE(r.is_err());
    EXPECT_NE(r.error.find("Failed to open config file"), std::string::npos);
}

TEST(Config, DefaultFileRoundTrips) {
    fs::path dir = platform::temp_dir() / "podtun-config-test";
    fs::remove_all(dir);
    fs::path path = dir / "config.yaml";

    ASSERT_TRUE(create_default_config(path).is_ok());
    ASSERT_TRUE(fs::exists(path));

    auto loaded = Config::load_file(path);
    ASSERT_TRUE(loaded.is_ok()) << loaded.error;
    EXPECT_EQ(loaded.value.source_path(), path);
    EXPECT_EQ(loaded.value.default_pod_name(), "podtun");

    // Existing files are never overwritten.
    { std::ofstream(path) << "defaultPodName: \"mine\"\n"; }
    ASSERT_TRUE(create_default_config(path).is_ok());
    EXPECT_EQ(Config::load_file(path).value.default_pod_name(), "mine");

    fs::remove_all(dir);
}

#include <gtest/gtest.h>
#include <core/config.hpp>
#include <core/constants.hpp>
#include <filesystem>
#include <fstream>
#include <cstdlib>

namespace fs = std::filesystem;

class ConfigTest : public ::testing::Test {
protected:
    fs::path test_dir;
    fs::path fake_home;
    std::string saved_home;

    void SetUp() override {
        test_dir = fs::temp_directory_path() / "gencache_config_test";
        fake_home = test_dir / "home";
        fs::create_directories(fake_home);
        if (const char* h = std::getenv("HOME")) saved_home = h;
        setenv("HOME", fake_home.c_str(), 1);
        unsetenv(BASE_DIR_ENV);
    }

    void TearDown() override {
        if (saved_home.empty()) unsetenv("HOME");
        else setenv("HOME", saved_home.c_str(), 1);
        unsetenv(BASE_DIR_ENV);
        fs::remove_all(test_dir);
    }

    void write_project(const std::string& yaml) {
        std::ofstream(test_dir / PROJECT_CONFIG_FILE) << yaml;
    }

    void write_global(const std::string& yaml) {
        fs::create_directories(fake_home / GLOBAL_CONFIG_DIR);
        std::ofstream(fake_home / GLOBAL_CONFIG_DIR / GLOBAL_CONFIG_FILE) << yaml;
    }
};

TEST_F(ConfigTest, EmptyDocumentUsesDefaults) {
    auto result = Config::parse("", test_dir);
    ASSERT_TRUE(result.is_ok()) << result.error;
    const Config& cfg = result.value;

    EXPECT_EQ(cfg.tool(), "sbt");
    EXPECT_EQ(cfg.schema_version(), "4.2");
    EXPECT_FALSE(cfg.integrations().enabled);
    EXPECT_FALSE(cfg.bootstrap().enabled);
    EXPECT_FALSE(cfg.staging().base_dir.has_value());
}

TEST_F(ConfigTest, IntegrationsSection) {
    auto result = Config::parse(R"(
base_dir: base
schema_version: "5.0"
integrations:
  base: build-integrations
  variants:
    - sbt-0.13
    - dir: sbt-1.0-2
      label: sbt 1.0 (2)
  plugin_sources:
    - global/IntegrationPlugin.scala
  prelude:
    script: build-twitter
    args: [--no-test, finagle]
)", test_dir);
    ASSERT_TRUE(result.is_ok()) << result.error;
    const Config& cfg = result.value;
    const auto& integ = cfg.integrations();

    EXPECT_TRUE(integ.enabled);
    EXPECT_EQ(cfg.schema_version(), "5.0");
    EXPECT_EQ(integ.base, cfg.project_dir() / "build-integrations");
    EXPECT_EQ(integ.schema_file, cfg.project_dir() / "target" / "schema-version.json");

    ASSERT_EQ(integ.variants.size(), 2u);
    EXPECT_EQ(integ.variants[0].dir, "sbt-0.13");
    EXPECT_EQ(integ.variants[0].label, "sbt-0.13");
    EXPECT_EQ(integ.variants[1].label, "sbt 1.0 (2)");

    ASSERT_EQ(integ.plugin_sources.size(), 1u);
    EXPECT_EQ(integ.plugin_sources[0], integ.base / "global" / "IntegrationPlugin.scala");

    ASSERT_TRUE(integ.prelude.has_value());
    EXPECT_EQ(integ.prelude->script, "build-twitter");
    EXPECT_EQ(integ.prelude->args, std::vector<std::string>({"--no-test", "finagle"}));
    EXPECT_EQ(integ.tasks,
              std::vector<std::string>({"cleanAllBuilds", "bloopInstall", "buildIndex"}));

    auto staging = cfg.staging();
    ASSERT_TRUE(staging.base_dir.has_value());
    EXPECT_EQ(*staging.base_dir, cfg.project_dir() / "base");
    EXPECT_EQ(staging.schema_version, "5.0");
    EXPECT_EQ(staging.index_prefix, "bloop-integrations");
}

TEST_F(ConfigTest, BootstrapSection) {
    auto result = Config::parse(R"(
bootstrap:
  tasks: bloopInstall
  repositories:
    - url: https://github.com/apache/kafka.git
      revision: 0123abc
)", test_dir);
    ASSERT_TRUE(result.is_ok()) << result.error;
    const auto& boot = result.value.bootstrap();

    EXPECT_TRUE(boot.enabled);
    EXPECT_EQ(boot.tasks, std::vector<std::string>({"bloopInstall"}));
    EXPECT_EQ(boot.extensions, std::vector<std::string>({".sbt", ".scala"}));
    ASSERT_EQ(boot.repositories.size(), 1u);
    EXPECT_EQ(boot.repositories[0].revision, "0123abc");
}

TEST_F(ConfigTest, IntegrationsDefaultToKnownVariants) {
    auto result = Config::parse("integrations:\n  base: build-integrations\n", test_dir);
    ASSERT_TRUE(result.is_ok()) << result.error;
    const auto& variants = result.value.integrations().variants;

    ASSERT_EQ(variants.size(), 6u);
    EXPECT_EQ(variants[0].dir, "sbt-0.13");
    EXPECT_EQ(variants[1].label, "sbt 0.13 (2)");
    EXPECT_EQ(variants[5].dir, "sbt-1.0-3");
    EXPECT_EQ(variants[5].label, "sbt 1.0 (3)");
}

TEST_F(ConfigTest, EmptyVariantListIsRejected) {
    auto result = Config::parse("integrations:\n  variants: []\n", test_dir);
    ASSERT_TRUE(result.is_err());
    EXPECT_NE(result.error.find("variants"), std::string::npos);

    EXPECT_TRUE(Config::parse("integrations:\n  variants: sbt-1.0\n", test_dir).is_err());
}

TEST_F(ConfigTest, SectionCanBeDisabled) {
    auto result = Config::parse("integrations:\n  enabled: false\n", test_dir);
    ASSERT_TRUE(result.is_ok());
    EXPECT_FALSE(result.value.integrations().enabled);
}

TEST_F(ConfigTest, HostOsOverride) {
    auto windows = Config::parse("host_os: windows\n", test_dir);
    ASSERT_TRUE(windows.is_ok());
    EXPECT_EQ(windows.value.host_os(), HostOs::Windows);

    auto bad = Config::parse("host_os: amiga\n", test_dir);
    EXPECT_TRUE(bad.is_err());
}

TEST_F(ConfigTest, InvalidEntriesAreErrors) {
    EXPECT_TRUE(Config::parse("- just\n- a list\n", test_dir).is_err());
    EXPECT_TRUE(Config::parse("integrations:\n  variants:\n    - label: x\n", test_dir).is_err());
    EXPECT_TRUE(Config::parse("bootstrap:\n  repositories:\n    - url: x\n", test_dir).is_err());
    EXPECT_TRUE(Config::parse("integrations:\n  prelude:\n    args: [a]\n", test_dir).is_err());
}

TEST_F(ConfigTest, LoadMissingProjectFails) {
    auto result = Config::load(test_dir);
    EXPECT_TRUE(result.is_err());
}

TEST_F(ConfigTest, ProjectOverridesGlobal) {
    write_global("base_dir: /from/global\nstaging_dir: /global/staging\n");
    write_project("base_dir: /from/project\n");

    auto result = Config::load(test_dir);
    ASSERT_TRUE(result.is_ok()) << result.error;
    auto staging = result.value.staging();
    EXPECT_EQ(*staging.base_dir, fs::path("/from/project"));
    EXPECT_EQ(*staging.staging_override, fs::path("/global/staging"));
}

TEST_F(ConfigTest, EnvironmentIsLastResortForBase) {
    write_project("tool: sbt\n");
    setenv(BASE_DIR_ENV, "/from/env", 1);

    auto result = Config::load(test_dir);
    ASSERT_TRUE(result.is_ok()) << result.error;
    EXPECT_EQ(*result.value.staging().base_dir, fs::path("/from/env"));

    write_global("base_dir: /from/global\n");
    auto with_global = Config::load(test_dir);
    ASSERT_TRUE(with_global.is_ok());
    EXPECT_EQ(*with_global.value.staging().base_dir, fs::path("/from/global"));
}

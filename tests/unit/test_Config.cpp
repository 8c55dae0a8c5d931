#include "SandboxFixture.hpp"
#include "config/Config.hpp"
#include "engine/errors.hpp"
#include "engine/EngineConfig.hpp"

#include <cstdlib>
#include <nlohmann/json.hpp>

using namespace fw::config;

class ConfigTest : public SandboxFixture {
protected:
    std::string savedHome;

    void SetUp() override {
        SandboxFixture::SetUp();
        if (const char* h = std::getenv("HOME")) savedHome = h;
        ::setenv("HOME", base.c_str(), 1);
    }

    void TearDown() override {
        if (savedHome.empty()) ::unsetenv("HOME");
        else ::setenv("HOME", savedHome.c_str(), 1);
        SandboxFixture::TearDown();
    }

    fs::path write(const std::string& yaml) const {
        const auto p = base / "config.yaml";
        writeFile(p, yaml);
        return p;
    }
};

TEST_F(ConfigTest, LoadsEverySection) {
    const auto cfg = loadConfig(write(R"(
sandbox:
  roots:
    - /srv/a
    - ~/Documents
duplicates:
  chunk_size_bytes: 131072
organize:
  allow_replace: true
classifier:
  endpoint: http://localhost:9000/classify
  timeout_seconds: 5
logging:
  log_dir: ~/logs
  console_log_level: debug
  subsystem_levels:
    sandbox: trace
)"));

    ASSERT_EQ(cfg.sandbox.roots.size(), 2u);
    EXPECT_EQ(cfg.sandbox.roots[0], "/srv/a");
    EXPECT_EQ(cfg.sandbox.roots[1], base / "Documents");
    EXPECT_EQ(cfg.duplicates.chunk_size_bytes, 131072u);
    EXPECT_TRUE(cfg.organize.allow_replace);
    EXPECT_EQ(cfg.classifier.endpoint, "http://localhost:9000/classify");
    EXPECT_TRUE(cfg.classifier.conflict_endpoint.empty());
    EXPECT_EQ(cfg.classifier.timeout_seconds, 5u);
    EXPECT_EQ(cfg.logging.log_dir, base / "logs");
    EXPECT_EQ(cfg.logging.levels.console_log_level, spdlog::level::debug);
    EXPECT_EQ(cfg.logging.levels.subsystem_levels.sandbox, spdlog::level::trace);
    EXPECT_EQ(cfg.logging.levels.subsystem_levels.plan, spdlog::level::info);
}

TEST_F(ConfigTest, EmptyFileMeansDefaults) {
    const auto cfg = loadConfig(write(""));
    EXPECT_TRUE(cfg.sandbox.roots.empty());
    EXPECT_EQ(cfg.duplicates.chunk_size_bytes, DEFAULT_HASH_CHUNK_BYTES);
    EXPECT_FALSE(cfg.organize.allow_replace);
    EXPECT_TRUE(cfg.logging.log_dir.empty());
}

TEST_F(ConfigTest, ChunkSizeIsClamped) {
    EXPECT_EQ(loadConfig(write("duplicates:\n  chunk_size_bytes: 1\n")).duplicates.chunk_size_bytes, MIN_HASH_CHUNK_BYTES);
    EXPECT_EQ(loadConfig(write("duplicates:\n  chunk_size_bytes: 999999999999\n")).duplicates.chunk_size_bytes, MAX_HASH_CHUNK_BYTES);
}

TEST_F(ConfigTest, MissingFileIsAConfigError) {
    EXPECT_THROW(loadConfig(base / "nope.yaml"), fw::engine::ConfigError);
}

TEST_F(ConfigTest, MalformedFilesAreConfigErrors) {
    EXPECT_THROW(loadConfig(write("sandbox: [unterminated\n")), fw::engine::ConfigError);
    EXPECT_THROW(loadConfig(write("- just\n- a list\n")), fw::engine::ConfigError);
    EXPECT_THROW(loadConfig(write("sandbox:\n  roots: /not/a/list\n")), fw::engine::ConfigError);
    EXPECT_THROW(loadConfig(write("organize: yes-please\n")), fw::engine::ConfigError);
}

TEST_F(ConfigTest, ExpandUser) {
    EXPECT_EQ(expandUser("~"), base);
    EXPECT_EQ(expandUser("~/a/b"), base / "a" / "b");
    EXPECT_EQ(expandUser("~bob/a"), "~bob/a");
    EXPECT_EQ(expandUser("/abs/~"), "/abs/~");
}

TEST_F(ConfigTest, EngineConfigCarriesSettings) {
    Config cfg;
    cfg.sandbox.roots = {root};
    cfg.duplicates.chunk_size_bytes = 8192;
    cfg.organize.allow_replace = true;

    const auto ec = fw::engine::EngineConfig::fromConfig(cfg);
    EXPECT_EQ(ec.roots, cfg.sandbox.roots);
    EXPECT_EQ(ec.hash_chunk_bytes, 8192u);
    EXPECT_TRUE(ec.allow_replace);
}

TEST_F(ConfigTest, SerializesLevelNames) {
    const nlohmann::json j = Config{};
    EXPECT_EQ(j["logging"]["console_log_level"], "info");
    EXPECT_EQ(j["logging"]["subsystem_levels"]["sandbox"], "warning");
    EXPECT_EQ(j["duplicates"]["chunk_size_bytes"], DEFAULT_HASH_CHUNK_BYTES);
}

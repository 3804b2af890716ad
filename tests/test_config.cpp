/*
 * Valheim Server Manager — configuration tests
 * (c) 2025 ValheimServerManager contributors
 */
#include <gtest/gtest.h>

#include <cstdlib>
#include <map>
#include <optional>

#include "TestUtil.hpp"
#include "include/Config.hpp"
#include "include/Errors.hpp"

using namespace vsm;
using nlohmann::json;
using vsm::test::TempDir;
using vsm::test::writeFile;

namespace {

/* Sets variables for the lifetime of the object, restoring previous values. */
class ScopedEnv {
public:
    ~ScopedEnv() {
        for (const auto& kv : saved_) {
            if (kv.second) ::setenv(kv.first.c_str(), kv.second->c_str(), 1);
            else ::unsetenv(kv.first.c_str());
        }
    }
    void set(const std::string& k, const std::string& v) {
        remember_(k);
        ::setenv(k.c_str(), v.c_str(), 1);
    }
    void unset(const std::string& k) {
        remember_(k);
        ::unsetenv(k.c_str());
    }

private:
    void remember_(const std::string& k) {
        if (saved_.count(k)) return;
        const char* v = std::getenv(k.c_str());
        saved_[k] = v ? std::optional<std::string>(v) : std::nullopt;
    }
    std::map<std::string, std::optional<std::string>> saved_;
};

/* Points every XDG base at a temp dir and clears VSMD_* variables used below. */
struct ConfigFixture : ::testing::Test {
    TempDir dir;
    ScopedEnv env;

    void SetUp() override {
        env.set("HOME", dir.path().string());
        env.set("XDG_CONFIG_HOME", dir.file("config"));
        env.set("XDG_STATE_HOME", dir.file("state"));
        env.set("XDG_DATA_HOME", dir.file("data"));
        for (const char* k : {"VSMD_SERVER_NAME", "VSMD_SERVER_PORT", "VSMD_WORLD",
                              "VSMD_SERVER_PASSWORD", "VSMD_INSTALL_DIR", "VSMD_SAVEDIR",
                              "VSMD_SERVER_LOG_DIR", "VSMD_WATCHDOG_ENABLED",
                              "VSMD_WATCHDOG_MAX_RESTARTS", "VSMD_RCON_ENABLED", "VSMD_RCON_HOST",
                              "VSMD_RCON_PORT", "VSMD_RCON_PASSWORD", "VSMD_HOST", "VSMD_PORT",
                              "VSMD_LOGFILE", "VSMD_RECORD_FILE", "VSMD_DEBUG", "VSMD_CONFIG_PATH"}) {
            env.unset(k);
        }
    }
};

} // namespace

TEST_F(ConfigFixture, DefaultsFollowXdgLayout) {
    const AppConfig c = defaultConfig();
    EXPECT_EQ(c.server.name, "Land of OZ Valheim");
    EXPECT_EQ(c.server.port, 2456);
    EXPECT_EQ(c.server.world, "Dedicated");
    EXPECT_FALSE(c.server.isPublic);
    EXPECT_EQ(c.server.installDir,
              dir.file("data") + "/steamcmd/steamapps/common/Valheim dedicated server");
    EXPECT_EQ(c.server.logDir, dir.file("state") + "/vsm/logs");
    EXPECT_EQ(c.daemon.logfile, dir.file("state") + "/vsm/vsmd.log");
    EXPECT_EQ(c.daemon.recordFile, dir.file("config") + "/vsm/server.pid");
    EXPECT_EQ(c.configFile, dir.file("config") + "/vsm/config.json");
    EXPECT_EQ(c.daemon.port, 8787);
    EXPECT_FALSE(c.rcon.enabled);
    EXPECT_EQ(c.rcon.port, 25575);
    EXPECT_TRUE(c.watchdog.enabled);
    EXPECT_EQ(c.watchdog.maxRestarts, 5);
    EXPECT_EQ(c.watchdog.restartDelayMs, 5000);
    EXPECT_EQ(c.watchdog.cooldownPeriodMs, 300000);
}

TEST_F(ConfigFixture, MissingFileGivesDefaultsAndDerivedPaths) {
    AppConfig c;
    std::vector<std::string> warnings;
    loadAppConfig(dir.file("nope.json"), c, &warnings);
    EXPECT_TRUE(warnings.empty());
    EXPECT_EQ(c.configFile, dir.file("nope.json"));
    EXPECT_EQ(c.server.executable, c.server.installDir + "/valheim_server.x86_64");
    EXPECT_EQ(c.framework.logFile, c.server.installDir + "/BepInEx/LogOutput.log");
}

TEST_F(ConfigFixture, EnvironmentOverridesDefaults) {
    env.set("VSMD_SERVER_NAME", "Env Server");
    env.set("VSMD_SERVER_PORT", "2600");
    env.set("VSMD_WORLD", "EnvWorld");
    env.set("VSMD_RCON_ENABLED", "yes");
    env.set("VSMD_RCON_PORT", "26000");
    env.set("VSMD_WATCHDOG_ENABLED", "off");
    env.set("VSMD_PORT", "9000");
    env.set("VSMD_DEBUG", "1");
    AppConfig c = defaultConfig();
    EXPECT_TRUE(applyEnvOverrides(c).empty());
    EXPECT_EQ(c.server.name, "Env Server");
    EXPECT_EQ(c.server.port, 2600);
    EXPECT_EQ(c.server.world, "EnvWorld");
    EXPECT_TRUE(c.rcon.enabled);
    EXPECT_EQ(c.rcon.port, 26000);
    EXPECT_FALSE(c.watchdog.enabled);
    EXPECT_EQ(c.daemon.port, 9000);
    EXPECT_TRUE(c.daemon.debug);
}

TEST_F(ConfigFixture, BadEnvironmentValuesAreIgnored) {
    env.set("VSMD_SERVER_PORT", "80");
    env.set("VSMD_RCON_PORT", "abc");
    env.set("VSMD_DEBUG", "maybe");
    AppConfig c = defaultConfig();
    const auto w = applyEnvOverrides(c);
    EXPECT_EQ(w.size(), 3u);
    EXPECT_EQ(c.server.port, 2456);
    EXPECT_EQ(c.rcon.port, 25575);
    EXPECT_FALSE(c.daemon.debug);
}

TEST_F(ConfigFixture, JsonOverridesEnvironment) {
    env.set("VSMD_WORLD", "EnvWorld");
    const std::string p = dir.file("config.json");
    writeFile(p, R"({
        "server":   {"world": "FileWorld", "public": true, "crossplay": true, "backups": 2},
        "watchdog": {"maxRestarts": 3, "restartDelay": 2000, "backoffMultiplier": 1.5},
        "rcon":     {"enabled": true, "password": "pw", "pollInterval": 5000},
        "framework":{"enabled": true},
        "daemon":   {"port": 9100, "detachOnExit": true}
    })");
    AppConfig c;
    std::vector<std::string> warnings;
    loadAppConfig(p, c, &warnings);
    EXPECT_TRUE(warnings.empty());
    EXPECT_EQ(c.server.world, "FileWorld");
    EXPECT_TRUE(c.server.isPublic);
    EXPECT_TRUE(c.server.crossplay);
    EXPECT_EQ(c.server.backups, 2);
    EXPECT_EQ(c.watchdog.maxRestarts, 3);
    EXPECT_EQ(c.watchdog.restartDelayMs, 2000);
    EXPECT_DOUBLE_EQ(c.watchdog.backoffMultiplier, 1.5);
    EXPECT_TRUE(c.rcon.enabled);
    EXPECT_EQ(c.rcon.password, "pw");
    EXPECT_EQ(c.rcon.pollIntervalMs, 5000);
    EXPECT_TRUE(c.framework.enabled);
    EXPECT_EQ(c.daemon.port, 9100);
    EXPECT_TRUE(c.daemon.detachOnExit);
}

TEST_F(ConfigFixture, InvalidFieldsAreRejectedIndividually) {
    AppConfig c = defaultConfig();
    const auto w = applyConfigJson(json::parse(R"({
        "server":   {"name": "", "port": 80, "world": "Kept"},
        "rcon":     {"port": 100, "host": "10.0.0.5", "timeout": "fast"},
        "watchdog": {"restartDelay": 10, "maxRestarts": 4}
    })"), c);
    EXPECT_EQ(w.size(), 5u);
    EXPECT_EQ(c.server.name, "Land of OZ Valheim");
    EXPECT_EQ(c.server.port, 2456);
    EXPECT_EQ(c.server.world, "Kept");
    EXPECT_EQ(c.rcon.port, 25575);
    EXPECT_EQ(c.rcon.host, "10.0.0.5");
    EXPECT_EQ(c.rcon.timeoutMs, 5000);
    EXPECT_EQ(c.watchdog.restartDelayMs, 5000);
    EXPECT_EQ(c.watchdog.maxRestarts, 4);
}

TEST_F(ConfigFixture, NonObjectSectionIsWarned) {
    AppConfig c = defaultConfig();
    const auto w = applyConfigJson(json::parse(R"({"rcon": 5})"), c);
    ASSERT_EQ(w.size(), 1u);
    EXPECT_NE(w[0].find("rcon"), std::string::npos);
}

TEST_F(ConfigFixture, MalformedJsonThrowsInvalidConfig) {
    const std::string p = dir.file("bad.json");
    writeFile(p, "{ \"server\": ");
    AppConfig c;
    try {
        loadAppConfig(p, c);
        FAIL() << "expected InvalidConfig";
    } catch (const Error& e) {
        EXPECT_EQ(e.code(), ErrorCode::InvalidConfig);
    }
}

TEST_F(ConfigFixture, ConvenienceLoaderFallsBackToDefaults) {
    env.set("VSMD_WORLD", "EnvWorld");
    const std::string p = dir.file("bad.json");
    writeFile(p, "not json at all");
    std::string err;
    const AppConfig c = loadAppConfig(p, &err);
    EXPECT_FALSE(err.empty());
    EXPECT_EQ(c.server.world, "EnvWorld");
    EXPECT_EQ(c.configFile, p);
    EXPECT_FALSE(c.server.executable.empty());
}

TEST_F(ConfigFixture, ConfigPathFromEnvironment) {
    const std::string p = dir.file("elsewhere.json");
    writeFile(p, R"({"server": {"world": "FromEnvPath"}})");
    env.set("VSMD_CONFIG_PATH", p);
    AppConfig c;
    loadAppConfig("", c);
    EXPECT_EQ(c.configFile, p);
    EXPECT_EQ(c.server.world, "FromEnvPath");
}

TEST_F(ConfigFixture, TildeIsExpanded) {
    const std::string p = dir.file("config.json");
    writeFile(p, R"({"server": {"installDir": "~/valheim"}})");
    AppConfig c;
    loadAppConfig(p, c);
    EXPECT_EQ(c.server.installDir, dir.path().string() + "/valheim");
    EXPECT_EQ(c.server.executable, dir.path().string() + "/valheim/valheim_server.x86_64");
}

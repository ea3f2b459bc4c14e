#include "DcmiConfig.hpp"
#include "NpuError.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>

#include <gtest/gtest.h>

namespace config = npu::config;

TEST(DcmiConfig, Defaults)
{
    config::Config defaults;
    EXPECT_EQ(defaults.libraryDir, "/usr/local/dcmi");
    EXPECT_EQ(defaults.libraryName, "libdcmi.so");
    EXPECT_EQ(defaults.backend, config::Backend::dynamic);
    EXPECT_EQ(defaults.libraryPath(), "/usr/local/dcmi/libdcmi.so");
}

TEST(DcmiConfig, ParseAllKeys)
{
    auto parsed = config::parseConfig(R"({
        "LibraryDir": "/opt/dcmi/lib64",
        "LibraryName": "libdcmi.so.1",
        "Backend": "linked"
    })");

    ASSERT_TRUE(parsed);
    EXPECT_EQ(parsed->libraryPath(), "/opt/dcmi/lib64/libdcmi.so.1");
    EXPECT_EQ(parsed->backend, config::Backend::linked);
}

TEST(DcmiConfig, ParseKeepsDefaultsForMissingKeys)
{
    auto parsed = config::parseConfig(R"({"LibraryDir": "/opt/dcmi"})");
    ASSERT_TRUE(parsed);
    EXPECT_EQ(parsed->libraryDir, "/opt/dcmi");
    EXPECT_EQ(parsed->libraryName, "libdcmi.so");

    EXPECT_EQ(config::parseConfig("{}"), config::Config{});
}

TEST(DcmiConfig, ParseRejectsBadDocuments)
{
    EXPECT_FALSE(config::parseConfig("{"));
    EXPECT_FALSE(config::parseConfig("[1, 2]"));
    EXPECT_FALSE(config::parseConfig(R"({"LibraryDir": 5})"));
}

TEST(DcmiConfig, UnknownBackend)
{
    try
    {
        config::parseBackend("static");
        FAIL() << "expected std::system_error";
    }
    catch (const std::system_error& e)
    {
        EXPECT_EQ(e.code(), npu::StatusError::invalidParameter);
    }
    EXPECT_THROW(config::parseConfig(R"({"Backend": "static"})"),
                 std::system_error);

    EXPECT_EQ(config::backendName(config::parseBackend("dynamic")),
              "dynamic");
    EXPECT_EQ(config::backendName(config::parseBackend("linked")), "linked");
}

TEST(DcmiConfig, MissingFileYieldsDefaults)
{
    EXPECT_EQ(config::loadConfigFile("/nonexistent/npu-dcmi.json"),
              config::Config{});
}

TEST(DcmiConfig, LoadFile)
{
    auto path = std::filesystem::temp_directory_path() / "npu-dcmi-test.json";
    {
        std::ofstream out(path);
        out << R"({"LibraryDir": "/srv/dcmi", "Backend": "dynamic"})";
    }

    auto loaded = config::loadConfigFile(path.string());
    EXPECT_EQ(loaded.libraryDir, "/srv/dcmi");
    EXPECT_EQ(loaded.backend, config::Backend::dynamic);

    {
        std::ofstream out(path);
        out << "not json";
    }
    EXPECT_EQ(config::loadConfigFile(path.string()), config::Config{});

    std::filesystem::remove(path);
}

TEST(DcmiConfig, EnvironmentOverrides)
{
    ASSERT_EQ(setenv(config::libraryDirVariable, "/env/dcmi", 1), 0);
    ASSERT_EQ(setenv(config::backendVariable, "linked", 1), 0);

    auto fromEnv = config::Config::fromEnvironment();
    EXPECT_EQ(fromEnv.libraryPath(), "/env/dcmi/libdcmi.so");
    EXPECT_EQ(fromEnv.backend, config::Backend::linked);

    config::Config custom;
    custom.libraryName = "libdcmi.so.2";
    custom.applyEnvironment();
    EXPECT_EQ(custom.libraryPath(), "/env/dcmi/libdcmi.so.2");

    ASSERT_EQ(unsetenv(config::libraryDirVariable), 0);
    ASSERT_EQ(unsetenv(config::backendVariable), 0);
    EXPECT_EQ(config::Config::fromEnvironment(), config::Config{});
}

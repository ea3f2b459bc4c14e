/*
 * SPDX-FileCopyrightText: Copyright OpenBMC Authors
 * SPDX-License-Identifier: Apache-2.0
 */

#include "DcmiConfig.hpp"

#include "NpuError.hpp"

#include <nlohmann/json.hpp>
#include <phosphor-logging/lg2.hpp>

#include <cstdlib>
#include <filesystem>
#include <format>
#include <fstream>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

namespace npu::config
{

PHOSPHOR_LOG2_USING;

namespace fs = std::filesystem;
using json = nlohmann::json;

static constexpr auto libraryDirProperty = "LibraryDir";
static constexpr auto libraryNameProperty = "LibraryName";
static constexpr auto backendProperty = "Backend";

Backend parseBackend(std::string_view name)
{
    if (name == "dynamic")
    {
        return Backend::dynamic;
    }
    if (name == "linked")
    {
        return Backend::linked;
    }
    throw std::system_error(make_error_code(StatusError::invalidParameter),
                            std::format("unknown DCMI backend '{}'", name));
}

std::string_view backendName(Backend backend)
{
    switch (backend)
    {
        case Backend::dynamic:
            return "dynamic";
        case Backend::linked:
            return "linked";
    }
    return "unknown";
}

std::string Config::libraryPath() const
{
    return (fs::path(libraryDir) / libraryName).string();
}

void Config::applyEnvironment()
{
    // NOLINTNEXTLINE(concurrency-mt-unsafe)
    if (const char* dir = std::getenv(libraryDirVariable))
    {
        libraryDir = dir;
    }
    // NOLINTNEXTLINE(concurrency-mt-unsafe)
    if (const char* name = std::getenv(backendVariable))
    {
        backend = parseBackend(name);
    }
}

Config Config::fromEnvironment()
{
    Config config;
    config.applyEnvironment();
    return config;
}

static std::optional<Config> fromJson(const json& document)
{
    if (!document.is_object())
    {
        error("DCMI config must be a JSON object");
        return std::nullopt;
    }
    Config config;
    if (document.contains(libraryDirProperty))
    {
        document.at(libraryDirProperty).get_to(config.libraryDir);
    }
    if (document.contains(libraryNameProperty))
    {
        document.at(libraryNameProperty).get_to(config.libraryName);
    }
    if (document.contains(backendProperty))
    {
        config.backend =
            parseBackend(document.at(backendProperty).get<std::string>());
    }
    return config;
}

std::optional<Config> parseConfig(std::string_view text)
{
    json document = json::parse(text, nullptr, false, true);
    if (document.is_discarded())
    {
        error("Failed to parse DCMI config");
        return std::nullopt;
    }

    try
    {
        return fromJson(document);
    }
    catch (const json::exception& e)
    {
        error("Invalid DCMI config: {ERROR}", "ERROR", e.what());
    }
    return std::nullopt;
}

Config loadConfigFile(const std::string& path)
{
    std::ifstream jsonFile(path);
    if (!jsonFile.is_open())
    {
        error("Config file not found: {PATH}", "PATH", path);
        return {};
    }

    try
    {
        return fromJson(json::parse(jsonFile, nullptr, true, true))
            .value_or(Config{});
    }
    catch (const json::exception& e)
    {
        error("Failed to parse config file {PATH}: {ERROR}", "PATH", path,
              "ERROR", e.what());
    }
    return {};
}

} // namespace npu::config

/*
 * SPDX-FileCopyrightText: Copyright OpenBMC Authors
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace npu::config
{

constexpr auto defaultLibraryDir = "/usr/local/dcmi";
constexpr auto defaultLibraryName = "libdcmi.so";

constexpr auto libraryDirVariable = "HW_DCMI_PATH";
constexpr auto backendVariable = "NPU_DCMI_BACKEND";

enum class Backend
{
    // Resolve the vendor symbols at runtime with dlopen
    dynamic,
    // Use the symbols linked into the executable
    linked,
};

/**
 * @brief Parse "dynamic" or "linked".
 *
 * Throws std::system_error with StatusError::invalidParameter for any other
 * value.
 */
Backend parseBackend(std::string_view name);

std::string_view backendName(Backend backend);

struct Config
{
    std::string libraryDir = defaultLibraryDir;
    std::string libraryName = defaultLibraryName;
    Backend backend = Backend::dynamic;

    std::string libraryPath() const;

    /**
     * @brief Defaults overridden by HW_DCMI_PATH and NPU_DCMI_BACKEND.
     */
    static Config fromEnvironment();

    /**
     * @brief Apply HW_DCMI_PATH and NPU_DCMI_BACKEND on top of this config.
     */
    void applyEnvironment();

    bool operator==(const Config&) const = default;
};

/**
 * @brief Read a JSON config file.
 *
 * Keys are "LibraryDir", "LibraryName" and "Backend", all optional. A
 * missing or unparsable file is logged and yields the defaults.
 */
Config loadConfigFile(const std::string& path);

/**
 * @brief Parse a JSON document with the same keys as loadConfigFile.
 *
 * @return std::nullopt when @p text is not valid JSON or a key has the
 *         wrong type
 */
std::optional<Config> parseConfig(std::string_view text);

} // namespace npu::config

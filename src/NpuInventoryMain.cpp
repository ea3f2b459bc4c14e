/*
 * SPDX-FileCopyrightText: Copyright OpenBMC Authors
 * SPDX-License-Identifier: Apache-2.0
 */

#include "DcmiConfig.hpp"
#include "Session.hpp"
#include "Telemetry.hpp"
#include "TelemetryJson.hpp"
#include "Topology.hpp"
#include "VendorDcmi.hpp"

#include <getopt.h>

#include <nlohmann/json.hpp>
#include <phosphor-logging/lg2.hpp>

#include <exception>
#include <iostream>
#include <optional>
#include <string>
#include <system_error>

using json = nlohmann::json;

namespace
{

// Run one query, recording a failure in place of its result
template <typename Query>
json query(Query&& run)
{
    try
    {
        return json(run());
    }
    catch (const std::system_error& e)
    {
        return json{{"error", e.what()}, {"code", e.code().value()}};
    }
}

json describeChip(const npu::Chip& chip, bool verbose)
{
    json entry{
        {"id", chip.id()},
        {"type", query([&] { return chip.type(); })},
        {"info", query([&] { return chip.info(); })},
        {"health", query([&] { return chip.health(); })},
        {"temperature", query([&] { return chip.temperature(); })},
        {"voltage", query([&] { return chip.voltage(); })},
        {"memory", query([&] { return chip.memoryInfo(); })},
    };
    if (verbose)
    {
        entry["pcie"] = query([&] { return chip.domainPcieInfo(); });
        entry["board"] = query([&] { return chip.boardInfo(); });
        entry["elabel"] = query([&] { return chip.elabelInfo(); });
        entry["power"] = query([&] { return chip.powerInfo(); });
        entry["ai_core"] = query([&] { return chip.aiCoreInfo(); });
        entry["hbm"] = query([&] { return chip.hbmInfo(); });
        entry["error_codes"] = query([&] { return chip.errorCodes(); });
    }
    return entry;
}

json describeUnit(const npu::ManagementUnit& unit, bool verbose)
{
    auto chipSet = unit.chips();

    json npuChips = json::array();
    for (const auto& chip : chipSet.npuChips)
    {
        npuChips.push_back(describeChip(chip, verbose));
    }

    json entry{
        {"id", unit.id()},
        {"npu_chips", npuChips},
        {"mcu_chip", nullptr},
        {"cpu_chip", nullptr},
    };
    if (chipSet.mcuChip)
    {
        entry["mcu_chip"] = describeChip(*chipSet.mcuChip, verbose);
    }
    if (chipSet.cpuChip)
    {
        // Only the id is reported for the CPU chip
        entry["cpu_chip"] = json{{"id", chipSet.cpuChip->id()}};
    }
    return entry;
}

void usage()
{
    std::cerr << "Usage: npu-inventory [OPTIONS]\n";
    std::cerr << "Options:\n";
    std::cerr << "  --config=<file> - JSON file with LibraryDir, LibraryName "
                 "and Backend\n"
              << "  --linked - Use the linked DCMI library instead of dlopen\n"
              << "  --verbose - Also report PCIe, board, label, power, AI "
                 "core, HBM and error codes\n"
              << "  --help - Print this help message and exit\n";
}

} // namespace

int main(int argc, char* const* argv)
{
    std::optional<std::string> configFile;
    bool linked = false;
    bool verbose = false;

    static const struct option options[] = {
        {"config", required_argument, nullptr, 'c'},
        {"linked", no_argument, nullptr, 'l'},
        {"verbose", no_argument, nullptr, 'v'},
        {"help", no_argument, nullptr, 'h'},
        {nullptr, 0, nullptr, 0}};

    int argflag = 0;
    while ((argflag = getopt_long(argc, argv, "c:lvh", options, nullptr)) !=
           -1)
    {
        switch (argflag)
        {
            case 'c':
                configFile = optarg;
                break;
            case 'l':
                linked = true;
                break;
            case 'v':
                verbose = true;
                break;
            case 'h':
                usage();
                return 0;
            default:
                usage();
                return 1;
        }
    }

    try
    {
        npu::config::Config config;
        if (configFile)
        {
            config = npu::config::loadConfigFile(*configFile);
        }
        config.applyEnvironment();
        if (linked)
        {
            config.backend = npu::config::Backend::linked;
        }

        auto session = npu::Session::init(npu::makeDcmiInterface(config));

        json units = json::array();
        for (const auto& unit : session.managementUnits())
        {
            units.push_back(describeUnit(unit, verbose));
        }

        json inventory{
            {"backend",
             std::string(npu::config::backendName(config.backend))},
            {"dcmi_version", query([&] { return session.dcmiVersion(); })},
            {"driver_version", query([&] { return session.driverVersion(); })},
            {"driver_health", query([&] { return session.driverHealth(); })},
            {"management_units", units},
        };
        std::cout << inventory.dump(4) << "\n";
    }
    catch (const std::exception& e)
    {
        lg2::error("NPU inventory failed: {ERROR}", "ERROR", e.what());
        std::cerr << "npu-inventory: " << e.what() << "\n";
        return 1;
    }
    return 0;
}

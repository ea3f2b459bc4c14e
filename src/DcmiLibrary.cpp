/*
 * SPDX-FileCopyrightText: Copyright OpenBMC Authors
 * SPDX-License-Identifier: Apache-2.0
 */

#include "DcmiFunctions.hpp"

#include <dlfcn.h>

#include <phosphor-logging/lg2.hpp>

#include <format>
#include <string>
#include <system_error>

namespace npu::vendor
{

template <typename Fn>
void LoadedLibrary::resolve(const char* name, Fn& fn)
{
    dlerror();
    void* symbol = dlsym(handle, name);
    if (symbol == nullptr)
    {
        lg2::error("DCMI library is missing symbol {SYMBOL}", "SYMBOL", name);
        throw std::system_error(
            std::make_error_code(std::errc::function_not_supported),
            std::format("dlsym {}", name));
    }
    fn = reinterpret_cast<Fn>(symbol);
}

void LoadedLibrary::resolveAll()
{
    resolve("dcmi_init", table.dcmi_init);
    resolve("dcmi_get_dcmi_version", table.dcmi_get_dcmi_version);
    resolve("dcmi_get_driver_version", table.dcmi_get_driver_version);
    resolve("dcmi_get_version", table.dcmi_get_version);
    resolve("dcmi_get_card_list", table.dcmi_get_card_list);
    resolve("dcmi_get_device_num_in_card", table.dcmi_get_device_num_in_card);
    resolve("dcmi_get_device_id_in_card", table.dcmi_get_device_id_in_card);
    resolve("dcmi_get_device_type", table.dcmi_get_device_type);
    resolve("dcmi_get_device_chip_info", table.dcmi_get_device_chip_info);
    resolve("dcmi_get_device_pcie_info", table.dcmi_get_device_pcie_info);
    resolve("dcmi_get_device_pcie_info_v2", table.dcmi_get_device_pcie_info_v2);
    resolve("dcmi_get_device_board_info", table.dcmi_get_device_board_info);
    resolve("dcmi_get_device_elabel_info", table.dcmi_get_device_elabel_info);
    resolve("dcmi_get_device_power_info", table.dcmi_get_device_power_info);
    resolve("dcmi_get_device_die_v2", table.dcmi_get_device_die_v2);
    resolve("dcmi_get_device_health", table.dcmi_get_device_health);
    resolve("dcmi_get_driver_health", table.dcmi_get_driver_health);
    resolve("dcmi_get_device_errorcode_v2", table.dcmi_get_device_errorcode_v2);
    resolve("dcmi_get_device_errorcode_string",
            table.dcmi_get_device_errorcode_string);
    resolve("dcmi_get_device_flash_count", table.dcmi_get_device_flash_count);
    resolve("dcmi_get_device_flash_info_v2",
            table.dcmi_get_device_flash_info_v2);
    resolve("dcmi_get_device_aicore_info", table.dcmi_get_device_aicore_info);
    resolve("dcmi_get_device_aicpu_info", table.dcmi_get_device_aicpu_info);
    resolve("dcmi_get_device_system_time", table.dcmi_get_device_system_time);
    resolve("dcmi_get_device_temperature", table.dcmi_get_device_temperature);
    resolve("dcmi_get_device_voltage", table.dcmi_get_device_voltage);
    resolve("dcmi_get_device_pcie_error_cnt",
            table.dcmi_get_device_pcie_error_cnt);
    resolve("dcmi_get_device_ecc_info", table.dcmi_get_device_ecc_info);
    resolve("dcmi_get_device_frequency", table.dcmi_get_device_frequency);
    resolve("dcmi_get_device_hbm_info", table.dcmi_get_device_hbm_info);
    resolve("dcmi_get_device_memory_info_v3",
            table.dcmi_get_device_memory_info_v3);
    resolve("dcmi_get_device_utilization_rate",
            table.dcmi_get_device_utilization_rate);
    resolve("dcmi_create_vdevice", table.dcmi_create_vdevice);
    resolve("dcmi_set_destroy_vdevice", table.dcmi_set_destroy_vdevice);
}

LoadedLibrary::LoadedLibrary(const std::string& path)
{
    handle = dlopen(path.c_str(), RTLD_NOW | RTLD_LOCAL);
    if (handle == nullptr)
    {
        const char* err = dlerror();
        std::string reason = (err != nullptr) ? err : "unknown error";
        lg2::error("Failed to load DCMI library {PATH}: {ERROR}", "PATH", path,
                   "ERROR", reason);
        throw std::system_error(
            std::make_error_code(std::errc::no_such_file_or_directory),
            std::format("dlopen {}: {}", path, reason));
    }

    try
    {
        resolveAll();
    }
    catch (const std::system_error&)
    {
        dlclose(handle);
        throw;
    }
    lg2::info("Loaded DCMI library {PATH}", "PATH", path);
}

LoadedLibrary::~LoadedLibrary()
{
    dlclose(handle);
}

} // namespace npu::vendor

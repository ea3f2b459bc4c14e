/*
 * SPDX-FileCopyrightText: Copyright OpenBMC Authors
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <tuple>

extern "C"
{
#include <dcmi_interface_api.h>
}

namespace npu::vendor
{

/**
 * @brief Table of vendor entry points, typed from the vendor header.
 */
struct DcmiFunctions
{
    decltype(&::dcmi_init) dcmi_init = nullptr;
    decltype(&::dcmi_get_dcmi_version) dcmi_get_dcmi_version = nullptr;
    decltype(&::dcmi_get_driver_version) dcmi_get_driver_version = nullptr;
    decltype(&::dcmi_get_version) dcmi_get_version = nullptr;
    decltype(&::dcmi_get_card_list) dcmi_get_card_list = nullptr;
    decltype(&::dcmi_get_device_num_in_card)
        dcmi_get_device_num_in_card = nullptr;
    decltype(&::dcmi_get_device_id_in_card)
        dcmi_get_device_id_in_card = nullptr;
    decltype(&::dcmi_get_device_type) dcmi_get_device_type = nullptr;
    decltype(&::dcmi_get_device_chip_info) dcmi_get_device_chip_info = nullptr;
    decltype(&::dcmi_get_device_pcie_info) dcmi_get_device_pcie_info = nullptr;
    decltype(&::dcmi_get_device_pcie_info_v2)
        dcmi_get_device_pcie_info_v2 = nullptr;
    decltype(&::dcmi_get_device_board_info)
        dcmi_get_device_board_info = nullptr;
    decltype(&::dcmi_get_device_elabel_info)
        dcmi_get_device_elabel_info = nullptr;
    decltype(&::dcmi_get_device_power_info)
        dcmi_get_device_power_info = nullptr;
    decltype(&::dcmi_get_device_die_v2) dcmi_get_device_die_v2 = nullptr;
    decltype(&::dcmi_get_device_health) dcmi_get_device_health = nullptr;
    decltype(&::dcmi_get_driver_health) dcmi_get_driver_health = nullptr;
    decltype(&::dcmi_get_device_errorcode_v2)
        dcmi_get_device_errorcode_v2 = nullptr;
    decltype(&::dcmi_get_device_errorcode_string)
        dcmi_get_device_errorcode_string = nullptr;
    decltype(&::dcmi_get_device_flash_count)
        dcmi_get_device_flash_count = nullptr;
    decltype(&::dcmi_get_device_flash_info_v2)
        dcmi_get_device_flash_info_v2 = nullptr;
    decltype(&::dcmi_get_device_aicore_info)
        dcmi_get_device_aicore_info = nullptr;
    decltype(&::dcmi_get_device_aicpu_info)
        dcmi_get_device_aicpu_info = nullptr;
    decltype(&::dcmi_get_device_system_time)
        dcmi_get_device_system_time = nullptr;
    decltype(&::dcmi_get_device_temperature)
        dcmi_get_device_temperature = nullptr;
    decltype(&::dcmi_get_device_voltage) dcmi_get_device_voltage = nullptr;
    decltype(&::dcmi_get_device_pcie_error_cnt)
        dcmi_get_device_pcie_error_cnt = nullptr;
    decltype(&::dcmi_get_device_ecc_info) dcmi_get_device_ecc_info = nullptr;
    decltype(&::dcmi_get_device_frequency) dcmi_get_device_frequency = nullptr;
    decltype(&::dcmi_get_device_hbm_info) dcmi_get_device_hbm_info = nullptr;
    decltype(&::dcmi_get_device_memory_info_v3)
        dcmi_get_device_memory_info_v3 = nullptr;
    decltype(&::dcmi_get_device_utilization_rate)
        dcmi_get_device_utilization_rate = nullptr;
    decltype(&::dcmi_create_vdevice) dcmi_create_vdevice = nullptr;
    decltype(&::dcmi_set_destroy_vdevice) dcmi_set_destroy_vdevice = nullptr;
};

template <typename Fn, size_t N>
struct ArgumentOf;

template <typename R, typename... Args, size_t N>
struct ArgumentOf<R (*)(Args...), N>
{
    using type = std::tuple_element_t<N, std::tuple<Args...>>;
};

// Type of parameter N of the vendor function pointer type Fn
template <typename Fn, size_t N>
using Argument = typename ArgumentOf<Fn, N>::type;

/**
 * @brief Addresses of the symbols linked into this binary.
 *
 * std::nullopt when the binary was built without the linked backend.
 */
std::optional<DcmiFunctions> linkedFunctions();

/**
 * @brief A dlopen handle with every vendor symbol resolved.
 *
 * Throws std::system_error when the library cannot be opened or a symbol is
 * missing. The library is closed on destruction.
 */
class LoadedLibrary
{
  public:
    explicit LoadedLibrary(const std::string& path);
    ~LoadedLibrary();

    LoadedLibrary(const LoadedLibrary&) = delete;
    LoadedLibrary& operator=(const LoadedLibrary&) = delete;
    LoadedLibrary(LoadedLibrary&&) = delete;
    LoadedLibrary& operator=(LoadedLibrary&&) = delete;

    const DcmiFunctions& functions() const
    {
        return table;
    }

  private:
    template <typename Fn>
    void resolve(const char* name, Fn& fn);

    void resolveAll();

    void* handle = nullptr;
    DcmiFunctions table;
};

} // namespace npu::vendor

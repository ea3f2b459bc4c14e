/*
 * SPDX-FileCopyrightText: Copyright OpenBMC Authors
 * SPDX-License-Identifier: Apache-2.0
 */

#include "DcmiFunctions.hpp"

#include <optional>

namespace npu::vendor
{

std::optional<DcmiFunctions> linkedFunctions()
{
    DcmiFunctions table;
    table.dcmi_init = &::dcmi_init;
    table.dcmi_get_dcmi_version = &::dcmi_get_dcmi_version;
    table.dcmi_get_driver_version = &::dcmi_get_driver_version;
    table.dcmi_get_version = &::dcmi_get_version;
    table.dcmi_get_card_list = &::dcmi_get_card_list;
    table.dcmi_get_device_num_in_card = &::dcmi_get_device_num_in_card;
    table.dcmi_get_device_id_in_card = &::dcmi_get_device_id_in_card;
    table.dcmi_get_device_type = &::dcmi_get_device_type;
    table.dcmi_get_device_chip_info = &::dcmi_get_device_chip_info;
    table.dcmi_get_device_pcie_info = &::dcmi_get_device_pcie_info;
    table.dcmi_get_device_pcie_info_v2 = &::dcmi_get_device_pcie_info_v2;
    table.dcmi_get_device_board_info = &::dcmi_get_device_board_info;
    table.dcmi_get_device_elabel_info = &::dcmi_get_device_elabel_info;
    table.dcmi_get_device_power_info = &::dcmi_get_device_power_info;
    table.dcmi_get_device_die_v2 = &::dcmi_get_device_die_v2;
    table.dcmi_get_device_health = &::dcmi_get_device_health;
    table.dcmi_get_driver_health = &::dcmi_get_driver_health;
    table.dcmi_get_device_errorcode_v2 = &::dcmi_get_device_errorcode_v2;
    table.dcmi_get_device_errorcode_string =
        &::dcmi_get_device_errorcode_string;
    table.dcmi_get_device_flash_count = &::dcmi_get_device_flash_count;
    table.dcmi_get_device_flash_info_v2 = &::dcmi_get_device_flash_info_v2;
    table.dcmi_get_device_aicore_info = &::dcmi_get_device_aicore_info;
    table.dcmi_get_device_aicpu_info = &::dcmi_get_device_aicpu_info;
    table.dcmi_get_device_system_time = &::dcmi_get_device_system_time;
    table.dcmi_get_device_temperature = &::dcmi_get_device_temperature;
    table.dcmi_get_device_voltage = &::dcmi_get_device_voltage;
    table.dcmi_get_device_pcie_error_cnt = &::dcmi_get_device_pcie_error_cnt;
    table.dcmi_get_device_ecc_info = &::dcmi_get_device_ecc_info;
    table.dcmi_get_device_frequency = &::dcmi_get_device_frequency;
    table.dcmi_get_device_hbm_info = &::dcmi_get_device_hbm_info;
    table.dcmi_get_device_memory_info_v3 = &::dcmi_get_device_memory_info_v3;
    table.dcmi_get_device_utilization_rate =
        &::dcmi_get_device_utilization_rate;
    table.dcmi_create_vdevice = &::dcmi_create_vdevice;
    table.dcmi_set_destroy_vdevice = &::dcmi_set_destroy_vdevice;
    return table;
}

} // namespace npu::vendor

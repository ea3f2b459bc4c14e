/*
 * SPDX-FileCopyrightText: Copyright OpenBMC Authors
 * SPDX-License-Identifier: Apache-2.0
 */

#include "TelemetryJson.hpp"

#include "Telemetry.hpp"
#include "VirtualPartition.hpp"

#include <nlohmann/json.hpp>

namespace npu
{

using json = nlohmann::json;

void to_json(json& j, const ChipInfo& info)
{
    j = json{
        {"chip_type", info.chipType},
        {"chip_name", info.chipName},
        {"chip_version", info.chipVersion},
        {"ai_core_count", info.aiCoreCount},
    };
}

void to_json(json& j, const PcieInfo& info)
{
    j = json{
        {"device_id", info.deviceId},
        {"vender_id", info.vendorId},
        {"subvender_id", info.subvendorId},
        {"subdevice_id", info.subdeviceId},
        {"bdf_device_id", info.bdfDeviceId},
        {"bdf_bus_id", info.bdfBusId},
        {"bdf_func_id", info.bdfFuncId},
    };
}

void to_json(json& j, const DomainPcieInfo& info)
{
    j = json{
        {"pcie_info", info.pcieInfo},
        {"domain", info.domain},
    };
}

void to_json(json& j, const BoardInfo& info)
{
    j = json{
        {"board_id", info.boardId},
        {"pcb_id", info.pcbId},
        {"bom_id", info.bomId},
        {"slot_id", info.slotId},
    };
}

void to_json(json& j, const ElabelInfo& info)
{
    j = json{
        {"product_name", info.productName},
        {"model", info.model},
        {"manufacturer", info.manufacturer},
        {"serial_number", info.serialNumber},
    };
}

void to_json(json& j, const DieInfo& info)
{
    j = json{{"soc_die", info.socDie}};
}

void to_json(json& j, const FlashInfo& info)
{
    j = json{
        {"flash_id", info.flashId},
        {"device_id", info.deviceId},
        {"vendor", info.vendor},
        {"is_health", info.isHealthy},
        {"size", info.size},
        {"sector_count", info.sectorCount},
        {"manufacturer_id", info.manufacturerId},
    };
}

void to_json(json& j, const AiCoreInfo& info)
{
    j = json{
        {"frequency", info.frequency},
        {"current_frequency", info.currentFrequency},
    };
}

void to_json(json& j, const AiCpuInfo& info)
{
    j = json{
        {"max_frequency", info.maxFrequency},
        {"current_frequency", info.currentFrequency},
        {"aicpu_num", info.aicpuNum},
        {"util_rate", info.utilRate},
    };
}

void to_json(json& j, const MemoryInfo& info)
{
    j = json{
        {"memory_size", info.memorySize},
        {"memory_available", info.memoryAvailable},
        {"freq", info.frequency},
        {"huge_page_size", info.hugePageSize},
        {"huge_pages_total", info.hugePagesTotal},
        {"huge_pages_free", info.hugePagesFree},
        {"utilization", info.utilization},
    };
}

void to_json(json& j, const HbmInfo& info)
{
    j = json{
        {"memory_size", info.memorySize},
        {"frequency", info.frequency},
        {"memory_usage", info.memoryUsage},
        {"temperature", info.temperature},
        {"bandwidth_util_rate", info.bandwidthUtilRate},
    };
}

void to_json(json& j, const ChipPcieErrorRate& rate)
{
    j = json{
        {"deskew_fifo_overflow_intr_status",
         rate.deskewFifoOverflowIntrStatus},
        {"symbol_unlock_intr_status", rate.symbolUnlockIntrStatus},
        {"deskew_unlock_intr_status", rate.deskewUnlockIntrStatus},
        {"phystatus_timeout_intr_status", rate.phystatusTimeoutIntrStatus},
        {"symbol_unlock_counter", rate.symbolUnlockCounter},
        {"pcs_rx_err_cnt", rate.pcsRxErrCnt},
        {"phy_lane_err_counter", rate.phyLaneErrCounter},
        {"pcs_rcv_err_status", rate.pcsRcvErrStatus},
        {"symbol_unlock_err_status", rate.symbolUnlockErrStatus},
        {"phy_lane_err_status", rate.phyLaneErrStatus},
        {"dl_lcrc_err_num", rate.dlLcrcErrNum},
        {"dl_dcrc_err_num", rate.dlDcrcErrNum},
    };
}

void to_json(json& j, const EccInfo& info)
{
    j = json{
        {"enable_flag", info.enableFlag},
        {"single_bit_error_cnt", info.singleBitErrorCnt},
        {"double_bit_error_cnt", info.doubleBitErrorCnt},
        {"total_single_bit_error_cnt", info.totalSingleBitErrorCnt},
        {"total_double_bit_error_cnt", info.totalDoubleBitErrorCnt},
        {"single_bit_isolated_pages_cnt", info.singleBitIsolatedPagesCnt},
        {"double_bit_isolated_pages_cnt", info.doubleBitIsolatedPagesCnt},
    };
}

void to_json(json& j, const VirtualPartitionRequest& request)
{
    j = json{
        {"vchip_id", request.vchipId},
        {"vfg_id", request.vfgId},
        {"template_name", request.templateName},
    };
}

void to_json(json& j, const VirtualPartitionDescriptor& descriptor)
{
    j = json{
        {"vchip_id", descriptor.vchipId},
        {"vfg_id", descriptor.vfgId},
        {"pcie_bus", descriptor.pcieBus},
        {"pcie_device", descriptor.pcieDevice},
        {"pcie_function", descriptor.pcieFunction},
    };
}

} // namespace npu

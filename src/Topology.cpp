/*
 * SPDX-FileCopyrightText: Copyright OpenBMC Authors
 * SPDX-License-Identifier: Apache-2.0
 */

#include "Topology.hpp"

#include "DcmiInterface.hpp"
#include "DcmiRecords.hpp"
#include "Decoders.hpp"
#include "NpuError.hpp"
#include "Telemetry.hpp"

#include <array>
#include <cstdint>
#include <format>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

namespace npu
{

Chip::Chip(std::shared_ptr<DcmiInterface> dcmi, int managementUnitId, int id,
           std::optional<UnitType> type) :
    dcmi(std::move(dcmi)), unitId(managementUnitId), chipId(id),
    knownType(type)
{}

ManagementUnit Chip::managementUnit() const
{
    return {dcmi, unitId};
}

UnitType Chip::type() const
{
    if (knownType)
    {
        return *knownType;
    }
    uint32_t value = raw::unitTypeInvalid;
    throwOnError(dcmi->getDeviceType(unitId, chipId, value),
                 "dcmi_get_device_type");
    return decode::unitType(value);
}

ChipInfo Chip::info() const
{
    auto record = raw::zeroed<raw::ChipInfo>();
    throwOnError(dcmi->getDeviceChipInfo(unitId, chipId, record),
                 "dcmi_get_device_chip_info");
    return decode::chipInfo(record);
}

PcieInfo Chip::pcieInfo() const
{
    auto record = raw::zeroed<raw::PcieInfo>();
    throwOnError(dcmi->getDevicePcieInfo(unitId, chipId, record),
                 "dcmi_get_device_pcie_info");
    return decode::pcieInfo(record);
}

DomainPcieInfo Chip::domainPcieInfo() const
{
    auto record = raw::zeroed<raw::PcieInfoAll>();
    throwOnError(dcmi->getDevicePcieInfoV2(unitId, chipId, record),
                 "dcmi_get_device_pcie_info_v2");
    return decode::domainPcieInfo(record);
}

BoardInfo Chip::boardInfo() const
{
    auto record = raw::zeroed<raw::BoardInfo>();
    throwOnError(dcmi->getDeviceBoardInfo(unitId, chipId, record),
                 "dcmi_get_device_board_info");
    return decode::boardInfo(record);
}

ElabelInfo Chip::elabelInfo() const
{
    auto record = raw::zeroed<raw::ElabelInfo>();
    throwOnError(dcmi->getDeviceElabelInfo(unitId, chipId, record),
                 "dcmi_get_device_elabel_info");
    return decode::elabelInfo(record);
}

uint32_t Chip::powerInfo() const
{
    int power = 0;
    throwOnError(dcmi->getDevicePowerInfo(unitId, chipId, power),
                 "dcmi_get_device_power_info");
    if (power < 0)
    {
        throwDataError(DataError::malformedRecord,
                       std::format("negative power reading {}", power));
    }
    return static_cast<uint32_t>(power);
}

DieInfo Chip::dieInfo(DieType target) const
{
    auto record = raw::zeroed<raw::DieId>();
    throwOnError(dcmi->getDeviceDieV2(unitId, chipId,
                                      static_cast<uint32_t>(target), record),
                 "dcmi_get_device_die_v2");
    return decode::dieInfo(record);
}

HealthState Chip::health() const
{
    uint32_t value = 0;
    throwOnError(dcmi->getDeviceHealth(unitId, chipId, value),
                 "dcmi_get_device_health");
    if (value == raw::healthNotFound)
    {
        throw std::system_error(
            make_error_code(StatusError::deviceNotExist),
            std::format("chip {} of unit {} not found", chipId, unitId));
    }
    return decode::healthState(value);
}

std::vector<uint32_t> Chip::errorCodes() const
{
    std::array<uint32_t, raw::errorCodeCapacity> buffer{};
    int count = 0;
    throwOnError(dcmi->getDeviceErrorCodeV2(unitId, chipId, count, buffer),
                 "dcmi_get_device_errorcode_v2");
    if (count < 0 || static_cast<size_t>(count) > buffer.size())
    {
        throwDataError(DataError::malformedRecord,
                       std::format("error code count {} out of range", count));
    }
    return {buffer.begin(), buffer.begin() + count};
}

std::string Chip::errorCodeString(uint32_t errorCode, bool simplified) const
{
    std::array<uint8_t, raw::errorStringDetailedLength> buffer{};
    std::span<uint8_t> text(buffer);
    if (simplified)
    {
        text = text.first(raw::errorStringSimplifiedLength);
    }
    throwOnError(
        dcmi->getDeviceErrorCodeString(unitId, chipId, errorCode, text),
        "dcmi_get_device_errorcode_string");
    return decode::cString(std::span<const uint8_t>(text));
}

uint32_t Chip::flashCount() const
{
    uint32_t count = 0;
    throwOnError(dcmi->getDeviceFlashCount(unitId, chipId, count),
                 "dcmi_get_device_flash_count");
    return count;
}

FlashInfo Chip::flashInfo(uint32_t flashIndex) const
{
    auto record = raw::zeroed<raw::FlashInfo>();
    throwOnError(dcmi->getDeviceFlashInfoV2(unitId, chipId, flashIndex, record),
                 "dcmi_get_device_flash_info_v2");
    return decode::flashInfo(record);
}

AiCoreInfo Chip::aiCoreInfo() const
{
    auto record = raw::zeroed<raw::AicoreInfo>();
    throwOnError(dcmi->getDeviceAicoreInfo(unitId, chipId, record),
                 "dcmi_get_device_aicore_info");
    return decode::aiCoreInfo(record);
}

AiCpuInfo Chip::aiCpuInfo() const
{
    auto record = raw::zeroed<raw::AicpuInfo>();
    throwOnError(dcmi->getDeviceAicpuInfo(unitId, chipId, record),
                 "dcmi_get_device_aicpu_info");
    return decode::aiCpuInfo(record);
}

uint32_t Chip::systemTime() const
{
    uint32_t time = 0;
    throwOnError(dcmi->getDeviceSystemTime(unitId, chipId, time),
                 "dcmi_get_device_system_time");
    return time;
}

int32_t Chip::temperature() const
{
    int value = 0;
    throwOnError(dcmi->getDeviceTemperature(unitId, chipId, value),
                 "dcmi_get_device_temperature");
    return decode::reading(static_cast<int32_t>(value));
}

uint32_t Chip::voltage() const
{
    uint32_t value = 0;
    throwOnError(dcmi->getDeviceVoltage(unitId, chipId, value),
                 "dcmi_get_device_voltage");
    return decode::reading(value);
}

ChipPcieErrorRate Chip::pcieErrorRate() const
{
    auto record = raw::zeroed<raw::PcieErrorRate>();
    throwOnError(dcmi->getDevicePcieErrorCnt(unitId, chipId, record),
                 "dcmi_get_device_pcie_error_cnt");
    return decode::pcieErrorRate(record);
}

EccInfo Chip::eccInfo(DeviceType target) const
{
    auto record = raw::zeroed<raw::EccInfo>();
    throwOnError(dcmi->getDeviceEccInfo(unitId, chipId,
                                        static_cast<uint32_t>(target), record),
                 "dcmi_get_device_ecc_info");
    return decode::eccInfo(record);
}

uint32_t Chip::frequency(FrequencyType target) const
{
    uint32_t value = 0;
    throwOnError(dcmi->getDeviceFrequency(
                     unitId, chipId, static_cast<uint32_t>(target), value),
                 "dcmi_get_device_frequency");
    return value;
}

HbmInfo Chip::hbmInfo() const
{
    auto record = raw::zeroed<raw::HbmInfo>();
    throwOnError(dcmi->getDeviceHbmInfo(unitId, chipId, record),
                 "dcmi_get_device_hbm_info");
    return decode::hbmInfo(record);
}

MemoryInfo Chip::memoryInfo() const
{
    auto record = raw::zeroed<raw::MemoryInfo>();
    throwOnError(dcmi->getDeviceMemoryInfoV3(unitId, chipId, record),
                 "dcmi_get_device_memory_info_v3");
    return decode::memoryInfo(record);
}

uint32_t Chip::utilizationRate(UtilizationType target) const
{
    uint32_t value = 0;
    throwOnError(dcmi->getDeviceUtilizationRate(
                     unitId, chipId, static_cast<int>(target), value),
                 "dcmi_get_device_utilization_rate");
    return value;
}

ManagementUnit::ManagementUnit(std::shared_ptr<DcmiInterface> dcmi, int id) :
    dcmi(std::move(dcmi)), unitId(id)
{}

int ManagementUnit::chipCount() const
{
    int count = 0;
    throwOnError(dcmi->getDeviceNumInCard(unitId, count),
                 "dcmi_get_device_num_in_card");
    return count;
}

ChipSet ManagementUnit::chips() const
{
    int deviceIdMax = 0;
    int mcuId = raw::absentChipId;
    int cpuId = raw::absentChipId;
    throwOnError(dcmi->getDeviceIdInCard(unitId, deviceIdMax, mcuId, cpuId),
                 "dcmi_get_device_id_in_card");

    ChipSet chipSet;
    for (int id = 0; id < deviceIdMax; id++)
    {
        chipSet.npuChips.emplace_back(dcmi, unitId, id, UnitType::npu);
    }
    if (mcuId != raw::absentChipId)
    {
        chipSet.mcuChip.emplace(dcmi, unitId, mcuId, UnitType::mcu);
    }
    if (cpuId != raw::absentChipId)
    {
        chipSet.cpuChip.emplace(dcmi, unitId, cpuId, UnitType::cpu);
    }
    return chipSet;
}

} // namespace npu

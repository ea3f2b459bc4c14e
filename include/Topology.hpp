/*
 * SPDX-FileCopyrightText: Copyright OpenBMC Authors
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "DcmiInterface.hpp"
#include "Telemetry.hpp"
#include "VirtualPartition.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace npu
{

class ManagementUnit;

/**
 * @brief An NPU, MCU or CPU inside a management unit.
 *
 * A Chip only records the ids it was built with and a handle to the
 * library; every query is a fresh vendor call. Most queries are only
 * answered for NPU chips, some for MCU chips too, and the vendor status
 * says so when a chip does not support one.
 */
class Chip
{
  public:
    /**
     * @param type  Unit type already known from enumeration, if any
     *
     * Ids are not checked. A chip built with a bad id fails on its first
     * query.
     */
    Chip(std::shared_ptr<DcmiInterface> dcmi, int managementUnitId, int id,
         std::optional<UnitType> type = std::nullopt);

    int id() const
    {
        return chipId;
    }

    int managementUnitId() const
    {
        return unitId;
    }

    ManagementUnit managementUnit() const;

    UnitType type() const;

    ChipInfo info() const;

    PcieInfo pcieInfo() const;

    DomainPcieInfo domainPcieInfo() const;

    BoardInfo boardInfo() const;

    ElabelInfo elabelInfo() const;

    // Power in units of 0.1 W
    uint32_t powerInfo() const;

    DieInfo dieInfo(DieType target) const;

    /**
     * @brief Chip health.
     *
     * Unlike Session::driverHealth the not-found sentinel is reported by
     * throwing StatusError::deviceNotExist.
     */
    HealthState health() const;

    std::vector<uint32_t> errorCodes() const;

    std::string errorCodeString(uint32_t errorCode, bool simplified) const;

    uint32_t flashCount() const;

    FlashInfo flashInfo(uint32_t flashIndex) const;

    AiCoreInfo aiCoreInfo() const;

    AiCpuInfo aiCpuInfo() const;

    // Seconds since the epoch on the chip clock
    uint32_t systemTime() const;

    // Degrees Celsius
    int32_t temperature() const;

    // Units of 0.01 V
    uint32_t voltage() const;

    ChipPcieErrorRate pcieErrorRate() const;

    EccInfo eccInfo(DeviceType target) const;

    // MHz
    uint32_t frequency(FrequencyType target) const;

    HbmInfo hbmInfo() const;

    MemoryInfo memoryInfo() const;

    // Percent
    uint32_t utilizationRate(UtilizationType target) const;

    VirtualPartitionDescriptor
        createVirtualPartition(const VirtualPartitionRequest& request) const;

    /**
     * @brief Destroy one virtual partition, or all of them when @p vchipId
     *        is allVirtualPartitions.
     */
    void destroyVirtualPartition(uint32_t vchipId) const;

    // Chips are equal when they name the same chip of the same unit
    bool operator==(const Chip& other) const
    {
        return unitId == other.unitId && chipId == other.chipId;
    }

  private:
    std::shared_ptr<DcmiInterface> dcmi;
    int unitId;
    int chipId;
    std::optional<UnitType> knownType;
};

struct ChipSet
{
    std::vector<Chip> npuChips;
    std::optional<Chip> mcuChip;
    std::optional<Chip> cpuChip;
};

/**
 * @brief A card slot holding one or more chips.
 */
class ManagementUnit
{
  public:
    ManagementUnit(std::shared_ptr<DcmiInterface> dcmi, int id);

    int id() const
    {
        return unitId;
    }

    int chipCount() const;

    /**
     * @brief Enumerate the chips of this unit with one vendor call.
     *
     * NPU chips get ids 0 up to the exclusive bound the library reports. The
     * MCU and CPU chips are present only when the library reports their id.
     */
    ChipSet chips() const;

    bool operator==(const ManagementUnit& other) const
    {
        return unitId == other.unitId;
    }

  private:
    std::shared_ptr<DcmiInterface> dcmi;
    int unitId;
};

} // namespace npu

/*
 * SPDX-FileCopyrightText: Copyright OpenBMC Authors
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "DcmiRecords.hpp"

#include <array>
#include <cstdint>
#include <string>

namespace npu
{

enum class UnitType : uint32_t
{
    npu = raw::unitTypeNpu,
    mcu = raw::unitTypeMcu,
    cpu = raw::unitTypeCpu,
    invalid = raw::unitTypeInvalid,
};

enum class HealthState : uint32_t
{
    ok = 0,
    generalAlarm = 1,
    importantAlarm = 2,
    emergencyAlarm = 3,
    deviceNotFoundOrNotStarted = raw::healthNotFound,
};

enum class DieType : uint32_t
{
    ndie = 0,
    vdie = 1,
};

// ECC can only be queried for ddr and hbm
enum class DeviceType : uint32_t
{
    ddr = 0,
    sram = 1,
    hbm = 2,
    npu = 3,
};

enum class FrequencyType : uint32_t
{
    ddr = 1,
    ctrlCpu = 2,
    hbm = 6,
    aiCoreCurrent = 7,
    aiCoreMax = 9,
    vectorCoreCurrent = 12,
};

enum class UtilizationType : int
{
    memory = 1,
    aiCore = 2,
    aiCpu = 3,
    ctrlCpu = 4,
    memoryBandwidth = 5,
    hbm = 6,
    hbmBandwidth = 10,
    vectorCore = 12,
};

constexpr size_t pcieLaneCount = 32;

/**
 * @brief Per-lane flags of a 32 bit PCIe status register, bit 0 first.
 *
 * All 32 entries are kept even though a link may use fewer lanes.
 */
using LaneStatus = std::array<bool, pcieLaneCount>;

struct ChipInfo
{
    std::string chipType;
    std::string chipName;
    std::string chipVersion;
    // meaningless for MCU and CPU chips
    uint32_t aiCoreCount{};

    bool operator==(const ChipInfo&) const = default;
};

struct PcieInfo
{
    uint32_t deviceId{};
    uint32_t vendorId{};
    uint32_t subvendorId{};
    uint32_t subdeviceId{};
    uint32_t bdfDeviceId{};
    uint32_t bdfBusId{};
    uint32_t bdfFuncId{};

    bool operator==(const PcieInfo&) const = default;
};

struct DomainPcieInfo
{
    PcieInfo pcieInfo;
    int32_t domain{};

    bool operator==(const DomainPcieInfo&) const = default;
};

/**
 * @brief Board identification.
 *
 * For an NPU chip only boardId and slotId are meaningful and slotId names
 * the PCIe slot. For an MCU chip every field is meaningful and slotId names
 * the card position.
 */
struct BoardInfo
{
    uint32_t boardId{};
    uint32_t pcbId{};
    uint32_t bomId{};
    uint32_t slotId{};

    bool operator==(const BoardInfo&) const = default;
};

struct ElabelInfo
{
    std::string productName;
    std::string model;
    std::string manufacturer;
    std::string serialNumber;

    bool operator==(const ElabelInfo&) const = default;
};

struct DieInfo
{
    std::array<uint32_t, raw::dieIdCount> socDie{};

    bool operator==(const DieInfo&) const = default;
};

struct FlashInfo
{
    uint64_t flashId{};
    uint16_t deviceId{};
    uint16_t vendor{};
    bool isHealthy{};
    uint64_t size{};
    uint32_t sectorCount{};
    uint16_t manufacturerId{};

    bool operator==(const FlashInfo&) const = default;
};

// Frequencies in MHz
struct AiCoreInfo
{
    uint32_t frequency{};
    uint32_t currentFrequency{};

    bool operator==(const AiCoreInfo&) const = default;
};

struct AiCpuInfo
{
    uint32_t maxFrequency{};
    uint32_t currentFrequency{};
    uint32_t aicpuNum{};
    std::array<uint32_t, raw::maxCoreCount> utilRate{};

    bool operator==(const AiCpuInfo&) const = default;
};

/**
 * @brief DDR memory of a chip.
 *
 * Sizes are in MB except hugePageSize which is in KB. memoryAvailable is
 * free memory plus free huge pages.
 */
struct MemoryInfo
{
    uint64_t memorySize{};
    uint64_t memoryAvailable{};
    uint32_t frequency{};
    uint64_t hugePageSize{};
    uint64_t hugePagesTotal{};
    uint64_t hugePagesFree{};
    uint32_t utilization{};

    bool operator==(const MemoryInfo&) const = default;
};

struct HbmInfo
{
    uint64_t memorySize{};
    uint32_t frequency{};
    uint64_t memoryUsage{};
    int32_t temperature{};
    uint32_t bandwidthUtilRate{};

    bool operator==(const HbmInfo&) const = default;
};

struct ChipPcieErrorRate
{
    bool deskewFifoOverflowIntrStatus{};
    bool symbolUnlockIntrStatus{};
    bool deskewUnlockIntrStatus{};
    bool phystatusTimeoutIntrStatus{};
    uint32_t symbolUnlockCounter{};
    uint32_t pcsRxErrCnt{};
    uint32_t phyLaneErrCounter{};
    LaneStatus pcsRcvErrStatus{};
    LaneStatus symbolUnlockErrStatus{};
    LaneStatus phyLaneErrStatus{};
    uint32_t dlLcrcErrNum{};
    uint32_t dlDcrcErrNum{};

    bool operator==(const ChipPcieErrorRate&) const = default;
};

struct EccInfo
{
    bool enableFlag{};
    uint32_t singleBitErrorCnt{};
    uint32_t doubleBitErrorCnt{};
    uint32_t totalSingleBitErrorCnt{};
    uint32_t totalDoubleBitErrorCnt{};
    uint32_t singleBitIsolatedPagesCnt{};
    uint32_t doubleBitIsolatedPagesCnt{};

    bool operator==(const EccInfo&) const = default;
};

} // namespace npu

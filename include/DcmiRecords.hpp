/*
 * SPDX-FileCopyrightText: Copyright OpenBMC Authors
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <type_traits>

/**
 * @file
 * @brief Fixed-size output records exchanged with the DCMI library.
 *
 * Each record carries the fields of the matching vendor structure with the
 * vendor widths. Records are trivially copyable and are always created
 * through zeroed<Record>() before being handed to a call as an output
 * parameter.
 */

namespace npu::raw
{

constexpr size_t chipNameLength = 32;
constexpr size_t elabelFieldLength = 256;
constexpr size_t dieIdCount = 5;
constexpr size_t maxCoreCount = 64;
constexpr size_t templateNameLength = 32;

constexpr size_t dcmiVersionLength = 16;
constexpr size_t driverVersionLength = 64;
constexpr size_t cardListCapacity = 64;
constexpr size_t errorCodeCapacity = 128;
constexpr size_t errorStringSimplifiedLength = 48;
constexpr size_t errorStringDetailedLength = 256;

constexpr int32_t absentChipId = -1;
constexpr uint32_t healthNotFound = 0xFFFFFFFF;
constexpr uint32_t flashHealthy = 0x8;
constexpr uint32_t autoAssignId = 0xFFFFFFFF;

/**
 * @brief Raw dcmi_unit_type values.
 */
constexpr uint32_t unitTypeNpu = 0;
constexpr uint32_t unitTypeMcu = 1;
constexpr uint32_t unitTypeCpu = 2;
constexpr uint32_t unitTypeInvalid = 0xFF;

template <typename Record>
Record zeroed()
{
    static_assert(std::is_trivially_copyable_v<Record>);
    return Record{};
}

struct ChipInfo
{
    std::array<uint8_t, chipNameLength> chipType;
    std::array<uint8_t, chipNameLength> chipName;
    std::array<uint8_t, chipNameLength> chipVersion;
    uint32_t aicoreCount;
};

struct PcieInfo
{
    uint32_t deviceId;
    uint32_t venderId;
    uint32_t subvenderId;
    uint32_t subdeviceId;
    uint32_t bdfDeviceId;
    uint32_t bdfBusId;
    uint32_t bdfFuncId;
};

struct PcieInfoAll
{
    PcieInfo base;
    int32_t domain;
};

struct BoardInfo
{
    uint32_t boardId;
    uint32_t pcbId;
    uint32_t bomId;
    uint32_t slotId;
};

struct ElabelInfo
{
    std::array<uint8_t, elabelFieldLength> productName;
    std::array<uint8_t, elabelFieldLength> model;
    std::array<uint8_t, elabelFieldLength> manufacturer;
    std::array<uint8_t, elabelFieldLength> serialNumber;
};

struct DieId
{
    std::array<uint32_t, dieIdCount> socDie;
};

struct FlashInfo
{
    uint64_t flashId;
    uint16_t deviceId;
    uint16_t vendor;
    uint32_t state;
    uint64_t size;
    uint32_t sectorCount;
    uint16_t manufacturerId;
};

struct AicoreInfo
{
    uint32_t freq;
    uint32_t curFreq;
};

struct AicpuInfo
{
    uint32_t maxFreq;
    uint32_t curFreq;
    uint32_t aicpuNum;
    std::array<uint32_t, maxCoreCount> utilRate;
};

struct MemoryInfo
{
    uint64_t memorySize;
    uint64_t memoryAvailable;
    uint32_t freq;
    uint64_t hugePageSize;
    uint64_t hugePagesTotal;
    uint64_t hugePagesFree;
    uint32_t utilization;
};

struct HbmInfo
{
    uint64_t memorySize;
    uint32_t freq;
    uint64_t memoryUsage;
    int32_t temp;
    uint32_t bandwidthUtilRate;
};

struct PcieErrorRate
{
    uint32_t deskewFifoOverflowIntrStatus;
    uint32_t symbolUnlockIntrStatus;
    uint32_t deskewUnlockIntrStatus;
    uint32_t phystatusTimeoutIntrStatus;
    uint32_t symbolUnlockCounter;
    uint32_t pcsRxErrCnt;
    uint32_t phyLaneErrCounter;
    uint32_t pcsRcvErrStatus;
    uint32_t symbolUnlockErrStatus;
    uint32_t phyLaneErrStatus;
    uint32_t dlLcrcErrNum;
    uint32_t dlDcrcErrNum;
};

struct EccInfo
{
    int32_t enableFlag;
    uint32_t singleBitErrorCnt;
    uint32_t doubleBitErrorCnt;
    uint32_t totalSingleBitErrorCnt;
    uint32_t totalDoubleBitErrorCnt;
    uint32_t singleBitIsolatedPagesCnt;
    uint32_t doubleBitIsolatedPagesCnt;
};

struct CreateVdevRes
{
    uint32_t vdevId;
    uint32_t vfgId;
    std::array<char, templateNameLength> templateName;
};

struct CreateVdevOut
{
    uint32_t vdevId;
    uint32_t pcieBus;
    uint32_t pcieDevice;
    uint32_t pcieFunc;
    uint32_t vfgId;
};

} // namespace npu::raw

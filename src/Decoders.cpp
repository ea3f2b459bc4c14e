/*
 * SPDX-FileCopyrightText: Copyright OpenBMC Authors
 * SPDX-License-Identifier: Apache-2.0
 */

#include "Decoders.hpp"

#include "DcmiRecords.hpp"
#include "NpuError.hpp"
#include "Telemetry.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <format>
#include <iterator>
#include <span>
#include <string>

namespace npu::decode
{

namespace
{

constexpr int32_t invalidDataSentinel = 0x7ffd;
constexpr int32_t readErrorSentinel = 0x7fff;

// Length of the UTF-8 sequence starting at text[pos], 0 if malformed
size_t utf8SequenceLength(std::span<const uint8_t> text, size_t pos)
{
    uint8_t lead = text[pos];
    size_t length = 0;
    uint32_t codePoint = 0;
    if (lead < 0x80)
    {
        return 1;
    }
    if ((lead & 0xE0) == 0xC0)
    {
        length = 2;
        codePoint = lead & 0x1F;
    }
    else if ((lead & 0xF0) == 0xE0)
    {
        length = 3;
        codePoint = lead & 0x0F;
    }
    else if ((lead & 0xF8) == 0xF0)
    {
        length = 4;
        codePoint = lead & 0x07;
    }
    else
    {
        return 0;
    }

    if (pos + length > text.size())
    {
        return 0;
    }
    for (size_t i = 1; i < length; i++)
    {
        uint8_t next = text[pos + i];
        if ((next & 0xC0) != 0x80)
        {
            return 0;
        }
        codePoint = (codePoint << 6) | (next & 0x3F);
    }

    // Reject overlong forms, surrogates and values past U+10FFFF
    constexpr uint32_t minimum[] = {0, 0, 0x80, 0x800, 0x10000};
    if (codePoint < minimum[length] || codePoint > 0x10FFFF ||
        (codePoint >= 0xD800 && codePoint <= 0xDFFF))
    {
        return 0;
    }
    return length;
}

bool isValidUtf8(std::span<const uint8_t> text)
{
    size_t pos = 0;
    while (pos < text.size())
    {
        size_t length = utf8SequenceLength(text, pos);
        if (length == 0)
        {
            return false;
        }
        pos += length;
    }
    return true;
}

} // namespace

std::string cString(std::span<const uint8_t> buffer)
{
    auto nul = std::ranges::find(buffer, uint8_t{0});
    if (nul == buffer.end())
    {
        throwDataError(DataError::invalidText,
                       std::format("no NUL in {} byte buffer", buffer.size()));
    }
    auto text = buffer.first(
        static_cast<size_t>(std::distance(buffer.begin(), nul)));
    if (!isValidUtf8(text))
    {
        throwDataError(DataError::invalidText, "string is not valid UTF-8");
    }
    return {text.begin(), text.end()};
}

std::string cString(std::span<const char> buffer)
{
    return cString(std::span<const uint8_t>(
        reinterpret_cast<const uint8_t*>(buffer.data()), buffer.size()));
}

std::string boundedString(std::span<const char> text)
{
    std::span<const uint8_t> bytes(
        reinterpret_cast<const uint8_t*>(text.data()), text.size());
    auto nul = std::ranges::find(bytes, uint8_t{0});
    bytes = bytes.first(static_cast<size_t>(std::distance(bytes.begin(), nul)));
    if (!isValidUtf8(bytes))
    {
        throwDataError(DataError::invalidText, "string is not valid UTF-8");
    }
    return {bytes.begin(), bytes.end()};
}

int32_t reading(int32_t value)
{
    switch (value)
    {
        case invalidDataSentinel:
            throwDataError(DataError::invalidData, "reading reported invalid");
        case readErrorSentinel:
            throwDataError(DataError::readError, "reading could not be read");
        default:
            return value;
    }
}

uint32_t reading(uint32_t value)
{
    if (value <= static_cast<uint32_t>(readErrorSentinel))
    {
        reading(static_cast<int32_t>(value));
    }
    return value;
}

LaneStatus laneStatus(uint32_t bits)
{
    LaneStatus lanes{};
    for (size_t lane = 0; lane < lanes.size(); lane++)
    {
        lanes[lane] = (bits & (1U << lane)) != 0;
    }
    return lanes;
}

uint32_t encodeLaneStatus(const LaneStatus& lanes)
{
    uint32_t bits = 0;
    for (size_t lane = 0; lane < lanes.size(); lane++)
    {
        if (lanes[lane])
        {
            bits |= 1U << lane;
        }
    }
    return bits;
}

UnitType unitType(uint32_t value)
{
    switch (value)
    {
        case raw::unitTypeNpu:
            return UnitType::npu;
        case raw::unitTypeMcu:
            return UnitType::mcu;
        case raw::unitTypeCpu:
            return UnitType::cpu;
        case raw::unitTypeInvalid:
            return UnitType::invalid;
        default:
            throwDataError(DataError::malformedRecord,
                           std::format("unknown unit type {}", value));
    }
}

HealthState healthState(uint32_t value)
{
    switch (value)
    {
        case 0:
            return HealthState::ok;
        case 1:
            return HealthState::generalAlarm;
        case 2:
            return HealthState::importantAlarm;
        case 3:
            return HealthState::emergencyAlarm;
        case raw::healthNotFound:
            return HealthState::deviceNotFoundOrNotStarted;
        default:
            throwDataError(DataError::malformedRecord,
                           std::format("unknown health state {}", value));
    }
}

ChipInfo chipInfo(const raw::ChipInfo& record)
{
    return ChipInfo{
        .chipType = cString(record.chipType),
        .chipName = cString(record.chipName),
        .chipVersion = cString(record.chipVersion),
        .aiCoreCount = record.aicoreCount,
    };
}

PcieInfo pcieInfo(const raw::PcieInfo& record)
{
    return PcieInfo{
        .deviceId = record.deviceId,
        .vendorId = record.venderId,
        .subvendorId = record.subvenderId,
        .subdeviceId = record.subdeviceId,
        .bdfDeviceId = record.bdfDeviceId,
        .bdfBusId = record.bdfBusId,
        .bdfFuncId = record.bdfFuncId,
    };
}

DomainPcieInfo domainPcieInfo(const raw::PcieInfoAll& record)
{
    return DomainPcieInfo{
        .pcieInfo = pcieInfo(record.base),
        .domain = record.domain,
    };
}

BoardInfo boardInfo(const raw::BoardInfo& record)
{
    return BoardInfo{
        .boardId = record.boardId,
        .pcbId = record.pcbId,
        .bomId = record.bomId,
        .slotId = record.slotId,
    };
}

ElabelInfo elabelInfo(const raw::ElabelInfo& record)
{
    return ElabelInfo{
        .productName = cString(record.productName),
        .model = cString(record.model),
        .manufacturer = cString(record.manufacturer),
        .serialNumber = cString(record.serialNumber),
    };
}

DieInfo dieInfo(const raw::DieId& record)
{
    return DieInfo{.socDie = record.socDie};
}

FlashInfo flashInfo(const raw::FlashInfo& record)
{
    return FlashInfo{
        .flashId = record.flashId,
        .deviceId = record.deviceId,
        .vendor = record.vendor,
        .isHealthy = record.state == raw::flashHealthy,
        .size = record.size,
        .sectorCount = record.sectorCount,
        .manufacturerId = record.manufacturerId,
    };
}

AiCoreInfo aiCoreInfo(const raw::AicoreInfo& record)
{
    return AiCoreInfo{
        .frequency = record.freq,
        .currentFrequency = record.curFreq,
    };
}

AiCpuInfo aiCpuInfo(const raw::AicpuInfo& record)
{
    return AiCpuInfo{
        .maxFrequency = record.maxFreq,
        .currentFrequency = record.curFreq,
        .aicpuNum = record.aicpuNum,
        .utilRate = record.utilRate,
    };
}

MemoryInfo memoryInfo(const raw::MemoryInfo& record)
{
    return MemoryInfo{
        .memorySize = record.memorySize,
        .memoryAvailable = record.memoryAvailable,
        .frequency = record.freq,
        .hugePageSize = record.hugePageSize,
        .hugePagesTotal = record.hugePagesTotal,
        .hugePagesFree = record.hugePagesFree,
        .utilization = record.utilization,
    };
}

HbmInfo hbmInfo(const raw::HbmInfo& record)
{
    return HbmInfo{
        .memorySize = record.memorySize,
        .frequency = record.freq,
        .memoryUsage = record.memoryUsage,
        .temperature = record.temp,
        .bandwidthUtilRate = record.bandwidthUtilRate,
    };
}

ChipPcieErrorRate pcieErrorRate(const raw::PcieErrorRate& record)
{
    return ChipPcieErrorRate{
        .deskewFifoOverflowIntrStatus =
            record.deskewFifoOverflowIntrStatus != 0,
        .symbolUnlockIntrStatus = record.symbolUnlockIntrStatus != 0,
        .deskewUnlockIntrStatus = record.deskewUnlockIntrStatus != 0,
        .phystatusTimeoutIntrStatus = record.phystatusTimeoutIntrStatus != 0,
        .symbolUnlockCounter = record.symbolUnlockCounter,
        .pcsRxErrCnt = record.pcsRxErrCnt,
        .phyLaneErrCounter = record.phyLaneErrCounter,
        .pcsRcvErrStatus = laneStatus(record.pcsRcvErrStatus),
        .symbolUnlockErrStatus = laneStatus(record.symbolUnlockErrStatus),
        .phyLaneErrStatus = laneStatus(record.phyLaneErrStatus),
        .dlLcrcErrNum = record.dlLcrcErrNum,
        .dlDcrcErrNum = record.dlDcrcErrNum,
    };
}

EccInfo eccInfo(const raw::EccInfo& record)
{
    return EccInfo{
        .enableFlag = record.enableFlag != 0,
        .singleBitErrorCnt = record.singleBitErrorCnt,
        .doubleBitErrorCnt = record.doubleBitErrorCnt,
        .totalSingleBitErrorCnt = record.totalSingleBitErrorCnt,
        .totalDoubleBitErrorCnt = record.totalDoubleBitErrorCnt,
        .singleBitIsolatedPagesCnt = record.singleBitIsolatedPagesCnt,
        .doubleBitIsolatedPagesCnt = record.doubleBitIsolatedPagesCnt,
    };
}

} // namespace npu::decode

/*
 * SPDX-FileCopyrightText: Copyright OpenBMC Authors
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "DcmiRecords.hpp"
#include "Telemetry.hpp"

#include <cstdint>
#include <span>
#include <string>

namespace npu::decode
{

/**
 * @brief Decode a NUL-terminated string held in a fixed-size buffer.
 *
 * Only the bytes before the first NUL are decoded. Throws DataError::
 * invalidText when the buffer holds no NUL or when those bytes are not
 * valid UTF-8.
 */
std::string cString(std::span<const uint8_t> buffer);
std::string cString(std::span<const char> buffer);

/**
 * @brief Decode text whose length is reported separately from the buffer.
 *
 * Decoding stops at the first NUL or at the end of @p text, whichever comes
 * first. Throws DataError::invalidText when the bytes are not valid UTF-8.
 */
std::string boundedString(std::span<const char> text);

/**
 * @brief Intercept the data-quality sentinels of a scalar reading.
 *
 * 0x7ffd throws DataError::invalidData, 0x7fff throws DataError::readError,
 * anything else is returned unchanged.
 */
int32_t reading(int32_t value);
uint32_t reading(uint32_t value);

LaneStatus laneStatus(uint32_t bits);

uint32_t encodeLaneStatus(const LaneStatus& lanes);

UnitType unitType(uint32_t value);

HealthState healthState(uint32_t value);

ChipInfo chipInfo(const raw::ChipInfo& record);

PcieInfo pcieInfo(const raw::PcieInfo& record);

DomainPcieInfo domainPcieInfo(const raw::PcieInfoAll& record);

BoardInfo boardInfo(const raw::BoardInfo& record);

ElabelInfo elabelInfo(const raw::ElabelInfo& record);

DieInfo dieInfo(const raw::DieId& record);

FlashInfo flashInfo(const raw::FlashInfo& record);

AiCoreInfo aiCoreInfo(const raw::AicoreInfo& record);

AiCpuInfo aiCpuInfo(const raw::AicpuInfo& record);

MemoryInfo memoryInfo(const raw::MemoryInfo& record);

HbmInfo hbmInfo(const raw::HbmInfo& record);

ChipPcieErrorRate pcieErrorRate(const raw::PcieErrorRate& record);

EccInfo eccInfo(const raw::EccInfo& record);

} // namespace npu::decode

/*
 * SPDX-FileCopyrightText: Copyright OpenBMC Authors
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "DcmiRecords.hpp"

#include <cstdint>
#include <span>

namespace npu
{

/**
 * @brief The raw call surface of the DCMI library.
 *
 * One method per vendor entry point. Every method returns the vendor status
 * unchanged and writes its results into caller-owned records or buffers. No
 * method interprets a status or a record; that is left to the topology and
 * decoder layers.
 *
 * Implementations must only be called after init() has returned 0.
 */
class DcmiInterface
{
  public:
    virtual ~DcmiInterface() = default;

    virtual int init() = 0;

    virtual int getDcmiVersion(std::span<char> version) = 0;

    virtual int getDriverVersion(std::span<char> version) = 0;

    /**
     * @param length  Receives the number of bytes the library wrote
     */
    virtual int getVersion(int cardId, int deviceId, std::span<char> version,
                           int& length) = 0;

    /**
     * @param cardCount  Receives the number of valid ids at the front of
     *                   @p cardList
     */
    virtual int getCardList(int& cardCount, std::span<int> cardList) = 0;

    virtual int getDeviceNumInCard(int cardId, int& deviceNum) = 0;

    /**
     * @param deviceIdMax  Receives the exclusive upper bound of NPU chip ids
     * @param mcuId        Receives the MCU chip id, or -1 when absent
     * @param cpuId        Receives the CPU chip id, or -1 when absent
     */
    virtual int getDeviceIdInCard(int cardId, int& deviceIdMax, int& mcuId,
                                  int& cpuId) = 0;

    virtual int getDeviceType(int cardId, int deviceId,
                              uint32_t& unitType) = 0;

    virtual int getDeviceChipInfo(int cardId, int deviceId,
                                  raw::ChipInfo& info) = 0;

    virtual int getDevicePcieInfo(int cardId, int deviceId,
                                  raw::PcieInfo& info) = 0;

    virtual int getDevicePcieInfoV2(int cardId, int deviceId,
                                    raw::PcieInfoAll& info) = 0;

    virtual int getDeviceBoardInfo(int cardId, int deviceId,
                                   raw::BoardInfo& info) = 0;

    virtual int getDeviceElabelInfo(int cardId, int deviceId,
                                    raw::ElabelInfo& info) = 0;

    virtual int getDevicePowerInfo(int cardId, int deviceId, int& power) = 0;

    virtual int getDeviceDieV2(int cardId, int deviceId, uint32_t dieType,
                               raw::DieId& dieId) = 0;

    virtual int getDeviceHealth(int cardId, int deviceId,
                                uint32_t& health) = 0;

    virtual int getDriverHealth(uint32_t& health) = 0;

    virtual int getDeviceErrorCodeV2(int cardId, int deviceId,
                                     int& errorCount,
                                     std::span<uint32_t> errorCodes) = 0;

    virtual int getDeviceErrorCodeString(int cardId, int deviceId,
                                         uint32_t errorCode,
                                         std::span<uint8_t> info) = 0;

    virtual int getDeviceFlashCount(int cardId, int deviceId,
                                    uint32_t& count) = 0;

    virtual int getDeviceFlashInfoV2(int cardId, int deviceId,
                                     uint32_t flashIndex,
                                     raw::FlashInfo& info) = 0;

    virtual int getDeviceAicoreInfo(int cardId, int deviceId,
                                    raw::AicoreInfo& info) = 0;

    virtual int getDeviceAicpuInfo(int cardId, int deviceId,
                                   raw::AicpuInfo& info) = 0;

    virtual int getDeviceSystemTime(int cardId, int deviceId,
                                    uint32_t& time) = 0;

    virtual int getDeviceTemperature(int cardId, int deviceId,
                                     int& temperature) = 0;

    virtual int getDeviceVoltage(int cardId, int deviceId,
                                 uint32_t& voltage) = 0;

    virtual int getDevicePcieErrorCnt(int cardId, int deviceId,
                                      raw::PcieErrorRate& rate) = 0;

    virtual int getDeviceEccInfo(int cardId, int deviceId, uint32_t deviceType,
                                 raw::EccInfo& info) = 0;

    virtual int getDeviceFrequency(int cardId, int deviceId,
                                   uint32_t frequencyType,
                                   uint32_t& frequency) = 0;

    virtual int getDeviceHbmInfo(int cardId, int deviceId,
                                 raw::HbmInfo& info) = 0;

    virtual int getDeviceMemoryInfoV3(int cardId, int deviceId,
                                      raw::MemoryInfo& info) = 0;

    virtual int getDeviceUtilizationRate(int cardId, int deviceId,
                                         int inputType,
                                         uint32_t& utilization) = 0;

    virtual int createVdevice(int cardId, int deviceId,
                              const raw::CreateVdevRes& request,
                              raw::CreateVdevOut& out) = 0;

    virtual int setDestroyVdevice(int cardId, int deviceId,
                                  uint32_t vdevId) = 0;
};

} // namespace npu

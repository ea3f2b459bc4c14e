#pragma once

#include "DcmiInterface.hpp"
#include "DcmiRecords.hpp"

#include <cstdint>
#include <span>

#include <gmock/gmock.h>

class MockDcmiInterface : public npu::DcmiInterface
{
  public:
    ~MockDcmiInterface() override = default;

    MOCK_METHOD(int, init, (), (override));
    MOCK_METHOD(int, getDcmiVersion, (std::span<char> version), (override));
    MOCK_METHOD(int, getDriverVersion, (std::span<char> version), (override));
    MOCK_METHOD(int, getVersion,
                (int cardId, int deviceId, std::span<char> version,
                 int& length),
                (override));
    MOCK_METHOD(int, getCardList, (int& cardCount, std::span<int> cardList),
                (override));
    MOCK_METHOD(int, getDeviceNumInCard, (int cardId, int& deviceNum),
                (override));
    MOCK_METHOD(int, getDeviceIdInCard,
                (int cardId, int& deviceIdMax, int& mcuId, int& cpuId),
                (override));
    MOCK_METHOD(int, getDeviceType,
                (int cardId, int deviceId, uint32_t& unitType), (override));
    MOCK_METHOD(int, getDeviceChipInfo,
                (int cardId, int deviceId, npu::raw::ChipInfo& info),
                (override));
    MOCK_METHOD(int, getDevicePcieInfo,
                (int cardId, int deviceId, npu::raw::PcieInfo& info),
                (override));
    MOCK_METHOD(int, getDevicePcieInfoV2,
                (int cardId, int deviceId, npu::raw::PcieInfoAll& info),
                (override));
    MOCK_METHOD(int, getDeviceBoardInfo,
                (int cardId, int deviceId, npu::raw::BoardInfo& info),
                (override));
    MOCK_METHOD(int, getDeviceElabelInfo,
                (int cardId, int deviceId, npu::raw::ElabelInfo& info),
                (override));
    MOCK_METHOD(int, getDevicePowerInfo, (int cardId, int deviceId, int& power),
                (override));
    MOCK_METHOD(int, getDeviceDieV2,
                (int cardId, int deviceId, uint32_t dieType,
                 npu::raw::DieId& dieId),
                (override));
    MOCK_METHOD(int, getDeviceHealth,
                (int cardId, int deviceId, uint32_t& health), (override));
    MOCK_METHOD(int, getDriverHealth, (uint32_t & health), (override));
    MOCK_METHOD(int, getDeviceErrorCodeV2,
                (int cardId, int deviceId, int& errorCount,
                 std::span<uint32_t> errorCodes),
                (override));
    MOCK_METHOD(int, getDeviceErrorCodeString,
                (int cardId, int deviceId, uint32_t errorCode,
                 std::span<uint8_t> info),
                (override));
    MOCK_METHOD(int, getDeviceFlashCount,
                (int cardId, int deviceId, uint32_t& count), (override));
    MOCK_METHOD(int, getDeviceFlashInfoV2,
                (int cardId, int deviceId, uint32_t flashIndex,
                 npu::raw::FlashInfo& info),
                (override));
    MOCK_METHOD(int, getDeviceAicoreInfo,
                (int cardId, int deviceId, npu::raw::AicoreInfo& info),
                (override));
    MOCK_METHOD(int, getDeviceAicpuInfo,
                (int cardId, int deviceId, npu::raw::AicpuInfo& info),
                (override));
    MOCK_METHOD(int, getDeviceSystemTime,
                (int cardId, int deviceId, uint32_t& time), (override));
    MOCK_METHOD(int, getDeviceTemperature,
                (int cardId, int deviceId, int& temperature), (override));
    MOCK_METHOD(int, getDeviceVoltage,
                (int cardId, int deviceId, uint32_t& voltage), (override));
    MOCK_METHOD(int, getDevicePcieErrorCnt,
                (int cardId, int deviceId, npu::raw::PcieErrorRate& rate),
                (override));
    MOCK_METHOD(int, getDeviceEccInfo,
                (int cardId, int deviceId, uint32_t deviceType,
                 npu::raw::EccInfo& info),
                (override));
    MOCK_METHOD(int, getDeviceFrequency,
                (int cardId, int deviceId, uint32_t frequencyType,
                 uint32_t& frequency),
                (override));
    MOCK_METHOD(int, getDeviceHbmInfo,
                (int cardId, int deviceId, npu::raw::HbmInfo& info),
                (override));
    MOCK_METHOD(int, getDeviceMemoryInfoV3,
                (int cardId, int deviceId, npu::raw::MemoryInfo& info),
                (override));
    MOCK_METHOD(int, getDeviceUtilizationRate,
                (int cardId, int deviceId, int inputType,
                 uint32_t& utilization),
                (override));
    MOCK_METHOD(int, createVdevice,
                (int cardId, int deviceId,
                 const npu::raw::CreateVdevRes& request,
                 npu::raw::CreateVdevOut& out),
                (override));
    MOCK_METHOD(int, setDestroyVdevice,
                (int cardId, int deviceId, uint32_t vdevId), (override));
};

#include "DcmiRecords.hpp"
#include "MockDcmiInterface.hpp"
#include "NpuError.hpp"
#include "Telemetry.hpp"
#include "Topology.hpp"

#include <cstdint>
#include <cstring>
#include <memory>
#include <span>
#include <system_error>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

using testing::_;
using testing::DoAll;
using testing::Return;
using testing::SetArgReferee;

class TopologyFixture : public testing::Test
{
  protected:
    std::shared_ptr<MockDcmiInterface> dcmi =
        std::make_shared<testing::StrictMock<MockDcmiInterface>>();
    npu::ManagementUnit unit{dcmi, 4};
};

TEST_F(TopologyFixture, ChipEnumerationUsesExclusiveBound)
{
    EXPECT_CALL(*dcmi, getDeviceIdInCard(4, _, _, _))
        .WillOnce(DoAll(SetArgReferee<1>(2), SetArgReferee<2>(-1),
                        SetArgReferee<3>(3), Return(0)));

    auto chips = unit.chips();

    ASSERT_EQ(chips.npuChips.size(), 2U);
    EXPECT_EQ(chips.npuChips[0].id(), 0);
    EXPECT_EQ(chips.npuChips[1].id(), 1);
    EXPECT_FALSE(chips.mcuChip.has_value());
    ASSERT_TRUE(chips.cpuChip.has_value());
    EXPECT_EQ(chips.cpuChip->id(), 3);
    EXPECT_EQ(chips.cpuChip->managementUnitId(), 4);

    // Tags come from enumeration, so no getDeviceType call is made
    EXPECT_EQ(chips.npuChips[0].type(), npu::UnitType::npu);
    EXPECT_EQ(chips.npuChips[1].type(), npu::UnitType::npu);
    EXPECT_EQ(chips.cpuChip->type(), npu::UnitType::cpu);
}

TEST_F(TopologyFixture, ChipEnumerationWithMcu)
{
    EXPECT_CALL(*dcmi, getDeviceIdInCard(4, _, _, _))
        .WillOnce(DoAll(SetArgReferee<1>(1), SetArgReferee<2>(5),
                        SetArgReferee<3>(-1), Return(0)));

    auto chips = unit.chips();

    EXPECT_EQ(chips.npuChips.size(), 1U);
    ASSERT_TRUE(chips.mcuChip.has_value());
    EXPECT_EQ(chips.mcuChip->id(), 5);
    EXPECT_EQ(chips.mcuChip->type(), npu::UnitType::mcu);
    EXPECT_FALSE(chips.cpuChip.has_value());
}

TEST_F(TopologyFixture, ChipEnumerationFailure)
{
    EXPECT_CALL(*dcmi, getDeviceIdInCard(4, _, _, _))
        .WillOnce(Return(-8008));

    try
    {
        unit.chips();
        FAIL() << "expected std::system_error";
    }
    catch (const std::system_error& e)
    {
        EXPECT_EQ(e.code(), npu::StatusError::deviceNotExist);
    }
}

TEST_F(TopologyFixture, ChipCount)
{
    EXPECT_CALL(*dcmi, getDeviceNumInCard(4, _))
        .WillOnce(DoAll(SetArgReferee<1>(2), Return(0)));
    EXPECT_EQ(unit.chipCount(), 2);
}

TEST_F(TopologyFixture, UnknownTypeIsQueried)
{
    npu::Chip chip(dcmi, 4, 0);
    EXPECT_CALL(*dcmi, getDeviceType(4, 0, _))
        .WillOnce(DoAll(SetArgReferee<2>(npu::raw::unitTypeInvalid),
                        Return(0)))
        .WillOnce(DoAll(SetArgReferee<2>(npu::raw::unitTypeMcu), Return(0)));

    EXPECT_EQ(chip.type(), npu::UnitType::invalid);
    EXPECT_EQ(chip.type(), npu::UnitType::mcu);
}

TEST_F(TopologyFixture, ChipKnowsItsUnit)
{
    npu::Chip chip(dcmi, 4, 1);
    EXPECT_EQ(chip.managementUnit().id(), 4);
}

TEST_F(TopologyFixture, HealthNotFoundIsAnError)
{
    npu::Chip chip(dcmi, 4, 0, npu::UnitType::npu);
    EXPECT_CALL(*dcmi, getDeviceHealth(4, 0, _))
        .WillOnce(DoAll(SetArgReferee<2>(0xFFFFFFFFU), Return(0)));

    try
    {
        chip.health();
        FAIL() << "expected std::system_error";
    }
    catch (const std::system_error& e)
    {
        EXPECT_EQ(e.code(), npu::StatusError::deviceNotExist);
    }
}

TEST_F(TopologyFixture, HealthImportantAlarm)
{
    npu::Chip chip(dcmi, 4, 0, npu::UnitType::npu);
    EXPECT_CALL(*dcmi, getDeviceHealth(4, 0, _))
        .WillOnce(DoAll(SetArgReferee<2>(2U), Return(0)));

    EXPECT_EQ(chip.health(), npu::HealthState::importantAlarm);
}

TEST_F(TopologyFixture, TemperatureSentinels)
{
    npu::Chip chip(dcmi, 4, 0, npu::UnitType::npu);
    EXPECT_CALL(*dcmi, getDeviceTemperature(4, 0, _))
        .WillOnce(DoAll(SetArgReferee<2>(25), Return(0)))
        .WillOnce(DoAll(SetArgReferee<2>(0x7ffd), Return(0)))
        .WillOnce(DoAll(SetArgReferee<2>(0x7fff), Return(0)));

    EXPECT_EQ(chip.temperature(), 25);
    try
    {
        chip.temperature();
        FAIL() << "expected invalid data";
    }
    catch (const std::system_error& e)
    {
        EXPECT_EQ(e.code(), npu::DataError::invalidData);
    }
    try
    {
        chip.temperature();
        FAIL() << "expected read error";
    }
    catch (const std::system_error& e)
    {
        EXPECT_EQ(e.code(), npu::DataError::readError);
    }
}

TEST_F(TopologyFixture, VoltageSentinel)
{
    npu::Chip chip(dcmi, 4, 0, npu::UnitType::npu);
    EXPECT_CALL(*dcmi, getDeviceVoltage(4, 0, _))
        .WillOnce(DoAll(SetArgReferee<2>(86U), Return(0)))
        .WillOnce(DoAll(SetArgReferee<2>(0x7fffU), Return(0)));

    EXPECT_EQ(chip.voltage(), 86U);
    EXPECT_THROW(chip.voltage(), std::system_error);
}

TEST_F(TopologyFixture, FailedCallNeverDecodes)
{
    npu::Chip chip(dcmi, 4, 0, npu::UnitType::npu);
    // The record holds no NUL, so decoding it would fail differently
    EXPECT_CALL(*dcmi, getDeviceChipInfo(4, 0, _))
        .WillOnce([](int, int, npu::raw::ChipInfo& info) {
            info.chipName.fill('x');
            return -8255;
        });

    try
    {
        chip.info();
        FAIL() << "expected std::system_error";
    }
    catch (const std::system_error& e)
    {
        EXPECT_EQ(e.code(), npu::StatusError::notSupported);
    }
}

TEST_F(TopologyFixture, ErrorCodesTakeReportedCount)
{
    npu::Chip chip(dcmi, 4, 0, npu::UnitType::npu);
    EXPECT_CALL(*dcmi, getDeviceErrorCodeV2(4, 0, _, _))
        .WillOnce([](int, int, int& count, std::span<uint32_t> codes) {
            EXPECT_EQ(codes.size(), npu::raw::errorCodeCapacity);
            codes[0] = 0x80CB8009;
            codes[1] = 0x80E01801;
            codes[2] = 0xDEAD;
            count = 2;
            return 0;
        })
        .WillOnce([](int, int, int& count, std::span<uint32_t> codes) {
            count = static_cast<int>(codes.size()) + 1;
            return 0;
        });

    EXPECT_THAT(chip.errorCodes(), testing::ElementsAre(0x80CB8009U,
                                                        0x80E01801U));
    EXPECT_THROW(chip.errorCodes(), std::system_error);
}

TEST_F(TopologyFixture, ErrorCodeStringBufferSize)
{
    npu::Chip chip(dcmi, 4, 0, npu::UnitType::npu);
    EXPECT_CALL(*dcmi, getDeviceErrorCodeString(4, 0, 0x80CB8009U, _))
        .WillOnce([](int, int, uint32_t, std::span<uint8_t> info) {
            EXPECT_EQ(info.size(), npu::raw::errorStringSimplifiedLength);
            std::memcpy(info.data(), "ECC", 4);
            return 0;
        })
        .WillOnce([](int, int, uint32_t, std::span<uint8_t> info) {
            EXPECT_EQ(info.size(), npu::raw::errorStringDetailedLength);
            std::memcpy(info.data(), "ECC error detected", 19);
            return 0;
        });

    EXPECT_EQ(chip.errorCodeString(0x80CB8009U, true), "ECC");
    EXPECT_EQ(chip.errorCodeString(0x80CB8009U, false), "ECC error detected");
}

TEST_F(TopologyFixture, EnumArgumentsAreForwarded)
{
    npu::Chip chip(dcmi, 4, 0, npu::UnitType::npu);
    EXPECT_CALL(*dcmi, getDeviceFrequency(4, 0, 7U, _))
        .WillOnce(DoAll(SetArgReferee<3>(1800U), Return(0)));
    EXPECT_CALL(*dcmi, getDeviceUtilizationRate(4, 0, 2, _))
        .WillOnce(DoAll(SetArgReferee<3>(35U), Return(0)));
    EXPECT_CALL(*dcmi, getDeviceEccInfo(4, 0, 2U, _)).WillOnce(Return(0));
    EXPECT_CALL(*dcmi, getDeviceDieV2(4, 0, 1U, _)).WillOnce(Return(0));

    EXPECT_EQ(chip.frequency(npu::FrequencyType::aiCoreCurrent), 1800U);
    EXPECT_EQ(chip.utilizationRate(npu::UtilizationType::aiCore), 35U);
    EXPECT_FALSE(chip.eccInfo(npu::DeviceType::hbm).enableFlag);
    EXPECT_EQ(chip.dieInfo(npu::DieType::vdie), npu::DieInfo{});
}

TEST_F(TopologyFixture, MemoryInfo)
{
    npu::Chip chip(dcmi, 4, 0, npu::UnitType::npu);
    EXPECT_CALL(*dcmi, getDeviceMemoryInfoV3(4, 0, _))
        .WillOnce([](int, int, npu::raw::MemoryInfo& info) {
            info.memorySize = 32768;
            info.memoryAvailable = 16384;
            info.hugePageSize = 2048;
            info.utilization = 50;
            return 0;
        });

    auto info = chip.memoryInfo();
    EXPECT_EQ(info.memorySize, 32768U);
    EXPECT_EQ(info.memoryAvailable, 16384U);
    EXPECT_EQ(info.hugePageSize, 2048U);
    EXPECT_EQ(info.utilization, 50U);
}

TEST_F(TopologyFixture, NegativePowerIsMalformed)
{
    npu::Chip chip(dcmi, 4, 0, npu::UnitType::npu);
    EXPECT_CALL(*dcmi, getDevicePowerInfo(4, 0, _))
        .WillOnce(DoAll(SetArgReferee<2>(-1), Return(0)))
        .WillOnce(DoAll(SetArgReferee<2>(725), Return(0)));

    try
    {
        chip.powerInfo();
        FAIL() << "expected std::system_error";
    }
    catch (const std::system_error& e)
    {
        EXPECT_EQ(e.code(), npu::DataError::malformedRecord);
    }
    EXPECT_EQ(chip.powerInfo(), 725U);
}

TEST_F(TopologyFixture, PcieAndBoardInfo)
{
    npu::Chip chip(dcmi, 4, 1, npu::UnitType::npu);
    EXPECT_CALL(*dcmi, getDevicePcieInfo(4, 1, _))
        .WillOnce([](int, int, npu::raw::PcieInfo& info) {
            info.deviceId = 0xd802;
            info.venderId = 0x19e5;
            info.bdfBusId = 0xc1;
            return 0;
        });
    EXPECT_CALL(*dcmi, getDeviceBoardInfo(4, 1, _))
        .WillOnce([](int, int, npu::raw::BoardInfo& info) {
            info.boardId = 0x64;
            info.slotId = 3;
            return 0;
        });

    auto pcie = chip.pcieInfo();
    EXPECT_EQ(pcie.deviceId, 0xd802U);
    EXPECT_EQ(pcie.vendorId, 0x19e5U);
    EXPECT_EQ(pcie.bdfBusId, 0xc1U);

    auto board = chip.boardInfo();
    EXPECT_EQ(board.boardId, 0x64U);
    EXPECT_EQ(board.slotId, 3U);
}

TEST_F(TopologyFixture, FlashInfoByIndex)
{
    npu::Chip chip(dcmi, 4, 0, npu::UnitType::npu);
    EXPECT_CALL(*dcmi, getDeviceFlashCount(4, 0, _))
        .WillOnce(DoAll(SetArgReferee<2>(1U), Return(0)));
    EXPECT_CALL(*dcmi, getDeviceFlashInfoV2(4, 0, 0U, _))
        .WillOnce([](int, int, uint32_t, npu::raw::FlashInfo& info) {
            info.flashId = 0xC84018;
            info.state = 0x8;
            info.size = 0x1000000;
            return 0;
        });

    ASSERT_EQ(chip.flashCount(), 1U);
    auto flash = chip.flashInfo(0);
    EXPECT_EQ(flash.flashId, 0xC84018U);
    EXPECT_TRUE(flash.isHealthy);
    EXPECT_EQ(flash.size, 0x1000000U);
}

TEST_F(TopologyFixture, AiCpuAndHbmInfo)
{
    npu::Chip chip(dcmi, 4, 0, npu::UnitType::npu);
    EXPECT_CALL(*dcmi, getDeviceAicpuInfo(4, 0, _))
        .WillOnce([](int, int, npu::raw::AicpuInfo& info) {
            info.maxFreq = 1900;
            info.aicpuNum = 6;
            info.utilRate[5] = 40;
            return 0;
        });
    EXPECT_CALL(*dcmi, getDeviceHbmInfo(4, 0, _))
        .WillOnce([](int, int, npu::raw::HbmInfo& info) {
            info.memorySize = 65536;
            info.temp = 41;
            info.bandwidthUtilRate = 7;
            return 0;
        });

    auto aicpu = chip.aiCpuInfo();
    EXPECT_EQ(aicpu.maxFrequency, 1900U);
    EXPECT_EQ(aicpu.aicpuNum, 6U);
    EXPECT_EQ(aicpu.utilRate[5], 40U);

    auto hbm = chip.hbmInfo();
    EXPECT_EQ(hbm.memorySize, 65536U);
    EXPECT_EQ(hbm.temperature, 41);
    EXPECT_EQ(hbm.bandwidthUtilRate, 7U);
}

TEST_F(TopologyFixture, PcieErrorRateAndSystemTime)
{
    npu::Chip chip(dcmi, 4, 0, npu::UnitType::npu);
    EXPECT_CALL(*dcmi, getDevicePcieErrorCnt(4, 0, _))
        .WillOnce([](int, int, npu::raw::PcieErrorRate& rate) {
            rate.phyLaneErrStatus = 0x2;
            rate.dlDcrcErrNum = 9;
            return 0;
        });
    EXPECT_CALL(*dcmi, getDeviceSystemTime(4, 0, _))
        .WillOnce(DoAll(SetArgReferee<2>(1700000000U), Return(0)));

    auto rate = chip.pcieErrorRate();
    EXPECT_TRUE(rate.phyLaneErrStatus[1]);
    EXPECT_FALSE(rate.phyLaneErrStatus[0]);
    EXPECT_EQ(rate.dlDcrcErrNum, 9U);

    EXPECT_EQ(chip.systemTime(), 1700000000U);
}

TEST_F(TopologyFixture, EqualityFollowsIds)
{
    EXPECT_EQ(unit, npu::ManagementUnit(dcmi, 4));
    EXPECT_NE(unit, npu::ManagementUnit(dcmi, 5));

    // Cached type and interface handle do not take part
    auto other = std::make_shared<testing::StrictMock<MockDcmiInterface>>();
    EXPECT_EQ(npu::Chip(dcmi, 4, 1, npu::UnitType::npu),
              npu::Chip(other, 4, 1));
    EXPECT_NE(npu::Chip(dcmi, 4, 1), npu::Chip(dcmi, 4, 2));
    EXPECT_NE(npu::Chip(dcmi, 4, 1), npu::Chip(dcmi, 3, 1));
    EXPECT_EQ(npu::Chip(dcmi, 4, 1).managementUnit(), unit);
}

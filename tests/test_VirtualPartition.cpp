#include "DcmiRecords.hpp"
#include "MockDcmiInterface.hpp"
#include "NpuError.hpp"
#include "Topology.hpp"
#include "VirtualPartition.hpp"

#include <memory>
#include <string>
#include <system_error>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

using testing::_;
using testing::Return;

class VirtualPartitionFixture : public testing::Test
{
  protected:
    std::shared_ptr<MockDcmiInterface> dcmi =
        std::make_shared<testing::StrictMock<MockDcmiInterface>>();
    npu::Chip chip{dcmi, 1, 0, npu::UnitType::npu};
};

TEST_F(VirtualPartitionFixture, DestroyAllForwardsSentinel)
{
    EXPECT_CALL(*dcmi, setDestroyVdevice(1, 0, 65535U)).WillOnce(Return(0));
    chip.destroyVirtualPartition(npu::allVirtualPartitions);
}

TEST_F(VirtualPartitionFixture, DestroyOne)
{
    EXPECT_CALL(*dcmi, setDestroyVdevice(1, 0, 103U)).WillOnce(Return(0));
    chip.destroyVirtualPartition(103);
}

TEST_F(VirtualPartitionFixture, DestroyMissingPartitionFails)
{
    EXPECT_CALL(*dcmi, setDestroyVdevice(1, 0, 7U)).WillOnce(Return(-8001));
    try
    {
        chip.destroyVirtualPartition(7);
        FAIL() << "expected std::system_error";
    }
    catch (const std::system_error& e)
    {
        EXPECT_EQ(e.code(), npu::StatusError::invalidParameter);
    }
}

TEST_F(VirtualPartitionFixture, CreateAutomatic)
{
    EXPECT_CALL(*dcmi, createVdevice(1, 0, _, _))
        .WillOnce([](int, int, const npu::raw::CreateVdevRes& request,
                     npu::raw::CreateVdevOut& out) {
            EXPECT_EQ(request.vdevId, 0xFFFFFFFFU);
            EXPECT_EQ(request.vfgId, 0xFFFFFFFFU);
            EXPECT_STREQ(request.templateName.data(), "vir02");
            out.vdevId = 100;
            out.vfgId = 0;
            out.pcieBus = 0x3b;
            out.pcieDevice = 1;
            out.pcieFunc = 2;
            return 0;
        });

    auto descriptor = chip.createVirtualPartition(
        npu::VirtualPartitionRequest::automatic("vir02"));

    npu::VirtualPartitionDescriptor expected{
        .vchipId = 100,
        .vfgId = 0,
        .pcieBus = 0x3b,
        .pcieDevice = 1,
        .pcieFunction = 2,
    };
    EXPECT_EQ(descriptor, expected);
}

TEST_F(VirtualPartitionFixture, CreateWithIds)
{
    EXPECT_CALL(*dcmi, createVdevice(1, 0, _, _))
        .WillOnce([](int, int, const npu::raw::CreateVdevRes& request,
                     npu::raw::CreateVdevOut& out) {
            EXPECT_EQ(request.vdevId, 101U);
            EXPECT_EQ(request.vfgId, 2U);
            out.vdevId = request.vdevId;
            out.vfgId = request.vfgId;
            return 0;
        });

    npu::VirtualPartitionRequest request{
        .vchipId = 101, .vfgId = 2, .templateName = "vir04_3c"};
    auto descriptor = chip.createVirtualPartition(request);
    EXPECT_EQ(descriptor.vchipId, 101U);
    EXPECT_EQ(descriptor.vfgId, 2U);
}

TEST_F(VirtualPartitionFixture, OversizeTemplateNeverReachesLibrary)
{
    // StrictMock fails the test on any createVdevice call
    std::string longest(npu::raw::templateNameLength - 1, 'v');
    std::string tooLong(npu::raw::templateNameLength, 'v');

    auto record =
        npu::encodeRequest(npu::VirtualPartitionRequest::automatic(longest));
    EXPECT_EQ(std::string(record.templateName.data()), longest);

    for (const auto& name : {tooLong, std::string(), std::string("a\0b", 3)})
    {
        try
        {
            chip.createVirtualPartition(
                npu::VirtualPartitionRequest::automatic(name));
            FAIL() << "expected std::system_error";
        }
        catch (const std::system_error& e)
        {
            EXPECT_EQ(e.code(), npu::StatusError::invalidParameter);
        }
    }
}

TEST_F(VirtualPartitionFixture, CreateFailurePropagates)
{
    EXPECT_CALL(*dcmi, createVdevice(1, 0, _, _)).WillOnce(Return(-8020));
    try
    {
        chip.createVirtualPartition(
            npu::VirtualPartitionRequest::automatic("vir01"));
        FAIL() << "expected std::system_error";
    }
    catch (const std::system_error& e)
    {
        EXPECT_EQ(e.code(), npu::StatusError::resourceOccupied);
    }
}

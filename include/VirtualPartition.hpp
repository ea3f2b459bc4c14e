/*
 * SPDX-FileCopyrightText: Copyright OpenBMC Authors
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "DcmiRecords.hpp"

#include <cstdint>
#include <string>
#include <utility>

namespace npu
{

// Passing this id to Chip::destroyVirtualPartition destroys every partition
constexpr uint32_t allVirtualPartitions = 65535;

/**
 * @brief Parameters of a virtual partition to carve out of an NPU chip.
 *
 * templateName names one of the vendor's predefined compute and memory
 * splits, for example "vir01". It must fit the 32 byte vendor field
 * including its terminating NUL.
 */
struct VirtualPartitionRequest
{
    uint32_t vchipId{raw::autoAssignId};
    uint32_t vfgId{raw::autoAssignId};
    std::string templateName;

    // Let the vendor library pick both ids
    static VirtualPartitionRequest automatic(std::string templateName)
    {
        return VirtualPartitionRequest{
            .vchipId = raw::autoAssignId,
            .vfgId = raw::autoAssignId,
            .templateName = std::move(templateName),
        };
    }

    bool operator==(const VirtualPartitionRequest&) const = default;
};

struct VirtualPartitionDescriptor
{
    uint32_t vchipId{};
    uint32_t vfgId{};
    uint32_t pcieBus{};
    uint32_t pcieDevice{};
    uint32_t pcieFunction{};

    bool operator==(const VirtualPartitionDescriptor&) const = default;
};

/**
 * @brief Build the vendor request record.
 *
 * Throws StatusError::invalidParameter when the template name does not fit.
 */
raw::CreateVdevRes encodeRequest(const VirtualPartitionRequest& request);

VirtualPartitionDescriptor decodeDescriptor(const raw::CreateVdevOut& out);

} // namespace npu

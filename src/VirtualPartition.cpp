/*
 * SPDX-FileCopyrightText: Copyright OpenBMC Authors
 * SPDX-License-Identifier: Apache-2.0
 */

#include "VirtualPartition.hpp"

#include "DcmiRecords.hpp"
#include "NpuError.hpp"
#include "Topology.hpp"

#include <phosphor-logging/lg2.hpp>

#include <algorithm>
#include <cstdint>
#include <format>
#include <string>
#include <system_error>

namespace npu
{

raw::CreateVdevRes encodeRequest(const VirtualPartitionRequest& request)
{
    auto record = raw::zeroed<raw::CreateVdevRes>();
    const std::string& name = request.templateName;

    // The vendor field is a C string, so one byte is kept for the NUL
    if (name.empty() || name.size() >= record.templateName.size() ||
        name.find('\0') != std::string::npos)
    {
        throw std::system_error(
            make_error_code(StatusError::invalidParameter),
            std::format("template name '{}' must be 1 to {} bytes", name,
                        record.templateName.size() - 1));
    }

    record.vdevId = request.vchipId;
    record.vfgId = request.vfgId;
    std::ranges::copy(name, record.templateName.begin());
    return record;
}

VirtualPartitionDescriptor decodeDescriptor(const raw::CreateVdevOut& out)
{
    return VirtualPartitionDescriptor{
        .vchipId = out.vdevId,
        .vfgId = out.vfgId,
        .pcieBus = out.pcieBus,
        .pcieDevice = out.pcieDevice,
        .pcieFunction = out.pcieFunc,
    };
}

VirtualPartitionDescriptor
    Chip::createVirtualPartition(const VirtualPartitionRequest& request) const
{
    auto record = encodeRequest(request);
    auto out = raw::zeroed<raw::CreateVdevOut>();
    throwOnError(dcmi->createVdevice(unitId, chipId, record, out),
                 "dcmi_create_vdevice");

    auto descriptor = decodeDescriptor(out);
    lg2::info("Created virtual partition {VCHIP} on chip {CHIP} of unit "
              "{UNIT} from template {TEMPLATE}",
              "VCHIP", descriptor.vchipId, "CHIP", chipId, "UNIT", unitId,
              "TEMPLATE", request.templateName);
    return descriptor;
}

void Chip::destroyVirtualPartition(uint32_t vchipId) const
{
    throwOnError(dcmi->setDestroyVdevice(unitId, chipId, vchipId),
                 "dcmi_set_destroy_vdevice");
    if (vchipId == allVirtualPartitions)
    {
        lg2::info("Destroyed all virtual partitions on chip {CHIP} of unit "
                  "{UNIT}",
                  "CHIP", chipId, "UNIT", unitId);
        return;
    }
    lg2::info("Destroyed virtual partition {VCHIP} on chip {CHIP} of unit "
              "{UNIT}",
              "VCHIP", vchipId, "CHIP", chipId, "UNIT", unitId);
}

} // namespace npu

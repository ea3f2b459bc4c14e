/*
 * SPDX-FileCopyrightText: Copyright OpenBMC Authors
 * SPDX-License-Identifier: Apache-2.0
 */

#include "Session.hpp"

#include "DcmiInterface.hpp"
#include "DcmiRecords.hpp"
#include "Decoders.hpp"
#include "NpuError.hpp"
#include "Telemetry.hpp"
#include "Topology.hpp"

#include <phosphor-logging/lg2.hpp>

#include <array>
#include <cstdint>
#include <format>
#include <memory>
#include <span>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

namespace npu
{

Session::Session(std::shared_ptr<DcmiInterface> dcmi) : dcmi(std::move(dcmi))
{}

Session Session::init(std::shared_ptr<DcmiInterface> dcmi)
{
    if (!dcmi)
    {
        throw std::invalid_argument("DCMI interface must not be null");
    }
    int rc = dcmi->init();
    if (rc != 0)
    {
        lg2::error("Failed to initialise DCMI, rc={RC}: {MSG}", "RC", rc,
                   "MSG", checkStatus(rc).message());
        throwOnError(rc, "dcmi_init");
    }
    lg2::info("DCMI initialised");
    return Session(std::move(dcmi));
}

std::string Session::dcmiVersion() const
{
    std::array<char, raw::dcmiVersionLength> buffer{};
    throwOnError(dcmi->getDcmiVersion(buffer), "dcmi_get_dcmi_version");
    return decode::cString(std::span<const char>(buffer));
}

std::string Session::driverVersion() const
{
    std::array<char, raw::driverVersionLength> buffer{};
    throwOnError(dcmi->getDriverVersion(buffer), "dcmi_get_driver_version");
    return decode::cString(std::span<const char>(buffer));
}

std::string Session::version(int managementUnitId, int chipId) const
{
    std::array<char, raw::driverVersionLength> buffer{};
    int length = 0;
    throwOnError(dcmi->getVersion(managementUnitId, chipId, buffer, length),
                 "dcmi_get_version");
    if (length < 0 || static_cast<size_t>(length) > buffer.size())
    {
        throwDataError(
            DataError::malformedRecord,
            std::format("version length {} exceeds {} byte buffer", length,
                        buffer.size()));
    }
    return decode::boundedString(
        std::span<const char>(buffer).first(static_cast<size_t>(length)));
}

std::vector<ManagementUnit> Session::managementUnits() const
{
    std::array<int, raw::cardListCapacity> cardList{};
    cardList.fill(-1);
    int count = 0;
    throwOnError(dcmi->getCardList(count, cardList), "dcmi_get_card_list");
    if (count < 0 || static_cast<size_t>(count) > cardList.size())
    {
        throwDataError(DataError::malformedRecord,
                       std::format("card count {} exceeds capacity {}", count,
                                   cardList.size()));
    }

    std::vector<ManagementUnit> units;
    units.reserve(static_cast<size_t>(count));
    for (int i = 0; i < count; i++)
    {
        units.emplace_back(dcmi, cardList[static_cast<size_t>(i)]);
    }
    return units;
}

HealthState Session::driverHealth() const
{
    uint32_t value = 0;
    throwOnError(dcmi->getDriverHealth(value), "dcmi_get_driver_health");
    return decode::healthState(value);
}

} // namespace npu

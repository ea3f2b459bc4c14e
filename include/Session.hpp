/*
 * SPDX-FileCopyrightText: Copyright OpenBMC Authors
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "DcmiInterface.hpp"
#include "Telemetry.hpp"
#include "Topology.hpp"

#include <memory>
#include <string>
#include <vector>

namespace npu
{

/**
 * @brief An initialised connection to the DCMI library.
 *
 * Every ManagementUnit and Chip handed out shares the same DcmiInterface.
 * The session holds no mutable state of its own and may be shared between
 * threads. Whether the vendor library tolerates concurrent calls is not
 * documented; callers that need certainty must serialise their queries.
 */
class Session
{
  public:
    /**
     * @brief Initialise the library behind @p dcmi.
     *
     * Throws std::system_error with the translated status when dcmi_init
     * fails.
     */
    static Session init(std::shared_ptr<DcmiInterface> dcmi);

    std::string dcmiVersion() const;

    std::string driverVersion() const;

    /**
     * @brief Driver version as reported for one chip.
     *
     * Deprecated by the vendor in favour of driverVersion().
     */
    std::string version(int managementUnitId, int chipId) const;

    std::vector<ManagementUnit> managementUnits() const;

    /**
     * @brief Health of the driver.
     *
     * HealthState::deviceNotFoundOrNotStarted is a valid answer here.
     */
    HealthState driverHealth() const;

  private:
    explicit Session(std::shared_ptr<DcmiInterface> dcmi);

    std::shared_ptr<DcmiInterface> dcmi;
};

} // namespace npu

/*
 * SPDX-FileCopyrightText: Copyright OpenBMC Authors
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "Telemetry.hpp"
#include "VirtualPartition.hpp"

#include <nlohmann/json.hpp>

namespace npu
{

NLOHMANN_JSON_SERIALIZE_ENUM(UnitType, {
                                           {UnitType::invalid, "invalid"},
                                           {UnitType::npu, "npu"},
                                           {UnitType::mcu, "mcu"},
                                           {UnitType::cpu, "cpu"},
                                       })

NLOHMANN_JSON_SERIALIZE_ENUM(
    HealthState,
    {
        {HealthState::deviceNotFoundOrNotStarted,
         "device_not_found_or_not_started"},
        {HealthState::ok, "ok"},
        {HealthState::generalAlarm, "general_alarm"},
        {HealthState::importantAlarm, "important_alarm"},
        {HealthState::emergencyAlarm, "emergency_alarm"},
    })

NLOHMANN_JSON_SERIALIZE_ENUM(DieType, {
                                          {DieType::ndie, "ndie"},
                                          {DieType::vdie, "vdie"},
                                      })

NLOHMANN_JSON_SERIALIZE_ENUM(DeviceType, {
                                             {DeviceType::ddr, "ddr"},
                                             {DeviceType::sram, "sram"},
                                             {DeviceType::hbm, "hbm"},
                                             {DeviceType::npu, "npu"},
                                         })

NLOHMANN_JSON_SERIALIZE_ENUM(
    FrequencyType, {
                       {FrequencyType::ddr, "ddr"},
                       {FrequencyType::ctrlCpu, "ctrl_cpu"},
                       {FrequencyType::hbm, "hbm"},
                       {FrequencyType::aiCoreCurrent, "ai_core_current"},
                       {FrequencyType::aiCoreMax, "ai_core_max"},
                       {FrequencyType::vectorCoreCurrent,
                        "vector_core_current"},
                   })

NLOHMANN_JSON_SERIALIZE_ENUM(
    UtilizationType, {
                         {UtilizationType::memory, "memory"},
                         {UtilizationType::aiCore, "ai_core"},
                         {UtilizationType::aiCpu, "ai_cpu"},
                         {UtilizationType::ctrlCpu, "ctrl_cpu"},
                         {UtilizationType::memoryBandwidth,
                          "memory_bandwidth"},
                         {UtilizationType::hbm, "hbm"},
                         {UtilizationType::hbmBandwidth, "hbm_bandwidth"},
                         {UtilizationType::vectorCore, "vector_core"},
                     })

void to_json(nlohmann::json& j, const ChipInfo& info);
void to_json(nlohmann::json& j, const PcieInfo& info);
void to_json(nlohmann::json& j, const DomainPcieInfo& info);
void to_json(nlohmann::json& j, const BoardInfo& info);
void to_json(nlohmann::json& j, const ElabelInfo& info);
void to_json(nlohmann::json& j, const DieInfo& info);
void to_json(nlohmann::json& j, const FlashInfo& info);
void to_json(nlohmann::json& j, const AiCoreInfo& info);
void to_json(nlohmann::json& j, const AiCpuInfo& info);
void to_json(nlohmann::json& j, const MemoryInfo& info);
void to_json(nlohmann::json& j, const HbmInfo& info);
void to_json(nlohmann::json& j, const ChipPcieErrorRate& rate);
void to_json(nlohmann::json& j, const EccInfo& info);
void to_json(nlohmann::json& j, const VirtualPartitionRequest& request);
void to_json(nlohmann::json& j, const VirtualPartitionDescriptor& descriptor);

} // namespace npu

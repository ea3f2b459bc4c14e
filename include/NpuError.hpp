/*
 * SPDX-FileCopyrightText: Copyright OpenBMC Authors
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string_view>
#include <system_error>
#include <type_traits>

namespace npu
{

/**
 * @brief Documented DCMI status codes.
 *
 * The enumerator values are the raw codes returned by the vendor library so
 * that a std::error_code built from a status keeps the number the vendor
 * handed back, including for codes missing from this table.
 */
enum class StatusError : int
{
    invalidParameter = -8001,
    operationNotPermitted = -8002,
    memoryOperationFailed = -8003,
    secureFunctionFailed = -8004,
    innerError = -8005,
    timeOut = -8006,
    invalidDeviceId = -8007,
    deviceNotExist = -8008,
    ioctlFailed = -8009,
    sendMessageFailed = -8010,
    receiveMessageFailed = -8011,
    notReady = -8012,
    notSupportedInContainer = -8013,
    resetFailed = -8015,
    abortOperation = -8016,
    isUpgrading = -8017,
    resourceOccupied = -8020,
    notSupported = -8255,
};

/**
 * @brief Conditions matched by status codes of the dcmi category.
 */
enum class StatusCondition : int
{
    unknownStatus = 1,
};

/**
 * @brief Failures found while decoding a record returned by a successful
 *        vendor call.
 */
enum class DataError : int
{
    invalidText = 1,
    invalidData = 2,
    readError = 3,
    malformedRecord = 4,
};

const std::error_category& statusCategory() noexcept;
const std::error_category& statusConditionCategory() noexcept;
const std::error_category& dataCategory() noexcept;

std::error_code make_error_code(StatusError e) noexcept;
std::error_condition make_error_condition(StatusCondition e) noexcept;
std::error_code make_error_code(DataError e) noexcept;

/**
 * @return true when @p status is one of the documented vendor codes
 */
bool isDocumentedStatus(int status) noexcept;

/**
 * @brief Translate a vendor status into an error code.
 *
 * Total over int: 0 yields an empty code, documented codes yield their
 * StatusError, anything else yields a dcmi category code carrying the raw
 * value which compares equal to StatusCondition::unknownStatus.
 */
std::error_code checkStatus(int status) noexcept;

/**
 * @brief Translate @p status and throw std::system_error if it is not a
 *        success.
 *
 * @param call  Name of the vendor call, used for the log and the exception
 *              message.
 */
void throwOnError(int status, std::string_view call);

[[noreturn]] void throwDataError(DataError e, std::string_view what);

} // namespace npu

template <>
struct std::is_error_code_enum<npu::StatusError> : std::true_type
{};

template <>
struct std::is_error_condition_enum<npu::StatusCondition> : std::true_type
{};

template <>
struct std::is_error_code_enum<npu::DataError> : std::true_type
{};

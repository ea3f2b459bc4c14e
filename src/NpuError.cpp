/*
 * SPDX-FileCopyrightText: Copyright OpenBMC Authors
 * SPDX-License-Identifier: Apache-2.0
 */

#include "NpuError.hpp"

#include <boost/container/flat_map.hpp>
#include <phosphor-logging/lg2.hpp>

#include <format>
#include <string>
#include <string_view>
#include <system_error>

namespace npu
{

namespace
{

using StatusTable = boost::container::flat_map<int, std::string_view>;

// Filled at static initialisation; lookups do not allocate
const StatusTable statusTable{
    {static_cast<int>(StatusError::invalidParameter), "Invalid parameter"},
    {static_cast<int>(StatusError::operationNotPermitted),
     "Operation not permitted"},
    {static_cast<int>(StatusError::memoryOperationFailed),
     "Memory operation failed"},
    {static_cast<int>(StatusError::secureFunctionFailed),
     "Secure function fail"},
    {static_cast<int>(StatusError::innerError), "Inner error"},
    {static_cast<int>(StatusError::timeOut), "Time out"},
    {static_cast<int>(StatusError::invalidDeviceId), "Invalid device ID"},
    {static_cast<int>(StatusError::deviceNotExist), "Device not exist"},
    {static_cast<int>(StatusError::ioctlFailed), "Ioctl return fail"},
    {static_cast<int>(StatusError::sendMessageFailed),
     "Send message fail"},
    {static_cast<int>(StatusError::receiveMessageFailed),
     "Receive message fail"},
    {static_cast<int>(StatusError::notReady), "Not ready"},
    {static_cast<int>(StatusError::notSupportedInContainer),
     "Not support in container"},
    {static_cast<int>(StatusError::resetFailed), "Reset fail"},
    {static_cast<int>(StatusError::abortOperation),
     "Reset operation abort"},
    {static_cast<int>(StatusError::isUpgrading), "Is upgrading"},
    {static_cast<int>(StatusError::resourceOccupied),
     "Device resource occupied"},
    {static_cast<int>(StatusError::notSupported),
     "Device id / function not support"},
};

class StatusCategory : public std::error_category
{
  public:
    const char* name() const noexcept override
    {
        return "dcmi";
    }

    std::string message(int code) const override
    {
        const auto& table = statusTable;
        auto it = table.find(code);
        if (it == table.end())
        {
            return std::format("Unknown error, error code: {}", code);
        }
        return std::string(it->second);
    }

    bool equivalent(int code,
                    const std::error_condition& cond) const noexcept override
    {
        if (cond == StatusCondition::unknownStatus)
        {
            return code != 0 && !isDocumentedStatus(code);
        }
        return error_category::equivalent(code, cond);
    }
};

class StatusConditionCategory : public std::error_category
{
  public:
    const char* name() const noexcept override
    {
        return "dcmi-condition";
    }

    std::string message(int cond) const override
    {
        switch (static_cast<StatusCondition>(cond))
        {
            case StatusCondition::unknownStatus:
                return "Undocumented DCMI status code";
        }
        return std::format("Unknown condition {}", cond);
    }
};

class DataCategory : public std::error_category
{
  public:
    const char* name() const noexcept override
    {
        return "npu-data";
    }

    std::string message(int code) const override
    {
        switch (static_cast<DataError>(code))
        {
            case DataError::invalidText:
                return "Invalid text in record";
            case DataError::invalidData:
                return "Invalid data";
            case DataError::readError:
                return "Data read error";
            case DataError::malformedRecord:
                return "Malformed record";
        }
        return std::format("Unknown data error {}", code);
    }
};

} // namespace

const std::error_category& statusCategory() noexcept
{
    static const StatusCategory category;
    return category;
}

const std::error_category& statusConditionCategory() noexcept
{
    static const StatusConditionCategory category;
    return category;
}

const std::error_category& dataCategory() noexcept
{
    static const DataCategory category;
    return category;
}

std::error_code make_error_code(StatusError e) noexcept
{
    return {static_cast<int>(e), statusCategory()};
}

std::error_condition make_error_condition(StatusCondition e) noexcept
{
    return {static_cast<int>(e), statusConditionCategory()};
}

std::error_code make_error_code(DataError e) noexcept
{
    return {static_cast<int>(e), dataCategory()};
}

bool isDocumentedStatus(int status) noexcept
{
    return statusTable.count(status) != 0;
}

std::error_code checkStatus(int status) noexcept
{
    if (status == 0)
    {
        return {};
    }
    return {status, statusCategory()};
}

void throwOnError(int status, std::string_view call)
{
    auto ec = checkStatus(status);
    if (!ec)
    {
        return;
    }
    lg2::debug("DCMI call {CALL} failed, rc={RC}: {MSG}", "CALL",
               std::string(call), "RC", status, "MSG", ec.message());
    throw std::system_error(ec, std::string(call));
}

void throwDataError(DataError e, std::string_view what)
{
    throw std::system_error(make_error_code(e), std::string(what));
}

} // namespace npu

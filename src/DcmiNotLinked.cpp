/*
 * SPDX-FileCopyrightText: Copyright OpenBMC Authors
 * SPDX-License-Identifier: Apache-2.0
 */

#include "DcmiFunctions.hpp"

#include <optional>

namespace npu::vendor
{

// Built without NPU_DCMI_LINKED_BACKEND, so only dlopen is available
std::optional<DcmiFunctions> linkedFunctions()
{
    return std::nullopt;
}

} // namespace npu::vendor

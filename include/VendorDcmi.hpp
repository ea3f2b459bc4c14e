/*
 * SPDX-FileCopyrightText: Copyright OpenBMC Authors
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "DcmiConfig.hpp"
#include "DcmiInterface.hpp"

#include <memory>

namespace npu
{

/**
 * @brief Build the DcmiInterface backed by the vendor library.
 *
 * With Backend::dynamic the library at config.libraryPath() is opened and
 * stays loaded while the returned interface lives. With Backend::linked the
 * symbols linked into the executable are used and the path is ignored.
 * The returned interface is not initialised; pass it to Session::init.
 *
 * Throws std::system_error with std::errc::function_not_supported when
 * Backend::linked is asked for and linkedBackendAvailable() is false.
 */
std::shared_ptr<DcmiInterface> makeDcmiInterface(const config::Config& config);

// True when this build links the vendor library directly
bool linkedBackendAvailable();

} // namespace npu

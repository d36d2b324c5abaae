/*
 * SPDX-FileCopyrightText: 2024 YubiKey KRunner Plugin Contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#pragma once

#include <memory>
#include "driver.h"

namespace YubiKeyManager {
namespace Device {

/**
 * @brief Opens transport drivers
 *
 * Seam between discovery and hardware access. Tests substitute a factory
 * that hands out scripted drivers.
 */
class DriverFactory
{
public:
    virtual ~DriverFactory() = default;

    /**
     * @brief Opens a driver for one transport
     * @return Driver, nullptr when the transport has no device attached,
     *         or error when opening failed
     */
    virtual Result<std::unique_ptr<Driver>> openDriver(Transport transport) = 0;
};

/**
 * @brief Factory backed by PC/SC and hidapi
 */
class PlatformDriverFactory : public DriverFactory
{
public:
    Result<std::unique_ptr<Driver>> openDriver(Transport transport) override;
};

} // namespace Device
} // namespace YubiKeyManager

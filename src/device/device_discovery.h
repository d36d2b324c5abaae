/*
 * SPDX-FileCopyrightText: 2024 YubiKey KRunner Plugin Contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#pragma once

#include <memory>
#include "shared/common/result.h"
#include "shared/types/device_mode.h"

namespace YubiKeyManager {
namespace Device {
using namespace YubiKeyManager::Shared;

class DriverFactory;
class YubiKeyDevice;

/**
 * @brief Finds the first YubiKey reachable over a set of transports
 *
 * Transports are tried in priority order CCID, OTP, U2F. Transports outside
 * the requested mask are never touched.
 */
class DeviceDiscovery
{
public:
    explicit DeviceDiscovery(std::shared_ptr<DriverFactory> factory);

    /**
     * @brief Opens and classifies the first device found
     * @param transports Transports to try
     * @return Device handle, nullptr if no transport yielded a device,
     *         FAILED_OPENING_DEVICE if a driver failed to open, or the
     *         classifier's error
     */
    Result<std::shared_ptr<YubiKeyDevice>> openDevice(Transports transports = ALL_TRANSPORTS) const;

private:
    std::shared_ptr<DriverFactory> m_factory;
};

} // namespace Device
} // namespace YubiKeyManager

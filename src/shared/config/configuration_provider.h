/*
 * SPDX-FileCopyrightText: 2024 YubiKey KRunner Plugin Contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#pragma once

#include "shared/types/device_mode.h"

#include <optional>

namespace YubiKeyManager {
namespace Shared {

/**
 * @brief Pure interface for accessing device manager configuration
 *
 * @note This is a pure C++ interface (no QObject inheritance)
 * @note The concrete implementation (DeviceConfiguration) inherits from both
 *       QObject and ConfigurationProvider to provide Qt signal support for
 *       configuration change notifications
 */
class ConfigurationProvider
{
public:
    virtual ~ConfigurationProvider();

    /**
     * @brief Reloads configuration from storage
     */
    virtual void reload() = 0;

    /**
     * @brief Transports tried by device discovery
     * @return Transport mask, never empty
     */
    virtual Transports discoveryTransports() const = 0;

    /**
     * @brief Delay before the touch prompt is shown
     * @return Delay in milliseconds
     */
    virtual int touchPromptDelay() const = 0;

    /**
     * @brief Challenge-response timeout used when programming a mode
     * @return Timeout in seconds (0-255)
     */
    virtual int challengeResponseTimeout() const = 0;

    /**
     * @brief Auto-eject time used when programming a mode
     * @return Time in seconds, or std::nullopt when touch-eject is disabled
     */
    virtual std::optional<int> autoEjectTimeout() const = 0;
};

} // namespace Shared
} // namespace YubiKeyManager

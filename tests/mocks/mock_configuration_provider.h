/*
 * SPDX-FileCopyrightText: 2024 YubiKey KRunner Plugin Contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#pragma once

#include "shared/config/configuration_provider.h"

namespace YubiKeyManager {
namespace Shared {

/**
 * @brief Mock implementation of ConfigurationProvider for unit tests
 *
 * Provides controllable configuration values for testing components
 * that depend on ConfigurationProvider interface.
 *
 * Usage:
 * @code
 * MockConfigurationProvider config;
 * config.setDiscoveryTransports(Transport::OTP | Transport::U2F);
 * config.setAutoEjectTimeout(15);
 * @endcode
 */
class MockConfigurationProvider : public ConfigurationProvider
{
public:
    void reload() override { ++m_reloadCount; }

    Transports discoveryTransports() const override { return m_transports; }
    int touchPromptDelay() const override { return m_touchPromptDelay; }
    int challengeResponseTimeout() const override { return m_challengeResponseTimeout; }
    std::optional<int> autoEjectTimeout() const override { return m_autoEjectTimeout; }

    // Test control methods
    void setDiscoveryTransports(Transports transports) { m_transports = transports; }
    void setTouchPromptDelay(int delay) { m_touchPromptDelay = delay; }
    void setChallengeResponseTimeout(int timeout) { m_challengeResponseTimeout = timeout; }
    void setAutoEjectTimeout(std::optional<int> timeout) { m_autoEjectTimeout = timeout; }

    int reloadCount() const { return m_reloadCount; }

private:
    Transports m_transports = ALL_TRANSPORTS;
    int m_touchPromptDelay = 500;
    int m_challengeResponseTimeout = 0;
    std::optional<int> m_autoEjectTimeout;
    int m_reloadCount = 0;
};

} // namespace Shared
} // namespace YubiKeyManager

/*
 * SPDX-FileCopyrightText: 2024 YubiKey KRunner Plugin Contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#pragma once

#include <QByteArray>
#include <optional>
#include "shared/common/result.h"
#include "shared/types/device_mode.h"
#include "shared/utils/version.h"

namespace YubiKeyManager {
namespace Device {
using namespace YubiKeyManager::Shared;

/**
 * @brief Open connection to a YubiKey over one transport
 *
 * One subclass per transport (CcidDriver, OtpDriver, U2fDriver) plus the
 * inert NullDriver. A driver is exclusively owned by one YubiKeyDevice.
 *
 * Identity (transport, version, serial) is read once when the driver is
 * opened. The mode is a cached field: setCachedMode() updates it after a
 * mode change without re-querying the hardware.
 *
 * Thread Safety:
 * - NOT thread-safe - caller must serialize access
 * - All I/O is synchronous and blocking
 */
class Driver
{
public:
    virtual ~Driver() = default;

    Driver(const Driver &) = delete;
    Driver &operator=(const Driver &) = delete;

    virtual Transport transport() const = 0;
    virtual Version version() const = 0;

    /**
     * @brief Serial number reported by the transport itself
     * @return Serial, or std::nullopt when the transport can't read it
     */
    virtual std::optional<quint32> serial() const = 0;

    /**
     * @brief Whether the device identifies as a FIDO-only Security Key
     */
    virtual bool isSecurityKey() const { return false; }

    /**
     * @brief Reads the raw YubiKey 4 capability blob
     * @return Length-prefixed TLV data, empty if the firmware reports none
     */
    virtual Result<QByteArray> readCapabilities() = 0;

    /**
     * @brief Determines capabilities by querying the device live
     * @return Capability mask of applications that answered
     */
    virtual Result<Capabilities> probeCapabilitiesSupport() = 0;

    /**
     * @brief Sends the mode-change command
     * @param modeByte Mode code ORed with flag bits
     * @param crTimeout Challenge-response timeout in seconds
     * @param autoejectTime Touch-eject time in seconds (0 = none)
     */
    virtual Result<void> setMode(quint8 modeByte, quint8 crTimeout, quint16 autoejectTime) = 0;

    /**
     * @brief Currently active mode as last reported or programmed
     */
    Mode mode() const { return m_mode; }

    /**
     * @brief Updates the cached mode field (no device I/O)
     */
    void setCachedMode(const Mode &mode) { m_mode = mode; }

protected:
    Driver() = default;

    Mode m_mode;
};

/**
 * @brief Placeholder installed in a device handle after its driver is released
 *
 * Reports no transport and an invalid mode; every I/O operation fails with
 * NO_DRIVER.
 */
class NullDriver : public Driver
{
public:
    NullDriver() = default;

    Transport transport() const override;
    Version version() const override;
    std::optional<quint32> serial() const override;
    Result<QByteArray> readCapabilities() override;
    Result<Capabilities> probeCapabilitiesSupport() override;
    Result<void> setMode(quint8 modeByte, quint8 crTimeout, quint16 autoejectTime) override;
};

} // namespace Device
} // namespace YubiKeyManager

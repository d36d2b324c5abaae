/*
 * SPDX-FileCopyrightText: 2024 YubiKey KRunner Plugin Contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#pragma once

#include <QString>
#include <memory>
#include <optional>
#include "device_classifier.h"
#include "shared/common/result.h"
#include "shared/types/device_mode.h"
#include "shared/utils/version.h"

namespace YubiKeyManager {
namespace Device {
using namespace YubiKeyManager::Shared;

class Driver;
class DriverFactory;

/**
 * @brief Handle to one physical YubiKey reached over one transport
 *
 * Created by DeviceDiscovery after the opened driver has been classified.
 * The handle exclusively owns its driver. Switching transport with
 * useTransport() releases the driver (the handle keeps a NullDriver and
 * becomes inert) and returns a new handle from fresh discovery.
 *
 * Always owned by std::shared_ptr so useTransport() can return the same
 * instance.
 *
 * Thread Safety:
 * - NOT thread-safe, callers serialize access
 */
class YubiKeyDevice : public std::enable_shared_from_this<YubiKeyDevice>
{
public:
    static constexpr quint8 FLAG_TOUCH_EJECT = 0x80;

    /**
     * @brief Classifies the driver and wraps it in a handle
     * @param driver Open driver, ownership transferred
     * @param factory Factory used when the handle switches transport
     * @return Handle, or the classifier's error
     */
    static Result<std::shared_ptr<YubiKeyDevice>> create(std::unique_ptr<Driver> driver,
                                                         std::shared_ptr<DriverFactory> factory);

    ~YubiKeyDevice();

    YubiKeyDevice(const YubiKeyDevice &) = delete;
    YubiKeyDevice &operator=(const YubiKeyDevice &) = delete;

    QString deviceName() const { return m_classification.deviceName; }
    Capabilities capabilities() const { return m_classification.capabilities; }
    Capabilities enabled() const { return m_classification.enabled; }

    Version version() const;
    Transport transport() const;
    Mode mode() const;

    /**
     * @brief Serial from the capability blob, falling back to the driver's
     */
    std::optional<quint32> serial() const;

    /**
     * @brief Whether every transport of the mode is a device capability
     */
    bool hasMode(const Mode &mode) const;

    /**
     * @brief Programs a new mode
     * @param mode Target mode, must satisfy hasMode()
     * @param crTimeout Challenge-response timeout in seconds
     * @param autoejectTime Touch-eject time in seconds; std::nullopt disables touch-eject
     * @return Success, UNSUPPORTED_MODE before any I/O, or the driver's error
     *
     * The new mode usually takes effect after the device is re-plugged; the
     * cached mode is updated right away.
     */
    Result<void> setMode(const Mode &mode, quint8 crTimeout = 0,
                         std::optional<quint16> autoejectTime = std::nullopt);

    /**
     * @brief Flag bits sent together with a mode code
     *
     * 0x80 (touch-eject) when autoejectTime is set. Firmware up to 3.3.1
     * always needs 0x80 for mode code 2.
     */
    static quint8 modeFlags(const Version &firmware, const Mode &mode,
                            std::optional<quint16> autoejectTime);

    /**
     * @brief Reopens the device over another transport
     * @return This handle if it already uses the transport, otherwise a new
     *         handle; UNSUPPORTED_TRANSPORT, DEVICE_NOT_FOUND,
     *         CONSISTENCY_FAULT or a discovery error
     *
     * After a reopen attempt this handle holds the null driver.
     */
    Result<std::shared_ptr<YubiKeyDevice>> useTransport(Transport transport);

    /**
     * @brief "{name} {version} {mode} [{transport}] serial: {serial} CAP: {hex}"
     */
    QString toString() const;

private:
    YubiKeyDevice(std::unique_ptr<Driver> driver, DeviceClassification classification,
                  std::shared_ptr<DriverFactory> factory);

    void releaseDriver();

    std::unique_ptr<Driver> m_driver;
    DeviceClassification m_classification;
    std::shared_ptr<DriverFactory> m_factory;
};

} // namespace Device
} // namespace YubiKeyManager

/*
 * SPDX-FileCopyrightText: 2024 YubiKey KRunner Plugin Contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#pragma once

#include <memory>
#include "driver.h"
#include "hid_device_handle.h"

namespace YubiKeyManager {
namespace Device {

/**
 * @brief FIDO U2F HID transport driver
 *
 * Allocates a channel with INIT and then uses the Yubico vendor commands
 * for capabilities and mode. U2F has no serial number.
 */
class U2fDriver : public Driver
{
public:
    /**
     * @brief Opens the first Yubico FIDO interface
     * @return Driver, nullptr when no device is attached, or error
     */
    static Result<std::unique_ptr<Driver>> open();

    ~U2fDriver() override;

    Transport transport() const override { return Transport::U2F; }
    Version version() const override { return m_version; }
    std::optional<quint32> serial() const override { return std::nullopt; }
    bool isSecurityKey() const override;

    Result<QByteArray> readCapabilities() override;

    /**
     * @brief Not available over U2F; returns NOT_SUPPORTED
     */
    Result<Capabilities> probeCapabilitiesSupport() override;

    Result<void> setMode(quint8 modeByte, quint8 crTimeout, quint16 autoejectTime) override;

private:
    U2fDriver(HidDeviceHandle handle, quint16 productId, const Mode &mode);

    /**
     * @brief Allocates a channel and reads the firmware version
     */
    Result<void> initialize();

    /**
     * @brief Sends one message and waits for the response on the same channel
     */
    Result<QByteArray> transact(quint32 channelId, quint8 command, const QByteArray &data);

    HidDeviceHandle m_handle;
    quint16 m_productId;
    quint32 m_channelId;
    Version m_version;

    static constexpr int RESPONSE_TIMEOUT_MS = 2000;
};

} // namespace Device
} // namespace YubiKeyManager

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
 * @brief HID keyboard transport driver
 *
 * Commands are slot frames written as 8-byte feature reports; see
 * OtpProtocol for the frame layout. The active mode is derived from the USB
 * product id.
 */
class OtpDriver : public Driver
{
public:
    /**
     * @brief Opens the first Yubico keyboard interface
     * @return Driver, nullptr when no device is attached, or error
     */
    static Result<std::unique_ptr<Driver>> open();

    ~OtpDriver() override;

    Transport transport() const override { return Transport::OTP; }
    Version version() const override { return m_version; }
    std::optional<quint32> serial() const override { return m_serial; }

    Result<QByteArray> readCapabilities() override;

    /**
     * @brief Not available over HID; returns NOT_SUPPORTED
     */
    Result<Capabilities> probeCapabilitiesSupport() override;

    Result<void> setMode(quint8 modeByte, quint8 crTimeout, quint16 autoejectTime) override;

private:
    OtpDriver(HidDeviceHandle handle, quint16 productId, const Mode &mode);

    Result<void> initialize();
    Result<OtpStatus> readStatus();

    /**
     * @brief Waits until the device has consumed the previous report
     */
    Result<void> waitForWriteReady();

    /**
     * @brief Writes a slot command frame
     */
    Result<void> writeCommand(quint8 slot, const QByteArray &payload);

    /**
     * @brief Writes a slot command and reads back its response
     * @return Raw response bytes (data plus CRC and padding)
     */
    Result<QByteArray> transact(quint8 slot, const QByteArray &payload);

    HidDeviceHandle m_handle;
    quint16 m_productId;
    Version m_version;
    std::optional<quint32> m_serial;

    static constexpr int WRITE_READY_TIMEOUT_MS = 1150;
    static constexpr int RESPONSE_TIMEOUT_MS = 2000;
    static constexpr int POLL_INTERVAL_MS = 10;
};

} // namespace Device
} // namespace YubiKeyManager

/*
 * SPDX-FileCopyrightText: 2024 YubiKey KRunner Plugin Contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#pragma once

#include <QString>
#include <memory>
#include "driver.h"

// Forward declarations for PC/SC types
#ifdef __APPLE__
#include <PCSC/winscard.h>
#include <PCSC/wintypes.h>
#else
#include <winscard.h>
#endif

namespace YubiKeyManager {
namespace Device {

/**
 * @brief Smart card transport driver over PC/SC
 *
 * Talks ISO 7816 APDUs to the OTP and management applets:
 * - version from the OTP applet SELECT response
 * - serial from OTP slot 0x10
 * - capability blob from the management applet (YubiKey 4.1+)
 * - live capability probing by selecting known applets (NEO)
 *
 * Ownership:
 * - Owns its PC/SC context and card handle; both are released in the destructor
 */
class CcidDriver : public Driver
{
public:
    /**
     * @brief Connects to the first YubiKey reader
     * @return Driver, nullptr when no YubiKey reader or card is present,
     *         or error on PC/SC failures
     *
     * A missing pcscd service counts as "no device".
     */
    static Result<std::unique_ptr<Driver>> open();

    ~CcidDriver() override;

    Transport transport() const override { return Transport::CCID; }
    Version version() const override { return m_version; }
    std::optional<quint32> serial() const override { return m_serial; }

    Result<QByteArray> readCapabilities() override;
    Result<Capabilities> probeCapabilitiesSupport() override;
    Result<void> setMode(quint8 modeByte, quint8 crTimeout, quint16 autoejectTime) override;

    /**
     * @brief PC/SC reader the device is attached to
     */
    QString readerName() const { return m_readerName; }

private:
    CcidDriver(SCARDCONTEXT context, SCARDHANDLE cardHandle, DWORD protocol, QString readerName);

    /**
     * @brief Reads version and serial after connecting
     */
    Result<void> initialize();

    /**
     * @brief Transmits an APDU
     * @return Response data without status word; error unless SW is 9000
     */
    Result<QByteArray> sendApdu(const QByteArray &command);

    /**
     * @brief Transmits an APDU, returning the raw response including SW
     */
    Result<QByteArray> transmit(const QByteArray &command);

    Result<QByteArray> selectApplet(const QByteArray &aid);

    SCARDCONTEXT m_context;
    SCARDHANDLE m_cardHandle;
    DWORD m_protocol;
    QString m_readerName;
    Version m_version;
    std::optional<quint32> m_serial;
};

} // namespace Device
} // namespace YubiKeyManager

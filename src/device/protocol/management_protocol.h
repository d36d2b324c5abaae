/*
 * SPDX-FileCopyrightText: 2024 YubiKey KRunner Plugin Contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#pragma once

#include <QByteArray>
#include <QList>
#include <QPair>
#include <QString>
#include "shared/types/device_mode.h"
#include "shared/utils/version.h"

namespace YubiKeyManager {
namespace Device {
using namespace YubiKeyManager::Shared;

/**
 * @brief Stateless utility class for the smart card (CCID) device protocol
 *
 * This class provides pure functions for:
 * - Application identifiers (OTP, management and the probed applets)
 * - APDU command creation (SELECT, serial, capabilities, mode)
 * - Status word handling
 * - Mode detection from the PC/SC reader name
 *
 * No state, no I/O - all functions are static.
 * Used by CcidDriver.
 */
class ManagementProtocol
{
public:
    // Class byte for all commands
    static constexpr quint8 CLA = 0x00;

    // Instruction codes
    static constexpr quint8 INS_SELECT = 0xA4;
    static constexpr quint8 INS_YK2_REQ = 0x01;          ///< OTP applet slot request
    static constexpr quint8 INS_SET_MODE = 0x16;         ///< Management applet (YubiKey 4+)
    static constexpr quint8 INS_YK4_CAPABILITIES = 0x1D; ///< Management applet (YubiKey 4.1+)

    // P1 for SELECT
    static constexpr quint8 P1_SELECT_BY_NAME = 0x04;

    // OTP slots addressed through INS_YK2_REQ / INS_SET_MODE
    static constexpr quint8 SLOT_DEVICE_SERIAL = 0x10;
    static constexpr quint8 SLOT_DEVICE_CONFIG = 0x11;

    // Status words
    static constexpr quint16 SW_SUCCESS = 0x9000;
    static constexpr quint16 SW_FILE_NOT_FOUND = 0x6A82;

    // Mode flag: eject the smart card on touch
    static constexpr quint8 FLAG_TOUCH_EJECT = 0x80;

    // Application Identifiers
    static const QByteArray OTP_AID;
    static const QByteArray MGR_AID;
    static const QByteArray U2F_AID;
    static const QByteArray OPGP_AID;
    static const QByteArray PIV_AID;
    static const QByteArray OATH_AID;

    /**
     * @brief Applets probed on devices without a capability blob
     * @return (AID, capability) pairs
     */
    static const QList<QPair<QByteArray, Capability>> &knownApplets();

    /**
     * @brief Creates SELECT command for an application
     * @return APDU: 00 A4 04 00 [Lc] [AID]
     */
    static QByteArray createSelectCommand(const QByteArray &aid);

    /**
     * @brief Creates serial number request (OTP applet)
     * @return APDU: 00 01 10 00
     */
    static QByteArray createReadSerialCommand();

    /**
     * @brief Creates capability blob request (management applet)
     * @return APDU: 00 1D 00 00
     */
    static QByteArray createReadCapabilitiesCommand();

    /**
     * @brief Creates the mode-change command for the given firmware
     * @param firmware Firmware version; 4.0+ talks to the management applet,
     *        older firmware to the OTP applet
     * @return APDU: 00 16 11 00 04 [data] or 00 01 11 00 04 [data]
     */
    static QByteArray createSetModeCommand(const Version &firmware, quint8 modeByte,
                                           quint8 crTimeout, quint16 autoejectTime);

    /**
     * @brief Applet that must be selected before createSetModeCommand()
     */
    static QByteArray setModeApplet(const Version &firmware);

    /**
     * @brief Serializes mode configuration
     * @return 4 bytes: mode, cr timeout, autoeject time (uint16 little-endian)
     */
    static QByteArray modeData(quint8 modeByte, quint8 crTimeout, quint16 autoejectTime);

    /**
     * @brief Extracts status word from response
     * @param response Response bytes
     * @return Status word (SW1 << 8 | SW2), 0 if response is too short
     */
    static quint16 getStatusWord(const QByteArray &response);

    /**
     * @brief Checks if status word indicates success
     */
    static bool isSuccess(quint16 sw);

    /**
     * @brief Response data without the trailing status word
     */
    static QByteArray responseData(const QByteArray &response);

    /**
     * @brief Checks whether a PC/SC reader belongs to a YubiKey
     */
    static bool isYubiKeyReader(const QString &readerName);

    /**
     * @brief Derives the active mode from the reader name
     *
     * Reader names carry the enabled interfaces, e.g.
     * "Yubico YubiKey OTP+FIDO+CCID 00 00". CCID is always part of the
     * result since the reader only exists while CCID is enabled.
     */
    static Mode modeFromReaderName(const QString &readerName);

private:
    ManagementProtocol() = delete;
};

} // namespace Device
} // namespace YubiKeyManager

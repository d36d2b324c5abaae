/*
 * SPDX-FileCopyrightText: 2024 YubiKey KRunner Plugin Contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#pragma once

#include <QByteArray>
#include <QList>
#include "shared/common/result.h"
#include "shared/utils/version.h"

namespace YubiKeyManager {
namespace Device {
using namespace YubiKeyManager::Shared;

/**
 * @brief Status block returned in every OTP feature report
 */
struct OtpStatus {
    Version firmwareVersion;     ///< major.minor.build
    quint8 programSequence = 0;  ///< Incremented on every successful write
    quint16 touchLevel = 0;      ///< Touch sensor level and slot flags
};

/**
 * @brief Stateless utility class for the OTP HID (keyboard) frame protocol
 *
 * The device exchanges 8-byte feature reports: 7 data bytes and one
 * status/sequence byte. A command is a 70-byte frame
 * @code
 * [PAYLOAD (64)][SLOT (1)][CRC16 (2, LE)][FILLER (3)]
 * @endcode
 * split into ten reports tagged 0x80 | sequence. All-zero reports other
 * than the first and the last are skipped.
 */
class OtpProtocol
{
public:
    static constexpr int FEATURE_REPORT_SIZE = 8;
    static constexpr int REPORT_DATA_SIZE = 7;
    static constexpr int SLOT_DATA_SIZE = 64;
    static constexpr int FRAME_SIZE = 70;

    // Status byte (offset 7) flags
    static constexpr quint8 SLOT_WRITE_FLAG = 0x80;
    static constexpr quint8 RESP_PENDING_FLAG = 0x40;
    static constexpr quint8 RESP_TIMEOUT_WAIT_FLAG = 0x20;
    static constexpr quint8 SEQUENCE_MASK = 0x1F;
    static constexpr quint8 DUMMY_REPORT_WRITE = 0x8F;

    static constexpr quint16 CRC_OK_RESIDUAL = 0xF0B8;

    // Slots
    static constexpr quint8 SLOT_DEVICE_SERIAL = 0x10;
    static constexpr quint8 SLOT_DEVICE_CONFIG = 0x11;
    static constexpr quint8 SLOT_YK4_CAPABILITIES = 0x13;

    /**
     * @brief CRC-16 (ISO 13239) as used by YubiKey frames
     */
    static quint16 crc16(const QByteArray &data);

    /**
     * @brief Verifies data followed by its CRC against the residual
     */
    static bool checkCrc(const QByteArray &dataWithCrc);

    /**
     * @brief Builds the 70-byte frame for a slot command
     * @param payload Up to 64 bytes, zero-padded
     */
    static QByteArray formatFrame(quint8 slot, const QByteArray &payload);

    /**
     * @brief Splits a frame into the feature reports that must be written
     * @return 8-byte reports in send order
     */
    static QList<QByteArray> frameReports(const QByteArray &frame);

    /**
     * @brief Report that resets the device's response state
     */
    static QByteArray resetReport();

    /**
     * @brief Parses the status block of a feature report
     * @param report 8-byte feature report
     */
    static Result<OtpStatus> parseStatus(const QByteArray &report);

    /**
     * @brief Takes `length` bytes from a response after verifying the CRC
     *        that follows them
     */
    static Result<QByteArray> extractResponse(const QByteArray &response, int length);

private:
    OtpProtocol() = delete;
};

/**
 * @brief Reassembles a multi-report response read from the device
 *
 * Feed every feature report read after a command until feed() stops
 * returning NeedMore.
 */
class OtpResponseAssembler
{
public:
    enum class Step {
        NeedMore,  ///< Keep reading reports
        Complete,  ///< data() holds the full response
        Failed     ///< Device reported status without finishing the transfer
    };

    Step feed(const QByteArray &report);

    [[nodiscard]] QByteArray data() const { return m_data; }

private:
    QByteArray m_data;
    quint8 m_expectedSequence = 0;
};

} // namespace Device
} // namespace YubiKeyManager

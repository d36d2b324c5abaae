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
 * @brief Data returned by the U2FHID INIT command
 */
struct U2fHidInitInfo {
    quint32 channelId = 0;       ///< Channel allocated for this client
    quint8 protocolVersion = 0;  ///< U2FHID protocol version (2)
    Version firmwareVersion;     ///< Device firmware major.minor.build
    quint8 capabilities = 0;     ///< U2FHID capability flags
};

/**
 * @brief Stateless utility class for U2FHID packet framing
 *
 * Messages travel in 64-byte packets:
 * @code
 * init:         [CID (4, BE)][CMD | 0x80][BCNT (2, BE)][DATA (57)]
 * continuation: [CID (4, BE)][SEQ 0..127][DATA (59)]
 * @endcode
 *
 * Besides INIT, two Yubico vendor commands are used: SET_MODE (0xC0) and
 * READ_CAPABILITIES (0xC2).
 */
class U2fHidProtocol
{
public:
    static constexpr int PACKET_SIZE = 64;
    static constexpr int INIT_DATA_SIZE = PACKET_SIZE - 7;
    static constexpr int CONT_DATA_SIZE = PACKET_SIZE - 5;
    static constexpr int MAX_MESSAGE_SIZE = INIT_DATA_SIZE + 128 * CONT_DATA_SIZE;
    static constexpr int NONCE_SIZE = 8;

    static constexpr quint32 BROADCAST_CID = 0xFFFFFFFF;
    static constexpr quint8 TYPE_INIT = 0x80;

    static constexpr quint8 CMD_INIT = 0x86;
    static constexpr quint8 CMD_KEEPALIVE = 0xBB;
    static constexpr quint8 CMD_ERROR = 0xBF;
    static constexpr quint8 CMD_YK_SET_MODE = 0xC0;
    static constexpr quint8 CMD_YK_CAPABILITIES = 0xC2;

    static constexpr quint16 USAGE_PAGE_FIDO = 0xF1D0;

    /**
     * @brief Splits a message into packets
     * @return 64-byte packets, or error if data exceeds MAX_MESSAGE_SIZE
     */
    static Result<QList<QByteArray>> buildPackets(quint32 channelId, quint8 command,
                                                  const QByteArray &data);

    /**
     * @brief Parses the INIT response payload
     * @param payload Response data (17 bytes)
     * @param nonce Nonce sent with the request; must be echoed back
     */
    static Result<U2fHidInitInfo> parseInitResponse(const QByteArray &payload,
                                                    const QByteArray &nonce);

private:
    U2fHidProtocol() = delete;
};

/**
 * @brief Reassembles a response message for one channel
 *
 * Packets for other channels and keep-alive messages are skipped.
 */
class U2fHidResponseAssembler
{
public:
    enum class Step {
        NeedMore,
        Complete,
        Failed   ///< Sequence error or malformed packet
    };

    explicit U2fHidResponseAssembler(quint32 channelId);

    Step feed(const QByteArray &packet);

    [[nodiscard]] quint8 command() const { return m_command; }
    [[nodiscard]] QByteArray data() const { return m_data; }

private:
    quint32 m_channelId;
    quint8 m_command = 0;
    int m_expectedLength = -1;
    quint8 m_nextSequence = 0;
    QByteArray m_data;
};

} // namespace Device
} // namespace YubiKeyManager

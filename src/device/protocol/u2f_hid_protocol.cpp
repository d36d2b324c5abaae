/*
 * SPDX-FileCopyrightText: 2024 YubiKey KRunner Plugin Contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "u2f_hid_protocol.h"
#include "../device_error_codes.h"
#include "../logging_categories.h"

#include <QDebug>

namespace YubiKeyManager {
namespace Device {

namespace {

void appendChannelId(QByteArray &packet, quint32 channelId)
{
    packet.append(static_cast<char>((channelId >> 24) & 0xFF));
    packet.append(static_cast<char>((channelId >> 16) & 0xFF));
    packet.append(static_cast<char>((channelId >> 8) & 0xFF));
    packet.append(static_cast<char>(channelId & 0xFF));
}

quint32 readChannelId(const QByteArray &packet)
{
    return (static_cast<quint32>(static_cast<quint8>(packet[0])) << 24)
         | (static_cast<quint32>(static_cast<quint8>(packet[1])) << 16)
         | (static_cast<quint32>(static_cast<quint8>(packet[2])) << 8)
         | static_cast<quint32>(static_cast<quint8>(packet[3]));
}

QByteArray padded(QByteArray packet)
{
    packet.append(QByteArray(U2fHidProtocol::PACKET_SIZE - packet.length(), '\0'));
    return packet;
}

} // namespace

Result<QList<QByteArray>> U2fHidProtocol::buildPackets(quint32 channelId, quint8 command,
                                                       const QByteArray &data)
{
    if (data.length() > MAX_MESSAGE_SIZE) {
        return Result<QList<QByteArray>>::error(DeviceErrorCodes::withDetail(
            DeviceErrorCodes::COMMUNICATION_ERROR,
            QStringLiteral("message of %1 bytes is too long").arg(data.length())));
    }

    QList<QByteArray> packets;

    QByteArray init;
    appendChannelId(init, channelId);
    init.append(static_cast<char>(command | TYPE_INIT));
    init.append(static_cast<char>((data.length() >> 8) & 0xFF));
    init.append(static_cast<char>(data.length() & 0xFF));
    init.append(data.left(INIT_DATA_SIZE));
    packets.append(padded(init));

    int offset = INIT_DATA_SIZE;
    quint8 sequence = 0;
    while (offset < data.length()) {
        QByteArray cont;
        appendChannelId(cont, channelId);
        cont.append(static_cast<char>(sequence++));
        cont.append(data.mid(offset, CONT_DATA_SIZE));
        packets.append(padded(cont));
        offset += CONT_DATA_SIZE;
    }

    return Result<QList<QByteArray>>::success(packets);
}

Result<U2fHidInitInfo> U2fHidProtocol::parseInitResponse(const QByteArray &payload,
                                                         const QByteArray &nonce)
{
    if (payload.length() < NONCE_SIZE + 9) {
        return Result<U2fHidInitInfo>::error(DeviceErrorCodes::withDetail(
            DeviceErrorCodes::COMMUNICATION_ERROR,
            QStringLiteral("INIT response has %1 bytes").arg(payload.length())));
    }

    if (payload.left(NONCE_SIZE) != nonce) {
        return Result<U2fHidInitInfo>::error(DeviceErrorCodes::withDetail(
            DeviceErrorCodes::COMMUNICATION_ERROR, QStringLiteral("INIT nonce mismatch")));
    }

    U2fHidInitInfo info;
    info.channelId = readChannelId(payload.mid(NONCE_SIZE, 4));
    info.protocolVersion = static_cast<quint8>(payload[NONCE_SIZE + 4]);
    info.firmwareVersion = Version::fromBytes(payload.mid(NONCE_SIZE + 5, 3));
    info.capabilities = static_cast<quint8>(payload[NONCE_SIZE + 8]);
    return Result<U2fHidInitInfo>::success(info);
}

U2fHidResponseAssembler::U2fHidResponseAssembler(quint32 channelId)
    : m_channelId(channelId)
{
}

U2fHidResponseAssembler::Step U2fHidResponseAssembler::feed(const QByteArray &packet)
{
    if (packet.length() < 5) {
        return Step::Failed;
    }

    if (readChannelId(packet) != m_channelId) {
        qCDebug(DeviceProtocolLog) << "Skipping packet for channel" << Qt::hex << readChannelId(packet);
        return Step::NeedMore;
    }

    const auto typeByte = static_cast<quint8>(packet[4]);

    if (m_expectedLength < 0) {
        if (!(typeByte & U2fHidProtocol::TYPE_INIT) || packet.length() < 7) {
            return Step::Failed;
        }
        if (typeByte == U2fHidProtocol::CMD_KEEPALIVE) {
            return Step::NeedMore;
        }

        m_command = typeByte;
        m_expectedLength = (static_cast<quint8>(packet[5]) << 8) | static_cast<quint8>(packet[6]);
        m_data = packet.mid(7, qMin(m_expectedLength, U2fHidProtocol::INIT_DATA_SIZE));
    } else {
        if (typeByte != m_nextSequence) {
            qCWarning(DeviceProtocolLog) << "U2FHID sequence error: expected" << static_cast<int>(m_nextSequence)
                                         << "got" << static_cast<int>(typeByte);
            return Step::Failed;
        }
        ++m_nextSequence;
        m_data.append(packet.mid(5, qMin(m_expectedLength - m_data.length(),
                                         U2fHidProtocol::CONT_DATA_SIZE)));
    }

    return m_data.length() >= m_expectedLength ? Step::Complete : Step::NeedMore;
}

} // namespace Device
} // namespace YubiKeyManager

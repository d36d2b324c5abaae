/*
 * SPDX-FileCopyrightText: 2024 YubiKey KRunner Plugin Contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "management_protocol.h"

#include <QRegularExpression>

namespace YubiKeyManager {
namespace Device {

const QByteArray ManagementProtocol::OTP_AID = QByteArray::fromHex("a0000005272001");
const QByteArray ManagementProtocol::MGR_AID = QByteArray::fromHex("a000000527471117");
const QByteArray ManagementProtocol::U2F_AID = QByteArray::fromHex("a0000006472f0001");
const QByteArray ManagementProtocol::OPGP_AID = QByteArray::fromHex("d27600012401");
const QByteArray ManagementProtocol::PIV_AID = QByteArray::fromHex("a000000308");
const QByteArray ManagementProtocol::OATH_AID = QByteArray::fromHex("a0000005272101");

const QList<QPair<QByteArray, Capability>> &ManagementProtocol::knownApplets()
{
    static const QList<QPair<QByteArray, Capability>> applets = {
        {OTP_AID, Capability::OTP},
        {U2F_AID, Capability::U2F},
        {OPGP_AID, Capability::OPGP},
        {PIV_AID, Capability::PIV},
        {OATH_AID, Capability::OATH},
    };
    return applets;
}

// =============================================================================
// Command Creation
// =============================================================================

QByteArray ManagementProtocol::createSelectCommand(const QByteArray &aid)
{
    QByteArray command;
    command.append(static_cast<char>(CLA));               // CLA
    command.append(static_cast<char>(INS_SELECT));        // INS = SELECT
    command.append(static_cast<char>(P1_SELECT_BY_NAME)); // P1 = Select by name
    command.append(static_cast<char>(0x00));              // P2
    command.append(static_cast<char>(aid.length()));      // Lc
    command.append(aid);                                  // Data = AID

    return command;
}

QByteArray ManagementProtocol::createReadSerialCommand()
{
    QByteArray command;
    command.append(static_cast<char>(CLA));
    command.append(static_cast<char>(INS_YK2_REQ));
    command.append(static_cast<char>(SLOT_DEVICE_SERIAL));
    command.append(static_cast<char>(0x00));

    return command;
}

QByteArray ManagementProtocol::createReadCapabilitiesCommand()
{
    QByteArray command;
    command.append(static_cast<char>(CLA));
    command.append(static_cast<char>(INS_YK4_CAPABILITIES));
    command.append(static_cast<char>(0x00));
    command.append(static_cast<char>(0x00));

    return command;
}

QByteArray ManagementProtocol::createSetModeCommand(const Version &firmware, quint8 modeByte,
                                                    quint8 crTimeout, quint16 autoejectTime)
{
    const QByteArray data = modeData(modeByte, crTimeout, autoejectTime);
    const bool managementApplet = firmware >= Version(4, 0, 0);

    QByteArray command;
    command.append(static_cast<char>(CLA));
    command.append(static_cast<char>(managementApplet ? INS_SET_MODE : INS_YK2_REQ));
    command.append(static_cast<char>(SLOT_DEVICE_CONFIG));
    command.append(static_cast<char>(0x00));
    command.append(static_cast<char>(data.length()));
    command.append(data);

    return command;
}

QByteArray ManagementProtocol::setModeApplet(const Version &firmware)
{
    return firmware >= Version(4, 0, 0) ? MGR_AID : OTP_AID;
}

QByteArray ManagementProtocol::modeData(quint8 modeByte, quint8 crTimeout, quint16 autoejectTime)
{
    QByteArray data;
    data.append(static_cast<char>(modeByte));
    data.append(static_cast<char>(crTimeout));
    data.append(static_cast<char>(autoejectTime & 0xFF));
    data.append(static_cast<char>((autoejectTime >> 8) & 0xFF));
    return data;
}

// =============================================================================
// Response Handling
// =============================================================================

quint16 ManagementProtocol::getStatusWord(const QByteArray &response)
{
    if (response.length() < 2) {
        return 0;
    }

    // Status word is last 2 bytes: SW1 << 8 | SW2
    const auto sw1 = static_cast<quint8>(response[response.length() - 2]);
    const auto sw2 = static_cast<quint8>(response[response.length() - 1]);

    return static_cast<quint16>((sw1 << 8) | sw2);
}

bool ManagementProtocol::isSuccess(quint16 sw)
{
    return sw == SW_SUCCESS;
}

QByteArray ManagementProtocol::responseData(const QByteArray &response)
{
    if (response.length() < 2) {
        return {};
    }
    return response.left(response.length() - 2);
}

// =============================================================================
// Reader Names
// =============================================================================

bool ManagementProtocol::isYubiKeyReader(const QString &readerName)
{
    return readerName.contains(QLatin1String("yubico"), Qt::CaseInsensitive)
        || readerName.contains(QLatin1String("yubikey"), Qt::CaseInsensitive);
}

Mode ManagementProtocol::modeFromReaderName(const QString &readerName)
{
    static const QRegularExpression separators(QStringLiteral("[\\s+]"));

    Transports transports;
    const QStringList tokens = readerName.split(separators, Qt::SkipEmptyParts);
    for (const QString &token : tokens) {
        if (const auto transport = transportFromName(token)) {
            transports |= *transport;
        }
    }

    // The reader only exists while CCID is enabled
    transports |= Transport::CCID;

    return Mode::fromTransports(transports).value_or(Mode());
}

} // namespace Device
} // namespace YubiKeyManager

/*
 * SPDX-FileCopyrightText: 2024 YubiKey KRunner Plugin Contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "device_mode.h"

#include <array>

namespace YubiKeyManager {
namespace Shared {

namespace {

// Index is the mode code
const std::array<Transports, 7> &modeTable()
{
    static const std::array<Transports, 7> table = {
        Transports(Transport::OTP),
        Transports(Transport::CCID),
        Transport::OTP | Transport::CCID,
        Transports(Transport::U2F),
        Transport::OTP | Transport::U2F,
        Transport::U2F | Transport::CCID,
        Transport::OTP | Transport::U2F | Transport::CCID,
    };
    return table;
}

} // namespace

const QList<Transport> &transportPriority()
{
    static const QList<Transport> order = {Transport::CCID, Transport::OTP, Transport::U2F};
    return order;
}

Capabilities toCapabilities(Transports transports)
{
    return Capabilities::fromInt(transports.toInt());
}

QString transportName(Transport transport)
{
    switch (transport) {
    case Transport::OTP:
        return QStringLiteral("OTP");
    case Transport::U2F:
        return QStringLiteral("U2F");
    case Transport::CCID:
        return QStringLiteral("CCID");
    case Transport::NoTransport:
    default:
        return QStringLiteral("None");
    }
}

std::optional<Transport> transportFromName(const QString &name)
{
    const QString token = name.trimmed().toUpper();
    if (token == QLatin1String("OTP")) {
        return Transport::OTP;
    }
    if (token == QLatin1String("U2F") || token == QLatin1String("FIDO")) {
        return Transport::U2F;
    }
    if (token == QLatin1String("CCID")) {
        return Transport::CCID;
    }
    return std::nullopt;
}

QString capabilitiesToString(Capabilities capabilities)
{
    static const QList<QPair<Capability, QString>> names = {
        {Capability::OTP, QStringLiteral("OTP")},
        {Capability::U2F, QStringLiteral("U2F")},
        {Capability::CCID, QStringLiteral("CCID")},
        {Capability::OPGP, QStringLiteral("OPGP")},
        {Capability::PIV, QStringLiteral("PIV")},
        {Capability::OATH, QStringLiteral("OATH")},
    };

    QStringList parts;
    for (const auto &entry : names) {
        if (capabilities.testFlag(entry.first)) {
            parts.append(entry.second);
        }
    }
    return parts.isEmpty() ? QStringLiteral("None") : parts.join(QLatin1Char('+'));
}

Mode::Mode(quint8 code, Transports transports) noexcept
    : m_code(code)
    , m_transports(transports)
{
}

std::optional<Mode> Mode::fromCode(int code)
{
    const auto &table = modeTable();
    if (code < 0 || code >= static_cast<int>(table.size())) {
        return std::nullopt;
    }
    return Mode(static_cast<quint8>(code), table[static_cast<size_t>(code)]);
}

std::optional<Mode> Mode::fromTransports(Transports transports)
{
    const auto &table = modeTable();
    for (size_t code = 0; code < table.size(); ++code) {
        if (table[code] == (transports & ALL_TRANSPORTS)) {
            return Mode(static_cast<quint8>(code), table[code]);
        }
    }
    return std::nullopt;
}

std::optional<Mode> Mode::fromString(const QString &text)
{
    Transports transports;
    const QStringList tokens = text.split(QLatin1Char('+'), Qt::SkipEmptyParts);
    for (const QString &token : tokens) {
        const auto transport = transportFromName(token);
        if (!transport) {
            return std::nullopt;
        }
        transports |= *transport;
    }
    return fromTransports(transports);
}

bool Mode::hasTransport(Transport transport) const noexcept
{
    return m_transports.testFlag(transport) && transport != Transport::NoTransport;
}

QString Mode::toString() const
{
    if (!isValid()) {
        return QStringLiteral("None");
    }

    QStringList parts;
    for (const Transport transport : {Transport::OTP, Transport::U2F, Transport::CCID}) {
        if (m_transports.testFlag(transport)) {
            parts.append(transportName(transport));
        }
    }
    return parts.join(QLatin1Char('+'));
}

bool Mode::operator==(const Mode &other) const noexcept
{
    return m_code == other.m_code && m_transports == other.m_transports;
}

bool Mode::operator!=(const Mode &other) const noexcept
{
    return !(*this == other);
}

} // namespace Shared
} // namespace YubiKeyManager

/*
 * SPDX-FileCopyrightText: 2024 YubiKey KRunner Plugin Contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "tlv.h"
#include "../device_error_codes.h"
#include "../logging_categories.h"

#include <QDebug>

namespace YubiKeyManager {
namespace Device {
using namespace YubiKeyManager::Shared;

Result<QMap<quint8, QByteArray>> Tlv::parseList(const QByteArray &data)
{
    QMap<quint8, QByteArray> result;

    int pos = 0;
    while (pos < data.length()) {
        // Need at least tag + length
        if (pos + 2 > data.length()) {
            qCWarning(DeviceProtocolLog) << "Incomplete TLV header at position" << pos;
            return Result<QMap<quint8, QByteArray>>::error(DeviceErrorCodes::withDetail(
                DeviceErrorCodes::MALFORMED_TLV,
                QStringLiteral("missing length byte at offset %1").arg(pos)));
        }

        const auto tag = static_cast<quint8>(data[pos]);
        const auto length = static_cast<quint8>(data[pos + 1]);

        if (pos + 2 + length > data.length()) {
            qCWarning(DeviceProtocolLog) << "TLV value extends beyond data:"
                                         << "tag=" << Qt::hex << Qt::showbase << static_cast<int>(tag)
                                         << Qt::dec << "length=" << static_cast<int>(length)
                                         << "pos=" << pos
                                         << "dataLength=" << data.length();
            return Result<QMap<quint8, QByteArray>>::error(DeviceErrorCodes::withDetail(
                DeviceErrorCodes::MALFORMED_TLV,
                QStringLiteral("tag 0x%1 declares %2 bytes, %3 available")
                    .arg(tag, 2, 16, QLatin1Char('0'))
                    .arg(length)
                    .arg(data.length() - pos - 2)));
        }

        result.insert(tag, data.mid(pos + 2, length));
        pos += 2 + length;
    }

    return Result<QMap<quint8, QByteArray>>::success(result);
}

Result<QByteArray> Tlv::encode(quint8 tag, const QByteArray &value)
{
    if (value.length() > MAX_VALUE_LENGTH) {
        return Result<QByteArray>::error(DeviceErrorCodes::withDetail(
            DeviceErrorCodes::MALFORMED_TLV,
            QStringLiteral("value of %1 bytes does not fit a one-byte length").arg(value.length())));
    }

    QByteArray encoded;
    encoded.reserve(value.length() + 2);
    encoded.append(static_cast<char>(tag));
    encoded.append(static_cast<char>(value.length()));
    encoded.append(value);
    return Result<QByteArray>::success(encoded);
}

Result<QByteArray> Tlv::encodeList(const QList<Record> &records)
{
    QByteArray encoded;
    for (const Record &record : records) {
        const auto recordResult = encode(record.first, record.second);
        if (recordResult.isError()) {
            return recordResult;
        }
        encoded.append(recordResult.value());
    }
    return Result<QByteArray>::success(encoded);
}

quint64 Tlv::toUnsigned(const QByteArray &bytes)
{
    quint64 value = 0;
    for (const char byte : bytes) {
        value = (value << 8) | static_cast<quint8>(byte);
    }
    return value;
}

} // namespace Device
} // namespace YubiKeyManager

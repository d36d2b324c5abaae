/*
 * SPDX-FileCopyrightText: 2024 YubiKey KRunner Plugin Contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#pragma once

#include <QByteArray>
#include <QList>
#include <QMap>
#include <QPair>
#include "shared/common/result.h"

namespace YubiKeyManager {
namespace Device {
using namespace YubiKeyManager::Shared;

/**
 * @brief Stateless codec for flat tag-length-value records
 *
 * Wire format, repeated until the buffer is exhausted (no terminator):
 * @code
 * [TAG (1 byte)][LENGTH (1 byte)][VALUE (LENGTH bytes)]
 * @endcode
 *
 * No state, no I/O - all functions are static.
 */
class Tlv
{
public:
    using Record = QPair<quint8, QByteArray>;

    static constexpr int MAX_VALUE_LENGTH = 0xFF;

    /**
     * @brief Parses TLV data into tag-value map
     * @param data TLV-encoded data
     * @return Map of tag to value bytes, or MALFORMED_TLV error
     *
     * A record whose declared length runs past the end of the buffer, or
     * a trailing tag byte without a length byte, is malformed.
     * When a tag occurs more than once the last value wins.
     */
    static Result<QMap<quint8, QByteArray>> parseList(const QByteArray &data);

    /**
     * @brief Encodes a single record
     * @return Encoded bytes, or MALFORMED_TLV if value exceeds 255 bytes
     */
    static Result<QByteArray> encode(quint8 tag, const QByteArray &value);

    /**
     * @brief Encodes records in the given order
     */
    static Result<QByteArray> encodeList(const QList<Record> &records);

    /**
     * @brief Interprets bytes as a big-endian unsigned integer
     * @param bytes Value bytes (only the last 8 bytes are significant)
     * @return Integer value, 0 for empty input
     */
    static quint64 toUnsigned(const QByteArray &bytes);

private:
    Tlv() = delete;
};

} // namespace Device
} // namespace YubiKeyManager

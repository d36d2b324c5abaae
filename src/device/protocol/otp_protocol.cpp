/*
 * SPDX-FileCopyrightText: 2024 YubiKey KRunner Plugin Contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "otp_protocol.h"
#include "../device_error_codes.h"
#include "../logging_categories.h"

#include <QDebug>

namespace YubiKeyManager {
namespace Device {

quint16 OtpProtocol::crc16(const QByteArray &data)
{
    quint16 crc = 0xFFFF;
    for (const char byte : data) {
        crc ^= static_cast<quint8>(byte);
        for (int bit = 0; bit < 8; ++bit) {
            const bool lsb = (crc & 1) != 0;
            crc >>= 1;
            if (lsb) {
                crc ^= 0x8408;
            }
        }
    }
    return crc;
}

bool OtpProtocol::checkCrc(const QByteArray &dataWithCrc)
{
    return crc16(dataWithCrc) == CRC_OK_RESIDUAL;
}

QByteArray OtpProtocol::formatFrame(quint8 slot, const QByteArray &payload)
{
    QByteArray frame = payload.left(SLOT_DATA_SIZE);
    frame.append(QByteArray(SLOT_DATA_SIZE - frame.length(), '\0'));

    const quint16 crc = crc16(frame);
    frame.append(static_cast<char>(slot));
    frame.append(static_cast<char>(crc & 0xFF));
    frame.append(static_cast<char>((crc >> 8) & 0xFF));
    frame.append(QByteArray(3, '\0'));

    return frame;
}

QList<QByteArray> OtpProtocol::frameReports(const QByteArray &frame)
{
    QList<QByteArray> reports;
    const int lastSequence = (frame.length() - 1) / REPORT_DATA_SIZE;

    for (int sequence = 0; sequence <= lastSequence; ++sequence) {
        QByteArray chunk = frame.mid(sequence * REPORT_DATA_SIZE, REPORT_DATA_SIZE);
        chunk.append(QByteArray(REPORT_DATA_SIZE - chunk.length(), '\0'));

        const bool allZero = chunk.count('\0') == REPORT_DATA_SIZE;
        if (allZero && sequence != 0 && sequence != lastSequence) {
            continue;
        }

        chunk.append(static_cast<char>(SLOT_WRITE_FLAG | sequence));
        reports.append(chunk);
    }

    return reports;
}

QByteArray OtpProtocol::resetReport()
{
    QByteArray report(FEATURE_REPORT_SIZE, '\0');
    report[FEATURE_REPORT_SIZE - 1] = static_cast<char>(DUMMY_REPORT_WRITE);
    return report;
}

Result<OtpStatus> OtpProtocol::parseStatus(const QByteArray &report)
{
    if (report.length() < FEATURE_REPORT_SIZE) {
        return Result<OtpStatus>::error(DeviceErrorCodes::withDetail(
            DeviceErrorCodes::COMMUNICATION_ERROR,
            QStringLiteral("status report has %1 bytes").arg(report.length())));
    }

    OtpStatus status;
    status.firmwareVersion = Version::fromBytes(report.mid(1, 3));
    status.programSequence = static_cast<quint8>(report[4]);
    status.touchLevel = static_cast<quint16>(static_cast<quint8>(report[5])
                                             | (static_cast<quint8>(report[6]) << 8));
    return Result<OtpStatus>::success(status);
}

Result<QByteArray> OtpProtocol::extractResponse(const QByteArray &response, int length)
{
    if (length < 0 || response.length() < length + 2) {
        return Result<QByteArray>::error(DeviceErrorCodes::withDetail(
            DeviceErrorCodes::COMMUNICATION_ERROR,
            QStringLiteral("response too short: %1 bytes").arg(response.length())));
    }

    if (!checkCrc(response.left(length + 2))) {
        qCWarning(DeviceProtocolLog) << "OTP response CRC mismatch:" << response.left(length + 2).toHex();
        return Result<QByteArray>::error(DeviceErrorCodes::withDetail(
            DeviceErrorCodes::COMMUNICATION_ERROR, QStringLiteral("response CRC mismatch")));
    }

    return Result<QByteArray>::success(response.left(length));
}

OtpResponseAssembler::Step OtpResponseAssembler::feed(const QByteArray &report)
{
    if (report.length() < OtpProtocol::FEATURE_REPORT_SIZE) {
        return Step::Failed;
    }

    const auto status = static_cast<quint8>(report[OtpProtocol::REPORT_DATA_SIZE]);

    if (status & OtpProtocol::RESP_PENDING_FLAG) {
        const quint8 sequence = status & OtpProtocol::SEQUENCE_MASK;
        if (sequence == m_expectedSequence) {
            m_data.append(report.left(OtpProtocol::REPORT_DATA_SIZE));
            ++m_expectedSequence;
        } else if (sequence == 0) {
            // Sequence wrapped: transfer finished
            return Step::Complete;
        }
        return Step::NeedMore;
    }

    if (status == 0) {
        // Plain status report: the device dropped or never started the transfer
        qCDebug(DeviceProtocolLog) << "Status report after" << m_data.length() << "response bytes";
        return Step::Failed;
    }

    // Waiting for touch or still processing
    return Step::NeedMore;
}

} // namespace Device
} // namespace YubiKeyManager

/*
 * SPDX-FileCopyrightText: 2024 YubiKey KRunner Plugin Contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include <QtTest>
#include "device/protocol/otp_protocol.h"
#include "device/device_error_codes.h"

using namespace YubiKeyManager::Device;
using namespace YubiKeyManager::Shared;

namespace {

QByteArray withCrc(const QByteArray &data)
{
    // Residual check expects the complement of the CRC, little-endian
    const quint16 crc = static_cast<quint16>(~OtpProtocol::crc16(data));
    QByteArray out = data;
    out.append(static_cast<char>(crc & 0xFF));
    out.append(static_cast<char>((crc >> 8) & 0xFF));
    return out;
}

QByteArray report(const QByteArray &data, quint8 flags)
{
    QByteArray out = data.left(OtpProtocol::REPORT_DATA_SIZE);
    out.append(QByteArray(OtpProtocol::REPORT_DATA_SIZE - out.length(), '\0'));
    out.append(static_cast<char>(flags));
    return out;
}

} // namespace

/**
 * @brief Unit tests for the OTP HID frame protocol
 */
class TestOtpProtocol : public QObject
{
    Q_OBJECT

private Q_SLOTS:
    // CRC
    void testCrc16_KnownValue();
    void testCheckCrc_Residual();

    // Frames
    void testFormatFrame_Layout();
    void testFrameReports_SkipsEmptyChunks();
    void testFrameReports_SequenceFlags();
    void testResetReport();

    // Status
    void testParseStatus();
    void testParseStatus_TooShort();

    // Responses
    void testExtractResponse();
    void testExtractResponse_BadCrc();
    void testExtractResponse_TooShort();
    void testAssembler_CollectsUntilSequenceWraps();
    void testAssembler_WaitsWhileDeviceBusy();
    void testAssembler_FailsOnPlainStatus();
};

// ========== CRC Tests ==========

void TestOtpProtocol::testCrc16_KnownValue()
{
    // CRC-16/ISO 13239 of "123456789" before the final complement
    QCOMPARE(OtpProtocol::crc16(QByteArray("123456789")), quint16(0x906E ^ 0xFFFF));
}

void TestOtpProtocol::testCheckCrc_Residual()
{
    const QByteArray data = QByteArray::fromHex("00bc614e");

    QVERIFY(OtpProtocol::checkCrc(withCrc(data)));

    QByteArray corrupted = withCrc(data);
    corrupted[0] = static_cast<char>(0x01);
    QVERIFY(!OtpProtocol::checkCrc(corrupted));
}

// ========== Frame Tests ==========

void TestOtpProtocol::testFormatFrame_Layout()
{
    const QByteArray payload = QByteArray::fromHex("06000000");
    const QByteArray frame = OtpProtocol::formatFrame(OtpProtocol::SLOT_DEVICE_CONFIG, payload);

    QCOMPARE(frame.length(), OtpProtocol::FRAME_SIZE);
    QCOMPARE(frame.left(4), payload);
    QCOMPARE(frame.mid(4, 60), QByteArray(60, '\0'));
    QCOMPARE(static_cast<quint8>(frame.at(64)), OtpProtocol::SLOT_DEVICE_CONFIG);

    const quint16 crc = OtpProtocol::crc16(frame.left(OtpProtocol::SLOT_DATA_SIZE));
    QCOMPARE(static_cast<quint8>(frame.at(65)), static_cast<quint8>(crc & 0xFF));
    QCOMPARE(static_cast<quint8>(frame.at(66)), static_cast<quint8>(crc >> 8));
    QCOMPARE(frame.right(3), QByteArray(3, '\0'));
}

void TestOtpProtocol::testFrameReports_SkipsEmptyChunks()
{
    const QByteArray frame = OtpProtocol::formatFrame(OtpProtocol::SLOT_DEVICE_SERIAL, QByteArray());
    const QList<QByteArray> reports = OtpProtocol::frameReports(frame);

    // Payload is all zero: only the first chunk and the chunks carrying
    // slot and CRC are sent
    QVERIFY(reports.size() < 10);
    QCOMPARE(static_cast<quint8>(reports.first().at(7)), quint8(0x80));
    QCOMPARE(static_cast<quint8>(reports.last().at(7)), quint8(0x80 | 9));
    for (const QByteArray &chunk : reports) {
        QCOMPARE(chunk.length(), OtpProtocol::FEATURE_REPORT_SIZE);
    }
}

void TestOtpProtocol::testFrameReports_SequenceFlags()
{
    QByteArray payload(OtpProtocol::SLOT_DATA_SIZE, '\x11');
    const QByteArray frame = OtpProtocol::formatFrame(OtpProtocol::SLOT_DEVICE_CONFIG, payload);
    const QList<QByteArray> reports = OtpProtocol::frameReports(frame);

    QCOMPARE(reports.size(), 10);
    for (int sequence = 0; sequence < reports.size(); ++sequence) {
        QCOMPARE(static_cast<quint8>(reports.at(sequence).at(7)),
                 static_cast<quint8>(OtpProtocol::SLOT_WRITE_FLAG | sequence));
        QCOMPARE(reports.at(sequence).left(7), frame.mid(sequence * 7, 7));
    }
}

void TestOtpProtocol::testResetReport()
{
    const QByteArray reset = OtpProtocol::resetReport();

    QCOMPARE(reset.length(), 8);
    QCOMPARE(reset.left(7), QByteArray(7, '\0'));
    QCOMPARE(static_cast<quint8>(reset.at(7)), quint8(0x8F));
}

// ========== Status Tests ==========

void TestOtpProtocol::testParseStatus()
{
    const auto status = OtpProtocol::parseStatus(QByteArray::fromHex("0004030507" "0500" "00"));

    QVERIFY(status.isSuccess());
    QCOMPARE(status.value().firmwareVersion, Version(4, 3, 5));
    QCOMPARE(static_cast<int>(status.value().programSequence), 7);
    QCOMPARE(static_cast<int>(status.value().touchLevel), 5);
}

void TestOtpProtocol::testParseStatus_TooShort()
{
    const auto status = OtpProtocol::parseStatus(QByteArray::fromHex("000403"));

    QVERIFY(status.isError());
    QVERIFY(DeviceErrorCodes::matches(status.error(), DeviceErrorCodes::COMMUNICATION_ERROR));
}

// ========== Response Tests ==========

void TestOtpProtocol::testExtractResponse()
{
    QByteArray response = withCrc(QByteArray::fromHex("00bc614e"));
    response.append(QByteArray(8, '\0'));

    const auto serial = OtpProtocol::extractResponse(response, 4);

    QVERIFY(serial.isSuccess());
    QCOMPARE(serial.value(), QByteArray::fromHex("00bc614e"));
}

void TestOtpProtocol::testExtractResponse_BadCrc()
{
    QByteArray response = withCrc(QByteArray::fromHex("00bc614e"));
    response[5] = static_cast<char>(response.at(5) ^ 0x01);

    QVERIFY(OtpProtocol::extractResponse(response, 4).isError());
}

void TestOtpProtocol::testExtractResponse_TooShort()
{
    QVERIFY(OtpProtocol::extractResponse(QByteArray::fromHex("00bc61"), 4).isError());
}

void TestOtpProtocol::testAssembler_CollectsUntilSequenceWraps()
{
    OtpResponseAssembler assembler;
    const quint8 pending = OtpProtocol::RESP_PENDING_FLAG;

    QCOMPARE(assembler.feed(report(QByteArray::fromHex("01020304050607"), pending | 0)),
             OtpResponseAssembler::Step::NeedMore);
    QCOMPARE(assembler.feed(report(QByteArray::fromHex("08090a0b0c0d0e"), pending | 1)),
             OtpResponseAssembler::Step::NeedMore);
    QCOMPARE(assembler.feed(report(QByteArray(), pending | 0)),
             OtpResponseAssembler::Step::Complete);

    QCOMPARE(assembler.data(), QByteArray::fromHex("0102030405060708090a0b0c0d0e"));
}

void TestOtpProtocol::testAssembler_WaitsWhileDeviceBusy()
{
    OtpResponseAssembler assembler;

    QCOMPARE(assembler.feed(report(QByteArray(), OtpProtocol::RESP_TIMEOUT_WAIT_FLAG)),
             OtpResponseAssembler::Step::NeedMore);
    QVERIFY(assembler.data().isEmpty());
}

void TestOtpProtocol::testAssembler_FailsOnPlainStatus()
{
    OtpResponseAssembler assembler;

    QCOMPARE(assembler.feed(report(QByteArray::fromHex("01020304050607"), OtpProtocol::RESP_PENDING_FLAG)),
             OtpResponseAssembler::Step::NeedMore);
    QCOMPARE(assembler.feed(report(QByteArray(), 0)), OtpResponseAssembler::Step::Failed);
}

QTEST_GUILESS_MAIN(TestOtpProtocol)
#include "test_otp_protocol.moc"

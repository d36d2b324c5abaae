/*
 * SPDX-FileCopyrightText: 2024 YubiKey KRunner Plugin Contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include <QtTest>
#include "shared/types/device_mode.h"

using namespace YubiKeyManager::Shared;

/**
 * @brief Unit tests for Transport, Capability and Mode
 */
class TestDeviceMode : public QObject
{
    Q_OBJECT

private Q_SLOTS:
    // Mode table
    void testFromCode_data();
    void testFromCode();
    void testFromCode_OutOfRange();
    void testFromTransports_MatchesCode();
    void testFromTransports_Empty();

    // Strings
    void testFromString_AnyOrder();
    void testFromString_FidoAlias();
    void testFromString_Invalid();
    void testToString_Invalid();
    void testTransportFromName();

    // Predicates
    void testHasTransport();
    void testEquality();
    void testDefaultModeIsInvalid();

    // Flags
    void testTransportBitsMatchCapabilities();
    void testTransportPriority();
    void testCapabilitiesToString();
};

void TestDeviceMode::testFromCode_data()
{
    QTest::addColumn<int>("code");
    QTest::addColumn<QString>("expected");

    QTest::newRow("0") << 0 << QStringLiteral("OTP");
    QTest::newRow("1") << 1 << QStringLiteral("CCID");
    QTest::newRow("2") << 2 << QStringLiteral("OTP+CCID");
    QTest::newRow("3") << 3 << QStringLiteral("U2F");
    QTest::newRow("4") << 4 << QStringLiteral("OTP+U2F");
    QTest::newRow("5") << 5 << QStringLiteral("U2F+CCID");
    QTest::newRow("6") << 6 << QStringLiteral("OTP+U2F+CCID");
}

void TestDeviceMode::testFromCode()
{
    QFETCH(int, code);
    QFETCH(QString, expected);

    const auto mode = Mode::fromCode(code);
    QVERIFY(mode.has_value());
    QVERIFY(mode->isValid());
    QCOMPARE(static_cast<int>(mode->code()), code);
    QCOMPARE(mode->toString(), expected);
}

void TestDeviceMode::testFromCode_OutOfRange()
{
    QVERIFY(!Mode::fromCode(7).has_value());
    QVERIFY(!Mode::fromCode(-1).has_value());
}

void TestDeviceMode::testFromTransports_MatchesCode()
{
    for (int code = 0; code <= 6; ++code) {
        const auto mode = Mode::fromCode(code);
        QVERIFY(mode.has_value());

        const auto roundTrip = Mode::fromTransports(mode->transports());
        QVERIFY(roundTrip.has_value());
        QCOMPARE(static_cast<int>(roundTrip->code()), code);
    }
}

void TestDeviceMode::testFromTransports_Empty()
{
    QVERIFY(!Mode::fromTransports(Transports()).has_value());
}

void TestDeviceMode::testFromString_AnyOrder()
{
    const auto mode = Mode::fromString(QStringLiteral("ccid+otp"));
    QVERIFY(mode.has_value());
    QCOMPARE(static_cast<int>(mode->code()), 2);
    QCOMPARE(mode->toString(), QStringLiteral("OTP+CCID"));
}

void TestDeviceMode::testFromString_FidoAlias()
{
    const auto mode = Mode::fromString(QStringLiteral("OTP+FIDO+CCID"));
    QVERIFY(mode.has_value());
    QCOMPARE(static_cast<int>(mode->code()), 6);
}

void TestDeviceMode::testFromString_Invalid()
{
    QVERIFY(!Mode::fromString(QStringLiteral("OTP+PIV")).has_value());
    QVERIFY(!Mode::fromString(QString()).has_value());
}

void TestDeviceMode::testToString_Invalid()
{
    QCOMPARE(Mode().toString(), QStringLiteral("None"));
}

void TestDeviceMode::testTransportFromName()
{
    QVERIFY(transportFromName(QStringLiteral("otp")) == Transport::OTP);
    QVERIFY(transportFromName(QStringLiteral("FIDO")) == Transport::U2F);
    QVERIFY(transportFromName(QStringLiteral(" CCID ")) == Transport::CCID);
    QVERIFY(!transportFromName(QStringLiteral("OTP+CCID")).has_value());
}

void TestDeviceMode::testHasTransport()
{
    const auto mode = Mode::fromCode(5);
    QVERIFY(mode.has_value());

    QVERIFY(mode->hasTransport(Transport::U2F));
    QVERIFY(mode->hasTransport(Transport::CCID));
    QVERIFY(!mode->hasTransport(Transport::OTP));
    QVERIFY(!mode->hasTransport(Transport::NoTransport));
}

void TestDeviceMode::testEquality()
{
    QVERIFY(*Mode::fromCode(4) == *Mode::fromString(QStringLiteral("U2F+OTP")));
    QVERIFY(*Mode::fromCode(4) != *Mode::fromCode(5));
}

void TestDeviceMode::testDefaultModeIsInvalid()
{
    const Mode mode;

    QVERIFY(!mode.isValid());
    QCOMPARE(static_cast<int>(mode.code()), 0xFF);
    QCOMPARE(mode.transports().toInt(), 0);
}

void TestDeviceMode::testTransportBitsMatchCapabilities()
{
    QCOMPARE(static_cast<int>(Transport::OTP), static_cast<int>(Capability::OTP));
    QCOMPARE(static_cast<int>(Transport::U2F), static_cast<int>(Capability::U2F));
    QCOMPARE(static_cast<int>(Transport::CCID), static_cast<int>(Capability::CCID));
    QCOMPARE(ALL_TRANSPORTS.toInt(), 0x07);
    QCOMPARE(toCapabilities(Transport::OTP | Transport::CCID).toInt(), 0x05);
}

void TestDeviceMode::testTransportPriority()
{
    const QList<Transport> expected = {Transport::CCID, Transport::OTP, Transport::U2F};
    QVERIFY(transportPriority() == expected);
}

void TestDeviceMode::testCapabilitiesToString()
{
    QCOMPARE(capabilitiesToString(Capabilities()), QStringLiteral("None"));
    QCOMPARE(capabilitiesToString(Capability::OTP | Capability::OATH | Capability::CCID),
             QStringLiteral("OTP+CCID+OATH"));
}

QTEST_GUILESS_MAIN(TestDeviceMode)
#include "test_device_mode.moc"

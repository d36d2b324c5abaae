/*
 * SPDX-FileCopyrightText: 2024 YubiKey KRunner Plugin Contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include <QtTest>
#include "device/drivers/usb_product_ids.h"

using namespace YubiKeyManager::Device;
using namespace YubiKeyManager::Shared;

class TestUsbProductIds : public QObject
{
    Q_OBJECT

private Q_SLOTS:
    void testModeForProductId_data();
    void testModeForProductId();
    void testModeForProductId_Unknown();
    void testIsSecurityKey();
};

void TestUsbProductIds::testModeForProductId_data()
{
    QTest::addColumn<int>("productId");
    QTest::addColumn<int>("expectedCode");

    QTest::newRow("standard") << int(UsbProductIds::YK_STANDARD) << 0;
    QTest::newRow("neo otp+ccid") << int(UsbProductIds::NEO_OTP_CCID) << 2;
    QTest::newRow("neo u2f") << int(UsbProductIds::NEO_U2F) << 3;
    QTest::newRow("security key") << int(UsbProductIds::SKY_U2F) << 3;
    QTest::newRow("yk4 ccid") << int(UsbProductIds::YK4_CCID) << 1;
    QTest::newRow("yk4 otp+u2f") << int(UsbProductIds::YK4_OTP_U2F) << 4;
    QTest::newRow("yk4 u2f+ccid") << int(UsbProductIds::YK4_U2F_CCID) << 5;
    QTest::newRow("yk4 all") << int(UsbProductIds::YK4_OTP_U2F_CCID) << 6;
    QTest::newRow("plus") << int(UsbProductIds::PLUS_OTP_U2F) << 4;
}

void TestUsbProductIds::testModeForProductId()
{
    QFETCH(int, productId);
    QFETCH(int, expectedCode);

    const auto mode = UsbProductIds::modeForProductId(static_cast<quint16>(productId));

    QVERIFY(mode.has_value());
    QCOMPARE(static_cast<int>(mode->code()), expectedCode);
}

void TestUsbProductIds::testModeForProductId_Unknown()
{
    QVERIFY(!UsbProductIds::modeForProductId(0x0000).has_value());
    QVERIFY(!UsbProductIds::modeForProductId(0x0200).has_value());
}

void TestUsbProductIds::testIsSecurityKey()
{
    QVERIFY(UsbProductIds::isSecurityKey(UsbProductIds::SKY_U2F));
    QVERIFY(!UsbProductIds::isSecurityKey(UsbProductIds::NEO_U2F));
    QVERIFY(!UsbProductIds::isSecurityKey(UsbProductIds::YK4_U2F));
}

QTEST_GUILESS_MAIN(TestUsbProductIds)
#include "test_usb_product_ids.moc"

/*
 * SPDX-FileCopyrightText: 2024 YubiKey KRunner Plugin Contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include <QtTest>
#include "device/device_discovery.h"
#include "device/device_error_codes.h"
#include "device/yubikey_device.h"
#include "mocks/mock_driver.h"
#include "mocks/mock_driver_factory.h"

using namespace YubiKeyManager::Device;
using namespace YubiKeyManager::Shared;

namespace {

MockDriverFactory::Opener yubiKeyOver(Transport transport)
{
    return [transport]() {
        auto driver = std::make_unique<MockDriver>(transport, Version(4, 3, 1), *Mode::fromCode(6));
        driver->setCapabilityBlob(QByteArray::fromHex("03" "01013f"));
        return Result<std::unique_ptr<Driver>>::success(std::move(driver));
    };
}

} // namespace

/**
 * @brief Unit tests for DeviceDiscovery
 *
 * Verifies transport priority, transport filtering and error handling
 * when opening drivers.
 */
class TestDeviceDiscovery : public QObject
{
    Q_OBJECT

private Q_SLOTS:
    void init();

    void testOpenDevice_PrefersCcid();
    void testOpenDevice_FallsThroughInPriorityOrder();
    void testOpenDevice_SkipsTransportsOutsideMask();
    void testOpenDevice_NothingFound();
    void testOpenDevice_OpenErrorAborts();
    void testOpenDevice_ClassifierErrorPropagates();
    void testOpenDevice_NoFactory();

private:
    std::shared_ptr<MockDriverFactory> m_factory;
};

void TestDeviceDiscovery::init()
{
    m_factory = std::make_shared<MockDriverFactory>();
}

void TestDeviceDiscovery::testOpenDevice_PrefersCcid()
{
    m_factory->setOpener(Transport::CCID, yubiKeyOver(Transport::CCID));
    m_factory->setOpener(Transport::OTP, yubiKeyOver(Transport::OTP));
    DeviceDiscovery discovery(m_factory);

    const auto result = discovery.openDevice();

    QVERIFY(result.isSuccess());
    QVERIFY(result.value() != nullptr);
    QCOMPARE(result.value()->transport(), Transport::CCID);
    QCOMPARE(m_factory->openedTransports(), QList<Transport>{Transport::CCID});
}

void TestDeviceDiscovery::testOpenDevice_FallsThroughInPriorityOrder()
{
    m_factory->setOpener(Transport::U2F, yubiKeyOver(Transport::U2F));
    DeviceDiscovery discovery(m_factory);

    const auto result = discovery.openDevice(ALL_TRANSPORTS);

    QVERIFY(result.isSuccess());
    QVERIFY(result.value() != nullptr);
    QCOMPARE(result.value()->transport(), Transport::U2F);

    const QList<Transport> expected = {Transport::CCID, Transport::OTP, Transport::U2F};
    QCOMPARE(m_factory->openedTransports(), expected);
}

void TestDeviceDiscovery::testOpenDevice_SkipsTransportsOutsideMask()
{
    m_factory->setOpener(Transport::CCID, yubiKeyOver(Transport::CCID));
    m_factory->setOpener(Transport::OTP, yubiKeyOver(Transport::OTP));
    DeviceDiscovery discovery(m_factory);

    const auto result = discovery.openDevice(Transport::OTP | Transport::U2F);

    QVERIFY(result.isSuccess());
    QVERIFY(result.value() != nullptr);
    QCOMPARE(result.value()->transport(), Transport::OTP);
    QVERIFY(!m_factory->openedTransports().contains(Transport::CCID));
}

void TestDeviceDiscovery::testOpenDevice_NothingFound()
{
    DeviceDiscovery discovery(m_factory);

    const auto result = discovery.openDevice();

    QVERIFY(result.isSuccess());
    QVERIFY(result.value() == nullptr);
    QCOMPARE(m_factory->openedTransports().size(), 3);
}

void TestDeviceDiscovery::testOpenDevice_OpenErrorAborts()
{
    m_factory->setError(Transport::OTP, QStringLiteral("device busy"));
    m_factory->setOpener(Transport::U2F, yubiKeyOver(Transport::U2F));
    DeviceDiscovery discovery(m_factory);

    const auto result = discovery.openDevice();

    QVERIFY(result.isError());
    QVERIFY(DeviceErrorCodes::matches(result.error(), DeviceErrorCodes::FAILED_OPENING_DEVICE));
    QVERIFY(result.error().contains(QStringLiteral("OTP")));
    QVERIFY(result.error().contains(QStringLiteral("device busy")));

    // U2F is never tried after the failure
    const QList<Transport> expected = {Transport::CCID, Transport::OTP};
    QCOMPARE(m_factory->openedTransports(), expected);
}

void TestDeviceDiscovery::testOpenDevice_ClassifierErrorPropagates()
{
    m_factory->setOpener(Transport::CCID, []() {
        auto driver = std::make_unique<MockDriver>(Transport::CCID, Version(4, 3, 1), *Mode::fromCode(6));
        driver->setCapabilityBlob(QByteArray::fromHex("02" "0105"));
        return Result<std::unique_ptr<Driver>>::success(std::move(driver));
    });
    DeviceDiscovery discovery(m_factory);

    const auto result = discovery.openDevice();

    QVERIFY(result.isError());
    QVERIFY(DeviceErrorCodes::matches(result.error(), DeviceErrorCodes::MALFORMED_TLV));
}

void TestDeviceDiscovery::testOpenDevice_NoFactory()
{
    DeviceDiscovery discovery(nullptr);

    const auto result = discovery.openDevice();

    QVERIFY(result.isError());
    QVERIFY(DeviceErrorCodes::matches(result.error(), DeviceErrorCodes::NO_DRIVER));
}

QTEST_GUILESS_MAIN(TestDeviceDiscovery)
#include "test_device_discovery.moc"

/*
 * SPDX-FileCopyrightText: 2024 YubiKey KRunner Plugin Contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include <QtTest>
#include <QSignalSpy>
#include "device/workflows/mode_switch_workflow.h"
#include "device/workflows/touch_prompt.h"
#include "device/yubikey_device.h"
#include "device/device_error_codes.h"
#include "mocks/mock_configuration_provider.h"
#include "mocks/mock_driver.h"
#include "mocks/mock_driver_factory.h"

using namespace YubiKeyManager::Device;
using namespace YubiKeyManager::Shared;

/**
 * @brief Unit tests for ModeSwitchWorkflow
 *
 * The mode command runs on a worker thread against a MockDriver; the
 * configuration comes from MockConfigurationProvider.
 */
class TestModeSwitchWorkflow : public QObject
{
    Q_OBJECT

private Q_SLOTS:
    void init();

    void testRun_UsesConfiguredTimeouts();
    void testRun_AutoEjectDisabled();
    void testRun_ExplicitTimeoutsOverrideConfig();
    void testRun_SlowDevicePromptsForTouch();
    void testRun_FastDeviceNoPrompt();
    void testRun_UnsupportedMode();
    void testRun_NullDevice();

private:
    std::shared_ptr<YubiKeyDevice> createDevice(MockDriver **raw, int setModeDelayMs = 0);

    MockConfigurationProvider m_config;
    std::shared_ptr<MockDriverFactory> m_factory;
};

void TestModeSwitchWorkflow::init()
{
    m_config = MockConfigurationProvider();
    m_factory = std::make_shared<MockDriverFactory>();
}

std::shared_ptr<YubiKeyDevice> TestModeSwitchWorkflow::createDevice(MockDriver **raw, int setModeDelayMs)
{
    auto driver = std::make_unique<MockDriver>(Transport::CCID, Version(4, 3, 1), *Mode::fromCode(6));
    driver->setCapabilityBlob(QByteArray::fromHex("03" "01013f"));
    driver->setSetModeDelay(setModeDelayMs);
    *raw = driver.get();

    auto created = YubiKeyDevice::create(std::move(driver), m_factory);
    return created.isSuccess() ? created.value() : nullptr;
}

void TestModeSwitchWorkflow::testRun_UsesConfiguredTimeouts()
{
    m_config.setChallengeResponseTimeout(15);
    m_config.setAutoEjectTimeout(120);
    MockDriver *raw = nullptr;
    const auto device = createDevice(&raw);
    QVERIFY(device);
    ModeSwitchWorkflow workflow(&m_config);

    const auto result = workflow.run(device, *Mode::fromCode(1));

    QVERIFY(result.isSuccess());
    QCOMPARE(raw->setModeCalls().size(), 1);
    QCOMPARE(static_cast<int>(raw->setModeCalls().first().modeByte), 0x81);
    QCOMPARE(static_cast<int>(raw->setModeCalls().first().crTimeout), 15);
    QCOMPARE(static_cast<int>(raw->setModeCalls().first().autoejectTime), 120);
    QCOMPARE(device->mode(), *Mode::fromCode(1));
}

void TestModeSwitchWorkflow::testRun_AutoEjectDisabled()
{
    m_config.setAutoEjectTimeout(std::nullopt);
    MockDriver *raw = nullptr;
    const auto device = createDevice(&raw);
    QVERIFY(device);
    ModeSwitchWorkflow workflow(&m_config);

    const auto result = workflow.run(device, *Mode::fromCode(2));

    QVERIFY(result.isSuccess());
    QCOMPARE(raw->setModeCalls().size(), 1);
    QCOMPARE(static_cast<int>(raw->setModeCalls().first().modeByte), 0x02);
    QCOMPARE(static_cast<int>(raw->setModeCalls().first().autoejectTime), 0);
}

void TestModeSwitchWorkflow::testRun_ExplicitTimeoutsOverrideConfig()
{
    m_config.setChallengeResponseTimeout(15);
    m_config.setAutoEjectTimeout(120);
    MockDriver *raw = nullptr;
    const auto device = createDevice(&raw);
    QVERIFY(device);
    ModeSwitchWorkflow workflow(&m_config);

    const auto result = workflow.run(device, *Mode::fromCode(6), 3, std::nullopt);

    QVERIFY(result.isSuccess());
    QCOMPARE(static_cast<int>(raw->setModeCalls().first().modeByte), 0x06);
    QCOMPARE(static_cast<int>(raw->setModeCalls().first().crTimeout), 3);
}

void TestModeSwitchWorkflow::testRun_SlowDevicePromptsForTouch()
{
    m_config.setTouchPromptDelay(20);
    MockDriver *raw = nullptr;
    const auto device = createDevice(&raw, 300);
    QVERIFY(device);
    ModeSwitchWorkflow workflow(&m_config);
    QSignalSpy spy(&workflow, &ModeSwitchWorkflow::touchRequested);

    const auto result = workflow.run(device, *Mode::fromCode(6));

    QVERIFY(result.isSuccess());
    QCOMPARE(spy.count(), 1);
    QCOMPARE(spy.at(0).at(0).toString(), TouchPrompt::promptMessage());
}

void TestModeSwitchWorkflow::testRun_FastDeviceNoPrompt()
{
    m_config.setTouchPromptDelay(5000);
    MockDriver *raw = nullptr;
    const auto device = createDevice(&raw);
    QVERIFY(device);
    ModeSwitchWorkflow workflow(&m_config);
    QSignalSpy spy(&workflow, &ModeSwitchWorkflow::touchRequested);

    const auto result = workflow.run(device, *Mode::fromCode(6));

    QVERIFY(result.isSuccess());
    QCOMPARE(spy.count(), 0);
}

void TestModeSwitchWorkflow::testRun_UnsupportedMode()
{
    auto created = YubiKeyDevice::create(
        std::make_unique<MockDriver>(Transport::OTP, Version(4, 0, 1), *Mode::fromCode(4)), m_factory);
    QVERIFY(created.isSuccess());
    ModeSwitchWorkflow workflow(&m_config);

    const auto result = workflow.run(created.value(), *Mode::fromCode(1));

    QVERIFY(result.isError());
    QVERIFY(DeviceErrorCodes::matches(result.error(), DeviceErrorCodes::UNSUPPORTED_MODE));
}

void TestModeSwitchWorkflow::testRun_NullDevice()
{
    ModeSwitchWorkflow workflow(&m_config);

    const auto result = workflow.run(nullptr, *Mode::fromCode(6));

    QVERIFY(result.isError());
    QVERIFY(DeviceErrorCodes::matches(result.error(), DeviceErrorCodes::NO_DRIVER));
}

QTEST_GUILESS_MAIN(TestModeSwitchWorkflow)
#include "test_mode_switch_workflow.moc"

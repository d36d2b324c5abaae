/*
 * SPDX-FileCopyrightText: 2024 YubiKey KRunner Plugin Contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "device/config/device_configuration.h"
#include "device/device_discovery.h"
#include "device/yubikey_device.h"
#include "device/drivers/driver_factory.h"
#include "device/workflows/mode_switch_workflow.h"
#include "shared/types/device_mode.h"

#include <QCommandLineParser>
#include <QCoreApplication>
#include <QTextStream>
#include <KLocalizedString>

using namespace YubiKeyManager::Device;
using namespace YubiKeyManager::Shared;

namespace {

QTextStream &out()
{
    static QTextStream stream(stdout);
    return stream;
}

QTextStream &err()
{
    static QTextStream stream(stderr);
    return stream;
}

void printDevice(const YubiKeyDevice &device)
{
    const std::optional<quint32> serial = device.serial();

    out() << i18n("Device type: %1", device.deviceName()) << Qt::endl;
    out() << i18n("Firmware version: %1", device.version().toString()) << Qt::endl;
    out() << i18n("Serial number: %1", serial ? QString::number(*serial) : i18n("Not set or unreadable"))
          << Qt::endl;
    out() << i18n("Connected over: %1", transportName(device.transport())) << Qt::endl;
    out() << i18n("Current mode: %1", device.mode().toString()) << Qt::endl;
    out() << i18n("Supported: %1", capabilitiesToString(device.capabilities())) << Qt::endl;
    out() << i18n("Enabled: %1", capabilitiesToString(device.enabled())) << Qt::endl;
}

} // namespace

int main(int argc, char *argv[])
{
    // NOLINTNEXTLINE(misc-const-correctness) - QCoreApplication is modified internally by Qt
    QCoreApplication app(argc, argv);
    app.setApplicationName(QStringLiteral("ykdevice-info"));
    app.setApplicationVersion(QStringLiteral("1.0"));

    KLocalizedString::setApplicationDomain("ykdevice");

    QCommandLineParser parser;
    parser.setApplicationDescription(i18n("Shows and configures the YubiKey connected to this computer"));
    parser.addHelpOption();
    parser.addVersionOption();

    const QCommandLineOption transportsOption(
        QStringLiteral("transports"),
        i18n("Transports to search, e.g. CCID+OTP (default from configuration)"),
        QStringLiteral("transports"));
    const QCommandLineOption useTransportOption(
        QStringLiteral("use-transport"),
        i18n("Reopen the device over this transport (OTP, U2F or CCID)"),
        QStringLiteral("transport"));
    const QCommandLineOption modeOption(
        QStringLiteral("mode"),
        i18n("Program a new mode, e.g. OTP+U2F+CCID"),
        QStringLiteral("mode"));
    const QCommandLineOption crTimeoutOption(
        QStringLiteral("cr-timeout"),
        i18n("Challenge-response timeout in seconds used with --mode"),
        QStringLiteral("seconds"));
    const QCommandLineOption autoejectOption(
        QStringLiteral("autoeject"),
        i18n("Eject the smart card on touch, after the given number of seconds, used with --mode"),
        QStringLiteral("seconds"));
    parser.addOptions({transportsOption, useTransportOption, modeOption, crTimeoutOption, autoejectOption});
    parser.process(app);

    const DeviceConfiguration config;

    Transports transports = config.discoveryTransports();
    if (parser.isSet(transportsOption)) {
        const auto requested = Mode::fromString(parser.value(transportsOption));
        if (!requested) {
            err() << i18n("Invalid transports: %1", parser.value(transportsOption)) << Qt::endl;
            return 1;
        }
        transports = requested->transports();
    }

    const DeviceDiscovery discovery(std::make_shared<PlatformDriverFactory>());
    auto opened = discovery.openDevice(transports);
    if (opened.isError()) {
        err() << i18n("Failed to open device: %1", opened.error()) << Qt::endl;
        return 1;
    }

    std::shared_ptr<YubiKeyDevice> device = opened.value();
    if (!device) {
        err() << i18n("No YubiKey detected") << Qt::endl;
        return 2;
    }

    if (parser.isSet(useTransportOption)) {
        const auto target = transportFromName(parser.value(useTransportOption));
        if (!target) {
            err() << i18n("Invalid transport: %1", parser.value(useTransportOption)) << Qt::endl;
            return 1;
        }

        auto switched = device->useTransport(*target);
        if (switched.isError()) {
            err() << i18n("Failed to switch transport: %1", switched.error()) << Qt::endl;
            return 1;
        }
        device = switched.value();
    }

    printDevice(*device);

    if (!parser.isSet(modeOption)) {
        return 0;
    }

    const auto mode = Mode::fromString(parser.value(modeOption));
    if (!mode) {
        err() << i18n("Invalid mode: %1", parser.value(modeOption)) << Qt::endl;
        return 1;
    }

    int crTimeout = config.challengeResponseTimeout();
    if (parser.isSet(crTimeoutOption)) {
        bool ok = false;
        crTimeout = parser.value(crTimeoutOption).toInt(&ok);
        if (!ok || crTimeout < 0 || crTimeout > 255) {
            err() << i18n("Invalid challenge-response timeout: %1", parser.value(crTimeoutOption)) << Qt::endl;
            return 1;
        }
    }

    std::optional<quint16> autoejectTime;
    if (config.autoEjectTimeout()) {
        autoejectTime = static_cast<quint16>(*config.autoEjectTimeout());
    }
    if (parser.isSet(autoejectOption)) {
        bool ok = false;
        const uint seconds = parser.value(autoejectOption).toUInt(&ok);
        if (!ok || seconds > 0xFFFF) {
            err() << i18n("Invalid autoeject time: %1", parser.value(autoejectOption)) << Qt::endl;
            return 1;
        }
        autoejectTime = static_cast<quint16>(seconds);
    }

    ModeSwitchWorkflow workflow(&config);
    QObject::connect(&workflow, &ModeSwitchWorkflow::touchRequested, [](const QString &message) {
        err() << message << Qt::endl;
    });

    const auto result = workflow.run(device, *mode, static_cast<quint8>(crTimeout), autoejectTime);
    if (result.isError()) {
        err() << i18n("Failed to set mode: %1", result.error()) << Qt::endl;
        return 1;
    }

    out() << i18n("Mode set to %1. Remove and re-insert your YubiKey for the change to take effect.",
                  mode->toString())
          << Qt::endl;
    return 0;
}

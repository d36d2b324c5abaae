/*
 * SPDX-FileCopyrightText: 2024 YubiKey KRunner Plugin Contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "yubikey_device.h"
#include "device_discovery.h"
#include "device_error_codes.h"
#include "logging_categories.h"
#include "drivers/driver.h"
#include "drivers/driver_factory.h"

#include <QDebug>

namespace YubiKeyManager {
namespace Device {

namespace {
// Last firmware that requires the touch-eject flag for mode code 2
const Version LAST_FORCED_EJECT_FIRMWARE(3, 3, 1);
constexpr quint8 FORCED_EJECT_MODE_CODE = 2;
} // namespace

Result<std::shared_ptr<YubiKeyDevice>> YubiKeyDevice::create(std::unique_ptr<Driver> driver,
                                                             std::shared_ptr<DriverFactory> factory)
{
    const auto classification = DeviceClassifier::classify(driver.get());
    if (classification.isError()) {
        return Result<std::shared_ptr<YubiKeyDevice>>::error(classification.error());
    }

    std::shared_ptr<YubiKeyDevice> device(
        new YubiKeyDevice(std::move(driver), classification.value(), std::move(factory)));
    qCInfo(YubiKeyDeviceLog) << "Device:" << device->toString();
    return Result<std::shared_ptr<YubiKeyDevice>>::success(device);
}

YubiKeyDevice::YubiKeyDevice(std::unique_ptr<Driver> driver, DeviceClassification classification,
                             std::shared_ptr<DriverFactory> factory)
    : m_driver(std::move(driver))
    , m_classification(std::move(classification))
    , m_factory(std::move(factory))
{
}

YubiKeyDevice::~YubiKeyDevice() = default;

Version YubiKeyDevice::version() const
{
    return m_driver->version();
}

Transport YubiKeyDevice::transport() const
{
    return m_driver->transport();
}

Mode YubiKeyDevice::mode() const
{
    return m_driver->mode();
}

std::optional<quint32> YubiKeyDevice::serial() const
{
    // A blob serial of 0 means the device hides it
    if (m_classification.serial && *m_classification.serial != 0) {
        return m_classification.serial;
    }
    return m_driver->serial();
}

bool YubiKeyDevice::hasMode(const Mode &mode) const
{
    if (!mode.isValid()) {
        return false;
    }
    const Capabilities required = toCapabilities(mode.transports());
    return (m_classification.capabilities & required) == required;
}

quint8 YubiKeyDevice::modeFlags(const Version &firmware, const Mode &mode,
                                std::optional<quint16> autoejectTime)
{
    quint8 flags = autoejectTime ? FLAG_TOUCH_EJECT : 0;

    if (firmware <= LAST_FORCED_EJECT_FIRMWARE && mode.code() == FORCED_EJECT_MODE_CODE) {
        flags = FLAG_TOUCH_EJECT;
    }

    return flags;
}

Result<void> YubiKeyDevice::setMode(const Mode &mode, quint8 crTimeout,
                                    std::optional<quint16> autoejectTime)
{
    if (!hasMode(mode)) {
        qCWarning(YubiKeyDeviceLog) << "Mode" << mode.toString() << "not supported by"
                                    << capabilitiesToString(m_classification.capabilities);
        return Result<void>::error(DeviceErrorCodes::withDetail(
            DeviceErrorCodes::UNSUPPORTED_MODE, mode.toString()));
    }

    const quint8 flags = modeFlags(version(), mode, autoejectTime);
    const auto modeByte = static_cast<quint8>(flags | mode.code());

    qCDebug(YubiKeyDeviceLog) << "Setting mode" << mode.toString() << "byte" << Qt::hex << static_cast<int>(modeByte)
                              << "cr timeout" << Qt::dec << static_cast<int>(crTimeout)
                              << "autoeject" << autoejectTime.value_or(0);

    const auto result = m_driver->setMode(modeByte, crTimeout, autoejectTime.value_or(0));
    if (result.isError()) {
        qCWarning(YubiKeyDeviceLog) << "Mode change failed:" << result.error();
        return result;
    }

    m_driver->setCachedMode(mode);
    return Result<void>::success();
}

Result<std::shared_ptr<YubiKeyDevice>> YubiKeyDevice::useTransport(Transport transport)
{
    if (this->transport() == transport) {
        return Result<std::shared_ptr<YubiKeyDevice>>::success(shared_from_this());
    }

    if (!mode().hasTransport(transport)) {
        return Result<std::shared_ptr<YubiKeyDevice>>::error(DeviceErrorCodes::withDetail(
            DeviceErrorCodes::UNSUPPORTED_TRANSPORT,
            QStringLiteral("%1 is not enabled in mode %2").arg(transportName(transport), mode().toString())));
    }

    const Mode previousMode = mode();
    const std::optional<quint32> previousSerial = serial();

    qCDebug(YubiKeyDeviceLog) << "Switching from" << transportName(this->transport())
                              << "to" << transportName(transport);
    releaseDriver();

    DeviceDiscovery discovery(m_factory);
    auto reopened = discovery.openDevice(transport);
    if (reopened.isError()) {
        return reopened;
    }

    std::shared_ptr<YubiKeyDevice> device = reopened.value();
    if (!device) {
        return Result<std::shared_ptr<YubiKeyDevice>>::error(DeviceErrorCodes::withDetail(
            DeviceErrorCodes::DEVICE_NOT_FOUND,
            QStringLiteral("no device over %1").arg(transportName(transport))));
    }

    const std::optional<quint32> newSerial = device->serial();
    if (newSerial && previousSerial && *newSerial != *previousSerial) {
        qCCritical(YubiKeyDeviceLog) << "Serial changed while switching transport:"
                                     << *previousSerial << "->" << *newSerial;
        return Result<std::shared_ptr<YubiKeyDevice>>::error(DeviceErrorCodes::withDetail(
            DeviceErrorCodes::CONSISTENCY_FAULT,
            QStringLiteral("serial %1 became %2").arg(*previousSerial).arg(*newSerial)));
    }

    if (device->mode() != previousMode) {
        qCCritical(YubiKeyDeviceLog) << "Mode changed while switching transport:"
                                     << previousMode.toString() << "->" << device->mode().toString();
        return Result<std::shared_ptr<YubiKeyDevice>>::error(DeviceErrorCodes::withDetail(
            DeviceErrorCodes::CONSISTENCY_FAULT,
            QStringLiteral("mode %1 became %2").arg(previousMode.toString(), device->mode().toString())));
    }

    return Result<std::shared_ptr<YubiKeyDevice>>::success(device);
}

QString YubiKeyDevice::toString() const
{
    const std::optional<quint32> serialNumber = serial();
    return QStringLiteral("%1 %2 %3 [%4] serial: %5 CAP: %6")
        .arg(deviceName(),
             version().toString(),
             mode().toString(),
             transportName(transport()),
             serialNumber ? QString::number(*serialNumber) : QStringLiteral("None"),
             QString::number(m_classification.capabilities.toInt(), 16));
}

void YubiKeyDevice::releaseDriver()
{
    // Old driver is destroyed before the replacement is installed
    m_driver.reset();
    m_driver = std::make_unique<NullDriver>();
}

} // namespace Device
} // namespace YubiKeyManager

/*
 * SPDX-FileCopyrightText: 2024 YubiKey KRunner Plugin Contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "device_discovery.h"
#include "device_error_codes.h"
#include "logging_categories.h"
#include "yubikey_device.h"
#include "drivers/driver_factory.h"

#include <QDebug>

namespace YubiKeyManager {
namespace Device {

DeviceDiscovery::DeviceDiscovery(std::shared_ptr<DriverFactory> factory)
    : m_factory(std::move(factory))
{
}

Result<std::shared_ptr<YubiKeyDevice>> DeviceDiscovery::openDevice(Transports transports) const
{
    if (!m_factory) {
        return Result<std::shared_ptr<YubiKeyDevice>>::error(DeviceErrorCodes::withDetail(
            DeviceErrorCodes::NO_DRIVER, QStringLiteral("no driver factory")));
    }

    for (const Transport transport : transportPriority()) {
        if (!transports.testFlag(transport)) {
            continue;
        }

        qCDebug(DeviceDiscoveryLog) << "Trying transport" << transportName(transport);
        auto opened = m_factory->openDriver(transport);
        if (opened.isError()) {
            qCWarning(DeviceDiscoveryLog) << "Opening" << transportName(transport)
                                          << "failed:" << opened.error();
            return Result<std::shared_ptr<YubiKeyDevice>>::error(DeviceErrorCodes::withDetail(
                DeviceErrorCodes::FAILED_OPENING_DEVICE,
                QStringLiteral("%1: %2").arg(transportName(transport), opened.error())));
        }

        std::unique_ptr<Driver> driver = opened.takeValue();
        if (driver) {
            return YubiKeyDevice::create(std::move(driver), m_factory);
        }
    }

    qCDebug(DeviceDiscoveryLog) << "No YubiKey found over" << transports.toInt();
    return Result<std::shared_ptr<YubiKeyDevice>>::success(nullptr);
}

} // namespace Device
} // namespace YubiKeyManager

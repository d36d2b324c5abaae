/*
 * SPDX-FileCopyrightText: 2024 YubiKey KRunner Plugin Contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "driver.h"
#include "../device_error_codes.h"

namespace YubiKeyManager {
namespace Device {

namespace {
QString releasedError()
{
    return DeviceErrorCodes::withDetail(DeviceErrorCodes::NO_DRIVER,
                                        QStringLiteral("driver has been released"));
}
} // namespace

Transport NullDriver::transport() const
{
    return Transport::NoTransport;
}

Version NullDriver::version() const
{
    return Version();
}

std::optional<quint32> NullDriver::serial() const
{
    return std::nullopt;
}

Result<QByteArray> NullDriver::readCapabilities()
{
    return Result<QByteArray>::error(releasedError());
}

Result<Capabilities> NullDriver::probeCapabilitiesSupport()
{
    return Result<Capabilities>::error(releasedError());
}

Result<void> NullDriver::setMode(quint8 modeByte, quint8 crTimeout, quint16 autoejectTime)
{
    Q_UNUSED(modeByte);
    Q_UNUSED(crTimeout);
    Q_UNUSED(autoejectTime);
    return Result<void>::error(releasedError());
}

} // namespace Device
} // namespace YubiKeyManager

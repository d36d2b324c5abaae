/*
 * SPDX-FileCopyrightText: 2024 YubiKey KRunner Plugin Contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "driver_factory.h"
#include "ccid_driver.h"
#include "otp_driver.h"
#include "u2f_driver.h"
#include "../device_error_codes.h"

namespace YubiKeyManager {
namespace Device {

Result<std::unique_ptr<Driver>> PlatformDriverFactory::openDriver(Transport transport)
{
    switch (transport) {
    case Transport::CCID:
        return CcidDriver::open();
    case Transport::OTP:
        return OtpDriver::open();
    case Transport::U2F:
        return U2fDriver::open();
    case Transport::NoTransport:
        break;
    }

    return Result<std::unique_ptr<Driver>>::error(DeviceErrorCodes::withDetail(
        DeviceErrorCodes::UNSUPPORTED_TRANSPORT, transportName(transport)));
}

} // namespace Device
} // namespace YubiKeyManager

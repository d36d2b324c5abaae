/*
 * SPDX-FileCopyrightText: 2024 YubiKey KRunner Plugin Contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "usb_product_ids.h"

namespace YubiKeyManager {
namespace Device {
namespace UsbProductIds {

std::optional<Mode> modeForProductId(quint16 productId)
{
    switch (productId) {
    case YK_STANDARD:
    case NEO_OTP:
    case YK4_OTP:
        return Mode::fromTransports(Transport::OTP);
    case NEO_OTP_CCID:
    case YK4_OTP_CCID:
        return Mode::fromTransports(Transport::OTP | Transport::CCID);
    case NEO_CCID:
    case YK4_CCID:
        return Mode::fromTransports(Transport::CCID);
    case NEO_U2F:
    case SKY_U2F:
    case YK4_U2F:
        return Mode::fromTransports(Transport::U2F);
    case NEO_OTP_U2F:
    case YK4_OTP_U2F:
    case PLUS_OTP_U2F:
        return Mode::fromTransports(Transport::OTP | Transport::U2F);
    case NEO_U2F_CCID:
    case YK4_U2F_CCID:
        return Mode::fromTransports(Transport::U2F | Transport::CCID);
    case NEO_OTP_U2F_CCID:
    case YK4_OTP_U2F_CCID:
        return Mode::fromTransports(ALL_TRANSPORTS);
    default:
        return std::nullopt;
    }
}

bool isSecurityKey(quint16 productId)
{
    return productId == SKY_U2F;
}

} // namespace UsbProductIds
} // namespace Device
} // namespace YubiKeyManager

/*
 * SPDX-FileCopyrightText: 2024 YubiKey KRunner Plugin Contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#pragma once

#include <optional>
#include "shared/types/device_mode.h"

namespace YubiKeyManager {
namespace Device {
using namespace YubiKeyManager::Shared;

/**
 * @brief USB identifiers of Yubico HID devices
 *
 * The product id encodes both the product line and the active mode.
 */
namespace UsbProductIds {

constexpr quint16 YUBICO_VENDOR_ID = 0x1050;

constexpr quint16 YK_STANDARD = 0x0010;
constexpr quint16 NEO_OTP = 0x0110;
constexpr quint16 NEO_OTP_CCID = 0x0111;
constexpr quint16 NEO_CCID = 0x0112;
constexpr quint16 NEO_U2F = 0x0113;
constexpr quint16 NEO_OTP_U2F = 0x0114;
constexpr quint16 NEO_U2F_CCID = 0x0115;
constexpr quint16 NEO_OTP_U2F_CCID = 0x0116;
constexpr quint16 SKY_U2F = 0x0120;
constexpr quint16 YK4_OTP = 0x0401;
constexpr quint16 YK4_U2F = 0x0402;
constexpr quint16 YK4_OTP_U2F = 0x0403;
constexpr quint16 YK4_CCID = 0x0404;
constexpr quint16 YK4_OTP_CCID = 0x0405;
constexpr quint16 YK4_U2F_CCID = 0x0406;
constexpr quint16 YK4_OTP_U2F_CCID = 0x0407;
constexpr quint16 PLUS_OTP_U2F = 0x0410;

/**
 * @brief Mode a device with this product id is running in
 * @return Mode, or std::nullopt for unknown product ids
 */
std::optional<Mode> modeForProductId(quint16 productId);

/**
 * @brief Whether the product id belongs to a FIDO-only Security Key
 */
bool isSecurityKey(quint16 productId);

} // namespace UsbProductIds

} // namespace Device
} // namespace YubiKeyManager

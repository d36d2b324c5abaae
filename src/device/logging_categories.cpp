/*
 * SPDX-FileCopyrightText: 2024 YubiKey KRunner Plugin Contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "logging_categories.h"

namespace YubiKeyManager {
namespace Device {

// Discovery and device handle
Q_LOGGING_CATEGORY(DeviceDiscoveryLog, "yubikey.manager.discovery", QtWarningMsg)
Q_LOGGING_CATEGORY(YubiKeyDeviceLog, "yubikey.manager.device", QtWarningMsg)
Q_LOGGING_CATEGORY(DeviceClassifierLog, "yubikey.manager.classifier", QtWarningMsg)

// Transport drivers
Q_LOGGING_CATEGORY(CcidDriverLog, "yubikey.manager.driver.ccid", QtWarningMsg)
Q_LOGGING_CATEGORY(OtpDriverLog, "yubikey.manager.driver.otp", QtWarningMsg)
Q_LOGGING_CATEGORY(U2fDriverLog, "yubikey.manager.driver.u2f", QtWarningMsg)

// Wire formats
Q_LOGGING_CATEGORY(DeviceProtocolLog, "yubikey.manager.protocol", QtWarningMsg)

// Ambient components
Q_LOGGING_CATEGORY(DeviceConfigLog, "yubikey.manager.config", QtWarningMsg)
Q_LOGGING_CATEGORY(TouchPromptLog, "yubikey.manager.touch", QtWarningMsg)

} // namespace Device
} // namespace YubiKeyManager

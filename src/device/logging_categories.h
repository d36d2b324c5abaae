/*
 * SPDX-FileCopyrightText: 2024 YubiKey KRunner Plugin Contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#pragma once

#include <QLoggingCategory>

namespace YubiKeyManager {
namespace Device {

/**
 * @brief Qt Logging Categories for the device core
 *
 * Control via environment:
 *   QT_LOGGING_RULES="yubikey.manager.*=true"
 */

// Discovery and device handle
Q_DECLARE_LOGGING_CATEGORY(DeviceDiscoveryLog)
Q_DECLARE_LOGGING_CATEGORY(YubiKeyDeviceLog)
Q_DECLARE_LOGGING_CATEGORY(DeviceClassifierLog)

// Transport drivers
Q_DECLARE_LOGGING_CATEGORY(CcidDriverLog)
Q_DECLARE_LOGGING_CATEGORY(OtpDriverLog)
Q_DECLARE_LOGGING_CATEGORY(U2fDriverLog)

// Wire formats
Q_DECLARE_LOGGING_CATEGORY(DeviceProtocolLog)

// Ambient components
Q_DECLARE_LOGGING_CATEGORY(DeviceConfigLog)
Q_DECLARE_LOGGING_CATEGORY(TouchPromptLog)

} // namespace Device
} // namespace YubiKeyManager

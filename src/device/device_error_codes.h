/*
 * SPDX-FileCopyrightText: 2024 YubiKey KRunner Plugin Contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#pragma once

#include <QString>

namespace YubiKeyManager {
namespace Device {

/**
 * @brief Error code constants for device operations
 *
 * These constants provide stable error identifiers that are independent
 * of the human-readable detail. Errors are built with withDetail() and
 * checked with matches().
 *
 * Usage:
 * @code
 * // Generating errors
 * return Result<void>::error(DeviceErrorCodes::withDetail(
 *     DeviceErrorCodes::UNSUPPORTED_MODE, mode.toString()));
 *
 * // Checking errors
 * if (result.isError() && DeviceErrorCodes::matches(result.error(), DeviceErrorCodes::UNSUPPORTED_MODE)) {
 *     // Handle unsupported mode
 * }
 * @endcode
 */
namespace DeviceErrorCodes {

/**
 * @brief TLV data is truncated or otherwise malformed
 */
inline const QString MALFORMED_TLV = QStringLiteral("DEVICE_ERROR_MALFORMED_TLV");

/**
 * @brief Requested mode needs transports the device does not support
 *
 * Reported before any command is sent to the device.
 */
inline const QString UNSUPPORTED_MODE = QStringLiteral("DEVICE_ERROR_UNSUPPORTED_MODE");

/**
 * @brief Requested transport is not enabled in the current mode
 */
inline const QString UNSUPPORTED_TRANSPORT = QStringLiteral("DEVICE_ERROR_UNSUPPORTED_TRANSPORT");

/**
 * @brief A transport driver failed while opening; discovery aborted
 */
inline const QString FAILED_OPENING_DEVICE = QStringLiteral("DEVICE_ERROR_FAILED_OPENING_DEVICE");

/**
 * @brief Device identity changed while switching transport
 *
 * Serial or mode of the reopened device differs from the one that was
 * released. The reopened handle is discarded.
 */
inline const QString CONSISTENCY_FAULT = QStringLiteral("DEVICE_ERROR_CONSISTENCY_FAULT");

/**
 * @brief No driver is attached (released handle or missing driver)
 */
inline const QString NO_DRIVER = QStringLiteral("DEVICE_ERROR_NO_DRIVER");

/**
 * @brief PC/SC, HID or APDU level failure
 */
inline const QString COMMUNICATION_ERROR = QStringLiteral("DEVICE_ERROR_COMMUNICATION");

/**
 * @brief Operation is not available over the current transport
 */
inline const QString NOT_SUPPORTED = QStringLiteral("DEVICE_ERROR_NOT_SUPPORTED");

/**
 * @brief Device could not be found when reopening
 */
inline const QString DEVICE_NOT_FOUND = QStringLiteral("DEVICE_ERROR_DEVICE_NOT_FOUND");

/**
 * @brief Builds "<code>: <detail>", or just the code when detail is empty
 */
inline QString withDetail(const QString &code, const QString &detail)
{
    return detail.isEmpty() ? code : QStringLiteral("%1: %2").arg(code, detail);
}

/**
 * @brief Checks whether an error string carries the given code
 */
inline bool matches(const QString &error, const QString &code)
{
    return error == code || error.startsWith(code + QStringLiteral(": "));
}

} // namespace DeviceErrorCodes

} // namespace Device
} // namespace YubiKeyManager

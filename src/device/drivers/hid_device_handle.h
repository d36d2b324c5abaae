/*
 * SPDX-FileCopyrightText: 2024 YubiKey KRunner Plugin Contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#pragma once

#include <QByteArray>
#include <QList>
#include <memory>
#include "shared/common/result.h"

#include <hidapi/hidapi.h>

namespace YubiKeyManager {
namespace Device {
using namespace YubiKeyManager::Shared;

/**
 * @brief Enumeration entry for one HID interface
 */
struct HidDeviceInfo {
    QByteArray path;
    quint16 vendorId = 0;
    quint16 productId = 0;
    quint16 usagePage = 0;
    int interfaceNumber = -1;
};

/**
 * @brief Owning wrapper around a hidapi device handle
 *
 * The handle is closed when the wrapper is destroyed. Feature reports are
 * exchanged without the report id byte; the wrapper adds report id 0.
 */
class HidDeviceHandle
{
public:
    HidDeviceHandle() = default;
    HidDeviceHandle(HidDeviceHandle &&) noexcept = default;
    HidDeviceHandle &operator=(HidDeviceHandle &&) noexcept = default;

    /**
     * @brief Lists HID interfaces of a vendor
     */
    static Result<QList<HidDeviceInfo>> enumerate(quint16 vendorId);

    /**
     * @brief Opens an interface by its enumeration path
     */
    static Result<HidDeviceHandle> open(const QByteArray &path);

    bool isOpen() const { return m_device != nullptr; }

    Result<QByteArray> getFeatureReport(int size);
    Result<void> sendFeatureReport(const QByteArray &report);

    /**
     * @brief Writes an output report
     */
    Result<void> write(const QByteArray &report);

    /**
     * @brief Reads an input report
     * @return Report data, empty if nothing arrived within timeoutMs
     */
    Result<QByteArray> read(int size, int timeoutMs);

private:
    struct HidDeleter {
        void operator()(hid_device *device) const noexcept;
    };

    static Result<void> ensureInitialized();
    QString lastError() const;

    std::unique_ptr<hid_device, HidDeleter> m_device;
};

} // namespace Device
} // namespace YubiKeyManager

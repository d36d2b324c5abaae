/*
 * SPDX-FileCopyrightText: 2024 YubiKey KRunner Plugin Contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "hid_device_handle.h"
#include "../device_error_codes.h"

namespace YubiKeyManager {
namespace Device {

namespace {
QString hidError(const QString &detail)
{
    return DeviceErrorCodes::withDetail(DeviceErrorCodes::COMMUNICATION_ERROR, detail);
}
} // namespace

void HidDeviceHandle::HidDeleter::operator()(hid_device *device) const noexcept
{
    if (device != nullptr) {
        hid_close(device);
    }
}

Result<void> HidDeviceHandle::ensureInitialized()
{
    // hid_init() is idempotent
    if (hid_init() != 0) {
        return Result<void>::error(hidError(QStringLiteral("hid_init failed")));
    }
    return Result<void>::success();
}

Result<QList<HidDeviceInfo>> HidDeviceHandle::enumerate(quint16 vendorId)
{
    const auto init = ensureInitialized();
    if (init.isError()) {
        return Result<QList<HidDeviceInfo>>::error(init.error());
    }

    QList<HidDeviceInfo> devices;
    hid_device_info *list = hid_enumerate(vendorId, 0);
    for (const hid_device_info *entry = list; entry != nullptr; entry = entry->next) {
        HidDeviceInfo info;
        info.path = QByteArray(entry->path);
        info.vendorId = entry->vendor_id;
        info.productId = entry->product_id;
        info.usagePage = entry->usage_page;
        info.interfaceNumber = entry->interface_number;
        devices.append(info);
    }
    hid_free_enumeration(list);

    return Result<QList<HidDeviceInfo>>::success(devices);
}

Result<HidDeviceHandle> HidDeviceHandle::open(const QByteArray &path)
{
    const auto init = ensureInitialized();
    if (init.isError()) {
        return Result<HidDeviceHandle>::error(init.error());
    }

    hid_device *device = hid_open_path(path.constData());
    if (device == nullptr) {
        return Result<HidDeviceHandle>::error(
            hidError(QStringLiteral("cannot open %1").arg(QString::fromUtf8(path))));
    }

    HidDeviceHandle handle;
    handle.m_device.reset(device);
    return Result<HidDeviceHandle>::success(std::move(handle));
}

Result<QByteArray> HidDeviceHandle::getFeatureReport(int size)
{
    QByteArray buffer(size + 1, '\0');
    const int read = hid_get_feature_report(m_device.get(),
                                            reinterpret_cast<unsigned char *>(buffer.data()),
                                            static_cast<size_t>(buffer.size()));
    if (read < 0) {
        return Result<QByteArray>::error(hidError(lastError()));
    }
    // Skip the report id
    return Result<QByteArray>::success(buffer.mid(1, size));
}

Result<void> HidDeviceHandle::sendFeatureReport(const QByteArray &report)
{
    QByteArray buffer(1, '\0');
    buffer.append(report);
    const int written = hid_send_feature_report(m_device.get(),
                                                reinterpret_cast<const unsigned char *>(buffer.constData()),
                                                static_cast<size_t>(buffer.size()));
    if (written < 0) {
        return Result<void>::error(hidError(lastError()));
    }
    return Result<void>::success();
}

Result<void> HidDeviceHandle::write(const QByteArray &report)
{
    QByteArray buffer(1, '\0');
    buffer.append(report);
    const int written = hid_write(m_device.get(),
                                  reinterpret_cast<const unsigned char *>(buffer.constData()),
                                  static_cast<size_t>(buffer.size()));
    if (written < 0) {
        return Result<void>::error(hidError(lastError()));
    }
    return Result<void>::success();
}

Result<QByteArray> HidDeviceHandle::read(int size, int timeoutMs)
{
    QByteArray buffer(size, '\0');
    const int read = hid_read_timeout(m_device.get(),
                                      reinterpret_cast<unsigned char *>(buffer.data()),
                                      static_cast<size_t>(buffer.size()), timeoutMs);
    if (read < 0) {
        return Result<QByteArray>::error(hidError(lastError()));
    }
    buffer.truncate(read);
    return Result<QByteArray>::success(buffer);
}

QString HidDeviceHandle::lastError() const
{
    const wchar_t *message = hid_error(m_device.get());
    return message != nullptr ? QString::fromWCharArray(message) : QStringLiteral("unknown HID error");
}

} // namespace Device
} // namespace YubiKeyManager

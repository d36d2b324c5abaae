/*
 * SPDX-FileCopyrightText: 2024 YubiKey KRunner Plugin Contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "otp_driver.h"
#include "usb_product_ids.h"
#include "../protocol/management_protocol.h"
#include "../protocol/otp_protocol.h"
#include "../protocol/tlv.h"
#include "../protocol/u2f_hid_protocol.h"
#include "../device_error_codes.h"
#include "../logging_categories.h"

#include <QDebug>
#include <QElapsedTimer>
#include <QThread>

namespace YubiKeyManager {
namespace Device {

namespace {
QString otpError(const QString &detail)
{
    return DeviceErrorCodes::withDetail(DeviceErrorCodes::COMMUNICATION_ERROR, detail);
}
} // namespace

Result<std::unique_ptr<Driver>> OtpDriver::open()
{
    const auto devices = HidDeviceHandle::enumerate(UsbProductIds::YUBICO_VENDOR_ID);
    if (devices.isError()) {
        return Result<std::unique_ptr<Driver>>::error(devices.error());
    }

    for (const HidDeviceInfo &info : devices.value()) {
        const auto mode = UsbProductIds::modeForProductId(info.productId);
        if (!mode || !mode->hasTransport(Transport::OTP)) {
            continue;
        }
        // The FIDO interface of a composite device is not the keyboard
        if (info.usagePage == U2fHidProtocol::USAGE_PAGE_FIDO) {
            continue;
        }

        qCDebug(OtpDriverLog) << "Opening keyboard interface" << info.path
                              << "product id" << Qt::hex << info.productId;

        auto handle = HidDeviceHandle::open(info.path);
        if (handle.isError()) {
            return Result<std::unique_ptr<Driver>>::error(handle.error());
        }

        std::unique_ptr<OtpDriver> driver(new OtpDriver(handle.takeValue(), info.productId, *mode));
        const auto initResult = driver->initialize();
        if (initResult.isError()) {
            return Result<std::unique_ptr<Driver>>::error(initResult.error());
        }

        qCInfo(OtpDriverLog) << "Opened OTP device, firmware" << driver->version().toString()
                             << "mode" << driver->mode().toString();
        return Result<std::unique_ptr<Driver>>::success(std::move(driver));
    }

    qCDebug(OtpDriverLog) << "No YubiKey keyboard interface found";
    return Result<std::unique_ptr<Driver>>::success(nullptr);
}

OtpDriver::OtpDriver(HidDeviceHandle handle, quint16 productId, const Mode &mode)
    : m_handle(std::move(handle))
    , m_productId(productId)
{
    m_mode = mode;
}

OtpDriver::~OtpDriver()
{
    qCDebug(OtpDriverLog) << "Closing OTP device" << Qt::hex << m_productId;
}

Result<void> OtpDriver::initialize()
{
    const auto status = readStatus();
    if (status.isError()) {
        return Result<void>::error(status.error());
    }
    m_version = status.value().firmwareVersion;

    // Serial visibility is a device setting, a failed read is not fatal
    const auto response = transact(OtpProtocol::SLOT_DEVICE_SERIAL, QByteArray());
    if (response.isSuccess()) {
        const auto serialBytes = OtpProtocol::extractResponse(response.value(), 4);
        if (serialBytes.isSuccess()) {
            m_serial = static_cast<quint32>(Tlv::toUnsigned(serialBytes.value()));
        }
    }
    if (!m_serial) {
        qCDebug(OtpDriverLog) << "Serial number not readable over OTP";
    }

    return Result<void>::success();
}

Result<QByteArray> OtpDriver::readCapabilities()
{
    const auto response = transact(OtpProtocol::SLOT_YK4_CAPABILITIES, QByteArray());
    if (response.isError()) {
        return response;
    }
    if (response.value().isEmpty()) {
        return Result<QByteArray>::success(QByteArray());
    }

    // Blob is length-prefixed; keep the prefix
    const int length = static_cast<quint8>(response.value().at(0)) + 1;
    return OtpProtocol::extractResponse(response.value(), length);
}

Result<Capabilities> OtpDriver::probeCapabilitiesSupport()
{
    return Result<Capabilities>::error(DeviceErrorCodes::withDetail(
        DeviceErrorCodes::NOT_SUPPORTED, QStringLiteral("capability probing requires CCID")));
}

Result<void> OtpDriver::setMode(quint8 modeByte, quint8 crTimeout, quint16 autoejectTime)
{
    return writeCommand(OtpProtocol::SLOT_DEVICE_CONFIG,
                        ManagementProtocol::modeData(modeByte, crTimeout, autoejectTime));
}

Result<OtpStatus> OtpDriver::readStatus()
{
    const auto report = m_handle.getFeatureReport(OtpProtocol::FEATURE_REPORT_SIZE);
    if (report.isError()) {
        return Result<OtpStatus>::error(report.error());
    }
    return OtpProtocol::parseStatus(report.value());
}

Result<void> OtpDriver::waitForWriteReady()
{
    QElapsedTimer timer;
    timer.start();

    while (timer.elapsed() < WRITE_READY_TIMEOUT_MS) {
        const auto report = m_handle.getFeatureReport(OtpProtocol::FEATURE_REPORT_SIZE);
        if (report.isError()) {
            return Result<void>::error(report.error());
        }
        const auto flags = static_cast<quint8>(report.value().at(OtpProtocol::REPORT_DATA_SIZE));
        if (!(flags & OtpProtocol::SLOT_WRITE_FLAG)) {
            return Result<void>::success();
        }
        QThread::msleep(POLL_INTERVAL_MS);
    }

    return Result<void>::error(otpError(QStringLiteral("timeout waiting for device to accept data")));
}

Result<void> OtpDriver::writeCommand(quint8 slot, const QByteArray &payload)
{
    const QByteArray frame = OtpProtocol::formatFrame(slot, payload);
    qCDebug(OtpDriverLog) << "Writing slot" << Qt::hex << static_cast<int>(slot) << "frame" << frame.toHex();

    const QList<QByteArray> reports = OtpProtocol::frameReports(frame);
    for (const QByteArray &report : reports) {
        const auto ready = waitForWriteReady();
        if (ready.isError()) {
            return ready;
        }
        const auto sent = m_handle.sendFeatureReport(report);
        if (sent.isError()) {
            return sent;
        }
    }

    // Device is done once it clears the write flag of the last report
    return waitForWriteReady();
}

Result<QByteArray> OtpDriver::transact(quint8 slot, const QByteArray &payload)
{
    const auto written = writeCommand(slot, payload);
    if (written.isError()) {
        return Result<QByteArray>::error(written.error());
    }

    OtpResponseAssembler assembler;
    QElapsedTimer timer;
    timer.start();
    bool pending = false;

    while (timer.elapsed() < RESPONSE_TIMEOUT_MS) {
        const auto report = m_handle.getFeatureReport(OtpProtocol::FEATURE_REPORT_SIZE);
        if (report.isError()) {
            return report;
        }

        const auto flags = static_cast<quint8>(report.value().at(OtpProtocol::REPORT_DATA_SIZE));
        if (!pending) {
            // Wait for the device to start the transfer
            pending = (flags & OtpProtocol::RESP_PENDING_FLAG) != 0;
            if (!pending) {
                QThread::msleep(POLL_INTERVAL_MS);
                continue;
            }
        }

        const auto step = assembler.feed(report.value());
        if (step == OtpResponseAssembler::Step::Complete) {
            const auto reset = m_handle.sendFeatureReport(OtpProtocol::resetReport());
            if (reset.isError()) {
                return Result<QByteArray>::error(reset.error());
            }
            qCDebug(OtpDriverLog) << "Response:" << assembler.data().toHex();
            return Result<QByteArray>::success(assembler.data());
        }
        if (step == OtpResponseAssembler::Step::Failed) {
            return Result<QByteArray>::error(otpError(
                QStringLiteral("no response to slot 0x%1").arg(slot, 2, 16, QLatin1Char('0'))));
        }
        QThread::msleep(POLL_INTERVAL_MS);
    }

    return Result<QByteArray>::error(otpError(QStringLiteral("timeout waiting for response")));
}

} // namespace Device
} // namespace YubiKeyManager

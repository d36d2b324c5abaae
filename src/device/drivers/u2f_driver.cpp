/*
 * SPDX-FileCopyrightText: 2024 YubiKey KRunner Plugin Contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "u2f_driver.h"
#include "usb_product_ids.h"
#include "../protocol/management_protocol.h"
#include "../protocol/u2f_hid_protocol.h"
#include "../device_error_codes.h"
#include "../logging_categories.h"

#include <QDebug>
#include <QElapsedTimer>
#include <QRandomGenerator>

namespace YubiKeyManager {
namespace Device {

namespace {
QString u2fError(const QString &detail)
{
    return DeviceErrorCodes::withDetail(DeviceErrorCodes::COMMUNICATION_ERROR, detail);
}
} // namespace

Result<std::unique_ptr<Driver>> U2fDriver::open()
{
    const auto devices = HidDeviceHandle::enumerate(UsbProductIds::YUBICO_VENDOR_ID);
    if (devices.isError()) {
        return Result<std::unique_ptr<Driver>>::error(devices.error());
    }

    for (const HidDeviceInfo &info : devices.value()) {
        if (info.usagePage != U2fHidProtocol::USAGE_PAGE_FIDO) {
            continue;
        }
        const auto mode = UsbProductIds::modeForProductId(info.productId);
        if (!mode || !mode->hasTransport(Transport::U2F)) {
            qCDebug(U2fDriverLog) << "Skipping FIDO interface with unknown product id"
                                  << Qt::hex << info.productId;
            continue;
        }

        qCDebug(U2fDriverLog) << "Opening FIDO interface" << info.path
                              << "product id" << Qt::hex << info.productId;

        auto handle = HidDeviceHandle::open(info.path);
        if (handle.isError()) {
            return Result<std::unique_ptr<Driver>>::error(handle.error());
        }

        std::unique_ptr<U2fDriver> driver(new U2fDriver(handle.takeValue(), info.productId, *mode));
        const auto initResult = driver->initialize();
        if (initResult.isError()) {
            return Result<std::unique_ptr<Driver>>::error(initResult.error());
        }

        qCInfo(U2fDriverLog) << "Opened U2F device, firmware" << driver->version().toString()
                             << "mode" << driver->mode().toString();
        return Result<std::unique_ptr<Driver>>::success(std::move(driver));
    }

    qCDebug(U2fDriverLog) << "No YubiKey FIDO interface found";
    return Result<std::unique_ptr<Driver>>::success(nullptr);
}

U2fDriver::U2fDriver(HidDeviceHandle handle, quint16 productId, const Mode &mode)
    : m_handle(std::move(handle))
    , m_productId(productId)
    , m_channelId(U2fHidProtocol::BROADCAST_CID)
{
    m_mode = mode;
}

U2fDriver::~U2fDriver()
{
    qCDebug(U2fDriverLog) << "Closing U2F device, channel" << Qt::hex << m_channelId;
}

bool U2fDriver::isSecurityKey() const
{
    return UsbProductIds::isSecurityKey(m_productId);
}

Result<void> U2fDriver::initialize()
{
    QByteArray nonce(U2fHidProtocol::NONCE_SIZE, '\0');
    for (char &byte : nonce) {
        byte = static_cast<char>(QRandomGenerator::global()->bounded(256));
    }

    const auto response = transact(U2fHidProtocol::BROADCAST_CID, U2fHidProtocol::CMD_INIT, nonce);
    if (response.isError()) {
        return Result<void>::error(response.error());
    }

    const auto info = U2fHidProtocol::parseInitResponse(response.value(), nonce);
    if (info.isError()) {
        return Result<void>::error(info.error());
    }

    m_channelId = info.value().channelId;
    m_version = info.value().firmwareVersion;
    qCDebug(U2fDriverLog) << "Allocated channel" << Qt::hex << m_channelId
                          << "protocol version" << static_cast<int>(info.value().protocolVersion);
    return Result<void>::success();
}

Result<QByteArray> U2fDriver::readCapabilities()
{
    return transact(m_channelId, U2fHidProtocol::CMD_YK_CAPABILITIES, QByteArray());
}

Result<Capabilities> U2fDriver::probeCapabilitiesSupport()
{
    return Result<Capabilities>::error(DeviceErrorCodes::withDetail(
        DeviceErrorCodes::NOT_SUPPORTED, QStringLiteral("capability probing requires CCID")));
}

Result<void> U2fDriver::setMode(quint8 modeByte, quint8 crTimeout, quint16 autoejectTime)
{
    const auto response = transact(m_channelId, U2fHidProtocol::CMD_YK_SET_MODE,
                                   ManagementProtocol::modeData(modeByte, crTimeout, autoejectTime));
    if (response.isError()) {
        return Result<void>::error(response.error());
    }
    return Result<void>::success();
}

Result<QByteArray> U2fDriver::transact(quint32 channelId, quint8 command, const QByteArray &data)
{
    const auto packets = U2fHidProtocol::buildPackets(channelId, command, data);
    if (packets.isError()) {
        return Result<QByteArray>::error(packets.error());
    }

    for (const QByteArray &packet : packets.value()) {
        const auto written = m_handle.write(packet);
        if (written.isError()) {
            return Result<QByteArray>::error(written.error());
        }
    }

    U2fHidResponseAssembler assembler(channelId);
    QElapsedTimer timer;
    timer.start();

    while (timer.elapsed() < RESPONSE_TIMEOUT_MS) {
        const auto packet = m_handle.read(U2fHidProtocol::PACKET_SIZE,
                                          static_cast<int>(RESPONSE_TIMEOUT_MS - timer.elapsed()));
        if (packet.isError()) {
            return packet;
        }
        if (packet.value().isEmpty()) {
            continue;
        }

        const auto step = assembler.feed(packet.value());
        if (step == U2fHidResponseAssembler::Step::Failed) {
            return Result<QByteArray>::error(u2fError(QStringLiteral("malformed U2FHID response")));
        }
        if (step == U2fHidResponseAssembler::Step::NeedMore) {
            continue;
        }

        if (assembler.command() == U2fHidProtocol::CMD_ERROR) {
            const int code = assembler.data().isEmpty() ? -1 : static_cast<quint8>(assembler.data().at(0));
            return Result<QByteArray>::error(u2fError(QStringLiteral("U2FHID error %1").arg(code)));
        }
        if (assembler.command() != command) {
            return Result<QByteArray>::error(u2fError(
                QStringLiteral("unexpected U2FHID command 0x%1").arg(assembler.command(), 2, 16, QLatin1Char('0'))));
        }
        return Result<QByteArray>::success(assembler.data());
    }

    return Result<QByteArray>::error(u2fError(QStringLiteral("timeout waiting for response")));
}

} // namespace Device
} // namespace YubiKeyManager

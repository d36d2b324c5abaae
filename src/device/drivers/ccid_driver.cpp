/*
 * SPDX-FileCopyrightText: 2024 YubiKey KRunner Plugin Contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "ccid_driver.h"
#include "../protocol/management_protocol.h"
#include "../protocol/tlv.h"
#include "../device_error_codes.h"
#include "../logging_categories.h"

#include <QDebug>
#include <QStringList>

// PC/SC error codes not always defined in winscard.h
#ifndef SCARD_E_NO_READERS_AVAILABLE
#define SCARD_E_NO_READERS_AVAILABLE ((LONG)0x8010002E)
#endif
#ifndef SCARD_E_NO_SERVICE
#define SCARD_E_NO_SERVICE ((LONG)0x8010001D)
#endif
#ifndef SCARD_W_REMOVED_CARD
#define SCARD_W_REMOVED_CARD ((LONG)0x80100069)
#endif
#ifndef SCARD_E_NO_SMARTCARD
#define SCARD_E_NO_SMARTCARD ((LONG)0x8010000C)
#endif

namespace YubiKeyManager {
namespace Device {

namespace {

QString pcscError(const char *call, LONG result)
{
    return DeviceErrorCodes::withDetail(
        DeviceErrorCodes::COMMUNICATION_ERROR,
        QStringLiteral("%1 failed: 0x%2").arg(QLatin1String(call))
            .arg(static_cast<quint32>(result), 8, 16, QLatin1Char('0')));
}

QStringList parseReaderList(const QByteArray &multiString)
{
    QStringList readers;
    for (const QByteArray &entry : multiString.split('\0')) {
        if (!entry.isEmpty()) {
            readers.append(QString::fromUtf8(entry));
        }
    }
    return readers;
}

} // namespace

Result<std::unique_ptr<Driver>> CcidDriver::open()
{
    SCARDCONTEXT context = 0;
    LONG result = SCardEstablishContext(SCARD_SCOPE_USER, nullptr, nullptr, &context);
    if (result == SCARD_E_NO_SERVICE) {
        qCDebug(CcidDriverLog) << "PC/SC service not running, no smart card transport";
        return Result<std::unique_ptr<Driver>>::success(nullptr);
    }
    if (result != SCARD_S_SUCCESS) {
        return Result<std::unique_ptr<Driver>>::error(pcscError("SCardEstablishContext", result));
    }

    DWORD readersLength = 0;
    result = SCardListReaders(context, nullptr, nullptr, &readersLength);
    if (result == SCARD_E_NO_READERS_AVAILABLE) {
        qCDebug(CcidDriverLog) << "No PC/SC readers available";
        SCardReleaseContext(context);
        return Result<std::unique_ptr<Driver>>::success(nullptr);
    }
    if (result != SCARD_S_SUCCESS) {
        SCardReleaseContext(context);
        return Result<std::unique_ptr<Driver>>::error(pcscError("SCardListReaders", result));
    }

    QByteArray readerBuffer(static_cast<int>(readersLength), '\0');
    result = SCardListReaders(context, nullptr, readerBuffer.data(), &readersLength);
    if (result != SCARD_S_SUCCESS) {
        SCardReleaseContext(context);
        if (result == SCARD_E_NO_READERS_AVAILABLE) {
            return Result<std::unique_ptr<Driver>>::success(nullptr);
        }
        return Result<std::unique_ptr<Driver>>::error(pcscError("SCardListReaders", result));
    }

    QString readerName;
    for (const QString &reader : parseReaderList(readerBuffer)) {
        if (ManagementProtocol::isYubiKeyReader(reader)) {
            readerName = reader;
            break;
        }
    }

    if (readerName.isEmpty()) {
        qCDebug(CcidDriverLog) << "No YubiKey reader found";
        SCardReleaseContext(context);
        return Result<std::unique_ptr<Driver>>::success(nullptr);
    }

    qCDebug(CcidDriverLog) << "Connecting to reader:" << readerName;

    SCARDHANDLE cardHandle = 0;
    DWORD protocol = 0;
    const QByteArray readerBytes = readerName.toUtf8();
    result = SCardConnect(context, readerBytes.constData(), SCARD_SHARE_SHARED,
                          SCARD_PROTOCOL_T0 | SCARD_PROTOCOL_T1, &cardHandle, &protocol);
    if (result == SCARD_E_NO_SMARTCARD || result == SCARD_W_REMOVED_CARD) {
        qCDebug(CcidDriverLog) << "Reader" << readerName << "has no card";
        SCardReleaseContext(context);
        return Result<std::unique_ptr<Driver>>::success(nullptr);
    }
    if (result != SCARD_S_SUCCESS) {
        SCardReleaseContext(context);
        return Result<std::unique_ptr<Driver>>::error(pcscError("SCardConnect", result));
    }

    // Driver owns context and handle from here on
    std::unique_ptr<CcidDriver> driver(new CcidDriver(context, cardHandle, protocol, readerName));
    const auto initResult = driver->initialize();
    if (initResult.isError()) {
        return Result<std::unique_ptr<Driver>>::error(initResult.error());
    }

    qCInfo(CcidDriverLog) << "Opened" << readerName << "firmware" << driver->version().toString()
                          << "mode" << driver->mode().toString();
    return Result<std::unique_ptr<Driver>>::success(std::move(driver));
}

CcidDriver::CcidDriver(SCARDCONTEXT context, SCARDHANDLE cardHandle, DWORD protocol, QString readerName)
    : m_context(context)
    , m_cardHandle(cardHandle)
    , m_protocol(protocol)
    , m_readerName(std::move(readerName))
{
    m_mode = ManagementProtocol::modeFromReaderName(m_readerName);
}

CcidDriver::~CcidDriver()
{
    if (m_cardHandle != 0) {
        qCDebug(CcidDriverLog) << "Disconnecting from" << m_readerName;
        SCardDisconnect(m_cardHandle, SCARD_LEAVE_CARD);
        m_cardHandle = 0;
    }
    if (m_context != 0) {
        SCardReleaseContext(m_context);
        m_context = 0;
    }
}

Result<void> CcidDriver::initialize()
{
    const auto selectResult = selectApplet(ManagementProtocol::OTP_AID);
    if (selectResult.isError()) {
        return Result<void>::error(selectResult.error());
    }

    m_version = Version::fromBytes(selectResult.value());
    if (!m_version.isValid()) {
        return Result<void>::error(DeviceErrorCodes::withDetail(
            DeviceErrorCodes::COMMUNICATION_ERROR,
            QStringLiteral("OTP applet did not report a firmware version")));
    }

    // Serial may be hidden by device configuration; that is not an error
    const auto serialResult = sendApdu(ManagementProtocol::createReadSerialCommand());
    if (serialResult.isSuccess() && serialResult.value().length() >= 4) {
        m_serial = static_cast<quint32>(Tlv::toUnsigned(serialResult.value().left(4)));
    } else {
        qCDebug(CcidDriverLog) << "Serial number not readable over CCID:"
                               << (serialResult.isError() ? serialResult.error() : QStringLiteral("short response"));
    }

    return Result<void>::success();
}

Result<QByteArray> CcidDriver::readCapabilities()
{
    if (m_version == Version(4, 2, 4)) {
        // This firmware answers with an invalid capability blob
        qCDebug(CcidDriverLog) << "Skipping capability read on firmware 4.2.4";
        return Result<QByteArray>::success(QByteArray());
    }

    const auto selectResult = selectApplet(ManagementProtocol::MGR_AID);
    if (selectResult.isError()) {
        return selectResult;
    }

    return sendApdu(ManagementProtocol::createReadCapabilitiesCommand());
}

Result<Capabilities> CcidDriver::probeCapabilitiesSupport()
{
    Capabilities capabilities = Capability::CCID;

    for (const auto &applet : ManagementProtocol::knownApplets()) {
        const auto response = transmit(ManagementProtocol::createSelectCommand(applet.first));
        if (response.isError()) {
            return Result<Capabilities>::error(response.error());
        }

        const quint16 sw = ManagementProtocol::getStatusWord(response.value());
        if (ManagementProtocol::isSuccess(sw)) {
            capabilities |= applet.second;
        } else {
            qCDebug(CcidDriverLog) << "Applet" << applet.first.toHex() << "not selectable, SW:"
                                   << Qt::hex << Qt::showbase << sw;
        }
    }

    qCDebug(CcidDriverLog) << "Probed capabilities:" << capabilitiesToString(capabilities);
    return Result<Capabilities>::success(capabilities);
}

Result<void> CcidDriver::setMode(quint8 modeByte, quint8 crTimeout, quint16 autoejectTime)
{
    const auto selectResult = selectApplet(ManagementProtocol::setModeApplet(m_version));
    if (selectResult.isError()) {
        return Result<void>::error(selectResult.error());
    }

    const auto response = sendApdu(ManagementProtocol::createSetModeCommand(
        m_version, modeByte, crTimeout, autoejectTime));
    if (response.isError()) {
        return Result<void>::error(response.error());
    }

    return Result<void>::success();
}

Result<QByteArray> CcidDriver::selectApplet(const QByteArray &aid)
{
    return sendApdu(ManagementProtocol::createSelectCommand(aid));
}

Result<QByteArray> CcidDriver::sendApdu(const QByteArray &command)
{
    const auto response = transmit(command);
    if (response.isError()) {
        return response;
    }

    const quint16 sw = ManagementProtocol::getStatusWord(response.value());
    if (!ManagementProtocol::isSuccess(sw)) {
        return Result<QByteArray>::error(DeviceErrorCodes::withDetail(
            DeviceErrorCodes::COMMUNICATION_ERROR,
            QStringLiteral("APDU %1 failed with SW %2")
                .arg(QString::fromLatin1(command.left(4).toHex()))
                .arg(sw, 4, 16, QLatin1Char('0'))));
    }

    return Result<QByteArray>::success(ManagementProtocol::responseData(response.value()));
}

Result<QByteArray> CcidDriver::transmit(const QByteArray &command)
{
    if (m_cardHandle == 0) {
        return Result<QByteArray>::error(DeviceErrorCodes::withDetail(
            DeviceErrorCodes::NO_DRIVER, QStringLiteral("card handle is closed")));
    }

    qCDebug(CcidDriverLog) << "Transmitting APDU:" << command.toHex();

    SCARD_IO_REQUEST pioSendPci;
    pioSendPci.dwProtocol = m_protocol;
    pioSendPci.cbPciLength = sizeof(SCARD_IO_REQUEST);

    BYTE response[4096]; // NOLINT(cppcoreguidelines-avoid-c-arrays) - PC/SC API requirement
    DWORD responseLen = sizeof(response);

    const LONG result = SCardTransmit(m_cardHandle, &pioSendPci,
                                      reinterpret_cast<const BYTE *>(command.constData()),
                                      static_cast<DWORD>(command.length()),
                                      nullptr, static_cast<BYTE *>(response), &responseLen); // NOLINT(cppcoreguidelines-pro-bounds-array-to-pointer-decay)

    if (result != SCARD_S_SUCCESS) {
        qCWarning(CcidDriverLog) << "SCardTransmit failed:" << QString::number(result, 16);
        return Result<QByteArray>::error(pcscError("SCardTransmit", result));
    }

    const QByteArray data(reinterpret_cast<const char *>(response), static_cast<int>(responseLen));
    qCDebug(CcidDriverLog) << "Response:" << data.toHex();
    return Result<QByteArray>::success(data);
}

} // namespace Device
} // namespace YubiKeyManager

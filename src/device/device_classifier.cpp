/*
 * SPDX-FileCopyrightText: 2024 YubiKey KRunner Plugin Contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "device_classifier.h"
#include "device_error_codes.h"
#include "logging_categories.h"
#include "drivers/driver.h"
#include "protocol/tlv.h"

#include <QDebug>

namespace YubiKeyManager {
namespace Device {

namespace {
const QString SECURITY_KEY_NAME = QStringLiteral("Security Key by Yubico");
const QString YUBIKEY_4_NAME = QStringLiteral("YubiKey 4");
const QString YUBIKEY_EDGE_NAME = QStringLiteral("YubiKey Edge");
const QString YUBIKEY_PLUS_NAME = QStringLiteral("YubiKey Plus");
const QString YUBIKEY_NEO_NAME = QStringLiteral("YubiKey NEO");
const QString YUBIKEY_NAME = QStringLiteral("YubiKey");

// Capability mask reported by the YubiKey Edge, which has no use for CCID
constexpr Capabilities EDGE_REPORTED_CAPABILITIES = TRANSPORT_CAPABILITIES;

Capabilities capabilitiesFromBytes(const QByteArray &bytes)
{
    return Capabilities::fromInt(static_cast<int>(Tlv::toUnsigned(bytes)));
}
} // namespace

const QList<DeviceClassifier::Rule> &DeviceClassifier::rules()
{
    static const QList<Rule> ruleList = {
        {SECURITY_KEY_NAME,
         [](const Driver &driver) {
             return driver.transport() == Transport::U2F && driver.isSecurityKey();
         },
         [](Driver &) {
             Draft draft;
             draft.deviceName = SECURITY_KEY_NAME;
             draft.capabilities = Capability::U2F;
             return Result<Draft>::success(draft);
         }},
        {YUBIKEY_4_NAME,
         [](const Driver &driver) { return driver.version() >= Version(4, 1, 0); },
         &DeviceClassifier::classifyYubiKey4},
        {YUBIKEY_PLUS_NAME,
         [](const Driver &driver) { return driver.version() >= Version(4, 0, 0); },
         [](Driver &) {
             Draft draft;
             draft.deviceName = YUBIKEY_PLUS_NAME;
             draft.capabilities = Capability::OTP | Capability::U2F;
             return Result<Draft>::success(draft);
         }},
        {YUBIKEY_NEO_NAME,
         [](const Driver &driver) { return driver.version() >= Version(3, 0, 0); },
         &DeviceClassifier::classifyNeo},
        {YUBIKEY_NAME,
         [](const Driver &) { return true; },
         [](Driver &) {
             Draft draft;
             draft.deviceName = YUBIKEY_NAME;
             draft.capabilities = Capability::OTP;
             return Result<Draft>::success(draft);
         }},
    };
    return ruleList;
}

Result<DeviceClassification> DeviceClassifier::classify(Driver *driver)
{
    if (driver == nullptr) {
        return Result<DeviceClassification>::error(DeviceErrorCodes::withDetail(
            DeviceErrorCodes::NO_DRIVER, QStringLiteral("cannot classify without a driver")));
    }

    for (const Rule &rule : rules()) {
        if (!rule.matches(*driver)) {
            continue;
        }

        qCDebug(DeviceClassifierLog) << "Matched rule" << rule.name << "for firmware"
                                     << driver->version().toString() << "over"
                                     << transportName(driver->transport());

        const auto draft = rule.apply(*driver);
        if (draft.isError()) {
            qCWarning(DeviceClassifierLog) << "Classification failed:" << draft.error();
            return Result<DeviceClassification>::error(draft.error());
        }

        DeviceClassification classification;
        classification.deviceName = draft.value().deviceName;
        classification.capabilities = draft.value().capabilities;
        classification.serial = draft.value().serial;
        classification.enabled = draft.value().enabled.value_or(
            defaultEnabled(classification.capabilities, driver->mode()));
        classification.enabled &= classification.capabilities;

        qCDebug(DeviceClassifierLog) << classification.deviceName << "capabilities"
                                     << capabilitiesToString(classification.capabilities)
                                     << "enabled" << capabilitiesToString(classification.enabled);
        return Result<DeviceClassification>::success(classification);
    }

    // Unreachable, the last rule always matches
    return Result<DeviceClassification>::error(DeviceErrorCodes::withDetail(
        DeviceErrorCodes::NOT_SUPPORTED, QStringLiteral("no classification rule matched")));
}

Result<CapabilityInfo> DeviceClassifier::parseCapabilities(const QByteArray &blob)
{
    CapabilityInfo info;
    if (blob.isEmpty()) {
        return Result<CapabilityInfo>::success(info);
    }

    const int length = static_cast<quint8>(blob.at(0));
    const auto records = Tlv::parseList(blob.mid(1, length));
    if (records.isError()) {
        return Result<CapabilityInfo>::error(records.error());
    }

    const QMap<quint8, QByteArray> &values = records.value();
    if (values.contains(TAG_CAPABILITIES)) {
        info.capabilities = capabilitiesFromBytes(values.value(TAG_CAPABILITIES));
    }
    if (values.contains(TAG_SERIAL)) {
        info.serial = static_cast<quint32>(Tlv::toUnsigned(values.value(TAG_SERIAL)));
    }
    if (values.contains(TAG_ENABLED)) {
        info.enabled = capabilitiesFromBytes(values.value(TAG_ENABLED));
    }

    return Result<CapabilityInfo>::success(info);
}

Capabilities DeviceClassifier::defaultEnabled(Capabilities capabilities, const Mode &mode)
{
    const Capabilities applications = capabilities & ~TRANSPORT_CAPABILITIES;
    return applications | toCapabilities(mode.transports());
}

Result<DeviceClassifier::Draft> DeviceClassifier::classifyYubiKey4(Driver &driver)
{
    const auto blob = driver.readCapabilities();
    if (blob.isError()) {
        return Result<Draft>::error(blob.error());
    }

    const auto info = parseCapabilities(blob.value());
    if (info.isError()) {
        return Result<Draft>::error(info.error());
    }

    Draft draft;
    draft.deviceName = YUBIKEY_4_NAME;
    draft.capabilities = info.value().capabilities.value_or(Capabilities());
    draft.serial = info.value().serial;
    // Without tag 0x03 every reported capability counts as enabled
    if (!blob.value().isEmpty()) {
        draft.enabled = info.value().enabled.value_or(draft.capabilities);
    }

    if (draft.capabilities == EDGE_REPORTED_CAPABILITIES) {
        draft.deviceName = YUBIKEY_EDGE_NAME;
        draft.capabilities = Capability::OTP | Capability::U2F;
    }

    return Result<Draft>::success(draft);
}

Result<DeviceClassifier::Draft> DeviceClassifier::classifyNeo(Driver &driver)
{
    Draft draft;
    draft.deviceName = YUBIKEY_NEO_NAME;

    if (driver.transport() == Transport::CCID) {
        const auto probed = driver.probeCapabilitiesSupport();
        if (probed.isError()) {
            return Result<Draft>::error(probed.error());
        }
        draft.capabilities = probed.value();
    } else if (driver.mode().hasTransport(Transport::U2F) || driver.version() >= Version(3, 3, 0)) {
        draft.capabilities = Capability::OTP | Capability::U2F | Capability::CCID;
    } else {
        draft.capabilities = Capability::OTP | Capability::CCID;
    }

    return Result<Draft>::success(draft);
}

} // namespace Device
} // namespace YubiKeyManager

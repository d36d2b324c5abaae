/*
 * SPDX-FileCopyrightText: 2024 YubiKey KRunner Plugin Contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#pragma once

#include <QByteArray>
#include <QList>
#include <QString>
#include <functional>
#include <optional>
#include "shared/common/result.h"
#include "shared/types/device_mode.h"

namespace YubiKeyManager {
namespace Device {
using namespace YubiKeyManager::Shared;

class Driver;

/**
 * @brief Identity derived from an open driver
 */
struct DeviceClassification {
    QString deviceName;
    Capabilities capabilities;
    Capabilities enabled;                  ///< Always a subset of capabilities
    std::optional<quint32> serial;         ///< Serial from the capability blob, if any
};

/**
 * @brief Decoded YubiKey 4 capability blob
 */
struct CapabilityInfo {
    std::optional<Capabilities> capabilities;  ///< Tag 0x01
    std::optional<quint32> serial;             ///< Tag 0x02
    std::optional<Capabilities> enabled;       ///< Tag 0x03
};

/**
 * @brief Determines device name and capabilities
 *
 * Classification walks an ordered rule list; the first rule whose predicate
 * matches the driver produces the result:
 *
 * 1. U2F transport and Security Key  -> "Security Key by Yubico"
 * 2. Firmware >= 4.1.0               -> "YubiKey 4" / "YubiKey Edge"
 * 3. Firmware >= 4.0.0               -> "YubiKey Plus"
 * 4. Firmware >= 3.0.0               -> "YubiKey NEO"
 * 5. Anything else                   -> "YubiKey"
 *
 * Devices that don't report an enabled mask get the default computed by
 * defaultEnabled().
 */
class DeviceClassifier
{
public:
    static constexpr quint8 TAG_CAPABILITIES = 0x01;
    static constexpr quint8 TAG_SERIAL = 0x02;
    static constexpr quint8 TAG_ENABLED = 0x03;

    /**
     * @brief Classifies the device behind a driver
     * @param driver Open driver, may perform I/O
     * @return Classification, NO_DRIVER for a null driver, or the error of a
     *         failing capability read/probe or a malformed blob
     */
    static Result<DeviceClassification> classify(Driver *driver);

    /**
     * @brief Decodes a length-prefixed capability blob
     *
     * An empty blob decodes to an empty CapabilityInfo. Bytes beyond the
     * declared length are ignored.
     */
    static Result<CapabilityInfo> parseCapabilities(const QByteArray &blob);

    /**
     * @brief Enabled mask assumed when the device doesn't report one
     *
     * All non-transport capabilities plus the transports of the active mode.
     */
    static Capabilities defaultEnabled(Capabilities capabilities, const Mode &mode);

private:
    DeviceClassifier() = delete;

    struct Draft {
        QString deviceName;
        Capabilities capabilities;
        std::optional<Capabilities> enabled;
        std::optional<quint32> serial;
    };

    struct Rule {
        QString name;
        std::function<bool(const Driver &)> matches;
        std::function<Result<Draft>(Driver &)> apply;
    };

    static const QList<Rule> &rules();

    static Result<Draft> classifyYubiKey4(Driver &driver);
    static Result<Draft> classifyNeo(Driver &driver);
};

} // namespace Device
} // namespace YubiKeyManager

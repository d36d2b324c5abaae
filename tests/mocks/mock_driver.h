/*
 * SPDX-FileCopyrightText: 2024 YubiKey KRunner Plugin Contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#pragma once

#include "device/drivers/driver.h"
#include "device/device_error_codes.h"

#include <QList>
#include <QThread>
#include <memory>

namespace YubiKeyManager {
namespace Device {

/**
 * @brief Scripted Driver for unit tests
 *
 * Identity fields and I/O results are set up front; every I/O call is
 * counted so tests can assert that an operation did (or didn't) reach the
 * driver.
 *
 * Usage:
 * @code
 * auto driver = std::make_unique<MockDriver>(Transport::CCID, Version(4, 3, 1),
 *                                            *Mode::fromCode(6));
 * driver->setCapabilityBlob(QByteArray::fromHex("03010107"));
 * auto device = YubiKeyDevice::create(std::move(driver), factory);
 * @endcode
 */
class MockDriver : public Driver
{
public:
    struct SetModeCall {
        quint8 modeByte;
        quint8 crTimeout;
        quint16 autoejectTime;
    };

    MockDriver(Transport transport, const Version &version, const Mode &mode,
               std::optional<quint32> serial = std::nullopt)
        : m_transport(transport)
        , m_version(version)
        , m_serial(serial)
        , m_capabilities(Result<QByteArray>::success(QByteArray()))
        , m_probe(Result<Capabilities>::success(Capabilities()))
        , m_setModeResult(Result<void>::success())
    {
        m_mode = mode;
    }

    ~MockDriver() override
    {
        if (m_destroyed) {
            *m_destroyed = true;
        }
    }

    Transport transport() const override { return m_transport; }
    Version version() const override { return m_version; }
    std::optional<quint32> serial() const override { return m_serial; }
    bool isSecurityKey() const override { return m_securityKey; }

    Result<QByteArray> readCapabilities() override
    {
        ++m_readCapabilitiesCount;
        return m_capabilities;
    }

    Result<Capabilities> probeCapabilitiesSupport() override
    {
        ++m_probeCount;
        return m_probe;
    }

    Result<void> setMode(quint8 modeByte, quint8 crTimeout, quint16 autoejectTime) override
    {
        if (m_setModeDelayMs > 0) {
            // Simulates a device waiting for touch
            QThread::msleep(static_cast<unsigned long>(m_setModeDelayMs));
        }
        m_setModeCalls.append({modeByte, crTimeout, autoejectTime});
        return m_setModeResult;
    }

    // Test control methods
    void setSecurityKey(bool securityKey) { m_securityKey = securityKey; }
    void setCapabilityBlob(const QByteArray &blob) { m_capabilities = Result<QByteArray>::success(blob); }
    void setCapabilityError(const QString &error) { m_capabilities = Result<QByteArray>::error(error); }
    void setProbeResult(Capabilities capabilities) { m_probe = Result<Capabilities>::success(capabilities); }
    void setProbeError(const QString &error) { m_probe = Result<Capabilities>::error(error); }
    void setSetModeError(const QString &error) { m_setModeResult = Result<void>::error(error); }
    void setSetModeDelay(int delayMs) { m_setModeDelayMs = delayMs; }

    /**
     * @brief Flag set to true when the driver is destroyed
     */
    void trackDestruction(std::shared_ptr<bool> destroyed) { m_destroyed = std::move(destroyed); }

    // Inspection methods
    int readCapabilitiesCount() const { return m_readCapabilitiesCount; }
    int probeCount() const { return m_probeCount; }
    QList<SetModeCall> setModeCalls() const { return m_setModeCalls; }
    int ioCount() const { return m_readCapabilitiesCount + m_probeCount + m_setModeCalls.size(); }

private:
    Transport m_transport;
    Version m_version;
    std::optional<quint32> m_serial;
    bool m_securityKey = false;

    Result<QByteArray> m_capabilities;
    Result<Capabilities> m_probe;
    Result<void> m_setModeResult;

    int m_readCapabilitiesCount = 0;
    int m_probeCount = 0;
    int m_setModeDelayMs = 0;
    QList<SetModeCall> m_setModeCalls;
    std::shared_ptr<bool> m_destroyed;
};

} // namespace Device
} // namespace YubiKeyManager

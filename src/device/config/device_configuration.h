/*
 * SPDX-FileCopyrightText: 2024 YubiKey KRunner Plugin Contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#pragma once

#include "shared/config/configuration_provider.h"
#include "shared/config/configuration_keys.h"
#include <QString>
#include <KSharedConfig>
#include <KConfigGroup>
#include <QFileSystemWatcher>
#include <QObject>

namespace YubiKeyManager {
namespace Device {

/**
 * @brief Configuration reader for the device tools
 *
 * Reads settings from the ykdevicerc file and reloads them when the file
 * changes on disk.
 *
 * @note Inherits from both QObject (for signals) and ConfigurationProvider (pure interface)
 */
class DeviceConfiguration : public QObject, public Shared::ConfigurationProvider
{
    Q_OBJECT

public:
    explicit DeviceConfiguration(QObject *parent = nullptr);

    /**
     * @brief Uses an already opened config, e.g. a file in a test directory
     */
    explicit DeviceConfiguration(KSharedConfig::Ptr config, QObject *parent = nullptr);

    /**
     * @brief Reloads configuration from file
     */
    void reload() override;

    Shared::Transports discoveryTransports() const override;
    int touchPromptDelay() const override;
    int challengeResponseTimeout() const override;
    std::optional<int> autoEjectTimeout() const override;

Q_SIGNALS:
    /**
     * @brief Emitted when configuration has been reloaded
     */
    void configurationChanged();

private Q_SLOTS:
    void onConfigFileChanged(const QString &path);

private:
    void watchConfigFile();

    KSharedConfig::Ptr m_config;
    KConfigGroup m_configGroup;
    QFileSystemWatcher *m_fileWatcher;

    template<typename T>
    T readConfigEntry(const char* key, const T& defaultValue) const {
        return m_configGroup.readEntry(key, defaultValue);
    }
};

} // namespace Device
} // namespace YubiKeyManager

/*
 * SPDX-FileCopyrightText: 2024 YubiKey KRunner Plugin Contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "device_configuration.h"
#include "../logging_categories.h"
#include <QStandardPaths>
#include <QFile>
#include <QDebug>

namespace YubiKeyManager {
namespace Device {
using namespace YubiKeyManager::Shared;

namespace {
const QString DEFAULT_TRANSPORTS = QStringLiteral("CCID+OTP+U2F");
constexpr int DEFAULT_TOUCH_PROMPT_DELAY = 500;
constexpr int MAX_CR_TIMEOUT = 255;
constexpr int MAX_AUTOEJECT_TIMEOUT = 0xFFFF;
} // namespace

DeviceConfiguration::DeviceConfiguration(QObject *parent)
    : DeviceConfiguration(KSharedConfig::openConfig(QString::fromLatin1(ConfigKeys::CONFIG_FILE)), parent)
{
}

DeviceConfiguration::DeviceConfiguration(KSharedConfig::Ptr config, QObject *parent)
    : QObject(parent)
    , m_config(std::move(config))
    , m_configGroup(m_config->group(QString::fromLatin1(ConfigKeys::GENERAL_GROUP)))
    , m_fileWatcher(new QFileSystemWatcher(this))
{
    watchConfigFile();

    connect(m_fileWatcher, &QFileSystemWatcher::fileChanged,
            this, &DeviceConfiguration::onConfigFileChanged);
}

void DeviceConfiguration::watchConfigFile()
{
    QString configPath = m_config->name();
    if (!configPath.startsWith(QLatin1Char('/'))) {
        configPath = QStandardPaths::writableLocation(QStandardPaths::GenericConfigLocation)
                     + QLatin1Char('/') + configPath;
    }

    qCDebug(DeviceConfigLog) << "Watching config file:" << configPath;

    // Watch config file for changes
    if (QFile::exists(configPath)) {
        m_fileWatcher->addPath(configPath);
    }
}

void DeviceConfiguration::reload()
{
    m_config->reparseConfiguration();
    m_configGroup = m_config->group(QString::fromLatin1(ConfigKeys::GENERAL_GROUP));
    Q_EMIT configurationChanged();
}

Transports DeviceConfiguration::discoveryTransports() const
{
    const QString value = readConfigEntry(ConfigKeys::TRANSPORTS, DEFAULT_TRANSPORTS);
    const auto mode = Mode::fromString(value);
    if (!mode) {
        qCWarning(DeviceConfigLog) << "Invalid" << ConfigKeys::TRANSPORTS << "value" << value
                                   << "- using" << DEFAULT_TRANSPORTS;
        return ALL_TRANSPORTS;
    }
    return mode->transports();
}

int DeviceConfiguration::touchPromptDelay() const
{
    const int delay = readConfigEntry(ConfigKeys::TOUCH_PROMPT_DELAY, DEFAULT_TOUCH_PROMPT_DELAY);
    return qMax(0, delay);
}

int DeviceConfiguration::challengeResponseTimeout() const
{
    const int timeout = readConfigEntry(ConfigKeys::CHALLENGE_RESPONSE_TIMEOUT, 0);
    return qBound(0, timeout, MAX_CR_TIMEOUT);
}

std::optional<int> DeviceConfiguration::autoEjectTimeout() const
{
    const int timeout = readConfigEntry(ConfigKeys::AUTO_EJECT_TIMEOUT, -1);
    if (timeout < 0) {
        return std::nullopt;
    }
    return qMin(timeout, MAX_AUTOEJECT_TIMEOUT);
}

void DeviceConfiguration::onConfigFileChanged(const QString &path)
{
    qCDebug(DeviceConfigLog) << "Config file changed:" << path;

    // Reload configuration from file
    reload();

    // Re-add file to watch list (QFileSystemWatcher removes it after change on some systems)
    if (!m_fileWatcher->files().contains(path) && QFile::exists(path)) {
        m_fileWatcher->addPath(path);
    }
}

} // namespace Device
} // namespace YubiKeyManager

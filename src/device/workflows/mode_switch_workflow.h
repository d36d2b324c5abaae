/*
 * SPDX-FileCopyrightText: 2024 YubiKey KRunner Plugin Contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#pragma once

#include <QObject>
#include <QString>
#include <memory>
#include <optional>
#include "shared/common/result.h"
#include "shared/config/configuration_provider.h"
#include "shared/types/device_mode.h"

namespace YubiKeyManager {
namespace Device {

class TouchPrompt;
class YubiKeyDevice;

/**
 * @brief Programs a device mode while prompting for touch
 *
 * The blocking driver command runs on a worker thread; the calling thread
 * spins a local event loop so the touch prompt timer can fire. Timeouts not
 * given explicitly come from the configuration.
 *
 * Flow:
 * 1. Arm TouchPrompt with the configured delay
 * 2. Run YubiKeyDevice::setMode() in the background
 * 3. Disarm the prompt and return the command's result
 */
class ModeSwitchWorkflow : public QObject
{
    Q_OBJECT

public:
    /**
     * @param config Configuration provider (not owned, must outlive the workflow)
     */
    explicit ModeSwitchWorkflow(const Shared::ConfigurationProvider *config, QObject *parent = nullptr);
    ~ModeSwitchWorkflow() override;

    /**
     * @brief Programs the mode with configured timeouts
     */
    Shared::Result<void> run(const std::shared_ptr<YubiKeyDevice> &device, const Shared::Mode &mode);

    /**
     * @brief Programs the mode with explicit timeouts
     * @param autoejectTime Touch-eject time; std::nullopt disables touch-eject
     */
    Shared::Result<void> run(const std::shared_ptr<YubiKeyDevice> &device, const Shared::Mode &mode,
                             quint8 crTimeout, std::optional<quint16> autoejectTime);

Q_SIGNALS:
    /**
     * @brief Emitted when the user should touch the key
     */
    void touchRequested(const QString &message);

private:
    const Shared::ConfigurationProvider *m_config;
    TouchPrompt *m_touchPrompt;
};

} // namespace Device
} // namespace YubiKeyManager

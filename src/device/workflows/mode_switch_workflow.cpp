/*
 * SPDX-FileCopyrightText: 2024 YubiKey KRunner Plugin Contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "mode_switch_workflow.h"
#include "touch_prompt.h"
#include "../yubikey_device.h"
#include "../device_error_codes.h"
#include "../logging_categories.h"

#include <QDebug>
#include <QEventLoop>
#include <QFutureWatcher>
#include <QtConcurrent>

namespace YubiKeyManager {
namespace Device {
using namespace YubiKeyManager::Shared;

ModeSwitchWorkflow::ModeSwitchWorkflow(const ConfigurationProvider *config, QObject *parent)
    : QObject(parent)
    , m_config(config)
    , m_touchPrompt(new TouchPrompt(this))
{
    connect(m_touchPrompt, &TouchPrompt::promptRequested, this, &ModeSwitchWorkflow::touchRequested);
}

ModeSwitchWorkflow::~ModeSwitchWorkflow() = default;

Result<void> ModeSwitchWorkflow::run(const std::shared_ptr<YubiKeyDevice> &device, const Mode &mode)
{
    std::optional<quint16> autoejectTime;
    if (const auto configured = m_config->autoEjectTimeout()) {
        autoejectTime = static_cast<quint16>(*configured);
    }

    return run(device, mode, static_cast<quint8>(m_config->challengeResponseTimeout()), autoejectTime);
}

Result<void> ModeSwitchWorkflow::run(const std::shared_ptr<YubiKeyDevice> &device, const Mode &mode,
                                     quint8 crTimeout, std::optional<quint16> autoejectTime)
{
    if (!device) {
        return Result<void>::error(DeviceErrorCodes::withDetail(
            DeviceErrorCodes::NO_DRIVER, QStringLiteral("no device to program")));
    }

    qCDebug(TouchPromptLog) << "ModeSwitchWorkflow: Programming" << mode.toString()
                            << "on" << device->deviceName();

    QEventLoop loop;
    QFutureWatcher<Result<void>> watcher;
    connect(&watcher, &QFutureWatcher<Result<void>>::finished, &loop, &QEventLoop::quit);

    m_touchPrompt->start(m_config->touchPromptDelay(), QStringLiteral("set mode %1").arg(mode.toString()));

    // === BLOCKING DEVICE COMMAND (background thread) ===
    watcher.setFuture(QtConcurrent::run([device, mode, crTimeout, autoejectTime]() -> Result<void> {
        return device->setMode(mode, crTimeout, autoejectTime);
    }));
    loop.exec();

    m_touchPrompt->finish();
    return watcher.result();
}

} // namespace Device
} // namespace YubiKeyManager

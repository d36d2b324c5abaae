/*
 * SPDX-FileCopyrightText: 2024 YubiKey KRunner Plugin Contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "touch_prompt.h"
#include "../logging_categories.h"
#include <QDebug>
#include <KLocalizedString>

namespace YubiKeyManager {
namespace Device {

TouchPrompt::TouchPrompt(QObject *parent)
    : QObject(parent)
    , m_promptTimer(new QTimer(this))
{
    m_promptTimer->setSingleShot(true);
    connect(m_promptTimer, &QTimer::timeout, this, &TouchPrompt::onTimeout);
}

void TouchPrompt::start(int delayMs, const QString &operation)
{
    qCDebug(TouchPromptLog) << "Arming touch prompt for" << operation << "delay:" << delayMs;

    m_operation = operation;
    m_prompted = false;
    m_promptTimer->start(qMax(0, delayMs));
}

void TouchPrompt::finish()
{
    if (m_promptTimer->isActive()) {
        qCDebug(TouchPromptLog) << "Operation finished before prompt:" << m_operation;
    }

    m_promptTimer->stop();
    m_operation.clear();
}

bool TouchPrompt::isActive() const
{
    return m_promptTimer->isActive();
}

QString TouchPrompt::promptMessage()
{
    return i18n("Touch your YubiKey...");
}

void TouchPrompt::onTimeout()
{
    qCDebug(TouchPromptLog) << "Prompting user to touch YubiKey for" << m_operation;

    m_prompted = true;
    Q_EMIT promptRequested(promptMessage());
}

} // namespace Device
} // namespace YubiKeyManager

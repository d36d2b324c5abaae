/*
 * SPDX-FileCopyrightText: 2024 YubiKey KRunner Plugin Contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#pragma once

#include <QObject>
#include <QString>
#include <QTimer>

namespace YubiKeyManager {
namespace Device {

/**
 * @brief Asks the user to touch the key when an operation blocks too long
 *
 * start() arms a single-shot timer; if the operation hasn't finished when it
 * fires, promptRequested() is emitted once. finish() disarms the timer.
 */
class TouchPrompt : public QObject
{
    Q_OBJECT

public:
    explicit TouchPrompt(QObject *parent = nullptr);
    ~TouchPrompt() override = default;

    /**
     * @brief Arms the prompt
     * @param delayMs Delay before prompting in milliseconds
     * @param operation Description used in logs
     */
    void start(int delayMs, const QString &operation = QString());

    /**
     * @brief Disarms the prompt; no signal is emitted afterwards
     */
    void finish();

    /**
     * @brief Whether the prompt is armed
     */
    bool isActive() const;

    /**
     * @brief Whether the prompt was shown since the last start()
     */
    bool wasPrompted() const { return m_prompted; }

    static QString promptMessage();

Q_SIGNALS:
    /**
     * @brief Emitted when the delay expired before finish()
     * @param message Text to show to the user
     */
    void promptRequested(const QString &message);

private Q_SLOTS:
    void onTimeout();

private:
    QTimer *m_promptTimer;
    QString m_operation;
    bool m_prompted = false;
};

} // namespace Device
} // namespace YubiKeyManager

/*
 * SPDX-FileCopyrightText: 2024 YubiKey KRunner Plugin Contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "device/workflows/touch_prompt.h"
#include <QSignalSpy>
#include <QTest>

using namespace YubiKeyManager::Device;

/**
 * @brief Unit tests for TouchPrompt
 *
 * Tests prompt timer management and state tracking
 */
class TestTouchPrompt : public QObject
{
    Q_OBJECT

private Q_SLOTS:
    void cleanup();

    void testStart_Arms();
    void testFinish_Disarms();
    void testTimeout_EmitsPromptOnce();
    void testFinishBeforeTimeout_NoSignal();
    void testRestart_ResetsPromptedState();

private:
    TouchPrompt *m_prompt = nullptr;
};

void TestTouchPrompt::cleanup()
{
    delete m_prompt;
    m_prompt = nullptr;
}

void TestTouchPrompt::testStart_Arms()
{
    m_prompt = new TouchPrompt(this);
    QVERIFY(!m_prompt->isActive());

    m_prompt->start(1000, QStringLiteral("set mode"));

    QVERIFY(m_prompt->isActive());
    QVERIFY(!m_prompt->wasPrompted());
}

void TestTouchPrompt::testFinish_Disarms()
{
    m_prompt = new TouchPrompt(this);
    m_prompt->start(1000);

    m_prompt->finish();

    QVERIFY(!m_prompt->isActive());
}

void TestTouchPrompt::testTimeout_EmitsPromptOnce()
{
    m_prompt = new TouchPrompt(this);
    QSignalSpy spy(m_prompt, &TouchPrompt::promptRequested);

    m_prompt->start(50, QStringLiteral("set mode"));

    QVERIFY(spy.wait(1000));
    QCOMPARE(spy.count(), 1);
    QCOMPARE(spy.at(0).at(0).toString(), TouchPrompt::promptMessage());
    QVERIFY(m_prompt->wasPrompted());
    QVERIFY(!m_prompt->isActive());

    // Single shot
    QTest::qWait(150);
    QCOMPARE(spy.count(), 1);
}

void TestTouchPrompt::testFinishBeforeTimeout_NoSignal()
{
    m_prompt = new TouchPrompt(this);
    QSignalSpy spy(m_prompt, &TouchPrompt::promptRequested);

    m_prompt->start(100);
    QTest::qWait(20);
    m_prompt->finish();

    QTest::qWait(200);
    QCOMPARE(spy.count(), 0);
    QVERIFY(!m_prompt->wasPrompted());
}

void TestTouchPrompt::testRestart_ResetsPromptedState()
{
    m_prompt = new TouchPrompt(this);
    QSignalSpy spy(m_prompt, &TouchPrompt::promptRequested);

    m_prompt->start(10);
    QVERIFY(spy.wait(1000));
    QVERIFY(m_prompt->wasPrompted());

    m_prompt->start(1000);
    QVERIFY(!m_prompt->wasPrompted());
    m_prompt->finish();
}

QTEST_GUILESS_MAIN(TestTouchPrompt)
#include "test_touch_prompt.moc"

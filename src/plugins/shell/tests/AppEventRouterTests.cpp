// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include <gtest/gtest.h>

#include "ShellTestSupport.hpp"

#include "shell/AppEventRouter.hpp"

#include <QtGui/QFileOpenEvent>
#include <QtTest/QSignalSpy>

using Shell::AppEventRouter;

TEST(AppEventRouterTests, FileOpenWithUrlBecomesActivation)
{
    ShellTest::ensureApp();
    QObject source;
    AppEventRouter router(&source);
    QSignalSpy opened(&router, &AppEventRouter::urlsOpened);

    QFileOpenEvent urlEvent(QUrl("plutoduck://auth/callback?code=abc"));
    QCoreApplication::sendEvent(&source, &urlEvent);
    ASSERT_EQ(opened.count(), 1);
    EXPECT_EQ(opened.at(0).at(0).toStringList(), QStringList{"plutoduck://auth/callback?code=abc"});

    QFileOpenEvent fileEvent(QUrl::fromLocalFile("/tmp/report.csv"));
    QCoreApplication::sendEvent(&source, &fileEvent);
    EXPECT_EQ(opened.count(), 1);
}

TEST(AppEventRouterTests, FileOpenKeepsQuotesAndBackslashesUnencoded)
{
    ShellTest::ensureApp();
    QObject source;
    AppEventRouter router(&source);
    QSignalSpy opened(&router, &AppEventRouter::urlsOpened);

    const QString link = QStringLiteral(R"(plutoduck://auth/callback?q="hello\world")");
    QFileOpenEvent event{QUrl(link)};
    QCoreApplication::sendEvent(&source, &event);

    ASSERT_EQ(opened.count(), 1);
    EXPECT_EQ(opened.at(0).at(0).toStringList(), QStringList{link});
}

TEST(AppEventRouterTests, ActivationRequestsReopen)
{
    ShellTest::ensureApp();
    QObject source;
    AppEventRouter router(&source);
    QSignalSpy reopen(&router, &AppEventRouter::reopenRequested);

    QApplicationStateChangeEvent inactive(Qt::ApplicationInactive);
    QCoreApplication::sendEvent(&source, &inactive);
    EXPECT_EQ(reopen.count(), 0);

    QApplicationStateChangeEvent active(Qt::ApplicationActive);
    QCoreApplication::sendEvent(&source, &active);
    EXPECT_EQ(reopen.count(), 1);
}

TEST(AppEventRouterTests, QuitEventIsAnnounced)
{
    ShellTest::ensureApp();
    QObject source;
    AppEventRouter router(&source);
    QSignalSpy quit(&router, &AppEventRouter::quitRequested);

    QEvent event(QEvent::Quit);
    QCoreApplication::sendEvent(&source, &event);
    EXPECT_EQ(quit.count(), 1);
}

TEST(AppEventRouterTests, ReadyFiresOnFirstEventLoopTurn)
{
    ShellTest::ensureApp();
    QObject source;
    AppEventRouter router(&source);
    QSignalSpy ready(&router, &AppEventRouter::ready);

    router.start();
    router.start();
    EXPECT_FALSE(router.isReady());
    EXPECT_EQ(ready.count(), 0);

    EXPECT_TRUE(ready.wait(1000));
    EXPECT_TRUE(router.isReady());
    EXPECT_EQ(ready.count(), 1);
}

TEST(AppEventRouterTests, IgnoresEventsForOtherObjects)
{
    ShellTest::ensureApp();
    QObject source;
    QObject other;
    AppEventRouter router(&source);
    QSignalSpy opened(&router, &AppEventRouter::urlsOpened);

    other.installEventFilter(&router);
    QFileOpenEvent event(QUrl("plutoduck://auth"));
    QCoreApplication::sendEvent(&other, &event);
    EXPECT_EQ(opened.count(), 0);
}

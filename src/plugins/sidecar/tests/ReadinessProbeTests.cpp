// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include <gtest/gtest.h>

#include "sidecar/ReadinessProbe.hpp"

#include <QtCore/QCoreApplication>
#include <QtCore/QElapsedTimer>
#include <QtNetwork/QHostAddress>
#include <QtNetwork/QTcpServer>

using namespace std::chrono_literals;

namespace {

QCoreApplication* ensureApp()
{
    if (auto* existing = QCoreApplication::instance())
        return existing;
    static int argc = 1;
    static char arg0[] = "sidecar-tests";
    static char* argv[] = { arg0, nullptr };
    return new QCoreApplication(argc, argv);
}

quint16 unusedPort()
{
    QTcpServer probe;
    if (!probe.listen(QHostAddress::LocalHost, 0))
        return 0;
    const quint16 port = probe.serverPort();
    probe.close();
    return port;
}

} // namespace

TEST(ReadinessProbeTests, SucceedsAsSoonAsSomethingListens)
{
    ensureApp();

    QTcpServer server;
    ASSERT_TRUE(server.listen(QHostAddress::LocalHost, 0));

    QElapsedTimer timer;
    timer.start();
    EXPECT_TRUE(Sidecar::waitForServer(QString("127.0.0.1:%1").arg(server.serverPort()), 5s));
    EXPECT_LT(timer.elapsed(), 2000);
}

TEST(ReadinessProbeTests, GivesUpAtTheDeadline)
{
    ensureApp();

    const quint16 port = unusedPort();
    ASSERT_NE(port, 0);

    QElapsedTimer timer;
    timer.start();
    EXPECT_FALSE(Sidecar::waitForServer(QString("127.0.0.1:%1").arg(port), 600ms, {100ms, 50ms}));
    EXPECT_GE(timer.elapsed(), 550);
    EXPECT_LT(timer.elapsed(), 3000);
}

TEST(ReadinessProbeTests, UnparsableEndpointFailsWithoutWaiting)
{
    ensureApp();

    QElapsedTimer timer;
    timer.start();
    EXPECT_FALSE(Sidecar::waitForServer(u"frontend.local:3100", 10s));
    EXPECT_FALSE(Sidecar::waitForServer(u"127.0.0.1:notaport", 10s));
    EXPECT_LT(timer.elapsed(), 1000);
}

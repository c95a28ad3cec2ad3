// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include <gtest/gtest.h>

#include "sidecar/SidecarSupervisor.hpp"

#include <QtCore/QCoreApplication>
#include <QtCore/QDir>
#include <QtCore/QFile>
#include <QtCore/QFileInfo>
#include <QtCore/QTemporaryDir>
#include <QtNetwork/QHostAddress>
#include <QtNetwork/QTcpServer>

using namespace std::chrono_literals;

using Sidecar::ISidecarService;
using Sidecar::SidecarErrorCode;
using Sidecar::SidecarSupervisor;

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

// Packaged-build layout under a scratch directory, with /bin/sh standing in for node.
Sidecar::SidecarContext makeContext(const QTemporaryDir& tmp, quint16 port)
{
    Sidecar::SidecarContext ctx;
    ctx.buildMode = Sidecar::BuildMode::Release;
    ctx.resourceDir = tmp.filePath("resources");
    ctx.appDataDir = tmp.filePath("appdata");
    ctx.tempDir = tmp.filePath("temp");
    ctx.runtimeProgram = "/bin/sh";
    ctx.endpoint = Sidecar::Endpoint{"127.0.0.1", port};
    ctx.readinessTimeout = 600ms;
    ctx.probe = Sidecar::ProbeOptions{100ms, 50ms};
    return ctx;
}

QString serverDir(const QTemporaryDir& tmp)
{
    return tmp.filePath("resources/dist/pluto-duck-frontend-server");
}

bool writeFile(const QString& path, const QByteArray& content)
{
    QFile f(path);
    if (!f.open(QIODevice::WriteOnly | QIODevice::Truncate))
        return false;
    return f.write(content) == content.size();
}

bool writeServerScript(const QTemporaryDir& tmp, const QByteArray& script)
{
    return QDir().mkpath(serverDir(tmp)) && writeFile(QDir(serverDir(tmp)).filePath("server.js"), script);
}

QByteArray readFile(const QString& path)
{
    QFile f(path);
    if (!f.open(QIODevice::ReadOnly))
        return {};
    return f.readAll();
}

bool processAlive(qint64 pid)
{
    return pid > 0 && QFileInfo::exists(QString("/proc/%1").arg(pid));
}

} // namespace

TEST(SidecarSupervisorTests, DevBuildSpawnsNothing)
{
    ensureApp();
    QTemporaryDir tmp;
    ASSERT_TRUE(tmp.isValid());

    auto ctx = makeContext(tmp, 3100);
    ctx.buildMode = Sidecar::BuildMode::Debug;

    SidecarSupervisor supervisor(ctx);
    const auto result = supervisor.launch();
    EXPECT_TRUE(result.ok());
    EXPECT_EQ(supervisor.status(), ISidecarService::Status::Disabled);
    EXPECT_FALSE(supervisor.readinessSettled());
    EXPECT_EQ(supervisor.serverState(), nullptr);
}

TEST(SidecarSupervisorTests, MissingServerDirectoryIsConfigurationMissing)
{
    ensureApp();
    QTemporaryDir tmp;
    ASSERT_TRUE(tmp.isValid());

    SidecarSupervisor supervisor(makeContext(tmp, unusedPort()));
    const auto result = supervisor.launch();
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error().code(), SidecarErrorCode::ConfigurationMissing);
    EXPECT_TRUE(result.error().message().startsWith("node server directory not found in resources"));
    EXPECT_EQ(supervisor.status(), ISidecarService::Status::Failed);
    EXPECT_EQ(supervisor.lastError().code(), SidecarErrorCode::ConfigurationMissing);
}

TEST(SidecarSupervisorTests, MissingEntryFileNamesTheEntryPath)
{
    ensureApp();
    QTemporaryDir tmp;
    ASSERT_TRUE(tmp.isValid());
    ASSERT_TRUE(QDir().mkpath(serverDir(tmp)));

    // Logs are recreated before the entry check, so a stale log is emptied.
    const QString stdoutLog = tmp.filePath("appdata/node-server/logs/node-server-stdout.log");
    ASSERT_TRUE(QDir().mkpath(QFileInfo(stdoutLog).absolutePath()));
    ASSERT_TRUE(writeFile(stdoutLog, "stale output\n"));

    SidecarSupervisor supervisor(makeContext(tmp, unusedPort()));
    const auto result = supervisor.launch();
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error().code(), SidecarErrorCode::ConfigurationMissing);
    EXPECT_EQ(result.error().message(),
              QString("node server entry not found at %1")
                  .arg(QDir::toNativeSeparators(QDir(serverDir(tmp)).filePath("server.js"))));
    EXPECT_EQ(supervisor.serverState(), nullptr);

    EXPECT_TRUE(readFile(stdoutLog).isEmpty());
    EXPECT_TRUE(QFileInfo::exists(tmp.filePath("appdata/node-server/logs/node-server-stderr.log")));
}

TEST(SidecarSupervisorTests, UnstartableRuntimeIsSpawnFailure)
{
    ensureApp();
    QTemporaryDir tmp;
    ASSERT_TRUE(tmp.isValid());
    ASSERT_TRUE(writeServerScript(tmp, "exit 0\n"));

    auto ctx = makeContext(tmp, unusedPort());
    ctx.runtimeProgram = tmp.filePath("no-such-runtime");

    SidecarSupervisor supervisor(ctx);
    const auto result = supervisor.launch();
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error().code(), SidecarErrorCode::SpawnFailure);
    EXPECT_TRUE(result.error().message().startsWith("failed to spawn node server process"));
    EXPECT_EQ(supervisor.status(), ISidecarService::Status::Failed);
}

TEST(SidecarSupervisorTests, TimedOutChildStillRunsWithItsEnvironmentAndLogs)
{
    ensureApp();
    QTemporaryDir tmp;
    ASSERT_TRUE(tmp.isValid());
    ASSERT_TRUE(writeServerScript(tmp,
        "printf '%s|%s|%s\\n' \"$PLUTODUCK_DATA_DIR__ROOT\" \"$HOSTNAME\" \"$PORT\"\n"
        "printf 'booting\\n' >&2\n"
        "exec sleep 30\n"));

    const quint16 port = unusedPort();
    ASSERT_NE(port, 0);

    SidecarSupervisor supervisor(makeContext(tmp, port));
    const auto result = supervisor.launch();
    ASSERT_TRUE(result.ok()) << result.error().toString().toStdString();

    EXPECT_EQ(supervisor.status(), ISidecarService::Status::TimedOut);
    EXPECT_TRUE(supervisor.readinessSettled());
    EXPECT_EQ(supervisor.lastError().code(), SidecarErrorCode::ReadinessTimeout);
    EXPECT_EQ(supervisor.url().toString(), QString("http://127.0.0.1:%1").arg(port));

    const qint64 pid = supervisor.processId();
    ASSERT_GT(pid, 0);
    ASSERT_NE(supervisor.serverState(), nullptr);
    EXPECT_TRUE(supervisor.serverState()->holdsHandle());

    const QString dataRoot = QDir::cleanPath(tmp.filePath("appdata/node-server"));
    EXPECT_EQ(supervisor.config().dataRoot, dataRoot);
    EXPECT_EQ(readFile(supervisor.config().stdoutLog).trimmed(),
              QString("%1|127.0.0.1|%2").arg(QDir::toNativeSeparators(dataRoot)).arg(port).toUtf8());
    EXPECT_EQ(readFile(supervisor.config().stderrLog).trimmed(), QByteArray("booting"));

    supervisor.shutdown();
    EXPECT_EQ(supervisor.status(), ISidecarService::Status::Stopped);
    EXPECT_FALSE(supervisor.serverState()->holdsHandle());
#if defined(Q_OS_LINUX)
    EXPECT_FALSE(processAlive(pid));
#endif

    // Exit already took the child; this must be a no-op.
    supervisor.shutdown();
}

TEST(SidecarSupervisorTests, ReadyWhenPortAcceptsAndDroppingKillsTheChild)
{
    ensureApp();
    QTemporaryDir tmp;
    ASSERT_TRUE(tmp.isValid());
    ASSERT_TRUE(writeServerScript(tmp, "exec sleep 30\n"));

    QTcpServer frontend;
    ASSERT_TRUE(frontend.listen(QHostAddress::LocalHost, 0));

    qint64 pid = 0;
    Sidecar::ServerState state;
    {
        auto ctx = makeContext(tmp, frontend.serverPort());
        ctx.readinessTimeout = 5s;

        SidecarSupervisor supervisor(ctx);
        QList<ISidecarService::Status> transitions;
        QObject::connect(&supervisor, &ISidecarService::statusChanged,
                         [&transitions](ISidecarService::Status s) { transitions.push_back(s); });

        ASSERT_TRUE(supervisor.launch().ok());
        EXPECT_EQ(supervisor.status(), ISidecarService::Status::Ready);
        EXPECT_EQ(transitions,
                  (QList<ISidecarService::Status>{ISidecarService::Status::Running,
                                                  ISidecarService::Status::Ready}));
        pid = supervisor.processId();
        state = supervisor.serverState();
        ASSERT_NE(state, nullptr);
        EXPECT_TRUE(state->holdsHandle());
    }

    EXPECT_FALSE(state->holdsHandle());
#if defined(Q_OS_LINUX)
    EXPECT_FALSE(processAlive(pid));
#endif
}

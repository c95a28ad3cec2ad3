// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include <gtest/gtest.h>

#include "ShellTestSupport.hpp"

#include "shell/ExternalUrlOpener.hpp"

#include <memory>

using Shell::ExternalUrlErrorCode;
using Shell::LaunchCommand;
using Shell::LaunchOutcome;

namespace {

struct LaunchJournal {
    QList<LaunchCommand> commands;
    LaunchOutcome next{true, {}, QProcess::NormalExit, 0};
};

struct RecordingLaunchPolicy {
    std::shared_ptr<LaunchJournal> journal = std::make_shared<LaunchJournal>();

    LaunchOutcome run(const LaunchCommand& command) const
    {
        journal->commands.push_back(command);
        return journal->next;
    }
};

using TestOpener = Shell::BasicExternalUrlOpener<RecordingLaunchPolicy>;

} // namespace

TEST(ExternalUrlOpenerTests, RejectsNonWebSchemesWithoutLaunching)
{
    TestOpener opener;

    for (const QString& input : {QString("ftp://example.com"), QString("javascript:alert(1)"),
                                 QString("file:///etc/passwd"), QString(""), QString("   "),
                                 QString("HTTP://EXAMPLE.COM"), QString("https:/example.com"),
                                 QString("example.com")}) {
        const auto err = opener.open(input);
        EXPECT_EQ(err.code(), ExternalUrlErrorCode::InputRejected) << input.toStdString();
        EXPECT_EQ(err.message(), "Only http(s) URLs are allowed");
    }

    EXPECT_TRUE(opener.policy().journal->commands.isEmpty());
}

TEST(ExternalUrlOpenerTests, LaunchesBrowserWithTrimmedUrl)
{
    TestOpener opener;

    const auto err = opener.open(u"  https://example.com/docs?a=1  ");
    EXPECT_TRUE(err.ok());

    const auto& commands = opener.policy().journal->commands;
    ASSERT_EQ(commands.size(), 1);
    EXPECT_EQ(commands.front().arguments.back(), "https://example.com/docs?a=1");
#if !defined(Q_OS_MACOS) && !defined(Q_OS_WIN)
    EXPECT_EQ(commands.front().program, "xdg-open");
    EXPECT_EQ(commands.front().arguments, QStringList{"https://example.com/docs?a=1"});
#endif

    EXPECT_TRUE(opener.open(u"http://localhost:3100").ok());
    EXPECT_EQ(commands.size(), 2);
}

TEST(ExternalUrlOpenerTests, ReportsLauncherFailures)
{
    TestOpener opener;
    auto& next = opener.policy().journal->next;

    next = LaunchOutcome{false, "No such file or directory", QProcess::NormalExit, 0};
    auto err = opener.open(u"https://example.com");
    EXPECT_EQ(err.code(), ExternalUrlErrorCode::BrowserLaunchFailure);
    EXPECT_EQ(err.message(), "Failed to launch browser: No such file or directory");

    next = LaunchOutcome{true, {}, QProcess::NormalExit, 4};
    err = opener.open(u"https://example.com");
    EXPECT_EQ(err.code(), ExternalUrlErrorCode::BrowserLaunchFailure);
    EXPECT_EQ(err.message(), "Browser command failed with status: exit status: 4");

    next = LaunchOutcome{true, {}, QProcess::CrashExit, 9};
    err = opener.open(u"https://example.com");
    EXPECT_EQ(err.message(), "Browser command failed with status: terminated abnormally");
}

#if defined(Q_OS_UNIX)
TEST(ExternalUrlOpenerTests, QtProcessPolicyWaitsForExitStatus)
{
    ShellTest::ensureApp();

    const Shell::QtProcessLaunchPolicy policy;

    const auto ok = policy.run({"/bin/sh", {"-c", "exit 0"}});
    EXPECT_TRUE(ok.started);
    EXPECT_TRUE(ok.succeeded());

    const auto failed = policy.run({"/bin/sh", {"-c", "exit 3"}});
    EXPECT_TRUE(failed.started);
    EXPECT_EQ(failed.exitCode, 3);
    EXPECT_FALSE(failed.succeeded());

    const auto missing = policy.run({"/nonexistent/launcher", {}});
    EXPECT_FALSE(missing.started);
    EXPECT_FALSE(missing.startError.isEmpty());
}
#endif

// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include <gtest/gtest.h>

#include "ShellTestSupport.hpp"

#include "shell/ShellConstants.hpp"
#include "shell/ShellPlugin.hpp"
#include "shell/ShellWindow.hpp"
#include "shell/WindowRegistry.hpp"

#include <extensionsystem/PluginManager.hpp>

#include <QtCore/QEvent>
#include <QtCore/QTimer>

using ExtensionSystem::PluginManager;

namespace {

class ShellPluginTests : public ::testing::Test
{
protected:
    void SetUp() override
    {
        ShellTest::ensureApp();
        PluginManager::reset();
    }
};

} // namespace

TEST_F(ShellPluginTests, PublishesRegistryWithBridgedMainWindow)
{
    auto journal = std::make_shared<ShellTest::SurfaceJournal>();
    Shell::ShellPlugin plugin(ShellTest::fakeFactory(journal));
    ASSERT_TRUE(plugin.initialize({}, PluginManager::instance()));

    auto* registry = PluginManager::getObject<Shell::WindowRegistry>();
    ASSERT_NE(registry, nullptr);
    ASSERT_NE(registry->mainWindow(), nullptr);
    EXPECT_EQ(registry->mainWindow()->id(), QString::fromLatin1(Shell::Constants::MAIN_WINDOW_ID));
    EXPECT_EQ(journal->registeredNames, QStringList{QString::fromLatin1(Shell::Constants::BRIDGE_OBJECT_NAME)});

    plugin.aboutToShutdown();
    EXPECT_EQ(PluginManager::getObject<Shell::WindowRegistry>(), nullptr);
}

TEST_F(ShellPluginTests, QuitEventClosesWindowsInsteadOfHidingThem)
{
    auto journal = std::make_shared<ShellTest::SurfaceJournal>();
    Shell::ShellPlugin plugin(ShellTest::fakeFactory(journal));
    ASSERT_TRUE(plugin.initialize({}, PluginManager::instance()));
    plugin.extensionsInitialized(PluginManager::instance());

    auto* registry = PluginManager::getObject<Shell::WindowRegistry>();
    ASSERT_NE(registry, nullptr);
    Shell::ShellWindow* window = registry->shellWindow(QString::fromLatin1(Shell::Constants::MAIN_WINDOW_ID));
    ASSERT_NE(window, nullptr);
    ASSERT_TRUE(window->isVisible());

    // A plain close is vetoed and only hides.
    EXPECT_FALSE(window->close());
    EXPECT_FALSE(window->isVisible());
    window->show();
    ASSERT_TRUE(window->isVisible());

    // If a window vetoes the quit, the loop keeps running until the watchdog stops it with 1.
    QTimer watchdog;
    watchdog.setSingleShot(true);
    QObject::connect(&watchdog, &QTimer::timeout, [] { QCoreApplication::exit(1); });
    watchdog.start(5000);
    QTimer::singleShot(0, QCoreApplication::instance(), [] {
        QCoreApplication::postEvent(QCoreApplication::instance(), new QEvent(QEvent::Quit));
    });

    const int rc = QApplication::exec();
    watchdog.stop();

    EXPECT_EQ(rc, 0);
    EXPECT_FALSE(window->isVisible());
    EXPECT_FALSE(window->closeHides());

    plugin.aboutToShutdown();
}

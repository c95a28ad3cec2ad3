// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include <gtest/gtest.h>

#include "shell/ShellBridge.hpp"

#include <QtCore/QMetaObject>

using Shell::ExternalUrlError;
using Shell::ExternalUrlErrorCode;
using Shell::ShellBridge;

TEST(ShellBridgeTests, SuccessIsReportedAsOk)
{
    QStringList seen;
    ShellBridge bridge([&seen](QStringView url) {
        seen.push_back(url.toString());
        return ExternalUrlError::none();
    });

    const QVariantMap result = bridge.open_external_url("https://pluto.example/login");
    EXPECT_EQ(result.value("ok").toBool(), true);
    EXPECT_FALSE(result.contains("error"));
    EXPECT_EQ(seen, QStringList{"https://pluto.example/login"});
    EXPECT_EQ(bridge.objectName(), "plutoShell");
}

TEST(ShellBridgeTests, FailureCarriesTheMessage)
{
    ShellBridge bridge([](QStringView) {
        return ExternalUrlError(ExternalUrlErrorCode::InputRejected, "Only http(s) URLs are allowed");
    });

    const QVariantMap result = bridge.open_external_url("mailto:someone@example.com");
    EXPECT_EQ(result.value("ok").toBool(), false);
    EXPECT_EQ(result.value("error").toString(), "Only http(s) URLs are allowed");
}

TEST(ShellBridgeTests, CommandIsReachableThroughTheMetaObject)
{
    ShellBridge bridge;

    // Rejected before any launcher runs, so this never opens a browser.
    QVariantMap result;
    ASSERT_TRUE(QMetaObject::invokeMethod(&bridge, "open_external_url",
                                          Q_RETURN_ARG(QVariantMap, result),
                                          Q_ARG(QString, QString("ftp://files.example"))));
    EXPECT_EQ(result.value("ok").toBool(), false);
    EXPECT_EQ(result.value("error").toString(), "Only http(s) URLs are allowed");
}

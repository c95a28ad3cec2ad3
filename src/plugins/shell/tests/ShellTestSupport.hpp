// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "shell/WebSurface.hpp"

#include <QtCore/QPointer>
#include <QtCore/QStringList>
#include <QtWidgets/QApplication>
#include <QtWidgets/QWidget>

#include <memory>

namespace ShellTest {

inline QApplication* ensureApp()
{
    if (auto* existing = qobject_cast<QApplication*>(QCoreApplication::instance()))
        return existing;
    if (qEnvironmentVariableIsEmpty("QT_QPA_PLATFORM"))
        qputenv("QT_QPA_PLATFORM", "offscreen");
    static int argc = 1;
    static char arg0[] = "shell-tests";
    static char* argv[] = { arg0, nullptr };
    return new QApplication(argc, argv);
}

// What a fake surface saw; outlives the surface so tests can inspect it after the window is gone.
struct SurfaceJournal {
    QList<QUrl> loads;
    QStringList scripts;
    QStringList registeredNames;
};

class FakeWebSurface final : public Shell::WebSurface
{
public:
    FakeWebSurface(QWidget* parent, std::shared_ptr<SurfaceJournal> journal)
        : m_widget(new QWidget(parent))
        , m_journal(std::move(journal))
    {}

    QWidget* widget() const override { return m_widget; }

    void load(const QUrl& url) override
    {
        m_url = url;
        m_journal->loads.push_back(url);
    }

    QUrl url() const override { return m_url; }

    void runJavaScript(const QString& script) override
    {
        m_journal->scripts.push_back(script);
    }

    void registerObject(const QString& name, QObject*) override
    {
        m_journal->registeredNames.push_back(name);
    }

private:
    QPointer<QWidget> m_widget;
    std::shared_ptr<SurfaceJournal> m_journal;
    QUrl m_url;
};

inline Shell::WebSurfaceFactory fakeFactory(const std::shared_ptr<SurfaceJournal>& journal)
{
    return [journal](QWidget* parent) -> std::unique_ptr<Shell::WebSurface> {
        return std::make_unique<FakeWebSurface>(parent, journal);
    };
}

} // namespace ShellTest

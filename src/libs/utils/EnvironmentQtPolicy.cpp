// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "utils/EnvironmentQtPolicy.hpp"

#include <QtCore/QCoreApplication>
#include <QtCore/QDir>
#include <QtCore/QStandardPaths>

namespace Utils {

EnvironmentPaths QtEnvironmentPersistencePolicy::resolvePaths(const EnvironmentConfig& cfg) const
{
    EnvironmentPaths out;

    // The platform location already carries organization and application names.
    const QString globalBase =
        !cfg.globalConfigRootOverride.isEmpty()
            ? QDir(cfg.globalConfigRootOverride).filePath(cfg.applicationName.isEmpty()
                                                              ? QStringLiteral("Pluto Duck")
                                                              : cfg.applicationName)
            : QStandardPaths::writableLocation(QStandardPaths::AppConfigLocation);
    out.globalConfigDir = QDir(globalBase).absolutePath();

    // An empty data location is legal: callers fall back to a temp directory.
    const QString appData =
        !cfg.dataRootOverride.isEmpty()
            ? cfg.dataRootOverride
            : QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
    if (!appData.isEmpty())
        out.appDataDir = QDir(appData).absolutePath();

    return out;
}

EnvironmentConfig applicationEnvironmentConfig()
{
    EnvironmentConfig cfg;
    cfg.organizationName = QCoreApplication::organizationName();
    cfg.applicationName = QCoreApplication::applicationName();
    return cfg;
}

QString QtEnvironmentPersistencePolicy::settingsFilePath(const EnvironmentPaths& paths) const
{
    return QDir(paths.globalConfigDir).filePath(QStringLiteral("global.ini"));
}

QtEnvironmentPersistencePolicy::SettingsHandle
QtEnvironmentPersistencePolicy::openSettings(const EnvironmentPaths& paths) const
{
    auto h = SettingsHandle{};
    h.settings = std::make_unique<QSettings>(settingsFilePath(paths), QSettings::IniFormat);
    h.settings->setFallbacksEnabled(false);
    return h;
}

QVariant QtEnvironmentPersistencePolicy::settingsValue(const SettingsHandle& h, QStringView key, const QVariant& def) const
{
    return h.settings ? h.settings->value(key.toString(), def) : def;
}

void QtEnvironmentPersistencePolicy::setSettingsValue(SettingsHandle& h, QStringView key, const QVariant& value) const
{
    if (!h.settings) return;
    h.settings->setValue(key.toString(), value);
}

void QtEnvironmentPersistencePolicy::removeSettingsKey(SettingsHandle& h, QStringView key) const
{
    if (!h.settings) return;
    h.settings->remove(key.toString());
}

bool QtEnvironmentPersistencePolicy::settingsContains(const SettingsHandle& h, QStringView key) const
{
    return h.settings ? h.settings->contains(key.toString()) : false;
}

void QtEnvironmentPersistencePolicy::syncSettings(SettingsHandle& h) const
{
    if (!h.settings) return;
    h.settings->sync();
}

} // namespace Utils

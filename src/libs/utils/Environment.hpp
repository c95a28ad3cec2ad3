// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include <QtCore/QString>
#include <QtCore/QStringList>
#include <QtCore/QStringView>
#include <QtCore/QVariant>

#include <utility>

using namespace Qt::StringLiterals;

namespace Utils {

struct EnvironmentConfig final {
    QString organizationName;
    QString applicationName;

    // Empty means "use the platform location".
    QString globalConfigRootOverride;
    QString dataRootOverride;
};

struct EnvironmentPaths final {
    QString globalConfigDir; // resolved absolute
    QString appDataDir;      // resolved absolute or empty when the platform has none
};

namespace SettingKeys {
inline constexpr char sidecarRuntime[] = "sidecar/runtime";
inline constexpr char resourceDir[] = "paths/resourceDir";
inline constexpr char defaultUrl[] = "window/defaultUrl";
inline constexpr char logFilterRules[] = "log/filterRules";
inline constexpr char deepLinkSchemes[] = "deeplink/schemes";
} // namespace SettingKeys

namespace Defaults {
#if defined(PLUTODUCK_DEV_BUILD)
// Dev builds run no sidecar; the window shows the externally started dev server.
inline constexpr char windowUrl[] = "http://127.0.0.1:3100";
#else
inline constexpr char windowUrl[] = "about:blank";
#endif
} // namespace Defaults

template <typename PersistencePolicy>
class BasicEnvironment final {
public:
    using Policy = PersistencePolicy;
    using SettingsHandle = typename Policy::SettingsHandle;

    explicit BasicEnvironment(EnvironmentConfig config, Policy policy = Policy{})
        : m_config(std::move(config))
        , m_policy(std::move(policy))
        , m_paths(m_policy.resolvePaths(m_config))
    {}

    const EnvironmentConfig& config() const noexcept { return m_config; }
    const EnvironmentPaths& paths()  const noexcept { return m_paths; }
    const Policy& policy() const noexcept { return m_policy; }

    QVariant setting(QStringView key, const QVariant& def = {}) const
    {
        auto h = m_policy.openSettings(m_paths);
        return m_policy.settingsValue(h, key, def);
    }

    void setSetting(QStringView key, const QVariant& value)
    {
        auto h = m_policy.openSettings(m_paths);
        m_policy.setSettingsValue(h, key, value);
        m_policy.syncSettings(h);
    }

    void removeSetting(QStringView key)
    {
        auto h = m_policy.openSettings(m_paths);
        m_policy.removeSettingsKey(h, key);
        m_policy.syncSettings(h);
    }

    bool hasSetting(QStringView key) const
    {
        auto h = m_policy.openSettings(m_paths);
        return m_policy.settingsContains(h, key);
    }

    ///
    // Typed accessors for the keys the shell reads

    QString stringSetting(QStringView key, const QString& def = {}) const
    {
        const QString value = setting(key, def).toString().trimmed();
        return value.isEmpty() ? def : value;
    }

    QString sidecarRuntime() const
    {
        return stringSetting(QString::fromLatin1(SettingKeys::sidecarRuntime), u"node"_s);
    }

    QString resourceDirOverride() const
    {
        return stringSetting(QString::fromLatin1(SettingKeys::resourceDir));
    }

    QString defaultUrl() const
    {
        return stringSetting(QString::fromLatin1(SettingKeys::defaultUrl), QString::fromLatin1(Defaults::windowUrl));
    }

    QString logFilterRules() const
    {
        return stringSetting(QString::fromLatin1(SettingKeys::logFilterRules));
    }

    QStringList deepLinkSchemes() const
    {
        const QVariant raw = setting(QString::fromLatin1(SettingKeys::deepLinkSchemes));
        QStringList schemes = raw.typeId() == QMetaType::QStringList
            ? raw.toStringList()
            : raw.toString().split(QLatin1Char(','), Qt::SkipEmptyParts);
        for (QString& s : schemes)
            s = s.trimmed().toLower();
        schemes.removeAll(QString());
        if (schemes.isEmpty())
            schemes.push_back(u"plutoduck"_s);
        return schemes;
    }

private:
    EnvironmentConfig m_config;
    Policy m_policy;
    EnvironmentPaths m_paths;
};

} // namespace Utils

// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "utils/Environment.hpp"

#include <QtCore/QSettings>

#include <memory>

namespace Utils {

class QtEnvironmentPersistencePolicy final {
public:
	struct SettingsHandle final {
		std::unique_ptr<QSettings> settings;
	};

	EnvironmentPaths resolvePaths(const EnvironmentConfig& cfg) const;

	SettingsHandle openSettings(const EnvironmentPaths& paths) const;
	QVariant settingsValue(const SettingsHandle& h, QStringView key, const QVariant& def) const;
	void setSettingsValue(SettingsHandle& h, QStringView key, const QVariant& value) const;
	void removeSettingsKey(SettingsHandle& h, QStringView key) const;
	bool settingsContains(const SettingsHandle& h, QStringView key) const;
	void syncSettings(SettingsHandle& h) const;

private:
	QString settingsFilePath(const EnvironmentPaths& paths) const;
};

using Environment = BasicEnvironment<QtEnvironmentPersistencePolicy>;

// Organization and application names as registered on the running QCoreApplication.
EnvironmentConfig applicationEnvironmentConfig();

} // namespace Utils

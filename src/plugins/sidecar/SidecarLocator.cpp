// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "sidecar/SidecarLocator.hpp"

#include <QtCore/QCoreApplication>
#include <QtCore/QDir>
#include <QtCore/QFileInfo>

namespace Sidecar {

SidecarError locateServerRoot(const SidecarContext& ctx, QString& outRoot)
{
	if (ctx.buildMode == BuildMode::Debug) {
		const QString debugPath =
			QDir::cleanPath(QDir(ctx.projectDir).filePath(QString::fromLatin1(Constants::SERVER_DIST_DEBUG)));
		if (!QFileInfo(debugPath).isDir()) {
			return {SidecarErrorCode::ConfigurationMissing,
					QStringLiteral("node server directory not found at %1").arg(debugPath)};
		}
		outRoot = debugPath;
		return SidecarError::none();
	}

	if (ctx.resourceDir.isEmpty())
		return {SidecarErrorCode::ConfigurationMissing, QStringLiteral("resource directory unavailable")};

	const QString resourcePath =
		QDir::cleanPath(QDir(ctx.resourceDir).filePath(QString::fromLatin1(Constants::SERVER_DIST_RESOURCE)));
	if (QFileInfo(resourcePath).isDir()) {
		outRoot = resourcePath;
		return SidecarError::none();
	}

	return {SidecarErrorCode::ConfigurationMissing,
			QStringLiteral("node server directory not found in resources (%1)").arg(resourcePath)};
}

QString platformResourceDir()
{
	const QDir appDir(QCoreApplication::applicationDirPath());

#if defined(Q_OS_MACOS)
	return QDir::cleanPath(appDir.absoluteFilePath(QStringLiteral("../Resources")));
#elif defined(Q_OS_WIN)
	return appDir.absolutePath();
#else
	return QDir::cleanPath(appDir.absoluteFilePath(QStringLiteral("../share/plutoduck")));
#endif
}

} // namespace Sidecar

// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "sidecar/DataRoot.hpp"

#include <QtCore/QDir>

namespace Sidecar {

namespace {

QString tempBase(const SidecarContext& ctx)
{
	const QString temp = ctx.tempDir.isEmpty() ? QDir::tempPath() : ctx.tempDir;
	return QDir(temp).filePath(QString::fromLatin1(Constants::TEMP_DATA_DIR));
}

QString rootUnder(const QString& base)
{
	return QDir::cleanPath(QDir(base).filePath(QString::fromLatin1(Constants::DATA_ROOT_NAME)));
}

bool ensureLogDir(const QString& root)
{
	return QDir(root).mkpath(QString::fromLatin1(Constants::LOG_DIR_NAME));
}

} // namespace

QString dataRootBase(const SidecarContext& ctx)
{
	if (ctx.buildMode == BuildMode::Debug)
		return QDir(ctx.projectDir).filePath(QString::fromLatin1(Constants::DEV_DATA_DIR));

	if (!ctx.appDataDir.isEmpty())
		return ctx.appDataDir;

	return tempBase(ctx);
}

DataRootResolution resolveDataRoot(const SidecarContext& ctx)
{
	DataRootResolution out;
	out.path = rootUnder(dataRootBase(ctx));
	out.logsReady = ensureLogDir(out.path);
	if (out.logsReady)
		return out;

	const QString fallback = rootUnder(tempBase(ctx));
	if (ctx.buildMode == BuildMode::Debug || fallback == out.path) {
		qCCritical(sidecarlog) << "failed to create node server data directories under" << out.path;
		return out;
	}

	qCWarning(sidecarlog) << "failed to create node server data directories under" << out.path;

	if (ensureLogDir(fallback)) {
		qCWarning(sidecarlog) << "using temporary node server data root" << fallback;
		out.path = fallback;
		out.logsReady = true;
		out.usedFallback = true;
	} else {
		qCCritical(sidecarlog) << "failed to create node server data directories under" << fallback;
	}

	return out;
}

} // namespace Sidecar

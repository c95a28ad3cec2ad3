// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "sidecar/SidecarConfig.hpp"

#include "sidecar/DataRoot.hpp"
#include "sidecar/SidecarLocator.hpp"

#include <QtCore/QDir>

namespace Sidecar {

QProcessEnvironment sidecarEnvironment(const QProcessEnvironment& base,
									   const QString& dataRoot,
									   const Endpoint& endpoint)
{
	QProcessEnvironment env = base;
	env.insert(QString::fromLatin1(Constants::ENV_DATA_ROOT), QDir::toNativeSeparators(dataRoot));
	env.insert(QString::fromLatin1(Constants::ENV_HOSTNAME), endpoint.host);
	env.insert(QString::fromLatin1(Constants::ENV_PORT), QString::number(endpoint.port));
	return env;
}

SidecarError SidecarConfig::resolve(const SidecarContext& ctx, SidecarConfig& out)
{
	QString serverRoot;
	if (auto err = locateServerRoot(ctx, serverRoot); !err.ok())
		return err;

	const DataRootResolution dataRoot = resolveDataRoot(ctx);
	const QDir logDir(QDir(dataRoot.path).filePath(QString::fromLatin1(Constants::LOG_DIR_NAME)));

	SidecarConfig cfg;
	cfg.serverRoot = serverRoot;
	cfg.entryFile = QDir(serverRoot).filePath(QString::fromLatin1(Constants::SERVER_ENTRY));
	cfg.dataRoot = dataRoot.path;
	cfg.endpoint = ctx.endpoint;
	cfg.stdoutLog = logDir.filePath(QString::fromLatin1(Constants::STDOUT_LOG_NAME));
	cfg.stderrLog = logDir.filePath(QString::fromLatin1(Constants::STDERR_LOG_NAME));
	cfg.environment = sidecarEnvironment(QProcessEnvironment::systemEnvironment(), cfg.dataRoot, cfg.endpoint);

	out = std::move(cfg);
	return SidecarError::none();
}

} // namespace Sidecar

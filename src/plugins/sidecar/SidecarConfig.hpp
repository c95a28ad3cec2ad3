// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "sidecar/Endpoint.hpp"
#include "sidecar/SidecarContext.hpp"
#include "sidecar/SidecarError.hpp"

#include <QtCore/QProcessEnvironment>
#include <QtCore/QString>
#include <QtCore/QUrl>

namespace Sidecar {

// Immutable description of one sidecar launch.
struct SIDECAR_EXPORT SidecarConfig final {
	QString serverRoot;
	QString entryFile;
	QString dataRoot;
	Endpoint endpoint;
	QString stdoutLog;
	QString stderrLog;
	QProcessEnvironment environment;

	QUrl url() const { return endpoint.url(); }

	// Resolves the data root and server directory. Only the locator can fail here; the
	// files themselves are checked by the supervisor.
	static SidecarError resolve(const SidecarContext& ctx, SidecarConfig& out);
};

// The sidecar's variables layered over `base`.
SIDECAR_EXPORT QProcessEnvironment sidecarEnvironment(const QProcessEnvironment& base,
													  const QString& dataRoot,
													  const Endpoint& endpoint);

} // namespace Sidecar

// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "sidecar/Endpoint.hpp"
#include "sidecar/ReadinessProbe.hpp"
#include "sidecar/SidecarConstants.hpp"

#include <QtCore/QString>

#include <chrono>

namespace Sidecar {

enum class BuildMode : quint8 {
	Debug,
	Release
};

// Dev builds are compiled with PLUTODUCK_DEV_BUILD; a development server owns the sidecar then.
constexpr BuildMode compiledBuildMode() noexcept
{
#if defined(PLUTODUCK_DEV_BUILD)
	return BuildMode::Debug;
#else
	return BuildMode::Release;
#endif
}

// Everything the supervisor needs to know about the host it runs on.
struct SidecarContext final {
	BuildMode buildMode = compiledBuildMode();

	QString projectDir;  // shell source directory, only meaningful in dev builds
	QString resourceDir; // packaged resources, empty when unavailable
	QString appDataDir;  // per-user platform data directory, may be empty
	QString tempDir;

	QString runtimeProgram = QString::fromLatin1(Constants::DEFAULT_RUNTIME);
	Endpoint endpoint{QString::fromLatin1(Constants::FRONTEND_HOST), Constants::FRONTEND_PORT};

	std::chrono::milliseconds readinessTimeout{Constants::READINESS_TIMEOUT_MS};
	ProbeOptions probe;
};

} // namespace Sidecar

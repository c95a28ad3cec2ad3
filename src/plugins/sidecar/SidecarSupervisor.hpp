// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "sidecar/SidecarConfig.hpp"
#include "sidecar/SidecarContext.hpp"
#include "sidecar/SidecarError.hpp"
#include "sidecar/SidecarHandle.hpp"
#include "sidecar/api/ISidecarService.hpp"

#include <memory>

namespace Sidecar {

// Runs the bundled node server for the lifetime of the shell.
//
// launch() resolves paths, truncates the logs, spawns the runtime and blocks on the readiness
// probe. The child is held in a shared SidecarSlot; shutdown() and the destructor both take
// from it, so exactly one of them kills and reaps the process.
class SIDECAR_EXPORT SidecarSupervisor final : public ISidecarService
{
	Q_OBJECT

public:
	explicit SidecarSupervisor(SidecarContext context, QObject* parent = nullptr);
	~SidecarSupervisor() override;

	SidecarLaunchResult launch();

	// Explicit exit path. Safe to call more than once.
	void shutdown();

	const SidecarContext& context() const noexcept { return m_context; }
	const SidecarConfig& config() const noexcept { return m_config; }
	ServerState serverState() const { return m_state; }

	Status status() const override { return m_status; }
	QUrl url() const override;
	SidecarError lastError() const override { return m_lastError; }
	qint64 processId() const override { return m_processId; }

private:
	void setStatus(Status status);
	SidecarLaunchResult fail(SidecarError error);

	SidecarError prepareLogs() const;
	SidecarError spawn();

	SidecarContext m_context;
	SidecarConfig m_config;

	Status m_status = Status::NotStarted;
	SidecarError m_lastError;
	qint64 m_processId = 0;

	ServerState m_state;
	std::unique_ptr<SidecarProcessGuard> m_guard;
};

} // namespace Sidecar

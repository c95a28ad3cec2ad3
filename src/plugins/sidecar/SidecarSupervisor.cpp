// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "sidecar/SidecarSupervisor.hpp"

#include "sidecar/ReadinessProbe.hpp"

#include <QtCore/QDir>
#include <QtCore/QFile>
#include <QtCore/QFileInfo>
#include <QtCore/QProcess>

namespace Sidecar {

namespace {

SidecarError truncateLog(const QString& path, const char* what)
{
	QFile file(path);
	if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
		return SidecarError(SidecarErrorCode::FilesystemSetup,
							QString("failed to create %1 log at %2: %3")
								.arg(QString::fromLatin1(what), path, file.errorString()));
	}
	return SidecarError::none();
}

} // namespace

SidecarSupervisor::SidecarSupervisor(SidecarContext context, QObject* parent)
	: ISidecarService(parent)
	, m_context(std::move(context))
{
	setObjectName("Sidecar.Supervisor");
}

SidecarSupervisor::~SidecarSupervisor()
{
	// Drop path: whatever shutdown() did not take is terminated here.
	if (m_guard) {
		m_status = Status::Stopped;
		m_guard.reset();
	}
}

QUrl SidecarSupervisor::url() const
{
	return m_context.endpoint.url();
}

void SidecarSupervisor::setStatus(Status status)
{
	if (m_status == status)
		return;
	m_status = status;
	emit statusChanged(status);
}

SidecarLaunchResult SidecarSupervisor::fail(SidecarError error)
{
	m_lastError = error;
	setStatus(Status::Failed);
	return SidecarLaunchResult::failure(std::move(error));
}

SidecarLaunchResult SidecarSupervisor::launch()
{
	if (m_status != Status::NotStarted)
		return SidecarLaunchResult::success();

	if (m_context.buildMode == BuildMode::Debug) {
		qCInfo(sidecarlog) << "debug build detected - skipping node server spawn (the dev server is started separately)";
		setStatus(Status::Disabled);
		return SidecarLaunchResult::success();
	}

	if (auto err = SidecarConfig::resolve(m_context, m_config); !err.ok())
		return fail(std::move(err));

	qCInfo(sidecarlog).noquote() << "launching node server" << m_config.entryFile
								 << "with data root" << m_config.dataRoot;

	if (auto err = prepareLogs(); !err.ok())
		return fail(std::move(err));

	if (!QFileInfo::exists(m_config.entryFile)) {
		return fail(SidecarError(SidecarErrorCode::ConfigurationMissing,
								 QString("node server entry not found at %1")
									 .arg(QDir::toNativeSeparators(m_config.entryFile))));
	}

	if (auto err = spawn(); !err.ok())
		return fail(std::move(err));

	qCInfo(sidecarlog).noquote() << "node server process spawned on" << url().toString()
								 << "with data root" << m_config.dataRoot;

	if (waitForServer(m_config.endpoint.authority(), m_context.readinessTimeout, m_context.probe)) {
		setStatus(Status::Ready);
	} else {
		qCWarning(sidecarlog) << "node server did not become ready within timeout";
		m_lastError = SidecarError(SidecarErrorCode::ReadinessTimeout,
								   QString("node server did not accept connections on %1 within %2 ms")
									   .arg(m_config.endpoint.authority())
									   .arg(m_context.readinessTimeout.count()));
		setStatus(Status::TimedOut);
	}

	return SidecarLaunchResult::success();
}

SidecarError SidecarSupervisor::prepareLogs() const
{
	const QString logDir = QFileInfo(m_config.stdoutLog).absolutePath();
	if (!QDir().mkpath(logDir)) {
		return SidecarError(SidecarErrorCode::FilesystemSetup,
							QString("failed to create log directory %1").arg(logDir));
	}

	if (auto err = truncateLog(m_config.stdoutLog, "stdout"); !err.ok())
		return err;
	return truncateLog(m_config.stderrLog, "stderr");
}

SidecarError SidecarSupervisor::spawn()
{
	auto process = std::make_unique<QProcess>();
	process->setProgram(m_context.runtimeProgram);
	process->setArguments({QString::fromLatin1(Constants::SERVER_ENTRY)});
	process->setWorkingDirectory(m_config.serverRoot);
	process->setProcessEnvironment(m_config.environment);
	process->setStandardInputFile(QProcess::nullDevice());
	process->setStandardOutputFile(m_config.stdoutLog, QIODevice::Append);
	process->setStandardErrorFile(m_config.stderrLog, QIODevice::Append);

	process->start();
	if (!process->waitForStarted()) {
		return SidecarError(SidecarErrorCode::SpawnFailure,
							QString("failed to spawn node server process: %1").arg(process->errorString()));
	}

	connect(process.get(), &QProcess::finished, this,
			[this](int exitCode, QProcess::ExitStatus exitStatus) {
				if (m_status == Status::Stopped)
					return;
				qCWarning(sidecarlog) << "node server exited unexpectedly, code" << exitCode
									  << (exitStatus == QProcess::CrashExit ? "(crashed)" : "");
			});

	m_processId = process->processId();
	m_state = std::make_shared<SidecarSlot>(
		SidecarHandle(std::make_unique<ProcessSidecarChild>(std::move(process))));
	m_guard = std::make_unique<SidecarProcessGuard>(m_state);

	setStatus(Status::Running);
	return SidecarError::none();
}

void SidecarSupervisor::shutdown()
{
	if (m_status == Status::Stopped)
		return;

	const bool wasRunning = m_state != nullptr;
	setStatus(Status::Stopped);
	if (!wasRunning)
		return;

	qCInfo(sidecarlog) << "App is exiting - cleaning up node server";
	terminateSidecar(m_state, "on exit");
}

} // namespace Sidecar

// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "sidecar/SidecarHandle.hpp"

#include <QtCore/QMutexLocker>
#include <QtCore/QProcess>

namespace Sidecar {

ProcessSidecarChild::ProcessSidecarChild(std::unique_ptr<QProcess> process)
	: m_process(std::move(process))
{
}

ProcessSidecarChild::~ProcessSidecarChild() = default;

qint64 ProcessSidecarChild::processId() const
{
	return m_process ? m_process->processId() : 0;
}

void ProcessSidecarChild::kill()
{
	if (m_process && m_process->state() != QProcess::NotRunning)
		m_process->kill();
}

int ProcessSidecarChild::waitForExit()
{
	if (!m_process)
		return -1;
	if (m_process->state() != QProcess::NotRunning)
		m_process->waitForFinished(-1);
	return m_process->exitCode();
}

SidecarHandle::SidecarHandle(std::unique_ptr<ISidecarChild> child)
	: m_child(std::move(child))
{
}

SidecarHandle::~SidecarHandle()
{
	terminate();
}

SidecarHandle::SidecarHandle(SidecarHandle&& other) noexcept
	: m_child(std::move(other.m_child))
{
}

SidecarHandle& SidecarHandle::operator=(SidecarHandle&& other) noexcept
{
	if (this != &other) {
		terminate();
		m_child = std::move(other.m_child);
	}
	return *this;
}

qint64 SidecarHandle::processId() const
{
	return m_child ? m_child->processId() : 0;
}

std::optional<int> SidecarHandle::terminate()
{
	if (!m_child)
		return std::nullopt;

	std::unique_ptr<ISidecarChild> child = std::move(m_child);
	child->kill();
	return child->waitForExit();
}

SidecarSlot::SidecarSlot(SidecarHandle handle)
	: m_handle(std::move(handle))
{
}

std::optional<SidecarHandle> SidecarSlot::take()
{
	QMutexLocker locker(&m_mutex);
	std::optional<SidecarHandle> out;
	out.swap(m_handle);
	return out;
}

bool SidecarSlot::holdsHandle() const
{
	QMutexLocker locker(&m_mutex);
	return m_handle.has_value();
}

bool terminateSidecar(const ServerState& state, const char* reason)
{
	if (!state)
		return false;

	std::optional<SidecarHandle> handle = state->take();
	if (!handle || handle->isEmpty())
		return false;

	qCInfo(sidecarlog) << "Killing node server process" << reason << "( pid" << handle->processId() << ")";
	const std::optional<int> code = handle->terminate();
	qCInfo(sidecarlog) << "Node server process killed" << reason << "exit code:" << code.value_or(-1);
	return true;
}

SidecarProcessGuard::SidecarProcessGuard(ServerState state)
	: m_state(std::move(state))
{
}

SidecarProcessGuard::~SidecarProcessGuard()
{
	qCInfo(sidecarlog) << "ServerProcess dropping - killing node server";
	terminateSidecar(m_state, "on drop");
}

} // namespace Sidecar

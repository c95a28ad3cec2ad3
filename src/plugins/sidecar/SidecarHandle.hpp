// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "sidecar/SidecarGlobal.hpp"

#include <QtCore/QMutex>

#include <memory>
#include <optional>

QT_BEGIN_NAMESPACE
class QProcess;
QT_END_NAMESPACE

namespace Sidecar {

// The operating-system process behind a SidecarHandle.
class SIDECAR_EXPORT ISidecarChild
{
public:
	virtual ~ISidecarChild() = default;

	virtual qint64 processId() const = 0;
	virtual void kill() = 0;
	// Blocks until the process has exited and returns its exit code.
	virtual int waitForExit() = 0;
};

class SIDECAR_EXPORT ProcessSidecarChild final : public ISidecarChild
{
public:
	// Takes a started process.
	explicit ProcessSidecarChild(std::unique_ptr<QProcess> process);
	~ProcessSidecarChild() override;

	qint64 processId() const override;
	void kill() override;
	int waitForExit() override;

	QProcess* process() const noexcept { return m_process.get(); }

private:
	std::unique_ptr<QProcess> m_process;
};

// Sole owner of a running sidecar. Destroying a non-empty handle kills the child and reaps it.
class SIDECAR_EXPORT SidecarHandle final
{
public:
	explicit SidecarHandle(std::unique_ptr<ISidecarChild> child);
	~SidecarHandle();

	SidecarHandle(SidecarHandle&& other) noexcept;
	SidecarHandle& operator=(SidecarHandle&& other) noexcept;

	SidecarHandle(const SidecarHandle&) = delete;
	SidecarHandle& operator=(const SidecarHandle&) = delete;

	bool isEmpty() const noexcept { return !m_child; }
	qint64 processId() const;

	// Kills and waits now instead of at destruction. Returns the exit code, or nullopt if
	// the handle was already empty.
	std::optional<int> terminate();

private:
	std::unique_ptr<ISidecarChild> m_child;
};

// Mutex-guarded optional handle. take() is the only mutation: whoever takes the handle first
// owns the termination, later callers get nullopt.
class SIDECAR_EXPORT SidecarSlot final
{
public:
	SidecarSlot() = default;
	explicit SidecarSlot(SidecarHandle handle);

	SidecarSlot(const SidecarSlot&) = delete;
	SidecarSlot& operator=(const SidecarSlot&) = delete;

	std::optional<SidecarHandle> take();
	bool holdsHandle() const;

private:
	mutable QMutex m_mutex;
	std::optional<SidecarHandle> m_handle;
};

using ServerState = std::shared_ptr<SidecarSlot>;

// Takes the handle out of `state` and terminates the child. Returns true if this call
// performed the termination.
SIDECAR_EXPORT bool terminateSidecar(const ServerState& state, const char* reason);

// Drop guard: terminates whatever is still in the slot when it goes out of scope.
class SIDECAR_EXPORT SidecarProcessGuard final
{
public:
	explicit SidecarProcessGuard(ServerState state);
	~SidecarProcessGuard();

	SidecarProcessGuard(const SidecarProcessGuard&) = delete;
	SidecarProcessGuard& operator=(const SidecarProcessGuard&) = delete;

	const ServerState& state() const noexcept { return m_state; }

private:
	ServerState m_state;
};

} // namespace Sidecar

// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "sidecar/SidecarGlobal.hpp"

#include <QtCore/QString>

namespace Sidecar {

enum class SidecarErrorCode : quint8 {
	None = 0,
	ConfigurationMissing,
	FilesystemSetup,
	SpawnFailure,
	ReadinessTimeout
};

class SIDECAR_EXPORT SidecarError final {
public:
	SidecarError() = default;
	SidecarError(SidecarErrorCode code, QString message)
		: m_code(code), m_message(std::move(message)) {}

	bool ok() const noexcept { return m_code == SidecarErrorCode::None; }
	SidecarErrorCode code() const noexcept { return m_code; }
	const QString& message() const noexcept { return m_message; }

	// "ConfigurationMissing: node server entry not found at ..."
	QString toString() const;

	static SidecarError none() { return {}; }

private:
	SidecarErrorCode m_code{SidecarErrorCode::None};
	QString m_message;
};

SIDECAR_EXPORT QString errorCodeName(SidecarErrorCode code);

class SIDECAR_EXPORT SidecarLaunchResult final {
public:
	SidecarLaunchResult() = default;

	static SidecarLaunchResult success() { return SidecarLaunchResult{}; }

	static SidecarLaunchResult failure(SidecarError err)
	{
		SidecarLaunchResult r;
		r.m_error = std::move(err);
		return r;
	}

	bool ok() const noexcept { return m_error.ok(); }
	const SidecarError& error() const noexcept { return m_error; }

	explicit operator bool() const noexcept { return ok(); }

private:
	SidecarError m_error{SidecarError::none()};
};

} // namespace Sidecar

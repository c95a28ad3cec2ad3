// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "sidecar/SidecarError.hpp"

namespace Sidecar {

QString errorCodeName(SidecarErrorCode code)
{
	switch (code) {
	case SidecarErrorCode::None:
		return QStringLiteral("None");
	case SidecarErrorCode::ConfigurationMissing:
		return QStringLiteral("ConfigurationMissing");
	case SidecarErrorCode::FilesystemSetup:
		return QStringLiteral("FilesystemSetup");
	case SidecarErrorCode::SpawnFailure:
		return QStringLiteral("SpawnFailure");
	case SidecarErrorCode::ReadinessTimeout:
		return QStringLiteral("ReadinessTimeout");
	}
	return QStringLiteral("Unknown");
}

QString SidecarError::toString() const
{
	if (ok())
		return QString();
	return QStringLiteral("%1: %2").arg(errorCodeName(m_code), m_message);
}

} // namespace Sidecar

// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "shell/WindowNavigator.hpp"

#include "shell/api/IShellWindow.hpp"

#include <sidecar/api/ISidecarService.hpp>

namespace Shell::WindowNavigator {

bool navigate(IShellWindow& window, const Sidecar::ISidecarService& sidecar)
{
	using Status = Sidecar::ISidecarService::Status;

	switch (sidecar.status()) {
	case Status::Ready:
	case Status::TimedOut:
		break;
	case Status::Disabled:
		qCDebug(shelllog) << "sidecar disabled - window" << window.id() << "keeps the dev server url";
		return false;
	default:
		qCWarning(shelllog) << "failed to navigate window to node server: sidecar status"
							<< sidecar.status();
		return false;
	}

	const QUrl target = sidecar.url();
	if (!target.isValid()) {
		qCWarning(shelllog) << "failed to navigate window to node server: invalid url" << target;
		return false;
	}

	window.navigate(target);
	return true;
}

} // namespace Shell::WindowNavigator

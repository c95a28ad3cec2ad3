// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "deeplink/ActivationUrls.hpp"

#include <QtCore/QUrl>

namespace DeepLink {

QStringList activationUrlsFromArguments(const QStringList& arguments, const QStringList& schemes)
{
	QStringList out;
	for (qsizetype i = 1; i < arguments.size(); ++i) {
		const QString& arg = arguments.at(i);
		if (arg.startsWith(QLatin1Char('-')))
			continue;

		// Only the scheme is read; the argument is forwarded byte for byte.
		const QString scheme = QUrl(arg, QUrl::TolerantMode).scheme();
		if (scheme.isEmpty() || !schemes.contains(scheme, Qt::CaseInsensitive))
			continue;

		out.push_back(arg);
	}
	return out;
}

} // namespace DeepLink

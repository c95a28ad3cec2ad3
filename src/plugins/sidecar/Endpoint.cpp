// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "sidecar/Endpoint.hpp"

#include <QtNetwork/QHostAddress>

namespace Sidecar {

QString Endpoint::authority() const
{
	const QString h = host.contains(QLatin1Char(':')) ? QStringLiteral("[%1]").arg(host) : host;
	return QStringLiteral("%1:%2").arg(h).arg(port);
}

QUrl Endpoint::url() const
{
	return QUrl(QStringLiteral("http://%1").arg(authority()));
}

std::optional<Endpoint> Endpoint::parse(QStringView text)
{
	text = text.trimmed();
	if (text.isEmpty())
		return std::nullopt;

	QStringView hostPart;
	QStringView portPart;

	if (text.front() == QLatin1Char('[')) {
		const auto closing = text.indexOf(QLatin1Char(']'));
		if (closing < 0 || closing + 1 >= text.size() || text[closing + 1] != QLatin1Char(':'))
			return std::nullopt;
		hostPart = text.sliced(1, closing - 1);
		portPart = text.sliced(closing + 2);
	} else {
		const auto colon = text.lastIndexOf(QLatin1Char(':'));
		if (colon <= 0 || text.first(colon).contains(QLatin1Char(':')))
			return std::nullopt;
		hostPart = text.first(colon);
		portPart = text.sliced(colon + 1);
	}

	QHostAddress address;
	if (!address.setAddress(hostPart.toString()))
		return std::nullopt;

	bool ok = false;
	const uint port = portPart.toUInt(&ok);
	if (!ok || port == 0 || port > 65535)
		return std::nullopt;

	Endpoint out;
	out.host = hostPart.toString();
	out.port = static_cast<quint16>(port);
	return out;
}

} // namespace Sidecar

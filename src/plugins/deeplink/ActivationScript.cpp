// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "deeplink/ActivationScript.hpp"

#include "deeplink/DeepLinkConstants.hpp"

#include <QtCore/QJsonArray>
#include <QtCore/QJsonDocument>

namespace DeepLink {

QString jsonStringLiteral(const QString& text)
{
	// QJsonDocument only serializes containers; strip the array brackets off ["..."].
	const QByteArray array = QJsonDocument(QJsonArray{text}).toJson(QJsonDocument::Compact);
	return QString::fromUtf8(array.mid(1, array.size() - 2));
}

QString activationScript(const QString& url)
{
	const QString literal = jsonStringLiteral(url);
	const QString queue = QString::fromLatin1(Constants::CALLBACK_QUEUE);

	return QStringLiteral("%1 = %1 || [];"
						  "%1.push(%2);"
						  "window.dispatchEvent(new CustomEvent('%3', { detail: { url: %2 } }));")
		.arg(queue, literal, QString::fromLatin1(Constants::CALLBACK_EVENT));
}

} // namespace DeepLink

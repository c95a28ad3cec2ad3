// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "deeplink/DeepLinkGlobal.hpp"

#include <QtCore/QByteArray>
#include <QtCore/QList>
#include <QtCore/QObject>
#include <QtCore/QPointer>
#include <QtCore/QStringList>

#include <optional>

QT_BEGIN_NAMESPACE
class QLocalServer;
class QLocalSocket;
QT_END_NAMESPACE

namespace DeepLink {

// Per-user local socket the first instance listens on. A later instance writes its activation
// URLs there once and exits; an empty list asks the primary to reopen its windows.
class DEEPLINK_EXPORT InstanceChannel final : public QObject
{
	Q_OBJECT

public:
	explicit InstanceChannel(QObject* parent = nullptr);
	~InstanceChannel() override;

	// "plutoduck-shell-<user>"
	static QString defaultServerName();

	// Takes over `serverName`. A socket nobody answers on is left over from a crashed primary
	// and is removed; a live owner makes this return false.
	bool listen(const QString& serverName = defaultServerName());
	bool isListening() const;
	QString serverName() const;

	// While held, received activations queue up instead of being emitted. Used between claiming
	// the name at startup and the moment a dispatcher is connected.
	void holdActivations();
	// Emits everything queued while held, in arrival order, and stops holding.
	void releaseActivations();
	bool isHolding() const noexcept { return m_holding; }

	// Delivers `urls` to a running primary. Returns false when nobody is listening.
	static bool forwardToPrimary(const QStringList& urls, const QString& serverName = defaultServerName());

	static QByteArray encodeMessage(const QStringList& urls);
	static std::optional<QStringList> decodeMessage(const QByteArray& message);

signals:
	void activationReceived(const QStringList& urls);
	void reopenRequested();

private:
	void acceptPending();
	void handleMessage(const QByteArray& message);
	void deliver(const QStringList& urls);

	QPointer<QLocalServer> m_server;
	bool m_holding = false;
	QList<QStringList> m_held;
};

} // namespace DeepLink

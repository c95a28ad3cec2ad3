// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "deeplink/InstanceChannel.hpp"

#include "deeplink/DeepLinkConstants.hpp"

#include <QtCore/QJsonArray>
#include <QtCore/QJsonDocument>
#include <QtCore/QJsonObject>
#include <QtCore/QRegularExpression>
#include <QtNetwork/QLocalServer>
#include <QtNetwork/QLocalSocket>

#include <memory>
#include <utility>

namespace DeepLink {

InstanceChannel::InstanceChannel(QObject* parent)
	: QObject(parent)
{
	setObjectName("DeepLink.InstanceChannel");
}

InstanceChannel::~InstanceChannel()
{
	if (m_server)
		m_server->close();
}

QString InstanceChannel::defaultServerName()
{
	QString user = qEnvironmentVariable("USER");
	if (user.isEmpty())
		user = qEnvironmentVariable("USERNAME");
	if (user.isEmpty())
		user = QStringLiteral("default");

	static const QRegularExpression unsafe(QStringLiteral("[^A-Za-z0-9_.-]"));
	user.replace(unsafe, QStringLiteral("_"));
	return QString::fromLatin1(Constants::INSTANCE_SERVER_PREFIX) + user;
}

bool InstanceChannel::listen(const QString& serverName)
{
	if (m_server)
		m_server->close();
	else
		m_server = new QLocalServer(this);

	m_server->setSocketOptions(QLocalServer::UserAccessOption);
	if (!m_server->listen(serverName)) {
		if (m_server->serverError() != QAbstractSocket::AddressInUseError) {
			qCWarning(deeplinklog) << "Failed to listen on local server" << serverName << ":" << m_server->errorString();
			return false;
		}

		QLocalSocket owner;
		owner.connectToServer(serverName);
		if (owner.waitForConnected(Constants::INSTANCE_CONNECT_TIMEOUT_MS)) {
			owner.abort();
			qCWarning(deeplinklog) << "another instance already owns" << serverName;
			return false;
		}

		qCInfo(deeplinklog) << "removing stale single-instance socket" << serverName;
		QLocalServer::removeServer(serverName);
		if (!m_server->listen(serverName)) {
			qCWarning(deeplinklog) << "Failed to listen on local server" << serverName << ":" << m_server->errorString();
			return false;
		}
	}

	connect(m_server, &QLocalServer::newConnection, this, &InstanceChannel::acceptPending, Qt::UniqueConnection);
	qCInfo(deeplinklog) << "single-instance channel listening on" << m_server->fullServerName();
	return true;
}

bool InstanceChannel::isListening() const
{
	return m_server && m_server->isListening();
}

QString InstanceChannel::serverName() const
{
	return m_server ? m_server->serverName() : QString();
}

void InstanceChannel::acceptPending()
{
	while (QLocalSocket* client = m_server->nextPendingConnection()) {
		auto buffer = std::make_shared<QByteArray>();

		connect(client, &QLocalSocket::readyRead, client, [client, buffer] {
			buffer->append(client->readAll());
			if (buffer->size() > Constants::INSTANCE_MAX_MESSAGE_BYTES) {
				qCWarning(deeplinklog) << "oversized activation message - dropping connection";
				buffer->clear();
				client->abort();
			}
		});
		connect(client, &QLocalSocket::disconnected, this, [this, client, buffer] {
			buffer->append(client->readAll());
			client->deleteLater();
			if (!buffer->isEmpty())
				handleMessage(*buffer);
		});
		if (client->state() == QLocalSocket::UnconnectedState) {
			buffer->append(client->readAll());
			client->deleteLater();
			if (!buffer->isEmpty())
				handleMessage(*buffer);
		}
	}
}

void InstanceChannel::handleMessage(const QByteArray& message)
{
	const std::optional<QStringList> urls = decodeMessage(message);
	if (!urls) {
		qCWarning(deeplinklog) << "ignoring malformed activation message from another instance";
		return;
	}

	if (m_holding) {
		m_held.push_back(*urls);
		return;
	}
	deliver(*urls);
}

void InstanceChannel::deliver(const QStringList& urls)
{
	if (urls.isEmpty()) {
		qCInfo(deeplinklog) << "another instance asked to reopen the windows";
		emit reopenRequested();
		return;
	}
	emit activationReceived(urls);
}

void InstanceChannel::holdActivations()
{
	m_holding = true;
}

void InstanceChannel::releaseActivations()
{
	m_holding = false;
	const QList<QStringList> held = std::exchange(m_held, {});
	for (const QStringList& urls : held)
		deliver(urls);
}

bool InstanceChannel::forwardToPrimary(const QStringList& urls, const QString& serverName)
{
	QLocalSocket socket;
	socket.connectToServer(serverName);
	if (!socket.waitForConnected(Constants::INSTANCE_CONNECT_TIMEOUT_MS))
		return false;

	socket.write(encodeMessage(urls));
	if (!socket.waitForBytesWritten(Constants::INSTANCE_WRITE_TIMEOUT_MS)) {
		qCWarning(deeplinklog) << "failed to hand activation to the running instance:" << socket.errorString();
		return false;
	}

	socket.disconnectFromServer();
	if (socket.state() != QLocalSocket::UnconnectedState)
		socket.waitForDisconnected(Constants::INSTANCE_WRITE_TIMEOUT_MS);
	return true;
}

QByteArray InstanceChannel::encodeMessage(const QStringList& urls)
{
	QJsonObject root;
	root.insert(QString::fromLatin1(Constants::INSTANCE_MESSAGE_URLS), QJsonArray::fromStringList(urls));
	return QJsonDocument(root).toJson(QJsonDocument::Compact);
}

std::optional<QStringList> InstanceChannel::decodeMessage(const QByteArray& message)
{
	QJsonParseError error{};
	const QJsonDocument doc = QJsonDocument::fromJson(message, &error);
	if (error.error != QJsonParseError::NoError || !doc.isObject())
		return std::nullopt;

	const QJsonValue value = doc.object().value(QString::fromLatin1(Constants::INSTANCE_MESSAGE_URLS));
	if (!value.isArray())
		return std::nullopt;

	QStringList urls;
	for (const QJsonValue& item : value.toArray()) {
		if (!item.isString())
			return std::nullopt;
		urls.push_back(item.toString());
	}
	return urls;
}

} // namespace DeepLink

#include "core/ipc/socket_client.h"
#include "core/ipc/service_base.h"
#include "core/shared/logging.h"

#include <QDir>
#include <QElapsedTimer>
#include <QJsonObject>

#include <algorithm>

namespace dd {

namespace {

bool isTransientConnectError(QLocalSocket::LocalSocketError error)
{
    switch (error) {
    case QLocalSocket::ServerNotFoundError:
    case QLocalSocket::ConnectionRefusedError:
    case QLocalSocket::SocketTimeoutError:
        return true;
    default:
        return false;
    }
}

} // namespace

SocketClient::SocketClient(QObject* parent)
    : QObject(parent)
    , m_socket(std::make_unique<QLocalSocket>())
{
    connect(m_socket.get(), &QLocalSocket::readyRead,
            this, &SocketClient::onReadyRead);
    connect(m_socket.get(), &QLocalSocket::disconnected,
            this, &SocketClient::onDisconnected);
}

SocketClient::~SocketClient()
{
    m_socket->disconnect(this);
    disconnect();
}

bool SocketClient::connectToServer(const QString& socketPath, int timeoutMs)
{
    const QString path = socketPath.trimmed().isEmpty()
        ? ServiceBase::socketPath(QStringLiteral("daemon"))
        : QDir::cleanPath(socketPath.trimmed());
    if (timeoutMs <= 0) {
        qCWarning(ddIpc, "Refusing to connect with timeout %dms", timeoutMs);
        return false;
    }

    if (isConnected() && m_socket->serverName() == path) {
        return true;
    }
    resetConnection();

    m_socket->connectToServer(path);
    if (m_socket->waitForConnected(timeoutMs)) {
        qCDebug(ddIpc, "Connected to %s", qPrintable(path));
        return true;
    }

    const QLocalSocket::LocalSocketError error = m_socket->error();
    if (isTransientConnectError(error)) {
        // Daemon not started yet, or still binding.
        qCDebug(ddIpc, "No daemon listening on %s: %s",
                qPrintable(path), qPrintable(m_socket->errorString()));
    } else {
        qCWarning(ddIpc, "Cannot connect to %s: %s (error=%d)",
                  qPrintable(path), qPrintable(m_socket->errorString()), static_cast<int>(error));
        emit errorOccurred(m_socket->errorString());
    }
    m_socket->abort();
    return false;
}

void SocketClient::disconnect()
{
    if (m_socket->state() != QLocalSocket::UnconnectedState) {
        m_socket->disconnectFromServer();
    }
    resetConnection();
}

void SocketClient::resetConnection()
{
    m_socket->abort();
    m_readBuffer.clear();
    m_pending.clear();
}

bool SocketClient::isConnected() const
{
    return m_socket->state() == QLocalSocket::ConnectedState;
}

std::optional<QJsonObject> SocketClient::sendRequest(const QString& type,
                                                     const QJsonObject& data,
                                                     int timeoutMs)
{
    if (!isConnected()) {
        qCWarning(ddIpc, "Cannot send request: not connected");
        return std::nullopt;
    }

    const qint64 id = m_nextRequestId++;
    QByteArray encoded = IpcMessage::encode(IpcMessage::makeRequest(type, data, id));
    if (encoded.isEmpty()) {
        qCWarning(ddIpc, "Failed to encode request type=%s", qPrintable(type));
        return std::nullopt;
    }

    qCDebug(ddIpc, "Sending request: type=%s id=%lld", qPrintable(type),
            static_cast<long long>(id));

    auto pending = std::make_shared<PendingRequest>();
    m_pending[id] = pending;

    m_socket->write(encoded);
    m_socket->flush();

    // Block-wait for the response without pumping the global event loop.
    QElapsedTimer timer;
    timer.start();

    while (!pending->completed && timer.elapsed() < timeoutMs) {
        const int remainingMs = std::max(0, timeoutMs - static_cast<int>(timer.elapsed()));
        if (remainingMs == 0) {
            break;
        }

        if (m_socket->bytesAvailable() == 0) {
            m_socket->waitForReadyRead(std::min(remainingMs, 50));
        }

        if (m_socket->bytesAvailable() > 0) {
            onReadyRead();
        } else if (m_socket->state() != QLocalSocket::ConnectedState) {
            break;
        }
    }

    m_pending.remove(id);

    if (!pending->completed) {
        qCWarning(ddIpc, "Request failed: type=%s id=%lld timeout=%dms connected=%d",
                  qPrintable(type), static_cast<long long>(id), timeoutMs,
                  isConnected() ? 1 : 0);
        return std::nullopt;
    }

    return pending->response;
}

void SocketClient::onReadyRead()
{
    m_readBuffer.append(m_socket->readAll());

    if (m_readBuffer.size() > kMaxReadBufferSize) {
        qCCritical(ddIpc, "Read buffer exceeded %d bytes, disconnecting", kMaxReadBufferSize);
        m_readBuffer.clear();
        m_socket->disconnectFromServer();
        return;
    }

    while (true) {
        const IpcMessage::DecodeResult result = IpcMessage::decode(m_readBuffer);
        if (result.status == IpcMessage::DecodeResult::Status::Incomplete) {
            break;
        }
        if (result.status == IpcMessage::DecodeResult::Status::Oversized) {
            qCCritical(ddIpc, "%s, disconnecting", qPrintable(result.error));
            m_readBuffer.clear();
            m_socket->disconnectFromServer();
            return;
        }

        m_readBuffer.remove(0, result.bytesConsumed);
        if (result.status == IpcMessage::DecodeResult::Status::Malformed) {
            qCWarning(ddIpc, "Dropping malformed response: %s", qPrintable(result.error));
            continue;
        }

        // Errors raised before the request was parsed carry no id; they
        // answer the oldest outstanding request.
        const std::optional<qint64> id = IpcMessage::requestId(result.json);
        auto it = id.has_value() ? m_pending.find(id.value()) : m_pending.begin();
        if (it != m_pending.end()) {
            it.value()->response = result.json;
            it.value()->completed = true;
        } else {
            qCWarning(ddIpc, "Received response for unknown request id=%lld",
                      static_cast<long long>(id.value_or(-1)));
        }
    }
}

void SocketClient::onDisconnected()
{
    qCDebug(ddIpc, "Disconnected from daemon");
    emit disconnected();
}

} // namespace dd

#include "core/ipc/socket_server.h"
#include "core/shared/logging.h"
#include <QElapsedTimer>
#include <QLocalServer>
#include <QLocalSocket>
#include <QThread>

#include <algorithm>
#include <chrono>
#include <exception>

#include <unistd.h>

namespace dd {

namespace {

bool socketHasActivePeer(const QString& socketPath)
{
    QLocalSocket probe;
    probe.connectToServer(socketPath);
    const bool connected = probe.waitForConnected(150);
    if (connected) {
        probe.disconnectFromServer();
        if (probe.state() != QLocalSocket::UnconnectedState) {
            probe.waitForDisconnected(50);
        }
    }
    return connected;
}

// Hands accepted descriptors to a callback instead of queueing QLocalSocket
// objects, so connections can be adopted by their own threads.
class AcceptingServer : public QLocalServer {
public:
    explicit AcceptingServer(std::function<void(quintptr)> onIncoming)
        : m_onIncoming(std::move(onIncoming))
    {
    }

protected:
    void incomingConnection(quintptr socketDescriptor) override
    {
        m_onIncoming(socketDescriptor);
    }

private:
    std::function<void(quintptr)> m_onIncoming;
};

} // namespace

SocketServer::SocketServer(QObject* parent)
    : QObject(parent)
{
    m_pool.setMaxThreadCount(std::max(4, QThread::idealThreadCount()));
}

SocketServer::~SocketServer()
{
    close();
    m_pool.waitForDone();
}

SocketServer::ListenStatus SocketServer::listen(const QString& socketPath)
{
    if (m_acceptThread.joinable()) {
        qCWarning(ddIpc, "listen() called while already listening on %s",
                  qPrintable(m_socketPath));
        return ListenStatus::Failed;
    }

    reapConnections(true);
    m_stopAccepting = false;
    m_stopping = false;
    m_aborting = false;
    m_socketPath = socketPath;

    std::promise<ListenStatus> ready;
    std::future<ListenStatus> result = ready.get_future();
    m_acceptThread = std::thread(&SocketServer::acceptLoop, this, socketPath, &ready);

    const ListenStatus status = result.get();
    if (status != ListenStatus::Listening) {
        m_acceptThread.join();
    }
    return status;
}

void SocketServer::acceptLoop(const QString& socketPath, std::promise<ListenStatus>* ready)
{
    AcceptingServer server([this](quintptr descriptor) { onIncomingConnection(descriptor); });
    server.setSocketOptions(QLocalServer::UserAccessOption);

    if (!server.listen(socketPath)) {
        const bool addressInUse =
            server.serverError() == QAbstractSocket::AddressInUseError;

        if (!addressInUse) {
            const QString err = server.errorString();
            qCCritical(ddIpc, "Failed to listen on %s: %s",
                       qPrintable(socketPath), qPrintable(err));
            emit errorOccurred(err);
            ready->set_value(ListenStatus::Failed);
            return;
        }

        if (socketHasActivePeer(socketPath)) {
            const QString err = QStringLiteral(
                "Socket already in use by an active service: %1").arg(socketPath);
            qCCritical(ddIpc, "%s", qPrintable(err));
            emit errorOccurred(err);
            ready->set_value(ListenStatus::AlreadyRunning);
            return;
        }

        qCWarning(ddIpc, "Detected stale socket, attempting safe cleanup: %s",
                  qPrintable(socketPath));
        QLocalServer::removeServer(socketPath);
        if (!server.listen(socketPath)) {
            const QString err = server.errorString();
            qCCritical(ddIpc, "Failed to listen on %s after stale cleanup: %s",
                       qPrintable(socketPath), qPrintable(err));
            emit errorOccurred(err);
            ready->set_value(ListenStatus::Failed);
            return;
        }
    }

    qCInfo(ddIpc, "Listening on %s", qPrintable(socketPath));
    m_listening = true;
    ready->set_value(ListenStatus::Listening);

    while (!m_stopAccepting.load()) {
        bool timedOut = false;
        server.waitForNewConnection(kPollSliceMs, &timedOut);
        reapConnections(false);
    }

    server.close();
    m_listening = false;
    qCInfo(ddIpc, "Server closed: %s", qPrintable(socketPath));
}

void SocketServer::onIncomingConnection(quintptr descriptor)
{
    const Limits limits = this->limits();

    std::lock_guard<std::mutex> lock(m_connectionsMutex);
    if (m_stopping.load() || m_activeConnections >= limits.maxConnections) {
        qCWarning(ddIpc, "Rejecting connection: %d/%d active%s",
                  m_activeConnections, limits.maxConnections,
                  m_stopping.load() ? " (shutting down)" : "");
        QLocalSocket socket;
        if (socket.setSocketDescriptor(descriptor)) {
            const QByteArray busy = IpcMessage::encode(IpcMessage::makeError(
                IpcErrorCode::ServiceUnavailable,
                QStringLiteral("Too many connections")));
            socket.write(busy);
            socket.waitForBytesWritten(kPollSliceMs);
            socket.abort();
        } else {
            ::close(static_cast<int>(descriptor));
        }
        return;
    }

    auto connection = std::make_unique<Connection>();
    Connection* raw = connection.get();
    ++m_activeConnections;
    m_connections.push_back(std::move(connection));
    raw->thread = std::thread(&SocketServer::serveConnection, this, descriptor, raw);
}

void SocketServer::serveConnection(quintptr descriptor, Connection* connection)
{
    const Limits limits = this->limits();

    QLocalSocket socket;
    if (!socket.setSocketDescriptor(descriptor)) {
        qCWarning(ddIpc, "Failed to adopt socket descriptor %lld: %s",
                  static_cast<long long>(descriptor), qPrintable(socket.errorString()));
        ::close(static_cast<int>(descriptor));
    } else {
        qCDebug(ddIpc, "Client connected (fd=%lld)", static_cast<long long>(descriptor));
        emit clientConnected();

        QByteArray buffer;
        QElapsedTimer idleTimer;
        QElapsedTimer frameTimer;
        idleTimer.start();
        bool open = true;

        while (open) {
            // Serve every complete frame already buffered
            while (open) {
                const IpcMessage::DecodeResult decoded = IpcMessage::decode(buffer);
                if (decoded.status == IpcMessage::DecodeResult::Status::Incomplete) {
                    break;
                }

                if (decoded.status == IpcMessage::DecodeResult::Status::Oversized) {
                    writeMessage(socket, IpcMessage::makeError(IpcErrorCode::InvalidParams,
                                                               decoded.error),
                                 limits.writeTimeoutMs);
                    open = false;
                    break;
                }

                buffer.remove(0, decoded.bytesConsumed);
                if (!buffer.isEmpty()) {
                    frameTimer.restart();
                }

                if (decoded.status == IpcMessage::DecodeResult::Status::Malformed) {
                    open = writeMessage(socket,
                                        IpcMessage::makeError(IpcErrorCode::InvalidParams,
                                                              decoded.error),
                                        limits.writeTimeoutMs);
                    continue;
                }

                QJsonObject response;
                const DispatchOutcome outcome = dispatch(decoded.json, response);
                open = writeMessage(socket, response, limits.writeTimeoutMs)
                    && outcome == DispatchOutcome::Answered;
                idleTimer.restart();
            }

            if (!open || m_stopping.load()) {
                break;
            }

            if (buffer.size() > kMaxReadBufferSize) {
                qCWarning(ddIpc, "Read buffer overflow (%d bytes), dropping connection",
                          static_cast<int>(buffer.size()));
                break;
            }

            if (!socket.waitForReadyRead(kPollSliceMs)) {
                if (socket.state() != QLocalSocket::ConnectedState) {
                    break;
                }
                if (!buffer.isEmpty() && frameTimer.elapsed() > limits.readTimeoutMs) {
                    qCWarning(ddIpc, "Incomplete frame after %dms, closing connection",
                              limits.readTimeoutMs);
                    writeMessage(socket, IpcMessage::makeError(
                                     IpcErrorCode::Timeout,
                                     QStringLiteral("Timed out reading request")),
                                 limits.writeTimeoutMs);
                    break;
                }
                if (buffer.isEmpty() && idleTimer.elapsed() > limits.idleTimeoutMs) {
                    qCDebug(ddIpc, "Closing idle connection");
                    break;
                }
                continue;
            }

            if (buffer.isEmpty()) {
                frameTimer.restart();
            }
            buffer.append(socket.readAll());
            idleTimer.restart();
        }

        if (socket.state() == QLocalSocket::ConnectedState) {
            socket.disconnectFromServer();
        }
        socket.abort();
        emit clientDisconnected();
        qCDebug(ddIpc, "Client disconnected");
    }

    std::lock_guard<std::mutex> lock(m_connectionsMutex);
    --m_activeConnections;
    connection->finished = true;
    m_connectionsDrained.notify_all();
}

SocketServer::DispatchOutcome SocketServer::dispatch(const QJsonObject& request,
                                                     QJsonObject& response)
{
    const auto id = IpcMessage::requestId(request);
    if (!m_handler) {
        response = IpcMessage::makeError(IpcErrorCode::InternalError,
                                         QStringLiteral("No request handler"), id);
        return DispatchOutcome::Answered;
    }

    const int requestTimeoutMs = limits().requestTimeoutMs;
    RequestHandler handler = m_handler;
    auto task = std::make_shared<std::packaged_task<QJsonObject()>>(
        [handler, request]() { return handler(request); });
    std::future<QJsonObject> future = task->get_future();
    m_pool.start([task]() { (*task)(); });

    QElapsedTimer timer;
    timer.start();
    while (future.wait_for(std::chrono::milliseconds(kPollSliceMs))
           != std::future_status::ready) {
        if (m_aborting.load()) {
            response = IpcMessage::makeError(IpcErrorCode::ServiceUnavailable,
                                             QStringLiteral("Service shutting down"), id);
            return DispatchOutcome::Aborted;
        }
        if (timer.elapsed() >= requestTimeoutMs) {
            qCWarning(ddIpc, "Request '%s' exceeded %dms",
                      qPrintable(IpcMessage::requestType(request)), requestTimeoutMs);
            response = IpcMessage::makeError(
                IpcErrorCode::Timeout,
                QStringLiteral("Request timed out after %1ms").arg(requestTimeoutMs), id);
            return DispatchOutcome::TimedOut;
        }
    }

    try {
        response = future.get();
    } catch (const std::exception& e) {
        qCCritical(ddIpc, "Request handler threw: %s", e.what());
        response = IpcMessage::makeError(IpcErrorCode::InternalError,
                                         QString::fromUtf8(e.what()), id);
    }
    return DispatchOutcome::Answered;
}

bool SocketServer::writeMessage(QLocalSocket& socket, const QJsonObject& message,
                                int writeTimeoutMs)
{
    QByteArray encoded = IpcMessage::encode(message);
    if (encoded.isEmpty()) {
        qCWarning(ddIpc, "Failed to encode response");
        encoded = IpcMessage::encode(IpcMessage::makeError(
            IpcErrorCode::InternalError, QStringLiteral("Response too large"),
            IpcMessage::requestId(message)));
    }

    if (socket.write(encoded) != encoded.size()) {
        qCWarning(ddIpc, "Short write: %s", qPrintable(socket.errorString()));
        return false;
    }

    QElapsedTimer timer;
    timer.start();
    while (socket.bytesToWrite() > 0) {
        if (timer.elapsed() >= writeTimeoutMs) {
            qCWarning(ddIpc, "Write timed out after %dms", writeTimeoutMs);
            return false;
        }
        if (!socket.waitForBytesWritten(kPollSliceMs)
            && socket.state() != QLocalSocket::ConnectedState) {
            return false;
        }
    }
    return true;
}

void SocketServer::reapConnections(bool joinAll)
{
    std::list<std::unique_ptr<Connection>> done;
    {
        std::lock_guard<std::mutex> lock(m_connectionsMutex);
        for (auto it = m_connections.begin(); it != m_connections.end();) {
            if (joinAll || (*it)->finished.load()) {
                done.push_back(std::move(*it));
                it = m_connections.erase(it);
            } else {
                ++it;
            }
        }
    }
    for (auto& connection : done) {
        if (connection->thread.joinable()) {
            connection->thread.join();
        }
    }
}

void SocketServer::close(int gracePeriodMs)
{
    if (!m_acceptThread.joinable()) {
        reapConnections(true);
        return;
    }

    m_stopAccepting = true;
    m_stopping = true;
    m_acceptThread.join();

    {
        std::unique_lock<std::mutex> lock(m_connectionsMutex);
        const bool drained = m_connectionsDrained.wait_for(
            lock, std::chrono::milliseconds(std::max(0, gracePeriodMs)),
            [this]() { return m_activeConnections == 0; });
        if (!drained) {
            qCWarning(ddIpc, "%d connection(s) still busy after %dms grace, aborting",
                      m_activeConnections, gracePeriodMs);
        }
    }

    m_aborting = true;
    reapConnections(true);

    if (!m_pool.waitForDone(limits().requestTimeoutMs)) {
        qCWarning(ddIpc, "Request handlers still running after shutdown");
    }
}

bool SocketServer::isListening() const
{
    return m_listening.load();
}

QString SocketServer::socketPath() const
{
    return m_socketPath;
}

int SocketServer::activeConnections() const
{
    std::lock_guard<std::mutex> lock(m_connectionsMutex);
    return m_activeConnections;
}

void SocketServer::setRequestHandler(RequestHandler handler)
{
    m_handler = std::move(handler);
}

void SocketServer::setLimits(const Limits& limits)
{
    std::lock_guard<std::mutex> lock(m_limitsMutex);
    m_limits = limits;
}

SocketServer::Limits SocketServer::limits() const
{
    std::lock_guard<std::mutex> lock(m_limitsMutex);
    return m_limits;
}

} // namespace dd

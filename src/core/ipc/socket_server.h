#pragma once

#include "core/ipc/message.h"
#include <QObject>
#include <QThreadPool>

#include <atomic>
#include <condition_variable>
#include <functional>
#include <future>
#include <list>
#include <memory>
#include <mutex>
#include <thread>

class QLocalSocket;

namespace dd {

// SocketServer -- length-prefixed JSON request/response over a Unix domain
// socket.
//
// A dedicated thread accepts connections. Each connection is served by its
// own thread that reads frames with bounded waits; request handlers run on a
// worker pool so a stalled handler only costs its own connection. Responses
// on one connection are written in request order.
class SocketServer : public QObject {
    Q_OBJECT
public:
    enum class ListenStatus {
        Listening,
        AlreadyRunning,   // another live process owns the socket
        Failed,
    };

    struct Limits {
        int readTimeoutMs = 5000;       // a started frame must complete within this
        int writeTimeoutMs = 5000;
        int idleTimeoutMs = 300000;     // idle connections are closed
        int requestTimeoutMs = 10000;   // handler budget per request
        int maxConnections = 64;
    };

    using RequestHandler = std::function<QJsonObject(const QJsonObject& request)>;

    // Per-connection read buffer cap: 64MB
    static constexpr int kMaxReadBufferSize = 64 * 1024 * 1024;
    static constexpr int kPollSliceMs = 100;

    explicit SocketServer(QObject* parent = nullptr);
    ~SocketServer() override;

    // Binds and starts accepting. Blocks until the socket is bound or the
    // bind failed. A stale socket file with no live peer is removed first.
    ListenStatus listen(const QString& socketPath);

    // Stops accepting, gives in-flight requests up to gracePeriodMs to
    // finish, then drops the remaining connections.
    void close(int gracePeriodMs = 0);

    bool isListening() const;
    QString socketPath() const;
    int activeConnections() const;

    // Must be set before listen().
    void setRequestHandler(RequestHandler handler);

    void setLimits(const Limits& limits);
    Limits limits() const;

signals:
    void clientConnected();
    void clientDisconnected();
    void errorOccurred(const QString& error);

private:
    struct Connection {
        std::thread thread;
        std::atomic<bool> finished{false};
    };

    enum class DispatchOutcome {
        Answered,
        TimedOut,
        Aborted,
    };

    void acceptLoop(const QString& socketPath, std::promise<ListenStatus>* ready);
    void onIncomingConnection(quintptr descriptor);
    void serveConnection(quintptr descriptor, Connection* connection);
    DispatchOutcome dispatch(const QJsonObject& request, QJsonObject& response);
    bool writeMessage(QLocalSocket& socket, const QJsonObject& message, int writeTimeoutMs);
    void reapConnections(bool joinAll);

    std::thread m_acceptThread;
    std::atomic<bool> m_listening{false};
    std::atomic<bool> m_stopAccepting{false};
    std::atomic<bool> m_stopping{false};
    std::atomic<bool> m_aborting{false};
    QString m_socketPath;

    RequestHandler m_handler;

    mutable std::mutex m_limitsMutex;
    Limits m_limits;

    mutable std::mutex m_connectionsMutex;
    std::condition_variable m_connectionsDrained;
    std::list<std::unique_ptr<Connection>> m_connections;
    int m_activeConnections = 0;

    QThreadPool m_pool;
};

} // namespace dd

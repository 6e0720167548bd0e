#pragma once

#include "core/ipc/message.h"
#include <QMap>
#include <QObject>
#include <QLocalSocket>
#include <memory>
#include <optional>

namespace dd {

// Blocking request/response client for the daemon socket.
class SocketClient : public QObject {
    Q_OBJECT
public:
    explicit SocketClient(QObject* parent = nullptr);
    ~SocketClient() override;

    static constexpr int kMaxReadBufferSize = 64 * 1024 * 1024; // 64 MB

    // An empty path connects to the per-user daemon socket.
    bool connectToServer(const QString& socketPath = {}, int timeoutMs = 5000);
    void disconnect();
    bool isConnected() const;

    // Send a request and get the response (blocking with timeout).
    // Returns nullopt on timeout or when the connection drops.
    std::optional<QJsonObject> sendRequest(const QString& type,
                                           const QJsonObject& data = {},
                                           int timeoutMs = 30000);

signals:
    void disconnected();
    void errorOccurred(const QString& error);

private slots:
    void onReadyRead();
    void onDisconnected();

private:
    void resetConnection();

    std::unique_ptr<QLocalSocket> m_socket;
    QByteArray m_readBuffer;
    qint64 m_nextRequestId = 1;

    struct PendingRequest {
        QJsonObject response;
        bool completed = false;
    };
    QMap<qint64, std::shared_ptr<PendingRequest>> m_pending;
};

} // namespace dd

#pragma once

#include "core/ipc/socket_server.h"
#include <QCoreApplication>
#include <QString>

#include <atomic>
#include <memory>

namespace dd {

// ServiceBase -- socket lifecycle shared by long-running services.
//
// start() binds the socket before writing the PID file, so a second
// instance never clobbers the PID of a live one. run() adds readiness
// reporting, SIGTERM/SIGINT handling and the event loop.
class ServiceBase : public QObject {
    Q_OBJECT
public:
    static constexpr int kExitOk = 0;
    static constexpr int kExitStartupFailed = 1;
    static constexpr int kExitAlreadyRunning = 3;

    explicit ServiceBase(const QString& serviceName, QObject* parent = nullptr);
    ~ServiceBase() override;

    // Bind and write the PID file. Returns kExitOk or an exit code.
    int start();

    // start(), print "ready", then run the event loop until shutdown.
    int run();

    // Graceful stop: close the socket with the grace period, run
    // onShutdown() and remove the PID file. Safe to call repeatedly.
    void stop();

    bool isRunning() const;

    // Get the socket path for this service
    static QString socketPath(const QString& serviceName);
    static QString runtimeDirectory();
    static QString socketDirectory();
    static QString pidDirectory();
    static QString pidPath(const QString& serviceName);

    // Routes SIGTERM and SIGINT to QCoreApplication::quit().
    static bool installSignalHandlers();

protected:
    // Called from worker threads; overrides must be thread-safe.
    virtual QJsonObject handleRequest(const QJsonObject& request);

    virtual void onShutdown() {}

    // Built-in handlers
    QJsonObject handlePing(const QJsonObject& request);
    QJsonObject handleShutdown(const QJsonObject& request);

    void requestShutdown();

    QString m_serviceName;
    std::unique_ptr<SocketServer> m_server;
    std::atomic<int> m_gracePeriodMs{3000};

private:
    bool writePidFile();
    void removePidFile();

    std::atomic<bool> m_running{false};
    QString m_pidPath;
};

} // namespace dd

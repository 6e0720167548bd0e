#include "core/ipc/service_base.h"
#include "core/shared/logging.h"
#include <QCoreApplication>
#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonObject>
#include <QSaveFile>
#include <QSocketNotifier>

#include <sys/socket.h>
#include <sys/types.h>
#include <csignal>
#include <unistd.h>

#include <cstdio>

namespace dd {

namespace {

int g_signalFds[2] = {-1, -1};

void forwardSignal(int)
{
    const char byte = 1;
    const ssize_t written = ::write(g_signalFds[0], &byte, sizeof(byte));
    (void)written;
}

QString defaultRuntimeRoot()
{
    const uid_t uid = getuid();
    return QStringLiteral("/tmp/daedalus-%1").arg(uid);
}

QString normalizedEnvPath(const char* envName)
{
    const QString value = qEnvironmentVariable(envName).trimmed();
    if (value.isEmpty()) {
        return {};
    }
    return QDir::cleanPath(value);
}

bool ensurePrivateDirectory(const QString& path)
{
    QDir dir(path);
    if (!dir.exists() && !dir.mkpath(QStringLiteral("."))) {
        qCCritical(ddIpc, "Failed to create directory: %s", qPrintable(path));
        return false;
    }
    if (!QFile::setPermissions(path, QFileDevice::ReadOwner | QFileDevice::WriteOwner
                                         | QFileDevice::ExeOwner)) {
        qCWarning(ddIpc, "Failed to restrict permissions on %s", qPrintable(path));
    }
    return true;
}

} // namespace

ServiceBase::ServiceBase(const QString& serviceName, QObject* parent)
    : QObject(parent)
    , m_serviceName(serviceName)
    , m_server(std::make_unique<SocketServer>())
{
    m_server->setRequestHandler([this](const QJsonObject& request) {
        return handleRequest(request);
    });
}

ServiceBase::~ServiceBase()
{
    m_server->close();
    removePidFile();
}

int ServiceBase::start()
{
    if (m_running.load()) {
        return kExitOk;
    }

    const QString path = socketPath(m_serviceName);
    if (!ensurePrivateDirectory(QFileInfo(path).absolutePath())) {
        return kExitStartupFailed;
    }

    switch (m_server->listen(path)) {
    case SocketServer::ListenStatus::Listening:
        break;
    case SocketServer::ListenStatus::AlreadyRunning:
        qCCritical(ddIpc, "Service '%s' is already running on %s",
                   qPrintable(m_serviceName), qPrintable(path));
        return kExitAlreadyRunning;
    case SocketServer::ListenStatus::Failed:
        qCCritical(ddIpc, "Service '%s' failed to start", qPrintable(m_serviceName));
        return kExitStartupFailed;
    }

    if (!writePidFile()) {
        m_server->close();
        return kExitStartupFailed;
    }

    m_running = true;
    qCInfo(ddIpc, "Service '%s' started on %s", qPrintable(m_serviceName), qPrintable(path));
    return kExitOk;
}

int ServiceBase::run()
{
    const int startCode = start();
    if (startCode != kExitOk) {
        return startCode;
    }

    if (!installSignalHandlers()) {
        qCWarning(ddIpc, "Signal handlers not installed; SIGTERM will not drain requests");
    }

    // Signal readiness to supervisor
    fprintf(stdout, "ready\n");
    fflush(stdout);

    const int code = QCoreApplication::exec();
    stop();
    return code;
}

void ServiceBase::stop()
{
    if (!m_running.exchange(false)) {
        return;
    }

    const int graceMs = m_gracePeriodMs.load();
    qCInfo(ddIpc, "Service '%s' stopping (grace=%dms)", qPrintable(m_serviceName), graceMs);
    m_server->close(graceMs);
    onShutdown();
    removePidFile();
    qCInfo(ddIpc, "Service '%s' stopped", qPrintable(m_serviceName));
}

bool ServiceBase::isRunning() const
{
    return m_running.load();
}

bool ServiceBase::installSignalHandlers()
{
    if (g_signalFds[0] != -1) {
        return true;
    }
    if (::socketpair(AF_UNIX, SOCK_STREAM, 0, g_signalFds) != 0) {
        qCWarning(ddIpc, "socketpair() failed for signal handling");
        g_signalFds[0] = g_signalFds[1] = -1;
        return false;
    }

    auto* notifier = new QSocketNotifier(g_signalFds[1], QSocketNotifier::Read,
                                         QCoreApplication::instance());
    QObject::connect(notifier, &QSocketNotifier::activated, notifier, [notifier]() {
        notifier->setEnabled(false);
        char byte = 0;
        const ssize_t received = ::read(g_signalFds[1], &byte, sizeof(byte));
        (void)received;
        qCInfo(ddIpc, "Termination signal received, shutting down");
        QCoreApplication::quit();
        notifier->setEnabled(true);
    });

    struct sigaction action {};
    action.sa_handler = forwardSignal;
    sigemptyset(&action.sa_mask);
    action.sa_flags = SA_RESTART;
    if (::sigaction(SIGTERM, &action, nullptr) != 0
        || ::sigaction(SIGINT, &action, nullptr) != 0) {
        qCWarning(ddIpc, "sigaction() failed");
        return false;
    }
    return true;
}

bool ServiceBase::writePidFile()
{
    m_pidPath = pidPath(m_serviceName);
    if (!ensurePrivateDirectory(QFileInfo(m_pidPath).absolutePath())) {
        return false;
    }

    QSaveFile file(m_pidPath);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        qCCritical(ddIpc, "Failed to open PID file %s: %s",
                   qPrintable(m_pidPath), qPrintable(file.errorString()));
        return false;
    }
    file.write(QByteArray::number(QCoreApplication::applicationPid()) + '\n');
    if (!file.commit()) {
        qCCritical(ddIpc, "Failed to write PID file %s: %s",
                   qPrintable(m_pidPath), qPrintable(file.errorString()));
        return false;
    }
    QFile::setPermissions(m_pidPath, QFileDevice::ReadOwner | QFileDevice::WriteOwner);
    return true;
}

void ServiceBase::removePidFile()
{
    if (m_pidPath.isEmpty()) {
        return;
    }

    // Only remove a PID file that still names this process.
    QFile file(m_pidPath);
    if (file.open(QIODevice::ReadOnly)) {
        const qint64 pid = file.readAll().trimmed().toLongLong();
        file.close();
        if (pid == QCoreApplication::applicationPid()) {
            file.remove();
        }
    }
    m_pidPath.clear();
}

QString ServiceBase::socketPath(const QString& serviceName)
{
    return QDir::cleanPath(socketDirectory() + QLatin1Char('/')
                           + serviceName + QStringLiteral(".sock"));
}

QString ServiceBase::runtimeDirectory()
{
    const QString runtimeDir = normalizedEnvPath("DAEDALUS_RUNTIME_DIR");
    if (!runtimeDir.isEmpty()) {
        return runtimeDir;
    }
    return defaultRuntimeRoot();
}

QString ServiceBase::socketDirectory()
{
    const QString socketDir = normalizedEnvPath("DAEDALUS_SOCKET_DIR");
    if (!socketDir.isEmpty()) {
        return socketDir;
    }
    return runtimeDirectory();
}

QString ServiceBase::pidDirectory()
{
    const QString pidDir = normalizedEnvPath("DAEDALUS_PID_DIR");
    if (!pidDir.isEmpty()) {
        return pidDir;
    }
    return runtimeDirectory();
}

QString ServiceBase::pidPath(const QString& serviceName)
{
    return QDir::cleanPath(pidDirectory() + QLatin1Char('/')
                           + serviceName + QStringLiteral(".pid"));
}

QJsonObject ServiceBase::handleRequest(const QJsonObject& request)
{
    const QString type = IpcMessage::requestType(request);

    switch (messageTypeFromString(type)) {
    case MessageType::Ping:
        return handlePing(request);
    case MessageType::Shutdown:
        return handleShutdown(request);
    default:
        break;
    }

    qCWarning(ddIpc, "Unknown message type '%s' in service '%s'",
              qPrintable(type), qPrintable(m_serviceName));
    return IpcMessage::makeError(IpcErrorCode::NotFound,
                                 QStringLiteral("Unknown message type: %1").arg(type),
                                 IpcMessage::requestId(request));
}

QJsonObject ServiceBase::handlePing(const QJsonObject& request)
{
    QJsonObject result;
    result[QStringLiteral("message")] = QStringLiteral("pong");
    result[QStringLiteral("timestamp")] = QDateTime::currentMSecsSinceEpoch();
    result[QStringLiteral("service")] = m_serviceName;

    qCDebug(ddIpc, "Ping received for service '%s'", qPrintable(m_serviceName));
    return IpcMessage::makeResponse(result, IpcMessage::requestId(request));
}

QJsonObject ServiceBase::handleShutdown(const QJsonObject& request)
{
    qCInfo(ddIpc, "Shutdown requested for service '%s'", qPrintable(m_serviceName));

    QJsonObject result;
    result[QStringLiteral("message")] = QStringLiteral("shutting down");

    requestShutdown();
    return IpcMessage::makeResponse(result, IpcMessage::requestId(request));
}

void ServiceBase::requestShutdown()
{
    // Queued so the response is written before the loop exits.
    if (QCoreApplication* app = QCoreApplication::instance()) {
        QMetaObject::invokeMethod(app, &QCoreApplication::quit, Qt::QueuedConnection);
    }
}

} // namespace dd

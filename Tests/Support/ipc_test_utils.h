#pragma once

#include "core/ipc/socket_client.h"

#include <QByteArray>
#include <QJsonObject>
#include <QString>

class QLocalSocket;

namespace dd::test {

QString resolveDaemonBinary();
QString makeShortSocketPath(const QString& tag);
bool waitForSocketFile(const QString& socketPath, int timeoutMs);
bool waitForServiceReady(SocketClient& client,
                         const QString& socketPath,
                         int timeoutMs,
                         int pingTimeoutMs = 500);
QJsonObject sendRequestOrEmpty(SocketClient& client,
                               const QString& type,
                               const QJsonObject& data = {},
                               int timeoutMs = 3000);
QJsonObject requestOrFailWithDiagnostics(SocketClient& client,
                                         const QString& type,
                                         const QJsonObject& data = {},
                                         int timeoutMs = 3000,
                                         const QString& socketPath = {});

// Raw socket helpers for framing tests.
bool writeRaw(QLocalSocket& socket, const QByteArray& bytes);
QJsonObject readFrame(QLocalSocket& socket, int timeoutMs);

bool isOk(const QJsonObject& message);
bool isError(const QJsonObject& message);
QString errorCodeString(const QJsonObject& message);

} // namespace dd::test

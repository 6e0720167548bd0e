#include "daemon_service.h"
#include <QCoreApplication>

int main(int argc, char* argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName(QStringLiteral("daedalus-daemon"));
    app.setApplicationVersion(QStringLiteral("0.1.0"));

    dd::DaemonService service;

    // Bind before touching shared state so a second instance exits early.
    const int startCode = service.start();
    if (startCode != dd::ServiceBase::kExitOk) {
        return startCode;
    }
    if (!service.initialize()) {
        service.stop();
        return dd::ServiceBase::kExitStartupFailed;
    }
    return service.run();
}

#pragma once

#include <QString>
#include <QStringList>

namespace dd {

struct Settings {
    // Suggestions
    int maxSuggestions = 5;
    double minConfidence = 0.3;
    int fuzzyThreshold = 60;
    int fuzzyPoolSize = 500;
    int semanticK = 10;

    // Privacy
    int retentionDays = 90;         // 0 keeps history forever
    QStringList excludedPaths = {
        QStringLiteral("~/.ssh"),
        QStringLiteral("~/.gnupg"),
        QStringLiteral("~/.password-store"),
    };
    QStringList excludedPatterns = {
        QStringLiteral("password"),
        QStringLiteral("token"),
        QStringLiteral("secret"),
        QStringLiteral("api[_-]?key"),
        QStringLiteral("aws[_-]?access"),
    };

    // Vector index
    int embeddingDimensions = 128;
    int buildBatchSize = 32;
    int buildIntervalMs = 30000;

    // Daemon transport
    int requestTimeoutMs = 10000;
    int readTimeoutMs = 5000;
    int writeTimeoutMs = 5000;
    int idleTimeoutMs = 300000;
    int gracePeriodMs = 3000;
    int maxConnections = 64;
};

} // namespace dd

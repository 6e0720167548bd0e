#pragma once

#include <QRegularExpression>
#include <QString>
#include <QStringList>

#include <vector>

namespace dd {

// PrivacyFilter -- decides whether a logged command may be persisted.
//
// Decision table, evaluated in order:
//   1. cwd equals or lies below an excluded directory  -> ExcludedPath
//   2. command text matches an excluded pattern          -> ExcludedPattern
//   3. Otherwise                                         -> Allow
//
// Excluded directories are the configured list plus the built-in credential
// directories. "~" expands to the home directory. Patterns are
// case-insensitive regular expressions; invalid or oversized ones are
// skipped with a warning.
class PrivacyFilter {
public:
    enum class Decision {
        Allow,
        ExcludedPath,
        ExcludedPattern,
    };

    static constexpr int kMaxPatternLength = 256;

    explicit PrivacyFilter(const QStringList& excludedPaths = {},
                           const QStringList& excludedPatterns = {},
                           bool includeDefaultPaths = true,
                           const QString& homeDirectory = {});

    Decision evaluate(const QString& command, const QString& cwd) const;

    // Directory rule only.
    bool isExcluded(const QString& cwd) const;

    int pathRuleCount() const { return static_cast<int>(m_paths.size()); }
    int patternCount() const { return static_cast<int>(m_patterns.size()); }

    static QStringList defaultSensitivePaths();
    static QString expandHome(const QString& path, const QString& homeDirectory);

private:
    QString m_home;
    QStringList m_paths;
    std::vector<QRegularExpression> m_patterns;
};

QString privacyDecisionToString(PrivacyFilter::Decision decision);

} // namespace dd

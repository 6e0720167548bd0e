#include "core/privacy/privacy_filter.h"
#include "core/shared/logging.h"

#include <QDir>

namespace dd {

namespace {

bool isUnderRoot(const QString& path, const QString& root)
{
    if (root == QLatin1String("/")) {
        return path.startsWith(QLatin1Char('/'));
    }
    return path == root || path.startsWith(root + QLatin1Char('/'));
}

} // namespace

QStringList PrivacyFilter::defaultSensitivePaths()
{
    return {
        QStringLiteral("~/.ssh"),
        QStringLiteral("~/.gnupg"),
        QStringLiteral("~/.password-store"),
        QStringLiteral("~/.config/pass"),
        QStringLiteral("~/.aws"),
        QStringLiteral("~/.kube"),
        QStringLiteral("~/.docker"),
        QStringLiteral("~/.config/gcloud"),
        QStringLiteral("~/.azure"),
        QStringLiteral("~/.config/gh"),
        QStringLiteral("/etc/ssh"),
    };
}

QString PrivacyFilter::expandHome(const QString& path, const QString& homeDirectory)
{
    const QString trimmed = path.trimmed();
    if (trimmed == QLatin1String("~")) {
        return QDir::cleanPath(homeDirectory);
    }
    if (trimmed.startsWith(QLatin1String("~/"))) {
        return QDir::cleanPath(homeDirectory + trimmed.mid(1));
    }
    return QDir::cleanPath(trimmed);
}

PrivacyFilter::PrivacyFilter(const QStringList& excludedPaths,
                             const QStringList& excludedPatterns,
                             bool includeDefaultPaths,
                             const QString& homeDirectory)
    : m_home(homeDirectory.isEmpty() ? QDir::homePath() : homeDirectory)
{
    QStringList roots = excludedPaths;
    if (includeDefaultPaths) {
        roots += defaultSensitivePaths();
    }
    for (const QString& root : roots) {
        if (root.trimmed().isEmpty()) {
            continue;
        }
        const QString expanded = expandHome(root, m_home);
        if (!m_paths.contains(expanded)) {
            m_paths.append(expanded);
        }
    }

    for (const QString& pattern : excludedPatterns) {
        if (pattern.isEmpty()) {
            continue;
        }
        if (pattern.size() > kMaxPatternLength) {
            LOG_WARN(ddPrivacy, "Skipping excluded pattern longer than %d characters",
                     kMaxPatternLength);
            continue;
        }
        QRegularExpression re(pattern, QRegularExpression::CaseInsensitiveOption);
        if (!re.isValid()) {
            LOG_WARN(ddPrivacy, "Skipping invalid excluded pattern '%s': %s",
                     qUtf8Printable(pattern), qUtf8Printable(re.errorString()));
            continue;
        }
        re.optimize();
        m_patterns.push_back(std::move(re));
    }
}

bool PrivacyFilter::isExcluded(const QString& cwd) const
{
    if (cwd.trimmed().isEmpty()) {
        return false;
    }
    const QString path = expandHome(cwd, m_home);
    for (const QString& root : m_paths) {
        if (isUnderRoot(path, root)) {
            return true;
        }
    }
    return false;
}

PrivacyFilter::Decision PrivacyFilter::evaluate(const QString& command, const QString& cwd) const
{
    if (isExcluded(cwd)) {
        return Decision::ExcludedPath;
    }
    for (const QRegularExpression& re : m_patterns) {
        if (re.match(command).hasMatch()) {
            return Decision::ExcludedPattern;
        }
    }
    return Decision::Allow;
}

QString privacyDecisionToString(PrivacyFilter::Decision decision)
{
    switch (decision) {
    case PrivacyFilter::Decision::Allow:           return QStringLiteral("allow");
    case PrivacyFilter::Decision::ExcludedPath:    return QStringLiteral("excluded_path");
    case PrivacyFilter::Decision::ExcludedPattern: return QStringLiteral("excluded_pattern");
    }
    return QStringLiteral("allow");
}

} // namespace dd

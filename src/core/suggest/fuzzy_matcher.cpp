#include "core/suggest/fuzzy_matcher.h"

#include <QSet>
#include <QVector>

#include <algorithm>
#include <cmath>

namespace dd {

int FuzzyMatcher::indelDistance(const QString& a, const QString& b)
{
    const int aLen = a.size();
    const int bLen = b.size();
    if (aLen == 0 || bLen == 0) {
        return aLen + bLen;
    }

    // Longest common subsequence, two rows.
    QVector<int> prev(bLen + 1, 0);
    QVector<int> curr(bLen + 1, 0);
    for (int i = 1; i <= aLen; ++i) {
        curr[0] = 0;
        for (int j = 1; j <= bLen; ++j) {
            if (a[i - 1] == b[j - 1]) {
                curr[j] = prev[j - 1] + 1;
            } else {
                curr[j] = std::max(prev[j], curr[j - 1]);
            }
        }
        std::swap(prev, curr);
    }

    const int lcs = prev[bLen];
    return aLen + bLen - 2 * lcs;
}

double FuzzyMatcher::rawRatio(const QString& a, const QString& b)
{
    const int total = a.size() + b.size();
    if (total == 0) {
        return 100.0;
    }
    return 100.0 * (1.0 - static_cast<double>(indelDistance(a, b)) / static_cast<double>(total));
}

int FuzzyMatcher::ratio(const QString& a, const QString& b)
{
    if (a.isEmpty() || b.isEmpty()) {
        return 0;
    }
    return static_cast<int>(std::lround(rawRatio(a.toLower(), b.toLower())));
}

QString FuzzyMatcher::normalize(const QString& text)
{
    QString out;
    out.reserve(text.size());
    for (const QChar ch : text) {
        out.append(ch.isLetterOrNumber() ? ch.toLower() : QChar(QLatin1Char(' ')));
    }
    return out.simplified();
}

QStringList FuzzyMatcher::sortedTokens(const QString& normalized)
{
    QStringList tokens = normalized.split(QLatin1Char(' '), Qt::SkipEmptyParts);
    tokens.sort();
    return tokens;
}

int FuzzyMatcher::tokenSortRatio(const QString& a, const QString& b)
{
    const QString left = sortedTokens(normalize(a)).join(QLatin1Char(' '));
    const QString right = sortedTokens(normalize(b)).join(QLatin1Char(' '));
    if (left.isEmpty() || right.isEmpty()) {
        return 0;
    }
    return static_cast<int>(std::lround(rawRatio(left, right)));
}

int FuzzyMatcher::tokenSetRatio(const QString& a, const QString& b)
{
    const QString left = normalize(a);
    const QString right = normalize(b);
    if (left.isEmpty() || right.isEmpty()) {
        return 0;
    }

    const QStringList leftTokens = sortedTokens(left);
    const QStringList rightTokens = sortedTokens(right);
    const QSet<QString> leftSet(leftTokens.begin(), leftTokens.end());
    const QSet<QString> rightSet(rightTokens.begin(), rightTokens.end());

    QStringList intersection;
    QStringList onlyLeft;
    QStringList onlyRight;
    for (const QString& token : leftSet) {
        (rightSet.contains(token) ? intersection : onlyLeft).append(token);
    }
    for (const QString& token : rightSet) {
        if (!leftSet.contains(token)) {
            onlyRight.append(token);
        }
    }
    intersection.sort();
    onlyLeft.sort();
    onlyRight.sort();

    const QString shared = intersection.join(QLatin1Char(' '));
    const QString combinedLeft = (shared + QLatin1Char(' ') + onlyLeft.join(QLatin1Char(' '))).trimmed();
    const QString combinedRight = (shared + QLatin1Char(' ') + onlyRight.join(QLatin1Char(' '))).trimmed();

    double best = rawRatio(combinedLeft, combinedRight);
    if (!shared.isEmpty()) {
        best = std::max(best, rawRatio(shared, combinedLeft));
        best = std::max(best, rawRatio(shared, combinedRight));
    }
    return static_cast<int>(std::lround(best));
}

} // namespace dd

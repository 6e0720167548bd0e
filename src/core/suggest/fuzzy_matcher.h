#pragma once

#include <QString>
#include <QStringList>

namespace dd {

// FuzzyMatcher -- normalized edit-distance similarity on a 0-100 scale.
//
// ratio() is the indel similarity 100 * (1 - indel / (len(a) + len(b))).
// tokenSetRatio() lowercases, strips punctuation and compares the shared
// token set against each side's remainder, so token order and repeated
// tokens do not matter.
class FuzzyMatcher {
public:
    static int ratio(const QString& a, const QString& b);
    static int tokenSortRatio(const QString& a, const QString& b);
    static int tokenSetRatio(const QString& a, const QString& b);

    // Insertions plus deletions needed to turn a into b.
    static int indelDistance(const QString& a, const QString& b);

    // Lowercase, non-alphanumerics to spaces, collapsed whitespace.
    static QString normalize(const QString& text);

private:
    static double rawRatio(const QString& a, const QString& b);
    static QStringList sortedTokens(const QString& normalized);
};

} // namespace dd

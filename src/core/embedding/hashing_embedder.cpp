#include "core/embedding/hashing_embedder.h"

#include <QRegularExpression>
#include <QStringList>

#include <algorithm>
#include <cmath>

namespace dd {

HashingEmbedder::HashingEmbedder(int dimensions)
    : m_dimensions(std::max(dimensions, 1))
{
}

uint32_t HashingEmbedder::fnv1a(const QByteArray& bytes)
{
    uint32_t hash = 2166136261u;
    for (const char ch : bytes) {
        hash ^= static_cast<uint8_t>(ch);
        hash *= 16777619u;
    }
    return hash;
}

void HashingEmbedder::accumulate(std::vector<float>& vector, const QByteArray& feature,
                                 float weight) const
{
    const uint32_t hash = fnv1a(feature);
    const size_t bucket = static_cast<size_t>(hash % static_cast<uint32_t>(m_dimensions));
    // High bit picks the sign so colliding features tend to cancel.
    const float sign = (hash & 0x80000000u) ? -1.0f : 1.0f;
    vector[bucket] += sign * weight;
}

std::vector<float> HashingEmbedder::encode(const QString& text)
{
    static const QRegularExpression whitespace(QStringLiteral("\\s+"));

    const QString normalized = text.trimmed().toLower();
    if (normalized.isEmpty()) {
        return {};
    }

    std::vector<float> vector(static_cast<size_t>(m_dimensions), 0.0f);

    const QStringList tokens = normalized.split(whitespace, Qt::SkipEmptyParts);
    for (const QString& token : tokens) {
        accumulate(vector, QByteArrayLiteral("t:") + token.toUtf8(), kTokenWeight);
    }

    const QString padded = QLatin1Char('^') + tokens.join(QLatin1Char(' ')) + QLatin1Char('$');
    for (int i = 0; i + 3 <= padded.size(); ++i) {
        accumulate(vector, QByteArrayLiteral("g:") + padded.mid(i, 3).toUtf8(), kTrigramWeight);
    }

    double norm = 0.0;
    for (const float value : vector) {
        norm += static_cast<double>(value) * static_cast<double>(value);
    }
    if (norm <= 0.0) {
        return vector;
    }

    const float inverse = static_cast<float>(1.0 / std::sqrt(norm));
    for (float& value : vector) {
        value *= inverse;
    }
    return vector;
}

} // namespace dd

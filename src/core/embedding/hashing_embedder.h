#pragma once

#include "core/embedding/embedder.h"

#include <cstdint>

namespace dd {

// Feature-hashing embedder: whitespace tokens and character trigrams are
// hashed into a signed bag of features and L2 normalized. Stable across
// runs, so a saved index stays valid after restart.
class HashingEmbedder : public Embedder {
public:
    static constexpr float kTokenWeight = 1.0f;
    static constexpr float kTrigramWeight = 0.5f;

    explicit HashingEmbedder(int dimensions);

    int dimensions() const override { return m_dimensions; }
    std::vector<float> encode(const QString& text) override;

    static uint32_t fnv1a(const QByteArray& bytes);

private:
    void accumulate(std::vector<float>& vector, const QByteArray& feature, float weight) const;

    const int m_dimensions;
};

} // namespace dd

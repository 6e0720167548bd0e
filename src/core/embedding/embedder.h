#pragma once

#include <QString>

#include <vector>

namespace dd {

// Produces a fixed-length vector per command text. Implementations must be
// safe to call from several threads at once.
class Embedder {
public:
    virtual ~Embedder() = default;

    virtual int dimensions() const = 0;
    virtual bool isAvailable() const { return true; }

    // Returns an empty vector on failure.
    virtual std::vector<float> encode(const QString& text) = 0;
};

} // namespace dd

#pragma once

#include "core/shared/types.h"

#include <QCache>
#include <QString>
#include <QStringList>

#include <mutex>
#include <optional>
#include <vector>

namespace dd {

class CommandStore;
class ConfigProvider;
class Embedder;
class VectorIndex;

// SuggestionCascade -- ranks completions for a partially typed command.
//
// Tiers run in order EXACT (prefix lookup), FUZZY (token-set similarity
// against recent history) and SEMANTIC (embedding nearest neighbours). The
// union is merged by command text, sorted deterministically, filtered by
// min_confidence and capped at max_suggestions.
//
// A store failure fails the request. A missing embedder or an unbuilt index
// only removes the semantic tier.
class SuggestionCascade {
public:
    static constexpr int kExactPoolLimit = 200;
    static constexpr double kExactRankDecay = 0.02;
    static constexpr double kExactConfidenceFloor = 0.5;
    static constexpr int kEmbeddingCacheEntries = 256;

    struct Outcome {
        enum class Status {
            Ok,
            RetrievalFailed,
        };

        Status status = Status::Ok;
        QString message;
        std::vector<SuggestionCandidate> suggestions;
        bool semanticConsulted = false;

        bool ok() const { return status == Status::Ok; }
    };

    SuggestionCascade(CommandStore& store,
                      VectorIndex& index,
                      ConfigProvider& config,
                      Embedder* embedder = nullptr);

    // history: recent commands from the caller's session, added to the
    // fuzzy candidate pool.
    Outcome suggest(const QString& partial,
                    const QString& cwd = {},
                    const QStringList& history = {});

    // Union by command text, keep the best confidence, record every tier,
    // then sort by (confidence desc, tier priority, command asc).
    static std::vector<SuggestionCandidate> merge(const std::vector<SuggestionCandidate>& candidates);

private:
    std::optional<std::vector<SuggestionCandidate>> exactTier(const QString& partial,
                                                              const QString& cwd);
    std::optional<std::vector<SuggestionCandidate>> fuzzyTier(const QString& partial,
                                                              const QStringList& history,
                                                              int poolSize,
                                                              int threshold);
    std::vector<SuggestionCandidate> semanticTier(const QString& partial, int k, bool& consulted);

    std::vector<float> embedPartial(const QString& partial);

    CommandStore& m_store;
    VectorIndex& m_index;
    ConfigProvider& m_config;
    Embedder* m_embedder = nullptr;

    std::mutex m_cacheMutex;
    QCache<QString, std::vector<float>> m_embeddingCache;
};

} // namespace dd

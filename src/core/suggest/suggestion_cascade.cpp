#include "core/suggest/suggestion_cascade.h"
#include "core/embedding/embedder.h"
#include "core/history/command_store.h"
#include "core/shared/config_provider.h"
#include "core/shared/logging.h"
#include "core/suggest/fuzzy_matcher.h"
#include "core/vector/vector_index.h"

#include <QElapsedTimer>
#include <QHash>
#include <QSet>

#include <algorithm>

namespace dd {

namespace {

void addSource(SuggestionCandidate& candidate, SuggestionTier tier)
{
    if (std::find(candidate.sources.begin(), candidate.sources.end(), tier)
        == candidate.sources.end()) {
        candidate.sources.push_back(tier);
    }
}

} // namespace

SuggestionCascade::SuggestionCascade(CommandStore& store,
                                     VectorIndex& index,
                                     ConfigProvider& config,
                                     Embedder* embedder)
    : m_store(store)
    , m_index(index)
    , m_config(config)
    , m_embedder(embedder)
    , m_embeddingCache(kEmbeddingCacheEntries)
{
}

SuggestionCascade::Outcome SuggestionCascade::suggest(const QString& partial,
                                                      const QString& cwd,
                                                      const QStringList& history)
{
    Outcome outcome;
    if (partial.trimmed().isEmpty()) {
        return outcome;
    }

    QElapsedTimer timer;
    timer.start();

    const Settings settings = m_config.snapshot();

    auto exact = exactTier(partial, cwd);
    if (!exact) {
        outcome.status = Outcome::Status::RetrievalFailed;
        outcome.message = QStringLiteral("Command history unavailable (prefix lookup failed)");
        return outcome;
    }

    auto fuzzy = fuzzyTier(partial, history, settings.fuzzyPoolSize, settings.fuzzyThreshold);
    if (!fuzzy) {
        outcome.status = Outcome::Status::RetrievalFailed;
        outcome.message = QStringLiteral("Command history unavailable (recent lookup failed)");
        return outcome;
    }

    const int k = std::max(settings.semanticK, settings.maxSuggestions * 2);
    std::vector<SuggestionCandidate> semantic = semanticTier(partial, k, outcome.semanticConsulted);

    std::vector<SuggestionCandidate> all;
    all.reserve(exact->size() + fuzzy->size() + semantic.size());
    all.insert(all.end(), exact->begin(), exact->end());
    all.insert(all.end(), fuzzy->begin(), fuzzy->end());
    all.insert(all.end(), semantic.begin(), semantic.end());

    for (SuggestionCandidate& candidate : merge(all)) {
        if (candidate.confidence < settings.minConfidence) {
            continue;
        }
        if (static_cast<int>(outcome.suggestions.size()) >= settings.maxSuggestions) {
            break;
        }
        outcome.suggestions.push_back(std::move(candidate));
    }

    LOG_DEBUG(ddSuggest, "suggest('%s'): exact=%d fuzzy=%d semantic=%d -> %d in %lldms",
              qUtf8Printable(partial),
              static_cast<int>(exact->size()),
              static_cast<int>(fuzzy->size()),
              static_cast<int>(semantic.size()),
              static_cast<int>(outcome.suggestions.size()),
              static_cast<long long>(timer.elapsed()));
    return outcome;
}

std::optional<std::vector<SuggestionCandidate>> SuggestionCascade::exactTier(const QString& partial,
                                                                             const QString& cwd)
{
    auto records = m_store.searchPrefix(partial, cwd, kExactPoolLimit, true);
    if (!records) {
        LOG_WARN(ddSuggest, "Exact tier: prefix lookup failed");
        return std::nullopt;
    }

    std::vector<SuggestionCandidate> candidates;
    QSet<QString> seen;
    for (const CommandRecord& record : records.value()) {
        if (seen.contains(record.command)) {
            continue;
        }
        const int rank = seen.size();
        seen.insert(record.command);

        SuggestionCandidate candidate;
        candidate.command = record.command;
        candidate.confidence = std::max(1.0 - rank * kExactRankDecay, kExactConfidenceFloor);
        candidate.sourceTier = SuggestionTier::Exact;
        candidate.sources = {SuggestionTier::Exact};
        candidates.push_back(std::move(candidate));
    }
    return candidates;
}

std::optional<std::vector<SuggestionCandidate>> SuggestionCascade::fuzzyTier(
    const QString& partial, const QStringList& history, int poolSize, int threshold)
{
    auto pool = m_store.distinctRecent(poolSize, true);
    if (!pool) {
        LOG_WARN(ddSuggest, "Fuzzy tier: recent lookup failed");
        return std::nullopt;
    }

    QStringList commands;
    QSet<QString> seen;
    for (const CommandStore::CommandSummary& summary : pool.value()) {
        if (!seen.contains(summary.command)) {
            seen.insert(summary.command);
            commands.append(summary.command);
        }
    }
    for (const QString& entry : history) {
        const QString command = entry.trimmed();
        if (!command.isEmpty() && !seen.contains(command)) {
            seen.insert(command);
            commands.append(command);
        }
    }

    std::vector<SuggestionCandidate> candidates;
    for (const QString& command : commands) {
        const int score = FuzzyMatcher::tokenSetRatio(partial, command);
        if (score < threshold) {
            continue;
        }
        SuggestionCandidate candidate;
        candidate.command = command;
        candidate.confidence = static_cast<double>(score) / 100.0;
        candidate.sourceTier = SuggestionTier::Fuzzy;
        candidate.fuzzyScore = static_cast<double>(score);
        candidate.sources = {SuggestionTier::Fuzzy};
        candidates.push_back(std::move(candidate));
    }
    return candidates;
}

std::vector<SuggestionCandidate> SuggestionCascade::semanticTier(const QString& partial, int k,
                                                                 bool& consulted)
{
    consulted = false;
    std::vector<SuggestionCandidate> candidates;

    if (!m_embedder || !m_embedder->isAvailable()) {
        return candidates;
    }
    if (!m_index.isBuilt()) {
        LOG_DEBUG(ddSuggest, "Semantic tier skipped: index not built");
        return candidates;
    }

    const std::vector<float> vector = embedPartial(partial);
    if (vector.empty()) {
        LOG_DEBUG(ddSuggest, "Semantic tier skipped: embedding unavailable");
        return candidates;
    }

    const VectorIndex::QueryResult result = m_index.query(vector, k);
    if (result.status != VectorIndex::QueryResult::Status::Ok) {
        LOG_DEBUG(ddSuggest, "Semantic tier skipped: index query status=%d",
                  static_cast<int>(result.status));
        return candidates;
    }
    consulted = true;

    for (const VectorIndex::QueryHit& hit : result.hits) {
        const QString command = hit.metadata.value(QStringLiteral("command")).toString();
        if (command.isEmpty()) {
            continue;
        }
        const double similarity = 1.0 / (1.0 + static_cast<double>(hit.distance));

        SuggestionCandidate candidate;
        candidate.command = command;
        candidate.confidence = std::clamp(similarity, 0.0, 1.0);
        candidate.sourceTier = SuggestionTier::Semantic;
        candidate.similarityScore = similarity;
        candidate.sources = {SuggestionTier::Semantic};
        candidates.push_back(std::move(candidate));
    }
    return candidates;
}

std::vector<float> SuggestionCascade::embedPartial(const QString& partial)
{
    {
        std::lock_guard<std::mutex> lock(m_cacheMutex);
        if (const std::vector<float>* cached = m_embeddingCache.object(partial)) {
            return *cached;
        }
    }

    std::vector<float> vector = m_embedder->encode(partial);
    if (static_cast<int>(vector.size()) != m_index.dimensions()) {
        if (!vector.empty()) {
            LOG_WARN(ddSuggest, "Embedder returned %d dimensions, index expects %d",
                     static_cast<int>(vector.size()), m_index.dimensions());
        }
        return {};
    }

    std::lock_guard<std::mutex> lock(m_cacheMutex);
    m_embeddingCache.insert(partial, new std::vector<float>(vector));
    return vector;
}

std::vector<SuggestionCandidate> SuggestionCascade::merge(
    const std::vector<SuggestionCandidate>& candidates)
{
    std::vector<SuggestionCandidate> merged;
    QHash<QString, size_t> positions;

    for (const SuggestionCandidate& candidate : candidates) {
        auto it = positions.constFind(candidate.command);
        if (it == positions.constEnd()) {
            positions.insert(candidate.command, merged.size());
            SuggestionCandidate copy = candidate;
            copy.sources.clear();
            addSource(copy, candidate.sourceTier);
            for (SuggestionTier tier : candidate.sources) {
                addSource(copy, tier);
            }
            merged.push_back(std::move(copy));
            continue;
        }

        SuggestionCandidate& existing = merged[it.value()];
        addSource(existing, candidate.sourceTier);
        for (SuggestionTier tier : candidate.sources) {
            addSource(existing, tier);
        }

        const bool better = candidate.confidence > existing.confidence
            || (candidate.confidence == existing.confidence
                && suggestionTierPriority(candidate.sourceTier)
                       > suggestionTierPriority(existing.sourceTier));
        if (better) {
            existing.confidence = candidate.confidence;
            existing.sourceTier = candidate.sourceTier;
        }
        if (candidate.fuzzyScore.has_value()) {
            existing.fuzzyScore = std::max(existing.fuzzyScore.value_or(0.0),
                                           candidate.fuzzyScore.value());
        }
        if (candidate.similarityScore.has_value()) {
            existing.similarityScore = std::max(existing.similarityScore.value_or(0.0),
                                                candidate.similarityScore.value());
        }
    }

    for (SuggestionCandidate& candidate : merged) {
        std::sort(candidate.sources.begin(), candidate.sources.end(),
                  [](SuggestionTier a, SuggestionTier b) {
                      return suggestionTierPriority(a) > suggestionTierPriority(b);
                  });
    }

    std::stable_sort(merged.begin(), merged.end(),
                     [](const SuggestionCandidate& a, const SuggestionCandidate& b) {
                         if (a.confidence != b.confidence) {
                             return a.confidence > b.confidence;
                         }
                         const int priorityA = suggestionTierPriority(a.sourceTier);
                         const int priorityB = suggestionTierPriority(b.sourceTier);
                         if (priorityA != priorityB) {
                             return priorityA > priorityB;
                         }
                         return a.command < b.command;
                     });
    return merged;
}

} // namespace dd

#pragma once

#include <QJsonObject>
#include <QString>
#include <cstdint>
#include <optional>
#include <vector>

namespace dd {

// One executed shell invocation. Immutable once stored.
struct CommandRecord {
    int64_t id = 0;
    QString command;
    QString workingDirectory;
    int exitCode = 0;
    double durationSeconds = 0.0;
    double timestamp = 0.0;     // seconds since epoch
    QString sessionId;
};

// Retrieval strategy that produced a suggestion.
enum class SuggestionTier {
    Exact,
    Semantic,
    Fuzzy,
};

QString suggestionTierToString(SuggestionTier tier);

// Tie-break priority: EXACT > SEMANTIC > FUZZY.
int suggestionTierPriority(SuggestionTier tier);

struct SuggestionCandidate {
    QString command;
    double confidence = 0.0;
    SuggestionTier sourceTier = SuggestionTier::Exact;
    std::optional<double> fuzzyScore;
    std::optional<double> similarityScore;
    std::vector<SuggestionTier> sources;
};

QJsonObject commandRecordToJson(const CommandRecord& record);
QJsonObject suggestionCandidateToJson(const SuggestionCandidate& candidate);

} // namespace dd

#include "core/shared/types.h"

#include <QJsonArray>

namespace dd {

QString suggestionTierToString(SuggestionTier tier)
{
    switch (tier) {
    case SuggestionTier::Exact:    return QStringLiteral("EXACT");
    case SuggestionTier::Semantic: return QStringLiteral("SEMANTIC");
    case SuggestionTier::Fuzzy:    return QStringLiteral("FUZZY");
    }
    return QStringLiteral("EXACT");
}

int suggestionTierPriority(SuggestionTier tier)
{
    switch (tier) {
    case SuggestionTier::Exact:    return 3;
    case SuggestionTier::Semantic: return 2;
    case SuggestionTier::Fuzzy:    return 1;
    }
    return 0;
}

QJsonObject commandRecordToJson(const CommandRecord& record)
{
    QJsonObject json;
    json[QStringLiteral("id")] = static_cast<qint64>(record.id);
    json[QStringLiteral("command")] = record.command;
    json[QStringLiteral("cwd")] = record.workingDirectory;
    json[QStringLiteral("exit_code")] = record.exitCode;
    json[QStringLiteral("duration")] = record.durationSeconds;
    json[QStringLiteral("timestamp")] = record.timestamp;
    if (!record.sessionId.isEmpty()) {
        json[QStringLiteral("session_id")] = record.sessionId;
    }
    return json;
}

QJsonObject suggestionCandidateToJson(const SuggestionCandidate& candidate)
{
    QJsonObject json;
    json[QStringLiteral("command")] = candidate.command;
    json[QStringLiteral("confidence")] = candidate.confidence;
    json[QStringLiteral("source_tier")] = suggestionTierToString(candidate.sourceTier);

    QJsonArray sources;
    for (SuggestionTier tier : candidate.sources) {
        sources.append(suggestionTierToString(tier));
    }
    json[QStringLiteral("sources")] = sources;

    if (candidate.fuzzyScore.has_value()) {
        json[QStringLiteral("fuzzy_score")] = candidate.fuzzyScore.value();
    }
    if (candidate.similarityScore.has_value()) {
        json[QStringLiteral("similarity_score")] = candidate.similarityScore.value();
    }
    return json;
}

} // namespace dd

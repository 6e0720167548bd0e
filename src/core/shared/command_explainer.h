#pragma once

#include <QString>

#include <optional>

namespace dd {

// Natural-language description of a shell command. Optional collaborator:
// a daemon without one answers explain requests with Unsupported.
class CommandExplainer {
public:
    virtual ~CommandExplainer() = default;

    // nullopt when no explanation could be produced.
    virtual std::optional<QString> explain(const QString& command) = 0;
};

} // namespace dd

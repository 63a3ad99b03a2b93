#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <variant>

#include <nlohmann/json.hpp>

#include "common/models.hpp"

namespace regdelta {

class ChangeHistory;
class SnapshotStore;

struct ChangeFilter {
    std::optional<ChangeKind> kind;
    std::optional<std::string> date;
    std::optional<std::string> field;
    // Matched against the record's STATE context, ignoring case.
    std::optional<std::string> state;

    bool operator==(const ChangeFilter &other) const = default;
};

struct CountChanges {
    ChangeFilter filter;

    bool operator==(const CountChanges &other) const = default;
};

struct ListChanges {
    ChangeFilter filter;
    std::size_t limit = 20;

    bool operator==(const ListChanges &other) const = default;
};

struct EntityHistory {
    EntityKey key;

    bool operator==(const EntityHistory &other) const = default;
};

// Latest run when date is unset.
struct RunSummary {
    std::optional<std::string> date;

    bool operator==(const RunSummary &other) const = default;
};

struct SnapshotStats {
    bool operator==(const SnapshotStats &other) const = default;
};

struct Help {
    bool operator==(const Help &other) const = default;
};

using QueryCommand = std::variant<CountChanges,
                                  ListChanges,
                                  EntityHistory,
                                  RunSummary,
                                  SnapshotStats,
                                  Help>;

struct QueryResponse {
    std::string text;
    nlohmann::json data;
};

// Maps a free-text question onto a command by keyword. Unrecognized input
// becomes Help.
QueryCommand parseQuery(const std::string &text);

// Answers commands from the read-only history and snapshot interfaces.
class QueryInterpreter {
public:
    QueryInterpreter(const ChangeHistory &history, const SnapshotStore &store);

    QueryResponse execute(const QueryCommand &command) const;
    QueryResponse ask(const std::string &text) const;

private:
    QueryResponse run(const CountChanges &command) const;
    QueryResponse run(const ListChanges &command) const;
    QueryResponse run(const EntityHistory &command) const;
    QueryResponse run(const RunSummary &command) const;
    QueryResponse run(const SnapshotStats &command) const;
    QueryResponse run(const Help &command) const;

    const ChangeHistory &m_history;
    const SnapshotStore &m_store;
};

} // namespace regdelta

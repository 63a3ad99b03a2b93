#include "query/query_interpreter.hpp"

#include <algorithm>
#include <cctype>
#include <limits>
#include <map>
#include <set>
#include <sstream>
#include <vector>

#include "changelog/change_history.hpp"
#include "common/json_utils.hpp"
#include "common/time_utils.hpp"
#include "engine/value_normalizer.hpp"
#include "store/snapshot_store.hpp"

namespace regdelta {

namespace {

struct Token {
    std::string raw;
    std::string lower;
};

std::vector<Token> tokenize(const std::string &text)
{
    std::vector<Token> tokens;
    std::istringstream in(text);
    std::string word;
    while (in >> word) {
        const auto first = word.find_first_not_of("\"'(?,.;:!)");
        const auto last = word.find_last_not_of("\"'(?,.;:!)");
        if (first == std::string::npos) {
            continue;
        }
        Token token;
        token.raw = word.substr(first, last - first + 1);
        token.lower = token.raw;
        std::transform(token.lower.begin(), token.lower.end(), token.lower.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        tokens.push_back(std::move(token));
    }
    return tokens;
}

bool startsWith(const std::string &value, const std::string &prefix)
{
    return value.compare(0, prefix.size(), prefix) == 0;
}

bool hasWord(const std::vector<Token> &tokens, std::initializer_list<const char *> prefixes)
{
    for (const auto &token : tokens) {
        for (const char *prefix : prefixes) {
            if (startsWith(token.lower, prefix)) {
                return true;
            }
        }
    }
    return false;
}

std::optional<std::string> wordAfter(const std::vector<Token> &tokens,
                                     std::initializer_list<const char *> keywords)
{
    for (std::size_t i = 0; i + 1 < tokens.size(); ++i) {
        for (const char *keyword : keywords) {
            if (tokens[i].lower == keyword) {
                std::size_t next = i + 1;
                // "history of K1", "changes for K1"
                if (next + 1 < tokens.size()
                    && (tokens[next].lower == "of" || tokens[next].lower == "for")) {
                    ++next;
                }
                return tokens[next].raw;
            }
        }
    }
    return std::nullopt;
}

bool hasDigit(const std::string &value)
{
    return std::any_of(value.begin(), value.end(),
                       [](unsigned char c) { return std::isdigit(c); });
}

// Registry keys always carry digits, so "new company incorporations" is not
// read as a lookup of an entity called "incorporations".
std::optional<std::string> entityKeyAfter(const std::vector<Token> &tokens)
{
    for (std::size_t i = 0; i + 1 < tokens.size(); ++i) {
        const std::string &word = tokens[i].lower;
        if (word != "entity" && word != "company" && word != "cin" && word != "history") {
            continue;
        }
        std::size_t next = i + 1;
        if (next + 1 < tokens.size()
            && (tokens[next].lower == "of" || tokens[next].lower == "for")) {
            ++next;
        }
        if (hasDigit(tokens[next].raw)) {
            return tokens[next].raw;
        }
    }
    return std::nullopt;
}

std::optional<std::string> asDate(const Token &token)
{
    if (isValidCaptureDate(token.raw)) {
        return token.raw;
    }
    const std::string expanded = expandCompactDate(token.raw);
    if (expanded != token.raw && isValidCaptureDate(expanded)) {
        return expanded;
    }
    return std::nullopt;
}

std::optional<std::string> findDate(const std::vector<Token> &tokens)
{
    for (const auto &token : tokens) {
        if (auto date = asDate(token)) {
            return date;
        }
    }
    return std::nullopt;
}

bool isStateStopword(const std::string &word)
{
    static const std::set<std::string> stopwords = {
        "on", "for", "top", "limit", "first", "last", "field", "total"};
    return stopwords.contains(word);
}

struct StateSpan {
    std::string name;
    std::size_t begin = 0;
    std::size_t end = 0;
};

// "in Tamil Nadu on 2024-01-02": the words after "in" up to a stopword or a date.
std::optional<StateSpan> findState(const std::vector<Token> &tokens)
{
    for (std::size_t i = 0; i + 1 < tokens.size(); ++i) {
        if (tokens[i].lower != "in") {
            continue;
        }
        StateSpan span;
        span.begin = i;
        std::size_t j = i + 1;
        for (; j < tokens.size(); ++j) {
            if (isStateStopword(tokens[j].lower) || asDate(tokens[j]).has_value()) {
                break;
            }
            if (!span.name.empty()) {
                span.name += " ";
            }
            span.name += tokens[j].raw;
        }
        if (!span.name.empty()) {
            span.end = j;
            return span;
        }
    }
    return std::nullopt;
}

std::optional<ChangeKind> findKind(const std::vector<Token> &tokens)
{
    if (hasWord(tokens, {"new", "incorporat", "appeared", "added"})) {
        return ChangeKind::New;
    }
    if (hasWord(tokens, {"deregist", "removed", "disappeared", "closed", "struck"})) {
        return ChangeKind::Removed;
    }
    if (hasWord(tokens, {"update", "modif", "mutat"})) {
        return ChangeKind::FieldUpdate;
    }
    return std::nullopt;
}

std::optional<std::size_t> findLimit(const std::vector<Token> &tokens)
{
    for (std::size_t i = 0; i + 1 < tokens.size(); ++i) {
        if (tokens[i].lower == "top" || tokens[i].lower == "limit"
            || tokens[i].lower == "first" || tokens[i].lower == "last") {
            const std::string &value = tokens[i + 1].raw;
            if (!value.empty() && std::all_of(value.begin(), value.end(),
                                              [](unsigned char c) { return std::isdigit(c); })) {
                if (value.size() > 9) {
                    return std::numeric_limits<std::size_t>::max();
                }
                return static_cast<std::size_t>(std::stoul(value));
            }
        }
    }
    return std::nullopt;
}

std::string upper(std::string value)
{
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return value;
}

std::string lower(std::string value)
{
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

std::string kindLabel(std::optional<ChangeKind> kind)
{
    if (!kind.has_value()) {
        return "changes";
    }
    switch (*kind) {
    case ChangeKind::New:
        return "new incorporations";
    case ChangeKind::Removed:
        return "deregistrations";
    case ChangeKind::FieldUpdate:
        return "field updates";
    }
    return "changes";
}

std::string describe(const ChangeRecord &record)
{
    std::string line = record.detectionDate + " " + toChangeTypeString(record.kind) + " "
        + record.entityKey;
    if (record.kind == ChangeKind::FieldUpdate) {
        line += " " + record.fieldName + ": " + record.oldValue.value_or("(null)") + " -> "
            + record.newValue.value_or("(null)");
    } else if (record.context.entityName.has_value()) {
        line += " (" + *record.context.entityName + ")";
    }
    return line;
}

nlohmann::json filterJson(const ChangeFilter &filter)
{
    nlohmann::json j = nlohmann::json::object();
    j["kind"] = filter.kind.has_value() ? nlohmann::json(*filter.kind) : nlohmann::json();
    j["date"] = filter.date.has_value() ? nlohmann::json(*filter.date) : nlohmann::json();
    j["field"] = filter.field.has_value() ? nlohmann::json(*filter.field) : nlohmann::json();
    j["state"] = filter.state.has_value() ? nlohmann::json(*filter.state) : nlohmann::json();
    return j;
}

std::vector<ChangeRecord> selectChanges(const ChangeHistory &history, const ChangeFilter &filter)
{
    std::vector<ChangeRecord> source = filter.date.has_value()
        ? history.changesForDate(*filter.date)
        : history.allChanges();

    const std::optional<std::string> state = filter.state.has_value()
        ? std::optional<std::string>(lower(ValueNormalizer::normalizeText(*filter.state)))
        : std::nullopt;

    std::vector<ChangeRecord> out;
    for (auto &record : source) {
        if (filter.kind.has_value() && record.kind != *filter.kind) {
            continue;
        }
        if (filter.field.has_value() && record.fieldName != *filter.field) {
            continue;
        }
        if (state.has_value()
            && (!record.context.state.has_value()
                || lower(ValueNormalizer::normalizeText(*record.context.state)) != *state)) {
            continue;
        }
        out.push_back(std::move(record));
    }
    return out;
}

} // namespace

QueryCommand parseQuery(const std::string &text)
{
    auto tokens = tokenize(text);
    if (tokens.empty() || hasWord(tokens, {"help", "usage"})) {
        return Help{};
    }

    if (auto key = entityKeyAfter(tokens)) {
        return EntityHistory{*key};
    }

    if (hasWord(tokens, {"snapshot"})) {
        return SnapshotStats{};
    }

    const auto date = findDate(tokens);
    if (hasWord(tokens, {"summary", "summari", "overview"})) {
        return RunSummary{date};
    }

    ChangeFilter filter;
    // State names ("New Delhi") must not feed the change-kind keywords.
    if (auto span = findState(tokens)) {
        filter.state = span->name;
        tokens.erase(tokens.begin() + static_cast<std::ptrdiff_t>(span->begin),
                     tokens.begin() + static_cast<std::ptrdiff_t>(span->end));
    }
    filter.kind = findKind(tokens);
    filter.date = date;
    if (auto field = wordAfter(tokens, {"field"})) {
        filter.field = upper(*field);
        if (!filter.kind.has_value()) {
            filter.kind = ChangeKind::FieldUpdate;
        }
    }

    const bool counting = hasWord(tokens, {"count", "number"})
        || (tokens.size() > 1 && tokens[0].lower == "how" && tokens[1].lower == "many");
    if (counting) {
        return CountChanges{filter};
    }

    if (hasWord(tokens, {"list", "show", "which", "what"})) {
        ListChanges list;
        list.filter = filter;
        if (auto limit = findLimit(tokens)) {
            list.limit = *limit;
        }
        return list;
    }

    if (filter.kind.has_value() || filter.date.has_value() || filter.state.has_value()) {
        return CountChanges{filter};
    }
    return Help{};
}

QueryInterpreter::QueryInterpreter(const ChangeHistory &history, const SnapshotStore &store)
    : m_history(history)
    , m_store(store)
{
}

QueryResponse QueryInterpreter::ask(const std::string &text) const
{
    return execute(parseQuery(text));
}

QueryResponse QueryInterpreter::execute(const QueryCommand &command) const
{
    return std::visit([this](const auto &cmd) { return run(cmd); }, command);
}

QueryResponse QueryInterpreter::run(const CountChanges &command) const
{
    const auto changes = selectChanges(m_history, command.filter);

    std::string text = std::to_string(changes.size()) + " " + kindLabel(command.filter.kind);
    if (command.filter.field.has_value()) {
        text += " to " + *command.filter.field;
    }
    if (command.filter.state.has_value()) {
        text += " in " + *command.filter.state;
    }
    if (command.filter.date.has_value()) {
        text += " on " + *command.filter.date;
    } else if (!command.filter.state.has_value()) {
        text += " in total";
    }
    text += ".";

    return {text, nlohmann::json{{"command", "count_changes"},
                                 {"filter", filterJson(command.filter)},
                                 {"count", changes.size()}}};
}

QueryResponse QueryInterpreter::run(const ListChanges &command) const
{
    const auto changes = selectChanges(m_history, command.filter);
    const std::size_t shown = std::min(command.limit, changes.size());

    std::string label = kindLabel(command.filter.kind);
    if (command.filter.state.has_value()) {
        label += " in " + *command.filter.state;
    }

    std::string text;
    if (changes.empty()) {
        text = "No matching " + label + ".";
    } else {
        text = "Showing " + std::to_string(shown) + " of " + std::to_string(changes.size())
            + " " + label + ":";
        for (std::size_t i = 0; i < shown; ++i) {
            text += "\n  " + describe(changes[i]);
        }
    }

    nlohmann::json items = nlohmann::json::array();
    for (std::size_t i = 0; i < shown; ++i) {
        items.push_back(nlohmann::json(changes[i]));
    }
    return {text, nlohmann::json{{"command", "list_changes"},
                                 {"filter", filterJson(command.filter)},
                                 {"total", changes.size()},
                                 {"changes", items}}};
}

QueryResponse QueryInterpreter::run(const EntityHistory &command) const
{
    const auto changes = m_history.changesForEntity(command.key);

    std::string text;
    if (changes.empty()) {
        text = "No recorded changes for " + command.key + ".";
    } else {
        text = std::to_string(changes.size()) + " recorded changes for " + command.key + ":";
        for (const auto &record : changes) {
            text += "\n  " + describe(record);
        }
    }
    return {text, nlohmann::json{{"command", "entity_history"},
                                 {"entity_key", command.key},
                                 {"changes", changes}}};
}

QueryResponse QueryInterpreter::run(const RunSummary &command) const
{
    const std::optional<std::string> date = command.date.has_value()
        ? command.date
        : m_history.latestRunDate();
    if (!date.has_value()) {
        return {"No runs recorded yet.",
                nlohmann::json{{"command", "run_summary"}, {"run", nullptr}}};
    }
    if (!m_history.hasRun(*date)) {
        return {"No run recorded for " + *date + ".",
                nlohmann::json{{"command", "run_summary"}, {"run", nullptr}}};
    }

    ChangeSet changeSet;
    changeSet.detectionDate = *date;
    changeSet.records = m_history.changesForDate(*date);

    std::map<std::string, std::size_t> breakdown;
    std::map<std::string, std::size_t> byState;
    for (const auto &record : changeSet.records) {
        if (record.kind == ChangeKind::FieldUpdate) {
            ++breakdown[record.fieldName];
        }
        if (record.context.state.has_value() && !record.context.state->empty()) {
            ++byState[*record.context.state];
        }
    }
    std::vector<std::string> affectedStates;
    for (const auto &entry : byState) {
        affectedStates.push_back(entry.first);
    }

    std::string text = "Run " + *date + ": "
        + std::to_string(changeSet.count(ChangeKind::New)) + " new incorporations, "
        + std::to_string(changeSet.count(ChangeKind::Removed)) + " deregistrations, "
        + std::to_string(changeSet.count(ChangeKind::FieldUpdate)) + " field updates.";
    for (const auto &[field, count] : breakdown) {
        text += "\n  " + field + ": " + std::to_string(count);
    }
    if (!affectedStates.empty()) {
        text += "\nAffected states: ";
        for (std::size_t i = 0; i < affectedStates.size(); ++i) {
            text += (i == 0 ? "" : ", ") + affectedStates[i];
        }
    }

    return {text, nlohmann::json{{"command", "run_summary"},
                                 {"run", *date},
                                 {"counts", changeCounts(changeSet)},
                                 {"field_change_breakdown", breakdown},
                                 {"affected_states", affectedStates},
                                 {"state_breakdown", byState}}};
}

QueryResponse QueryInterpreter::run(const SnapshotStats &) const
{
    const auto snapshots = m_store.listSnapshots();
    if (snapshots.empty()) {
        return {"No snapshots stored.",
                nlohmann::json{{"command", "snapshot_stats"}, {"count", 0}}};
    }

    const auto &first = snapshots.front();
    const auto &last = snapshots.back();
    std::string text = std::to_string(snapshots.size()) + " snapshots from "
        + first.captureDate + " to " + last.captureDate + "; latest has "
        + std::to_string(last.recordCount) + " records.";

    return {text, nlohmann::json{{"command", "snapshot_stats"},
                                 {"count", snapshots.size()},
                                 {"earliest", first.captureDate},
                                 {"latest", last.captureDate},
                                 {"latest_record_count", last.recordCount},
                                 {"snapshots", snapshots}}};
}

QueryResponse QueryInterpreter::run(const Help &) const
{
    const std::string text =
        "Ask about recorded changes, for example:\n"
        "  how many new incorporations on 2024-01-02\n"
        "  list field updates field AUTHORIZED_CAPITAL top 10\n"
        "  count deregistrations in Maharashtra\n"
        "  history of U12345MH2020PTC123456\n"
        "  summary 2024-01-02\n"
        "  snapshots";
    return {text, nlohmann::json{{"command", "help"}}};
}

} // namespace regdelta

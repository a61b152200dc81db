#pragma once
#include <parallel_hashmap/phmap.h>

#include <cstddef>
#include <string>
#include <string_view>

namespace CT {

enum class Stage {
    Primary,
    Nested,
    Check
};

[[nodiscard]] auto stageToString(Stage stage) -> std::string_view;

/**
 * Identifiers accepted so far by the primary and nested stages, plus one
 * run-wide set of sub-identifiers. A sub-identifier accepted under one parent
 * is never accepted again under any other parent. Entries are never removed.
 *
 * The existence check registers nothing; only Stage::Primary and
 * Stage::Nested are meaningful keys here.
 */
class IdentifierRegistry {
public:
    [[nodiscard]] auto seen(Stage stage, std::string_view id) const -> bool;
    // Callers check seen() first; marking an existing id is a no-op.
    void mark(Stage stage, std::string_view id);
    [[nodiscard]] auto size(Stage stage) const -> std::size_t;

    [[nodiscard]] auto seenSub(std::string_view subId) const -> bool;
    void markSub(std::string_view subId);
    [[nodiscard]] auto subCount() const -> std::size_t { return subIds.size(); }

private:
    using IdSet = phmap::flat_hash_set<std::string>;

    auto set(Stage stage) -> IdSet&;
    auto set(Stage stage) const -> IdSet const&;

    IdSet primaryIds;
    IdSet nestedIds;
    IdSet subIds;
};

} // namespace CT

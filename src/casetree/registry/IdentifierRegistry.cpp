#include "IdentifierRegistry.hpp"

namespace CT {

auto stageToString(Stage stage) -> std::string_view {
    switch (stage) {
    case Stage::Primary:
        return "first CSV";
    case Stage::Nested:
        return "second CSV";
    case Stage::Check:
        return "third CSV";
    }
    return "unknown";
}

auto IdentifierRegistry::set(Stage stage) -> IdSet& {
    return stage == Stage::Nested ? nestedIds : primaryIds;
}

auto IdentifierRegistry::set(Stage stage) const -> IdSet const& {
    return stage == Stage::Nested ? nestedIds : primaryIds;
}

auto IdentifierRegistry::seen(Stage stage, std::string_view id) const -> bool {
    return this->set(stage).contains(std::string{id});
}

void IdentifierRegistry::mark(Stage stage, std::string_view id) {
    this->set(stage).emplace(id);
}

auto IdentifierRegistry::size(Stage stage) const -> std::size_t {
    return this->set(stage).size();
}

auto IdentifierRegistry::seenSub(std::string_view subId) const -> bool {
    return subIds.contains(std::string{subId});
}

void IdentifierRegistry::markSub(std::string_view subId) {
    subIds.emplace(subId);
}

} // namespace CT

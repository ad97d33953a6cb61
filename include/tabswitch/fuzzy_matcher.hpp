#pragma once

#include <optional>
#include <string>

namespace tabswitch
{

// Scores a candidate label against a query. nullopt means "no match";
// higher scores are better matches.
class FuzzyMatcher
{
   public:
    virtual ~FuzzyMatcher() = default;

    virtual std::optional<int> score(const std::string& candidate,
                                     const std::string& query) const = 0;
};

}   // namespace tabswitch

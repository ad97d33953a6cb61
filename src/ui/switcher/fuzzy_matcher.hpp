#pragma once

#include <string>
#include <tabswitch/fuzzy_matcher.hpp>

namespace tabswitch
{

// Case-insensitive subsequence matcher shared by the tab switcher and the
// command registry.
//
// Scoring:
//   - Substring match: 100, +50 if it is a prefix, +25 if it is the whole text
//   - Otherwise every query char must appear in order: 10 per matched char,
//     a growing bonus for consecutive matches, +15 on word boundaries
//   - Empty query: 1 (everything matches equally)
class DefaultFuzzyMatcher : public FuzzyMatcher
{
   public:
    std::optional<int> score(const std::string& candidate,
                             const std::string& query) const override;

    // Raw score, 0 when there is no match.
    static int fuzzy_score(const std::string& query, const std::string& text);
};

}   // namespace tabswitch

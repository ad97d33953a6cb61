#include "fuzzy_matcher.hpp"

#include <cctype>

namespace tabswitch
{

static std::string to_lower(const std::string& s)
{
    std::string out;
    out.reserve(s.size());
    for (char c : s)
        out += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return out;
}

static bool is_word_boundary(const std::string& text, size_t i)
{
    if (i == 0)
        return true;
    char prev = text[i - 1];
    if (prev == ' ' || prev == '_' || prev == '.' || prev == '/' || prev == '-')
        return true;
    return std::islower(static_cast<unsigned char>(prev))
           && std::isupper(static_cast<unsigned char>(text[i]));
}

std::optional<int> DefaultFuzzyMatcher::score(const std::string& candidate,
                                              const std::string& query) const
{
    int s = fuzzy_score(query, candidate);
    if (s <= 0)
        return std::nullopt;
    return s;
}

int DefaultFuzzyMatcher::fuzzy_score(const std::string& query, const std::string& text)
{
    if (query.empty())
        return 1;
    if (text.empty())
        return 0;

    std::string q_lower = to_lower(query);
    std::string t_lower = to_lower(text);

    auto pos = t_lower.find(q_lower);
    if (pos != std::string::npos)
    {
        int score = 100;
        if (pos == 0)
            score += 50;
        if (q_lower.size() == t_lower.size())
            score += 25;
        return score;
    }

    size_t qi                = 0;
    int    score             = 0;
    bool   prev_matched      = false;
    int    consecutive_bonus = 0;

    for (size_t ti = 0; ti < t_lower.size() && qi < q_lower.size(); ++ti)
    {
        if (t_lower[ti] == q_lower[qi])
        {
            score += 10;

            if (prev_matched)
            {
                consecutive_bonus += 5;
                score += consecutive_bonus;
            }
            else
            {
                consecutive_bonus = 0;
            }

            if (is_word_boundary(text, ti))
            {
                score += 15;
            }

            prev_matched = true;
            ++qi;
        }
        else
        {
            prev_matched      = false;
            consecutive_bonus = 0;
        }
    }

    // All query chars must match
    if (qi < q_lower.size())
        return 0;

    return score;
}

}   // namespace tabswitch

#include "tab_match_list.hpp"

#include <algorithm>
#include <exception>
#include <tabswitch/logger.hpp>
#include <unordered_map>

namespace tabswitch
{

MatchRequest TabMatchList::begin_update(std::string query, std::vector<TabMatch> candidates)
{
    MatchRequest req;
    req.generation = ++latest_generation_;
    req.query      = std::move(query);
    req.candidates = std::move(candidates);
    return req;
}

// Best of the short label and the full-context label, so both "main.cpp" and
// "src/main" find the same tab. A throwing scorer counts as no match.
static std::optional<int> score_candidate(const TabMatch&     m,
                                          const FuzzyMatcher& matcher,
                                          const std::string&  query,
                                          size_t              max_detail)
{
    try
    {
        auto short_score = matcher.score(m.item->tab_label(0), query);
        auto long_score  = matcher.score(m.item->tab_label(max_detail), query);
        if (!short_score)
            return long_score;
        if (!long_score)
            return short_score;
        return std::max(*short_score, *long_score);
    }
    catch (const std::exception& e)
    {
        TABSWITCH_LOG_DEBUG(log_category::Matches, "scorer failed: {}", e.what());
        return std::nullopt;
    }
}

MatchResult TabMatchList::compute(const MatchRequest& request,
                                  const FuzzyMatcher& matcher,
                                  const MatchOptions& options)
{
    MatchResult result;
    result.generation = request.generation;
    result.query      = request.query;

    if (request.query.empty())
    {
        result.matches = request.candidates;
        for (auto& m : result.matches)
            m.score = 0;
    }
    else
    {
        for (const auto& candidate : request.candidates)
        {
            if (!candidate.item)
                continue;
            auto s = score_candidate(candidate, matcher, request.query, options.max_detail);
            if (!s || *s <= 0)
                continue;
            TabMatch m = candidate;
            m.score    = *s;
            result.matches.push_back(std::move(m));
        }

        // Candidates arrive in baseline order, so a stable sort breaks ties by it.
        std::stable_sort(result.matches.begin(),
                         result.matches.end(),
                         [](const TabMatch& a, const TabMatch& b) { return a.score > b.score; });

        if (options.max_results > 0 && result.matches.size() > options.max_results)
        {
            result.matches.resize(options.max_results);
        }
    }

    compute_details(result.matches, options.max_detail);
    return result;
}

void TabMatchList::compute_details(std::vector<TabMatch>& matches, size_t max_detail)
{
    for (auto& m : matches)
        m.detail = 0;

    bool done = false;
    while (!done)
    {
        done = true;

        // Group by label. A match whose label stopped changing at its current
        // detail is left out: more detail would not help it.
        std::unordered_map<std::string, std::vector<size_t>> by_label;
        for (size_t ix = 0; ix < matches.size(); ++ix)
        {
            const auto& m = matches[ix];
            if (!m.item)
                continue;
            std::string label = m.item->tab_label(m.detail);
            if (m.detail == 0 || label != m.item->tab_label(m.detail - 1))
            {
                by_label[label].push_back(ix);
            }
        }

        for (auto& [label, ixs] : by_label)
        {
            if (ixs.size() < 2)
                continue;
            for (size_t ix : ixs)
            {
                if (matches[ix].detail < max_detail)
                {
                    matches[ix].detail++;
                    done = false;
                }
            }
        }
    }
}

bool TabMatchList::apply(MatchResult result)
{
    if (cancelled_)
    {
        TABSWITCH_LOG_DEBUG(log_category::Matches,
                            "dropping result {} for a closed list",
                            result.generation);
        return false;
    }
    if (!is_latest(result.generation))
    {
        TABSWITCH_LOG_DEBUG(log_category::Matches,
                            "dropping superseded result {} (latest {})",
                            result.generation,
                            latest_generation_);
        return false;
    }

    matches_            = std::move(result.matches);
    query_              = std::move(result.query);
    applied_generation_ = result.generation;
    selected_           = matches_.empty() ? std::nullopt : std::optional<size_t>(0);

    TABSWITCH_LOG_TRACE(log_category::Matches,
                        "applied generation {}: {} matches for '{}'",
                        applied_generation_,
                        matches_.size(),
                        query_);
    return true;
}

const TabMatch* TabMatchList::at(size_t ix) const
{
    return ix < matches_.size() ? &matches_[ix] : nullptr;
}

bool TabMatchList::select(size_t ix)
{
    if (ix >= matches_.size())
        return false;
    selected_ = ix;
    return true;
}

bool TabMatchList::remove_at(size_t ix)
{
    if (ix >= matches_.size())
        return false;

    matches_.erase(matches_.begin() + static_cast<std::ptrdiff_t>(ix));
    if (matches_.empty())
    {
        selected_.reset();
    }
    else if (selected_ && *selected_ >= matches_.size())
    {
        selected_ = matches_.size() - 1;
    }
    return true;
}

}   // namespace tabswitch

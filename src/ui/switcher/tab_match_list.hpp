#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <tabswitch/fuzzy_matcher.hpp>
#include <vector>

#include "tab_match.hpp"

namespace tabswitch
{

// A recomputation request. Carries everything compute() needs so it can run
// after the list has moved on.
struct MatchRequest
{
    uint64_t              generation = 0;
    std::string           query;
    std::vector<TabMatch> candidates;   // Baseline order
};

struct MatchResult
{
    uint64_t              generation = 0;
    std::string           query;
    std::vector<TabMatch> matches;
};

struct MatchOptions
{
    size_t max_detail  = 8;   // Disambiguation ceiling
    size_t max_results = 0;   // 0 = unlimited; applies to non-empty queries
};

// ─── TabMatchList ────────────────────────────────────────────────────────────
// The live, filtered list plus its selection.
//
// Recomputation is split in three so it can be suspended:
//   begin_update()  issues a new generation; every older request is superseded
//   compute()       pure scoring/sorting, may run later
//   apply()         replaces the list only if the result is still the latest

class TabMatchList
{
   public:
    TabMatchList() = default;

    MatchRequest begin_update(std::string query, std::vector<TabMatch> candidates);

    static MatchResult compute(const MatchRequest& request,
                               const FuzzyMatcher& matcher,
                               const MatchOptions& options = {});

    // Returns false (and leaves the list untouched) if the result has been
    // superseded or the list was cancelled.
    bool apply(MatchResult result);

    // Discard every in-flight and future result.
    void cancel() { cancelled_ = true; }
    bool cancelled() const { return cancelled_; }

    bool     is_latest(uint64_t generation) const { return generation == latest_generation_; }
    uint64_t latest_generation() const { return latest_generation_; }
    uint64_t applied_generation() const { return applied_generation_; }

    // ── Contents ────────────────────────────────────────────────────────

    const std::vector<TabMatch>& matches() const { return matches_; }
    size_t                       size() const { return matches_.size(); }
    bool                         empty() const { return matches_.empty(); }
    const TabMatch*              at(size_t ix) const;
    const std::string&           query() const { return query_; }

    // ── Selection ───────────────────────────────────────────────────────

    std::optional<size_t> selected() const { return selected_; }

    // Returns false for out-of-range indices.
    bool select(size_t ix);

    // Remove one match. Later matches shift down by one; the selection is
    // clamped to the new length. Returns false for out-of-range indices.
    bool remove_at(size_t ix);

    // Assign the smallest detail levels that make every label unique, raising
    // only colliding labels and never beyond `max_detail`.
    static void compute_details(std::vector<TabMatch>& matches, size_t max_detail);

   private:
    std::vector<TabMatch> matches_;
    std::string           query_;
    std::optional<size_t> selected_;
    uint64_t              latest_generation_  = 0;
    uint64_t              applied_generation_ = 0;
    bool                  cancelled_          = false;
};

}   // namespace tabswitch

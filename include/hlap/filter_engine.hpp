#pragma once

#include "types.hpp"
#include <functional>
#include <string>
#include <vector>

namespace hlap {

// Which longer peptides may contain a fragment
enum class FragmentScope : uint8_t {
    SameProtein,  // container must share a master accession with the fragment
    Global        // any longer peptide in the run
};

inline const char* fragment_scope_name(FragmentScope scope) {
    return scope == FragmentScope::Global ? "global" : "protein";
}

struct FragmentPolicy {
    FragmentScope scope = FragmentScope::SameProtein;
    int min_length = 6;          // shorter peptides are never called fragments
    int max_length = 22;         // longer peptides only act as containers
    double rt_tolerance = 0.5;   // minutes; <= 0 disables the retention time check
};

struct FilterConfig {
    bool skip_contaminant_removal = false;
    bool skip_fragment_removal = false;
    bool skip_duplicate_removal = false;
    std::string contaminant_marker = "sp";
    FragmentPolicy fragment;

    bool stage_enabled(FilterStage stage) const {
        switch (stage) {
            case FilterStage::Contaminant: return !skip_contaminant_removal;
            case FilterStage::Fragment: return !skip_fragment_removal;
            case FilterStage::Duplicate: return !skip_duplicate_removal;
        }
        return false;
    }
};

// True when any master accession carries the marker as its classification
// tag: the whole value ("sp") or its first '|' field ("sp|P02768|ALBU_HUMAN").
// Case-sensitive; "xsp" and "SP" do not match "sp".
bool is_contaminant(const PeptideRecord& record, const std::string& marker);

// True when `container` may hold `fragment` under the policy's scope and RT rules.
// Does not look at the sequences.
bool fragment_container_in_scope(const PeptideRecord& fragment,
                                 const PeptideRecord& container,
                                 const FragmentPolicy& policy);

FilterStageResult remove_contaminants(const std::vector<PeptideRecord>& input,
                                      const std::string& marker);

// A record is a fragment when its sequence is an exact substring of a
// strictly longer record of `input` that is in scope. Containers come from
// the whole stage input, so nested fragments are all removed.
FilterStageResult remove_fragments(const std::vector<PeptideRecord>& input,
                                   const FragmentPolicy& policy);

// First occurrence of each normalized sequence wins
FilterStageResult remove_duplicates(const std::vector<PeptideRecord>& input);

using StageCallback = std::function<void(const FilterStageResult&)>;

/**
 * Run the cascade contaminant -> fragment -> duplicate.
 *
 * Always returns one result per stage in that order. A disabled stage has
 * enabled=false, kept equal to its input and nothing removed. Each stage
 * consumes the previous stage's kept set, so kept sets only shrink and the
 * removed sets plus the final kept set partition the input.
 * `on_stage` (optional) sees each result as soon as its stage finishes.
 */
std::vector<FilterStageResult> run_filters(const std::vector<PeptideRecord>& input,
                                           const FilterConfig& config,
                                           const StageCallback& on_stage = nullptr);

// Final kept set of a cascade (the input itself when `results` is empty)
const std::vector<PeptideRecord>& final_kept(const std::vector<FilterStageResult>& results,
                                             const std::vector<PeptideRecord>& input);

}  // namespace hlap

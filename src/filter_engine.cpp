#include "hlap/filter_engine.hpp"
#include <algorithm>
#include <cmath>
#include <numeric>
#include <unordered_set>

namespace hlap {

bool is_contaminant(const PeptideRecord& record, const std::string& marker) {
    if (marker.empty()) return false;
    for (const auto& acc : record.master_accessions) {
        const size_t bar = acc.find('|');
        const std::string tag = trim(bar == std::string::npos ? acc : acc.substr(0, bar));
        if (tag == marker) return true;
    }
    return false;
}

bool fragment_container_in_scope(const PeptideRecord& fragment,
                                 const PeptideRecord& container,
                                 const FragmentPolicy& policy) {
    if (policy.scope == FragmentScope::SameProtein) {
        bool shared = false;
        for (const auto& a : fragment.master_accessions) {
            if (std::find(container.master_accessions.begin(),
                          container.master_accessions.end(), a) !=
                container.master_accessions.end()) {
                shared = true;
                break;
            }
        }
        if (!shared) return false;
    }
    if (policy.rt_tolerance > 0.0 && fragment.retention_time && container.retention_time) {
        if (std::abs(*fragment.retention_time - *container.retention_time) >= policy.rt_tolerance) {
            return false;
        }
    }
    return true;
}

FilterStageResult remove_contaminants(const std::vector<PeptideRecord>& input,
                                      const std::string& marker) {
    FilterStageResult result;
    result.stage = FilterStage::Contaminant;
    for (const auto& rec : input) {
        if (is_contaminant(rec, marker)) {
            result.removed.push_back(rec);
        } else {
            result.kept.push_back(rec);
        }
    }
    return result;
}

FilterStageResult remove_fragments(const std::vector<PeptideRecord>& input,
                                   const FragmentPolicy& policy) {
    FilterStageResult result;
    result.stage = FilterStage::Fragment;

    // Containers sorted longest first so the scan for a candidate stops at
    // the first record that is not strictly longer.
    std::vector<size_t> by_length(input.size());
    std::iota(by_length.begin(), by_length.end(), 0);
    std::stable_sort(by_length.begin(), by_length.end(), [&](size_t a, size_t b) {
        return input[a].sequence.size() > input[b].sequence.size();
    });

    std::vector<bool> fragment(input.size(), false);
    for (size_t i = 0; i < input.size(); ++i) {
        const PeptideRecord& cand = input[i];
        const int len = static_cast<int>(cand.sequence.size());
        if (len == 0 || len < policy.min_length || len > policy.max_length) continue;

        for (size_t j : by_length) {
            const PeptideRecord& host = input[j];
            if (host.sequence.size() <= cand.sequence.size()) break;
            if (host.sequence.find(cand.sequence) == std::string::npos) continue;
            if (fragment_container_in_scope(cand, host, policy)) {
                fragment[i] = true;
                break;
            }
        }
    }

    for (size_t i = 0; i < input.size(); ++i) {
        if (fragment[i]) {
            result.removed.push_back(input[i]);
        } else {
            result.kept.push_back(input[i]);
        }
    }
    return result;
}

FilterStageResult remove_duplicates(const std::vector<PeptideRecord>& input) {
    FilterStageResult result;
    result.stage = FilterStage::Duplicate;
    std::unordered_set<std::string> seen;
    seen.reserve(input.size());
    for (const auto& rec : input) {
        if (seen.insert(rec.normalized_sequence()).second) {
            result.kept.push_back(rec);
        } else {
            result.removed.push_back(rec);
        }
    }
    return result;
}

std::vector<FilterStageResult> run_filters(const std::vector<PeptideRecord>& input,
                                           const FilterConfig& config,
                                           const StageCallback& on_stage) {
    std::vector<FilterStageResult> results;
    results.reserve(NUM_FILTER_STAGES);

    const std::vector<PeptideRecord>* current = &input;
    for (size_t s = 0; s < NUM_FILTER_STAGES; ++s) {
        const auto stage = static_cast<FilterStage>(s);
        FilterStageResult res;
        if (!config.stage_enabled(stage)) {
            res.stage = stage;
            res.enabled = false;
            res.kept = *current;
        } else if (stage == FilterStage::Contaminant) {
            res = remove_contaminants(*current, config.contaminant_marker);
        } else if (stage == FilterStage::Fragment) {
            res = remove_fragments(*current, config.fragment);
        } else {
            res = remove_duplicates(*current);
        }
        results.push_back(std::move(res));
        current = &results.back().kept;
        if (on_stage) on_stage(results.back());
    }
    return results;
}

const std::vector<PeptideRecord>& final_kept(const std::vector<FilterStageResult>& results,
                                             const std::vector<PeptideRecord>& input) {
    return results.empty() ? input : results.back().kept;
}

}  // namespace hlap

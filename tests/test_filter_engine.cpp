// tests/test_filter_engine.cpp
//
// Cascade contaminant -> fragment -> duplicate:
//   - removed sets and the final kept set partition the input
//   - contaminant tag matching is exact, not a substring test
//   - fragment scope (shared protein vs global), RT gating and length bounds
//   - duplicates keep the first occurrence, case-insensitively
//   - disabled stages pass their input through

#include "hlap/filter_engine.hpp"

#include <iostream>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace {

void expect(bool ok, const std::string& msg, int& failed) {
    if (!ok) {
        std::cerr << "  FAIL: " << msg << "\n";
        ++failed;
    }
}

hlap::PeptideRecord make_record(const std::string& seq,
                                std::vector<std::string> accessions = {"P00001"},
                                std::optional<double> rt = std::nullopt) {
    static size_t next_row = 0;
    hlap::PeptideRecord r;
    r.sequence = seq;
    r.length = static_cast<int>(seq.size());
    r.master_accessions = std::move(accessions);
    r.retention_time = rt;
    r.row_index = next_row++;
    return r;
}

std::vector<std::string> sequences(const std::vector<hlap::PeptideRecord>& recs) {
    std::vector<std::string> out;
    for (const auto& r : recs) out.push_back(r.sequence);
    return out;
}

// ---------------------------------------------------------------------------
int test_partition() {
    std::cout << "[1] removed sets and final kept partition the input\n";
    int failed = 0;

    std::vector<hlap::PeptideRecord> input = {
        make_record("AAAGSLSR", {"sp|P02768|ALBU_HUMAN"}),
        make_record("KLLEEVAAK", {"P10000"}),
        make_record("LLEEVAA", {"P10000"}),
        make_record("YLDPKTVLL", {"P20000"}),
        make_record("ylDPKTVLL", {"P20000"}),
        make_record("RVAPEEHPV", {"P30000"}),
    };

    hlap::FilterConfig config;
    auto results = hlap::run_filters(input, config);
    expect(results.size() == hlap::NUM_FILTER_STAGES, "expected three stage results", failed);

    size_t removed_total = 0;
    std::set<size_t> seen_rows;
    for (const auto& res : results) {
        removed_total += res.removed.size();
        for (const auto& r : res.removed) {
            expect(seen_rows.insert(r.row_index).second, "record removed twice", failed);
        }
    }
    const auto& kept = hlap::final_kept(results, input);
    for (const auto& r : kept) {
        expect(seen_rows.insert(r.row_index).second, "kept record also removed", failed);
    }
    expect(removed_total + kept.size() == input.size(),
           "partition size " + std::to_string(removed_total + kept.size()) + " != " +
           std::to_string(input.size()), failed);

    expect(results[0].removed.size() == 1, "one contaminant", failed);
    expect(results[1].removed.size() == 1, "one fragment", failed);
    expect(results[2].removed.size() == 1, "one duplicate", failed);
    expect(sequences(kept) == std::vector<std::string>({"KLLEEVAAK", "YLDPKTVLL", "RVAPEEHPV"}),
           "kept order follows input order", failed);

    // Kept sets only shrink
    expect(results[0].kept.size() >= results[1].kept.size() &&
           results[1].kept.size() >= results[2].kept.size(), "kept sets grew", failed);

    if (!failed) std::cout << "  PASS\n";
    return failed;
}

// ---------------------------------------------------------------------------
int test_contaminant_tag() {
    std::cout << "[2] contaminant tag matching\n";
    int failed = 0;

    expect(hlap::is_contaminant(make_record("AAAAAAA", {"sp|P02768|ALBU_HUMAN"}), "sp"),
           "sp| prefix is a contaminant", failed);
    expect(hlap::is_contaminant(make_record("AAAAAAA", {"sp"}), "sp"),
           "bare sp is a contaminant", failed);
    expect(hlap::is_contaminant(make_record("AAAAAAA", {"P12345", "sp|Q99999"}), "sp"),
           "second accession carries the tag", failed);
    expect(!hlap::is_contaminant(make_record("AAAAAAA", {"xsp|P12345"}), "sp"),
           "xsp is not sp", failed);
    expect(!hlap::is_contaminant(make_record("AAAAAAA", {"SP|P12345"}), "sp"),
           "tag comparison is case-sensitive", failed);
    expect(!hlap::is_contaminant(make_record("AAAAAAA", {"tr|Ksp123"}), "sp"),
           "substring of another field is not a tag", failed);
    expect(!hlap::is_contaminant(make_record("AAAAAAA", {}), "sp"),
           "no accessions, no contaminant", failed);
    expect(hlap::is_contaminant(make_record("AAAAAAA", {"CON_|P1"}), "CON_"),
           "custom marker", failed);

    if (!failed) std::cout << "  PASS\n";
    return failed;
}

// ---------------------------------------------------------------------------
int test_fragment_scope() {
    std::cout << "[3] fragment scope\n";
    int failed = 0;

    std::vector<hlap::PeptideRecord> input = {
        make_record("ASIINFEKLA", {"P1"}),
        make_record("SIINFEKL", {"P2"}),
        make_record("GILGFVFTL", {"P3"}),
        make_record("GILGFVF", {"P3"}),
    };

    hlap::FragmentPolicy protein;
    auto res = hlap::remove_fragments(input, protein);
    expect(sequences(res.removed) == std::vector<std::string>({"GILGFVF"}),
           "same-protein scope removes only the shared-accession fragment", failed);

    hlap::FragmentPolicy global;
    global.scope = hlap::FragmentScope::Global;
    res = hlap::remove_fragments(input, global);
    expect(sequences(res.removed) == std::vector<std::string>({"SIINFEKL", "GILGFVF"}),
           "global scope removes both fragments", failed);
    expect(res.kept.size() + res.removed.size() == input.size(), "fragment partition", failed);

    // Nested: the middle record is itself a fragment but still contains the shortest
    std::vector<hlap::PeptideRecord> nested = {
        make_record("AKLLEEVAAKA", {"P9"}),
        make_record("KLLEEVAAK", {"P9"}),
        make_record("LLEEVAA", {"P9"}),
    };
    res = hlap::remove_fragments(nested, protein);
    expect(res.removed.size() == 2, "nested fragments are all removed", failed);
    expect(sequences(res.kept) == std::vector<std::string>({"AKLLEEVAAKA"}),
           "longest peptide survives", failed);

    // Identical sequences are not fragments of each other
    std::vector<hlap::PeptideRecord> same = {
        make_record("SIINFEKL", {"P1"}),
        make_record("SIINFEKL", {"P1"}),
    };
    res = hlap::remove_fragments(same, protein);
    expect(res.removed.empty(), "equal-length copies are left to the duplicate stage", failed);

    if (!failed) std::cout << "  PASS\n";
    return failed;
}

// ---------------------------------------------------------------------------
int test_fragment_rt_and_length() {
    std::cout << "[4] fragment RT tolerance and length bounds\n";
    int failed = 0;
    hlap::FragmentPolicy policy;

    {
        std::vector<hlap::PeptideRecord> input = {
            make_record("ASIINFEKLA", {"P1"}, 10.0),
            make_record("SIINFEKL", {"P1"}, 10.8),
        };
        auto res = hlap::remove_fragments(input, policy);
        expect(res.removed.empty(), "RT difference 0.8 keeps the candidate", failed);

        hlap::FragmentPolicy no_rt = policy;
        no_rt.rt_tolerance = 0.0;
        res = hlap::remove_fragments(input, no_rt);
        expect(res.removed.size() == 1, "tolerance 0 disables the RT check", failed);
    }
    {
        std::vector<hlap::PeptideRecord> input = {
            make_record("ASIINFEKLA", {"P1"}, 10.0),
            make_record("SIINFEKL", {"P1"}, 10.2),
        };
        auto res = hlap::remove_fragments(input, policy);
        expect(res.removed.size() == 1, "RT difference 0.2 removes the candidate", failed);
    }
    {
        std::vector<hlap::PeptideRecord> input = {
            make_record("ASIINFEKLA", {"P1"}, 10.0),
            make_record("SIINFEKL", {"P1"}),
        };
        auto res = hlap::remove_fragments(input, policy);
        expect(res.removed.size() == 1, "missing RT does not block removal", failed);
    }
    {
        std::vector<hlap::PeptideRecord> input = {
            make_record("ASIINFEKLA", {"P1"}),
            make_record("IINFE", {"P1"}),
        };
        auto res = hlap::remove_fragments(input, policy);
        expect(res.removed.empty(), "5-mer is below the fragment minimum", failed);
    }
    {
        const std::string inner = "AAAAACCCCCDDDDDEEEEEFFF";  // 23 residues
        std::vector<hlap::PeptideRecord> input = {
            make_record("K" + inner + "K", {"P1"}),
            make_record(inner, {"P1"}),
        };
        auto res = hlap::remove_fragments(input, policy);
        expect(res.removed.empty(), "23-mer is above the fragment maximum", failed);
    }

    if (!failed) std::cout << "  PASS\n";
    return failed;
}

// ---------------------------------------------------------------------------
int test_duplicates() {
    std::cout << "[5] duplicates keep the first occurrence\n";
    int failed = 0;

    std::vector<hlap::PeptideRecord> input = {
        make_record("SIINFEKL", {"P1"}),
        make_record("GILGFVFTL", {"P2"}),
        make_record("SIINFEKL", {"P3"}),
        make_record("siinfekl", {"P4"}),
    };
    auto res = hlap::remove_duplicates(input);
    expect(sequences(res.kept) == std::vector<std::string>({"SIINFEKL", "GILGFVFTL"}),
           "kept [A, B]", failed);
    expect(res.removed.size() == 2, "two duplicates removed", failed);
    expect(!res.kept.empty() && res.kept[0].master_accessions[0] == "P1",
           "first occurrence retained", failed);
    expect(res.removed.size() == 2 && res.removed[0].master_accessions[0] == "P3" &&
           res.removed[1].master_accessions[0] == "P4", "later occurrences removed in order", failed);

    if (!failed) std::cout << "  PASS\n";
    return failed;
}

// ---------------------------------------------------------------------------
int test_disabled_stages() {
    std::cout << "[6] disabled stages pass input through\n";
    int failed = 0;

    std::vector<hlap::PeptideRecord> input = {
        make_record("AAAGSLSR", {"sp|P02768"}),
        make_record("AAAGSLSR", {"sp|P02768"}),
        make_record("AAAGSLS", {"sp|P02768"}),
    };

    hlap::FilterConfig config;
    config.skip_contaminant_removal = true;
    config.skip_fragment_removal = true;
    config.skip_duplicate_removal = true;

    std::vector<hlap::FilterStage> seen;
    auto results = hlap::run_filters(input, config,
        [&](const hlap::FilterStageResult& r) { seen.push_back(r.stage); });

    expect(results.size() == 3, "three results even when disabled", failed);
    for (const auto& r : results) {
        expect(!r.enabled, std::string(hlap::filter_stage_name(r.stage)) + " should be disabled",
               failed);
        expect(r.removed.empty(), "disabled stage removed records", failed);
        expect(r.kept.size() == input.size(), "disabled stage dropped records", failed);
    }
    expect(seen == std::vector<hlap::FilterStage>({hlap::FilterStage::Contaminant,
                                                   hlap::FilterStage::Fragment,
                                                   hlap::FilterStage::Duplicate}),
           "callback order", failed);

    // Only duplicates enabled
    config.skip_duplicate_removal = false;
    results = hlap::run_filters(input, config);
    expect(results[2].enabled && results[2].removed.size() == 1, "duplicate stage alone", failed);
    expect(hlap::final_kept(results, input).size() == 2, "two records left", failed);

    // Empty input
    hlap::FilterConfig defaults;
    results = hlap::run_filters({}, defaults);
    expect(results.size() == 3 && results.back().kept.empty(), "empty input", failed);

    if (!failed) std::cout << "  PASS\n";
    return failed;
}

}  // namespace

int main() {
    int total = 0;
    total += test_partition();
    total += test_contaminant_tag();
    total += test_fragment_scope();
    total += test_fragment_rt_and_length();
    total += test_duplicates();
    total += test_disabled_stages();

    if (total == 0) {
        std::cout << "\nAll filter engine tests passed.\n";
        return 0;
    }
    std::cerr << "\n" << total << " test(s) FAILED.\n";
    return 1;
}

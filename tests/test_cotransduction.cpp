// tests/test_cotransduction.cpp
//
// Co-transduced protein matching:
//   - full-string, case-insensitive matching against single values
//   - separators the pattern does not spell out are ignored
//   - invalid entries are reported without blocking the others
//   - first matching pattern is recorded per peptide
//   - protein pattern inferred from run file names

#include "hlap/cotransduction.hpp"

#include <iostream>
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
                                std::vector<std::string> accessions,
                                std::vector<std::string> descriptions = {}) {
    hlap::PeptideRecord r;
    r.sequence = seq;
    r.length = static_cast<int>(seq.size());
    r.master_accessions = std::move(accessions);
    r.master_descriptions = std::move(descriptions);
    return r;
}

// ---------------------------------------------------------------------------
int test_full_match() {
    std::cout << "[1] full-string matching\n";
    int failed = 0;

    auto wide = hlap::compile_pattern(".*HLA.*");
    auto bare = hlap::compile_pattern("HLA");
    expect(hlap::matches(wide, "fooHLAbar"), ".*HLA.* matches fooHLAbar", failed);
    expect(!hlap::matches(bare, "fooHLAbar"), "HLA must not match fooHLAbar", failed);
    expect(hlap::matches(bare, "hla"), "matching ignores case", failed);

    // Anchors are redundant under full matching
    auto anchored = hlap::compile_pattern("^HLA$");
    for (const char* s : {"HLA", "fooHLA", "HLAbar"}) {
        expect(hlap::matches(anchored, s) == hlap::matches(bare, s),
               std::string("^HLA$ and HLA disagree on ") + s, failed);
    }

    auto virus = hlap::compile_pattern(".*VIRUS.*");
    expect(hlap::matches(virus, "Envelope glycoprotein OS=Hepatitis B virus"),
           "description substring via .*", failed);
    expect(!hlap::matches(virus, "Albumin"), "no match on unrelated value", failed);

    if (!failed) std::cout << "  PASS\n";
    return failed;
}

// ---------------------------------------------------------------------------
int test_separator_normalization() {
    std::cout << "[2] separator normalization\n";
    int failed = 0;

    auto loose = hlap::compile_pattern(".*HLAA2.*");
    expect(loose.ignored_chars == " _-", "pattern without separators ignores all three", failed);
    for (const char* s : {"xHLA_A2x", "xHLA-A2x", "xHLA A2x", "xHLAA2x"}) {
        expect(hlap::matches(loose, s), std::string(".*HLAA2.* should match ") + s, failed);
    }

    auto strict = hlap::compile_pattern(".*HLA_A2.*");
    expect(strict.ignored_chars == " -", "underscore kept when spelled out", failed);
    expect(hlap::matches(strict, "xHLA_A2x"), ".*HLA_A2.* matches HLA_A2", failed);
    expect(!hlap::matches(strict, "xHLAA2x"), ".*HLA_A2.* must not match HLAA2", failed);
    expect(hlap::matches(strict, "x HLA_A2 x"), "spaces still ignored", failed);

    expect(hlap::strip_chars("a_b-c d", "_-") == "abc d", "strip_chars", failed);
    expect(hlap::ignored_separators("A B") == "_-", "ignored_separators", failed);

    if (!failed) std::cout << "  PASS\n";
    return failed;
}

// ---------------------------------------------------------------------------
int test_pattern_list_and_errors() {
    std::cout << "[3] pattern lists and invalid entries\n";
    int failed = 0;

    auto list = hlap::split_pattern_list(" .*HEL.* , ,GFP ");
    expect(list == std::vector<std::string>({".*HEL.*", "GFP"}), "split and trim", failed);
    expect(hlap::split_pattern_list("none").empty(), "'none' means no patterns", failed);
    expect(hlap::split_pattern_list("").empty(), "empty text", failed);

    auto set = hlap::compile_patterns({".*HEL.*", "([unclosed", ".*GFP.*"});
    expect(set.patterns.size() == 2, "two valid patterns compiled", failed);
    expect(set.errors.size() == 1, "one invalid pattern reported", failed);
    if (!set.errors.empty()) {
        expect(set.errors[0].pattern() == "([unclosed", "error names the pattern", failed);
    }

    bool threw = false;
    try {
        hlap::compile_pattern("(");
    } catch (const hlap::PatternCompilationError& e) {
        threw = true;
        expect(e.pattern() == "(", "exception carries raw text", failed);
    }
    expect(threw, "compile_pattern throws on a bad regex", failed);

    if (!failed) std::cout << "  PASS\n";
    return failed;
}

// ---------------------------------------------------------------------------
int test_classify_and_groups() {
    std::cout << "[4] classification and protein groups\n";
    int failed = 0;

    std::vector<hlap::PeptideRecord> recs = {
        make_record("SIINFEKL", {"P0DTC2"}, {"Spike glycoprotein OS=SARS-CoV-2"}),
        make_record("GILGFVFTL", {"P03485"}, {"Matrix protein 1 OS=Influenza A virus"}),
        make_record("AAAGSLSR", {"P02768"}, {"Albumin"}),
        make_record("NLVPMVATV", {"P06725"}, {"65 kDa phosphoprotein OS=Human cytomegalovirus"}),
    };

    auto set = hlap::compile_patterns({".*virus.*", ".*glycoprotein.*"});
    auto classified = hlap::classify(recs, set.patterns);
    expect(classified.size() == recs.size(), "one result per record", failed);

    expect(classified[0].co_transduced && classified[0].matched_pattern == ".*glycoprotein.*",
           "spike matched by the second pattern", failed);
    expect(classified[1].co_transduced && classified[1].matched_pattern == ".*virus.*",
           "influenza matched by the first pattern", failed);
    expect(!classified[2].co_transduced && !classified[2].matched_pattern,
           "albumin not co-transduced", failed);
    expect(classified[3].co_transduced && classified[3].matched_pattern == ".*virus.*",
           "cytomegalovirus matched", failed);
    expect(classified[1].matched_values ==
           std::vector<std::string>({"Matrix protein 1 OS=Influenza A virus"}),
           "matched value recorded", failed);

    // First pattern wins even when a later one also matches
    auto both = hlap::compile_patterns({".*P03485.*", ".*virus.*"});
    auto again = hlap::classify(recs, both.patterns);
    expect(again[1].matched_pattern == ".*P03485.*", "first matching pattern recorded", failed);

    // No patterns: nothing is co-transduced
    auto none = hlap::classify(recs, {});
    for (const auto& c : none) {
        expect(!c.co_transduced, "no patterns, no co-transduced", failed);
    }

    auto groups = hlap::collect_groups(classified, set.patterns);
    expect(groups.size() == 3, "three protein groups", failed);
    if (groups.size() == 3) {
        expect(groups[0].pattern == ".*virus.*" &&
               groups[0].protein == "Matrix protein 1 OS=Influenza A virus",
               "first group in encounter order", failed);
        expect(groups[1].peptides == std::vector<std::string>({"NLVPMVATV"}),
               "second group peptides", failed);
        expect(groups[2].pattern == ".*glycoprotein.*" &&
               groups[2].peptides == std::vector<std::string>({"SIINFEKL"}),
               "glycoprotein group", failed);
    }

    if (!failed) std::cout << "  PASS\n";
    return failed;
}

// ---------------------------------------------------------------------------
int test_filename_inference() {
    std::cout << "[5] pattern inference from file names\n";
    int failed = 0;

    auto p = hlap::infer_pattern_from_filename("sample_2024_HLAB7_peptideX_bRP_PeptideGroups.txt");
    expect(p && *p == "peptideX", "peptideX inferred", failed);

    p = hlap::infer_pattern_from_filename("test1_000000_HLA_A010101_HEL_bRP_PeptideGroups.txt");
    expect(p && *p == "HEL", "HEL inferred after split allele", failed);

    p = hlap::infer_pattern_from_filename("/data/run/r1_20240101_HLA_B0702_GFP_HEL_bRP_x_PeptideGroups.txt");
    expect(p && *p == "GFP_HEL", "multi-token span re-joined", failed);

    p = hlap::infer_pattern_from_filename("r1_20240101_HLA_B0702_ns1.2_bRP_PeptideGroups.txt");
    expect(p && *p == "ns1\\.2", "metacharacters escaped", failed);

    expect(!hlap::infer_pattern_from_filename("r1_20240101_HLA_B0702_HEL_PeptideGroups.txt"),
           "no bRP token", failed);
    expect(!hlap::infer_pattern_from_filename("r1_2024_bRP_PeptideGroups.txt"),
           "fewer than five tokens", failed);
    expect(!hlap::infer_pattern_from_filename("r1_20240101_HLA_B0702_bRP_PeptideGroups.txt"),
           "empty span", failed);

    // Inferred text compiles and matches literally
    p = hlap::infer_pattern_from_filename("test1_000000_HLA_A010101_HEL_bRP_PeptideGroups.txt");
    if (p) {
        auto pat = hlap::compile_pattern(*p);
        expect(hlap::matches(pat, "hel"), "literal matches case-insensitively", failed);
        expect(!hlap::matches(pat, "HEL1"), "literal is fully matched", failed);
    }

    if (!failed) std::cout << "  PASS\n";
    return failed;
}

}  // namespace

int main() {
    int total = 0;
    total += test_full_match();
    total += test_separator_normalization();
    total += test_pattern_list_and_errors();
    total += test_classify_and_groups();
    total += test_filename_inference();

    if (total == 0) {
        std::cout << "\nAll co-transduction tests passed.\n";
        return 0;
    }
    std::cerr << "\n" << total << " test(s) FAILED.\n";
    return 1;
}

#pragma once

#include "types.hpp"
#include <optional>
#include <regex>
#include <string>
#include <vector>

namespace hlap {

// Separator characters that are ignored unless the pattern spells them out
constexpr char SEPARATOR_CHARS[] = {' ', '_', '-'};

/**
 * A user pattern compiled for normalized full-string matching.
 *
 * Separators from SEPARATOR_CHARS that the raw text does not contain are in
 * `ignored_chars`; they are stripped from the pattern and from every
 * candidate before matching, so ".*HLAA2.*" accepts "HLA_A2", "HLA-A2",
 * "HLA A2" and "HLAA2" while ".*HLA_A2.*" only accepts "HLA_A2".
 * Matching is case-insensitive and must cover the whole candidate.
 */
struct CoTransductionPattern {
    std::string raw_expression;
    std::string normalized_expression;
    std::string ignored_chars;
    std::regex matcher;
};

struct PatternSet {
    std::vector<CoTransductionPattern> patterns;
    std::vector<PatternCompilationError> errors;  // one per rejected entry
};

// Comma-separated list -> trimmed, non-empty entries. "none" means no patterns.
std::vector<std::string> split_pattern_list(const std::string& text);

// Phase 1: separators in SEPARATOR_CHARS that do not occur in `raw`
std::string ignored_separators(const std::string& raw);

// Remove every character of `ignored` from `text`
std::string strip_chars(const std::string& text, const std::string& ignored);

// Phase 2: build the matcher. Throws PatternCompilationError on a bad regex.
CoTransductionPattern compile_pattern(const std::string& raw);

// Compile each entry independently; bad entries land in PatternSet::errors
PatternSet compile_patterns(const std::vector<std::string>& raw_patterns);

// Candidate text as the pattern sees it
std::string normalize_candidate(const std::string& candidate,
                                const CoTransductionPattern& pattern);

bool matches(const CoTransductionPattern& pattern, const std::string& candidate);

// Values of `record` (accessions first, then descriptions) matched by `pattern`
std::vector<std::string> matching_values(const CoTransductionPattern& pattern,
                                         const PeptideRecord& record);

// Classify each record against the patterns in order; the first pattern that
// fully matches any single accession or description value wins.
std::vector<ClassifiedRecord> classify(const std::vector<PeptideRecord>& records,
                                       const std::vector<CoTransductionPattern>& patterns);

// Group co-transduced peptides by matched protein value, pattern by pattern,
// proteins in first-encounter order, peptides sorted
std::vector<CoTransducedGroup> collect_groups(const std::vector<ClassifiedRecord>& classified,
                                              const std::vector<CoTransductionPattern>& patterns);

// Escape regex metacharacters so the text matches only itself
std::string escape_regex_literal(const std::string& text);

/**
 * Infer the co-transduced protein pattern from a run file name.
 *
 * Tokens are the underscore-separated parts of the base name. The protein
 * span starts right after the HLA allele (index 4 when token 2 is "HLA",
 * index 3 otherwise) and ends before the first "bRP" token; tokens are
 * re-joined with '_' and escaped as a literal.
 *
 *   test1_000000_HLA_A010101_HEL_bRP_PeptideGroups.txt -> "HEL"
 *   sample_2024_HLAB7_peptideX_bRP_PeptideGroups.txt   -> "peptideX"
 *
 * Returns nullopt for fewer than 5 tokens, no "bRP" or an empty span.
 */
std::optional<std::string> infer_pattern_from_filename(const std::string& file_name);

}  // namespace hlap

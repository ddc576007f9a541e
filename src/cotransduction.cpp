#include "hlap/cotransduction.hpp"
#include "hlap/peptide_table.hpp"
#include <algorithm>
#include <set>

namespace hlap {

std::vector<std::string> split_pattern_list(const std::string& text) {
    std::vector<std::string> out;
    const std::string whole = trim(text);
    if (whole.empty() || to_lower(whole) == "none") return out;

    size_t start = 0;
    while (start <= whole.size()) {
        size_t comma = whole.find(',', start);
        std::string item = trim(whole.substr(start, comma == std::string::npos ? std::string::npos
                                                                                : comma - start));
        if (!item.empty()) out.push_back(std::move(item));
        if (comma == std::string::npos) break;
        start = comma + 1;
    }
    return out;
}

std::string ignored_separators(const std::string& raw) {
    std::string ignored;
    for (char c : SEPARATOR_CHARS) {
        if (raw.find(c) == std::string::npos) ignored += c;
    }
    return ignored;
}

std::string strip_chars(const std::string& text, const std::string& ignored) {
    if (ignored.empty()) return text;
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        if (ignored.find(c) == std::string::npos) out += c;
    }
    return out;
}

CoTransductionPattern compile_pattern(const std::string& raw) {
    CoTransductionPattern p;
    p.raw_expression = raw;
    p.ignored_chars = ignored_separators(raw);
    p.normalized_expression = trim(strip_chars(raw, p.ignored_chars));
    if (p.normalized_expression.empty()) {
        throw PatternCompilationError(raw, "empty pattern");
    }
    try {
        p.matcher = std::regex(p.normalized_expression,
                               std::regex::ECMAScript | std::regex::icase);
    } catch (const std::regex_error& e) {
        throw PatternCompilationError(raw, e.what());
    }
    return p;
}

PatternSet compile_patterns(const std::vector<std::string>& raw_patterns) {
    PatternSet set;
    for (const auto& raw : raw_patterns) {
        try {
            set.patterns.push_back(compile_pattern(raw));
        } catch (const PatternCompilationError& e) {
            set.errors.push_back(e);
        }
    }
    return set;
}

std::string normalize_candidate(const std::string& candidate,
                                const CoTransductionPattern& pattern) {
    return trim(strip_chars(candidate, pattern.ignored_chars));
}

bool matches(const CoTransductionPattern& pattern, const std::string& candidate) {
    return std::regex_match(normalize_candidate(candidate, pattern), pattern.matcher);
}

std::vector<std::string> matching_values(const CoTransductionPattern& pattern,
                                         const PeptideRecord& record) {
    std::vector<std::string> hits;
    for (const auto& acc : record.master_accessions) {
        if (matches(pattern, acc)) hits.push_back(acc);
    }
    for (const auto& desc : record.master_descriptions) {
        if (matches(pattern, desc)) hits.push_back(desc);
    }
    return hits;
}

std::vector<ClassifiedRecord> classify(const std::vector<PeptideRecord>& records,
                                       const std::vector<CoTransductionPattern>& patterns) {
    std::vector<ClassifiedRecord> out;
    out.reserve(records.size());
    for (const auto& rec : records) {
        ClassifiedRecord cr;
        cr.record = rec;
        for (const auto& p : patterns) {
            auto hits = matching_values(p, rec);
            if (!hits.empty()) {
                cr.co_transduced = true;
                cr.matched_pattern = p.raw_expression;
                cr.matched_values = std::move(hits);
                break;
            }
        }
        out.push_back(std::move(cr));
    }
    return out;
}

std::vector<CoTransducedGroup> collect_groups(const std::vector<ClassifiedRecord>& classified,
                                              const std::vector<CoTransductionPattern>& patterns) {
    std::vector<CoTransducedGroup> groups;
    for (const auto& p : patterns) {
        std::vector<std::string> order;
        std::vector<std::set<std::string>> peptides;
        for (const auto& cr : classified) {
            for (const auto& value : matching_values(p, cr.record)) {
                auto it = std::find(order.begin(), order.end(), value);
                size_t idx = static_cast<size_t>(it - order.begin());
                if (it == order.end()) {
                    order.push_back(value);
                    peptides.emplace_back();
                }
                peptides[idx].insert(cr.record.sequence);
            }
        }
        for (size_t i = 0; i < order.size(); ++i) {
            CoTransducedGroup g;
            g.pattern = p.raw_expression;
            g.protein = order[i];
            g.peptides.assign(peptides[i].begin(), peptides[i].end());
            groups.push_back(std::move(g));
        }
    }
    return groups;
}

std::string escape_regex_literal(const std::string& text) {
    static const std::string kMeta = "\\^$.|?*+()[]{}";
    std::string out;
    out.reserve(text.size() * 2);
    for (char c : text) {
        if (kMeta.find(c) != std::string::npos) out += '\\';
        out += c;
    }
    return out;
}

std::optional<std::string> infer_pattern_from_filename(const std::string& file_name) {
    const auto tokens = name_tokens(file_name);
    if (tokens.size() < 5) return std::nullopt;

    const size_t start = tokens[2] == "HLA" ? 4 : 3;
    auto brp = std::find(tokens.begin() + static_cast<std::ptrdiff_t>(start), tokens.end(), "bRP");
    if (brp == tokens.end()) return std::nullopt;

    const size_t end = static_cast<size_t>(brp - tokens.begin());
    if (end == start) return std::nullopt;

    std::string span;
    for (size_t i = start; i < end; ++i) {
        if (i > start) span += '_';
        span += tokens[i];
    }
    return escape_regex_literal(span);
}

}  // namespace hlap

#include "hlap/peptide_table.hpp"
#include <algorithm>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <limits>
#include <unistd.h>
#include <zlib.h>

namespace hlap {

// Large I/O buffer for gzip reads
constexpr size_t GZBUF_SIZE = 4 * 1024 * 1024;

// LineReader implementation
class LineReader::Impl {
public:
    std::ifstream file_;
    gzFile gz_file_ = nullptr;
    bool is_gzipped_ = false;
    char buffer_[65536];

    bool open(const std::string& filename) {
        if (filename.size() > 3 &&
            filename.substr(filename.size() - 3) == ".gz") {
            is_gzipped_ = true;
            gz_file_ = gzopen(filename.c_str(), "rb");
            if (!gz_file_) return false;
            gzbuffer(gz_file_, GZBUF_SIZE);
            return true;
        }
        file_.open(filename, std::ios::binary);
        return static_cast<bool>(file_);
    }

    bool getline(std::string& line) {
        line.clear();
        if (is_gzipped_) {
            // gzgets stops at the buffer size; keep reading until the newline
            bool got_any = false;
            while (gzgets(gz_file_, buffer_, sizeof(buffer_))) {
                got_any = true;
                size_t len = strlen(buffer_);
                if (len > 0 && buffer_[len - 1] == '\n') {
                    line.append(buffer_, len - 1);
                    break;
                }
                line.append(buffer_, len);
            }
            if (!got_any) return false;
        } else if (!std::getline(file_, line)) {
            return false;
        }
        if (!line.empty() && line.back() == '\r') line.pop_back();
        return true;
    }

    void close() {
        if (gz_file_) {
            gzclose(gz_file_);
            gz_file_ = nullptr;
        }
        if (file_.is_open()) file_.close();
    }

    ~Impl() {
        close();
    }
};

LineReader::LineReader(const std::string& filename)
    : impl_(std::make_unique<Impl>()) {
    if (!impl_->open(filename)) {
        throw PeptideFileError("Failed to open file: " + filename);
    }
}

LineReader::~LineReader() = default;

bool LineReader::read_line(std::string& line) {
    return impl_->getline(line);
}

int Table::column_index(const std::string& name) const {
    for (size_t i = 0; i < header.size(); ++i) {
        if (header[i] == name) return static_cast<int>(i);
    }
    return -1;
}

namespace {

// Reject UTF-16 exports and drop a UTF-8 byte order mark from the header line
void check_encoding(std::string& first_line, const std::string& path) {
    if (first_line.size() >= 2) {
        const auto b0 = static_cast<unsigned char>(first_line[0]);
        const auto b1 = static_cast<unsigned char>(first_line[1]);
        if ((b0 == 0xFF && b1 == 0xFE) || (b0 == 0xFE && b1 == 0xFF)) {
            throw PeptideFileError("Could not process " + path +
                                   " because it is UTF-16 encoded. Only UTF-8 is accepted.");
        }
    }
    if (first_line.size() >= 3 &&
        static_cast<unsigned char>(first_line[0]) == 0xEF &&
        static_cast<unsigned char>(first_line[1]) == 0xBB &&
        static_cast<unsigned char>(first_line[2]) == 0xBF) {
        first_line.erase(0, 3);
    }
}

// ProteomeDiscoverer quotes some TSV cells; strip one surrounding pair
std::string unquote(const std::string& cell) {
    if (cell.size() >= 2 && cell.front() == '"' && cell.back() == '"') {
        std::string out;
        out.reserve(cell.size() - 2);
        for (size_t i = 1; i + 1 < cell.size(); ++i) {
            if (cell[i] == '"' && i + 2 < cell.size() && cell[i + 1] == '"') ++i;
            out += cell[i];
        }
        return out;
    }
    return cell;
}

// Parse one CSV record; continues onto following lines while inside quotes
bool read_csv_record(LineReader& reader, std::vector<std::string>& fields,
                     std::string* first_line_hook, const std::string& path) {
    fields.clear();
    std::string line;
    if (!reader.read_line(line)) return false;
    if (first_line_hook) check_encoding(line, path);

    std::string field;
    bool in_quotes = false;
    while (true) {
        for (size_t i = 0; i < line.size(); ++i) {
            char c = line[i];
            if (in_quotes) {
                if (c == '"') {
                    if (i + 1 < line.size() && line[i + 1] == '"') {
                        field += '"';
                        ++i;
                    } else {
                        in_quotes = false;
                    }
                } else {
                    field += c;
                }
            } else if (c == '"') {
                in_quotes = true;
            } else if (c == ',') {
                fields.push_back(std::move(field));
                field.clear();
            } else {
                field += c;
            }
        }
        if (!in_quotes) break;
        field += '\n';
        if (!reader.read_line(line)) {
            throw PeptideFileError("Unterminated quoted field in " + path);
        }
    }
    fields.push_back(std::move(field));
    return true;
}

bool blank(const std::vector<std::string>& fields) {
    return std::all_of(fields.begin(), fields.end(),
                       [](const std::string& f) { return trim(f).empty(); });
}

std::optional<double> parse_double(const std::string& text) {
    const std::string t = trim(text);
    if (t.empty()) return std::nullopt;
    char* end = nullptr;
    errno = 0;
    double v = std::strtod(t.c_str(), &end);
    if (errno != 0 || end == t.c_str() || *end != '\0' || !std::isfinite(v)) return std::nullopt;
    return v;
}

}  // namespace

std::vector<std::string> split_tsv_line(const std::string& line) {
    std::vector<std::string> fields;
    size_t start = 0;
    while (start <= line.size()) {
        size_t tab = line.find('\t', start);
        if (tab == std::string::npos) {
            fields.push_back(unquote(line.substr(start)));
            break;
        }
        fields.push_back(unquote(line.substr(start, tab - start)));
        start = tab + 1;
    }
    return fields;
}

Table read_tsv(const std::string& path) {
    LineReader reader(path);
    Table table;
    std::string line;
    if (!reader.read_line(line)) return table;
    check_encoding(line, path);
    table.header = split_tsv_line(line);

    while (reader.read_line(line)) {
        if (trim(line).empty()) continue;
        auto fields = split_tsv_line(line);
        fields.resize(table.header.size());
        table.rows.push_back(std::move(fields));
    }
    return table;
}

Table read_csv(const std::string& path) {
    LineReader reader(path);
    Table table;
    std::vector<std::string> fields;
    std::string hook;
    if (!read_csv_record(reader, fields, &hook, path)) return table;
    table.header = fields;

    while (read_csv_record(reader, fields, nullptr, path)) {
        if (blank(fields)) continue;
        fields.resize(table.header.size());
        table.rows.push_back(fields);
    }
    return table;
}

std::string csv_escape(const std::string& field) {
    if (field.find_first_of(",\"\n\r") == std::string::npos) return field;
    std::string out = "\"";
    for (char c : field) {
        if (c == '"') out += '"';
        out += c;
    }
    out += '"';
    return out;
}

void write_csv(const std::string& path,
               const std::vector<std::string>& header,
               const std::vector<std::vector<std::string>>& rows) {
    namespace fs = std::filesystem;
    const fs::path target(path);
    if (target.has_parent_path()) {
        fs::create_directories(target.parent_path());
    }
    const std::string tmp = path + ".tmp." + std::to_string(getpid());
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out) {
            throw std::runtime_error("Cannot write " + tmp + ": " + std::strerror(errno));
        }
        for (size_t i = 0; i < header.size(); ++i) {
            if (i) out << ',';
            out << csv_escape(header[i]);
        }
        out << '\n';
        for (const auto& row : rows) {
            for (size_t i = 0; i < row.size(); ++i) {
                if (i) out << ',';
                out << csv_escape(row[i]);
            }
            out << '\n';
        }
        out.flush();
        if (!out) {
            throw std::runtime_error("Write failed for " + tmp);
        }
    }
    std::error_code ec;
    fs::rename(tmp, target, ec);
    if (ec) {
        fs::remove(tmp);
        throw std::runtime_error("Cannot replace " + path + ": " + ec.message());
    }
}

void write_records_csv(const std::string& path,
                       const std::vector<std::string>& header,
                       const std::vector<PeptideRecord>& records) {
    std::vector<std::vector<std::string>> rows;
    rows.reserve(records.size());
    for (const auto& rec : records) {
        std::vector<std::string> row;
        row.reserve(header.size());
        for (const auto& col : header) {
            const std::string* v = rec.column(col);
            row.push_back(v ? *v : std::string());
        }
        rows.push_back(std::move(row));
    }
    write_csv(path, header, rows);
}

// ---------------------------------------------------------------------------
// File names
// ---------------------------------------------------------------------------

std::string base_name(const std::string& path) {
    std::string name = std::filesystem::path(path).filename().string();
    static const std::string kGroups = "_PeptideGroups.txt";
    static const std::string kTxt = ".txt";
    auto ends_with = [&](const std::string& suffix) {
        return name.size() >= suffix.size() &&
               name.compare(name.size() - suffix.size(), suffix.size(), suffix) == 0;
    };
    if (ends_with(kGroups + ".gz")) return name.substr(0, name.size() - kGroups.size() - 3);
    if (ends_with(kGroups)) return name.substr(0, name.size() - kGroups.size());
    if (ends_with(kTxt + ".gz")) return name.substr(0, name.size() - kTxt.size() - 3);
    if (ends_with(kTxt)) return name.substr(0, name.size() - kTxt.size());
    return name;
}

std::vector<std::string> name_tokens(const std::string& path) {
    const std::string base = base_name(path);
    std::vector<std::string> tokens;
    size_t start = 0;
    while (true) {
        size_t us = base.find('_', start);
        if (us == std::string::npos) {
            tokens.push_back(base.substr(start));
            break;
        }
        tokens.push_back(base.substr(start, us - start));
        start = us + 1;
    }
    return tokens;
}

std::string infer_date_created(const std::string& path) {
    auto tokens = name_tokens(path);
    return tokens.size() > 1 ? tokens[1] : std::string();
}

std::optional<std::string> infer_allele(const std::string& path) {
    auto tokens = name_tokens(path);
    if (tokens.size() > 3 && tokens[2] == "HLA") {
        return "HLA_" + tokens[3];
    }
    if (tokens.size() > 2 && tokens[2].size() > 3 && tokens[2].compare(0, 3, "HLA") == 0) {
        return tokens[2];
    }
    return std::nullopt;
}

RunMetadata describe_file(const std::string& path, const std::string& allele_override) {
    RunMetadata meta;
    meta.file_name = std::filesystem::path(path).filename().string();
    meta.base_name = base_name(path);
    meta.date_created = infer_date_created(path);
    if (!allele_override.empty()) {
        meta.hla_allele = allele_override;
    } else if (auto allele = infer_allele(path)) {
        meta.hla_allele = *allele;
    }
    return meta;
}

// ---------------------------------------------------------------------------
// PeptideGroups tables
// ---------------------------------------------------------------------------

std::vector<std::string> split_multi_value(const std::string& cell) {
    std::vector<std::string> values;
    size_t start = 0;
    while (start <= cell.size()) {
        size_t sep = cell.find(';', start);
        std::string value = trim(cell.substr(start, sep == std::string::npos ? std::string::npos
                                                                               : sep - start));
        if (!value.empty()) values.push_back(std::move(value));
        if (sep == std::string::npos) break;
        start = sep + 1;
    }
    return values;
}

std::string strip_annotated_sequence(const std::string& annotated) {
    size_t first = annotated.find('.');
    if (first == std::string::npos) return annotated;
    size_t second = annotated.find('.', first + 1);
    if (second == std::string::npos) return annotated;
    return annotated.substr(first + 1, second - first - 1);
}

PeptideTable records_from_table(const Table& table, const std::string& source) {
    PeptideTable out;
    out.header = table.header;

    const int seq_col = table.column_index(COL_SEQUENCE);
    const int ann_col = table.column_index(COL_ANNOTATED_SEQUENCE);
    if (seq_col < 0 && ann_col < 0) {
        throw PeptideFileError("Could not process " + source +
                               " because a sequence column could not be found.");
    }

    int rt_col = -1;
    for (size_t i = 0; i < table.header.size(); ++i) {
        if (table.header[i].compare(0, 2, "RT") == 0) {
            rt_col = static_cast<int>(i);
            break;
        }
    }
    if (rt_col < 0) {
        out.warnings.push_back(source + " is missing an RT column.");
    }

    const int acc_col = table.column_index(COL_MASTER_ACCESSIONS);
    if (acc_col < 0) {
        out.warnings.push_back(source + " is missing a master accessions column.");
    }
    const int desc_col = table.column_index(COL_MASTER_DESCRIPTIONS);
    if (desc_col < 0) {
        out.warnings.push_back(source + " is missing a master descriptions column.");
    }
    int len_col = table.column_index("length");
    if (len_col < 0) len_col = table.column_index("Length");

    out.records.reserve(table.rows.size());
    for (size_t r = 0; r < table.rows.size(); ++r) {
        const auto& row = table.rows[r];
        PeptideRecord rec;
        rec.row_index = r;
        rec.columns.reserve(table.header.size());
        for (size_t c = 0; c < table.header.size(); ++c) {
            rec.columns.emplace_back(table.header[c], c < row.size() ? row[c] : std::string());
        }

        // Ragged rows read as empty cells
        auto cell = [&row](int c) -> std::string {
            return c >= 0 && static_cast<size_t>(c) < row.size() ? row[c] : std::string();
        };

        rec.sequence = seq_col >= 0 ? trim(cell(seq_col))
                                    : strip_annotated_sequence(trim(cell(ann_col)));
        if (acc_col >= 0) rec.master_accessions = split_multi_value(cell(acc_col));
        if (desc_col >= 0) rec.master_descriptions = split_multi_value(cell(desc_col));
        if (rt_col >= 0) rec.retention_time = parse_double(cell(rt_col));

        rec.length = static_cast<int>(rec.sequence.size());
        if (len_col >= 0) {
            // Out-of-range lengths keep the sequence length
            auto len = parse_double(cell(len_col));
            if (len && *len >= 0.0 && *len <= static_cast<double>(std::numeric_limits<int>::max())) {
                rec.length = static_cast<int>(*len);
            }
        }
        out.records.push_back(std::move(rec));
    }
    return out;
}

PeptideTable read_peptide_table(const std::string& path, const std::string& allele_override) {
    if (!std::filesystem::exists(path)) {
        throw PeptideFileError("File path " + path + " does not exist.");
    }
    PeptideTable table = records_from_table(read_tsv(path), path);
    table.metadata = describe_file(path, allele_override);
    return table;
}

}  // namespace hlap

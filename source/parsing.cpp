#include "ms2pred/parsing.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <map>
#include <optional>
#include <stdexcept>

#include <boost/log/trivial.hpp>
#include <boost/program_options.hpp>

#include "ms2pred/errors.hpp"
#include "ms2pred/fragmentation.hpp"
#include "ms2pred/model.hpp"

namespace po = boost::program_options;

namespace ms2pred {
// ----------------- Utilities -----------------
namespace util {
    inline bool is_space(const char c) {
        return std::isspace(static_cast<unsigned char>(c));
    }

    inline std::string_view trim(std::string_view s) {
        while (!s.empty() && is_space(s.front())) s.remove_prefix(1);
        while (!s.empty() && is_space(s.back())) s.remove_suffix(1);
        return s;
    }

    inline std::vector<std::string_view> split(const std::string_view s, const char sep) {
        std::vector<std::string_view> fields;
        std::size_t start = 0;
        while (true) {
            const auto pos = s.find(sep, start);
            if (pos == std::string_view::npos) {
                fields.push_back(s.substr(start));
                return fields;
            }
            fields.push_back(s.substr(start, pos - start));
            start = pos + 1;
        }
    }

    template <typename T>
    std::optional<T> to_number(std::string_view s) {
        s = trim(s);
        T value{};
        const auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
        if (ec != std::errc() || ptr != s.data() + s.size() || s.empty()) return std::nullopt;
        return value;
    }
}

// ----------------- PEPREC -----------------
namespace peprec {

std::vector<std::pair<site_t, std::string>> parse_modifications(std::string_view column) {
    column = util::trim(column);
    std::vector<std::pair<site_t, std::string>> modifications;
    if (column.empty() || column == "-") return modifications;

    const auto fields = util::split(column, '|');
    if (fields.size() % 2 != 0) {
        throw std::invalid_argument("Modification column must hold position|name pairs: " + std::string(column));
    }
    for (std::size_t i = 0; i < fields.size(); i += 2) {
        const auto site = util::to_number<site_t>(fields[i]);
        if (!site) {
            throw std::invalid_argument("Invalid modification position '" + std::string(fields[i]) + "' in "
                                        + std::string(column));
        }
        const auto name = util::trim(fields[i + 1]);
        if (name.empty()) {
            throw std::invalid_argument("Empty modification name in " + std::string(column));
        }
        modifications.emplace_back(*site, std::string(name));
    }
    return modifications;
}

// --------------------------------------------------------------------
// PEPREC reader; the separator is detected from the header
// --------------------------------------------------------------------
PeptideRecords read_peprec(const std::string& file_path) {
    std::ifstream in(file_path);
    if (!in)
        throw std::runtime_error("Cannot open PEPREC: " + file_path);

    std::string line;
    if (!std::getline(in, line))
        throw std::runtime_error("PEPREC file is empty: " + file_path);
    if (!line.empty() && line.back() == '\r') line.pop_back();

    const char sep = line.find(',') != std::string::npos ? ','
                   : line.find('\t') != std::string::npos ? '\t' : ' ';

    constexpr std::array<std::string_view, 4> required = {"spec_id", "modifications", "peptide", "charge"};
    std::array<std::size_t, 4> column{};
    const auto header = util::split(line, sep);
    for (std::size_t r = 0; r < required.size(); ++r) {
        const auto it = std::ranges::find_if(header, [&](const std::string_view h) { return util::trim(h) == required[r]; });
        if (it == header.end()) {
            throw std::runtime_error("PEPREC " + file_path + " has no '" + std::string(required[r]) + "' column");
        }
        column[r] = static_cast<std::size_t>(it - header.begin());
    }
    const std::size_t min_fields = *std::ranges::max_element(column) + 1;

    PeptideRecords records;
    std::size_t line_number = 1;
    while (std::getline(in, line)) {
        ++line_number;
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (util::trim(line).empty()) continue;

        const auto fields = util::split(line, sep);
        if (fields.size() < min_fields) {
            throw std::runtime_error("PEPREC " + file_path + ":" + std::to_string(line_number) + ": expected at least "
                                     + std::to_string(min_fields) + " fields, got " + std::to_string(fields.size()));
        }

        PeptideRecord record;
        record.id = std::string(util::trim(fields[column[0]]));
        record.sequence = std::string(util::trim(fields[column[2]]));
        try {
            record.modifications = parse_modifications(fields[column[1]]);
        } catch (const std::invalid_argument& e) {
            throw std::runtime_error("PEPREC " + file_path + ":" + std::to_string(line_number) + ": " + e.what());
        }
        const auto charge = util::to_number<charge_t>(fields[column[3]]);
        if (!charge) {
            throw std::runtime_error("PEPREC " + file_path + ":" + std::to_string(line_number) + ": invalid charge '"
                                     + std::string(fields[column[3]]) + "'");
        }
        record.charge = *charge;
        records.push_back(std::move(record));
    }

    BOOST_LOG_TRIVIAL(info) << "Read " << records.size() << " peptides from " << file_path << ".";
    return records;
}

} // namespace peprec

// ----------------- CSV output -----------------
namespace csv {

namespace {

// Quoted when asked to or when the text holds a separator, quote or line break.
std::string field(const std::string_view text, const bool always_quote = false) {
    if (!always_quote && text.find_first_of(",\"\r\n") == std::string_view::npos) {
        return std::string(text);
    }
    std::string quoted = "\"";
    for (const char c : text) {
        if (c == '"') quoted.push_back('"');
        quoted.push_back(c == '\n' || c == '\r' ? ' ' : c);
    }
    quoted.push_back('"');
    return quoted;
}

}

void write_predictions_csv(const std::vector<PeptideResult>& results, const std::string& file_path) {
    std::ofstream out(file_path);
    if (!out)
        throw std::runtime_error("Cannot open output file: " + file_path);

    out << "spec_id,charge,ion,ionnumber,mz,prediction\n";
    out << std::setprecision(10);
    std::size_t lines = 0;
    for (const auto& result : results) {
        if (!result.ok()) continue;
        const auto& spectrum = *result.spectrum;
        const auto id = field(spectrum.id());
        for (const auto& ion : spectrum.ions()) {
            out << id << ',' << spectrum.charge() << ',' << ion.ion_type.name << ','
                << ion.ion_number << ',' << ion.mz << ',' << ion.intensity << '\n';
            ++lines;
        }
    }
    if (!out)
        throw std::runtime_error("Failed writing predictions to " + file_path);
    BOOST_LOG_TRIVIAL(info) << "Wrote " << lines << " predicted ions to " << file_path << ".";
}

std::size_t write_errors_csv(const std::vector<PeptideResult>& results, const std::string& file_path) {
    std::ofstream out(file_path);
    if (!out)
        throw std::runtime_error("Cannot open output file: " + file_path);

    out << "spec_id,error,message\n";
    std::size_t lines = 0;
    for (const auto& result : results) {
        if (result.ok()) continue;
        // messages are free text and always quoted
        out << field(result.id) << ',' << to_string(result.error.value_or(ErrorKind::Internal)) << ','
            << field(result.message, true) << '\n';
        ++lines;
    }
    if (!out)
        throw std::runtime_error("Failed writing errors to " + file_path);
    return lines;
}

void write_correlations_csv(const std::vector<SpectrumCorrelation>& correlations, const std::string& file_path) {
    std::ofstream out(file_path);
    if (!out)
        throw std::runtime_error("Cannot open output file: " + file_path);

    out << "spec_id,ions,matched,pearson\n";
    out << std::setprecision(6);
    for (const auto& c : correlations) {
        out << field(c.id) << ',' << c.ions << ',' << c.matched << ',';
        if (c.pearson) out << *c.pearson;
        out << '\n';
    }
    if (!out)
        throw std::runtime_error("Failed writing correlations to " + file_path);
    BOOST_LOG_TRIVIAL(info) << "Wrote " << correlations.size() << " correlations to " << file_path << ".";
}

} // namespace csv

// ----------------- Configuration files -----------------
namespace config {

ModelSource read_model_manifest(const std::string& file_path) {
    std::ifstream in(file_path);
    if (!in)
        throw ModelLoadError("Cannot open model manifest: " + file_path);

    // every key is unregistered; sections are interpreted below
    const po::options_description none;
    po::parsed_options parsed(&none);
    try {
        parsed = po::parse_config_file(in, none, true);
    } catch (const po::error& e) {
        throw ModelLoadError("Malformed model manifest " + file_path + ": " + e.what());
    }

    const auto base_dir = std::filesystem::path(file_path).parent_path();
    std::vector<std::string> order;
    std::map<std::string, std::map<std::string, std::string>> sections;
    for (const auto& option : parsed.options) {
        const auto dot = option.string_key.rfind('.');
        if (dot == std::string::npos || option.value.empty()) {
            throw ModelLoadError("Model manifest " + file_path + ": entry '" + option.string_key
                                 + "' is outside a [<method>.<ion type>] section");
        }
        const auto section = option.string_key.substr(0, dot);
        if (!sections.contains(section)) order.push_back(section);
        sections[section][option.string_key.substr(dot + 1)] = option.value.front();
    }

    ModelSource source;
    for (const auto& section : order) {
        const auto& keys = sections.at(section);
        const auto fail = [&](const std::string& what) {
            return ModelLoadError("Model manifest " + file_path + ", [" + section + "]: " + what);
        };

        const auto dot = section.find('.');
        if (dot == std::string::npos) throw fail("section name must be <method>.<ion type>");

        ModelSpec entry{};
        try {
            entry.method = parse_method(section.substr(0, dot));
        } catch (const UnsupportedMethodError& e) {
            throw fail(e.what());
        }
        entry.ion_type = section.substr(dot + 1);

        for (const auto& [key, value] : keys) {
            if (key == "path") {
                const std::filesystem::path path(value);
                entry.path = (path.is_relative() ? base_dir / path : path).string();
            } else if (key == "schema") {
                const auto version = util::to_number<schema_version_t>(value);
                if (!version) throw fail("invalid schema version '" + value + "'");
                entry.schema_version = *version;
            } else if (key == "transform") {
                try {
                    entry.transform = parse_transform(value);
                } catch (const std::invalid_argument& e) {
                    throw fail(e.what());
                }
            } else if (key == "sha1") {
                const auto is_hex = [](const char c) { return std::isxdigit(static_cast<unsigned char>(c)) != 0; };
                if (value.size() != 40 || !std::ranges::all_of(value, is_hex)) {
                    throw fail("invalid sha1 '" + value + "', expected 40 hex digits");
                }
                entry.sha1 = value;
                for (char& c : entry.sha1) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
            } else if (key == "base_score") {
                const auto base = util::to_number<double>(value);
                if (!base) throw fail("invalid base_score '" + value + "'");
                entry.base_score = *base;
            } else {
                throw fail("unknown key '" + key + "'");
            }
        }
        if (entry.path.empty()) throw fail("missing path");
        source.push_back(std::move(entry));
    }

    BOOST_LOG_TRIVIAL(debug) << "Model manifest " << file_path << " lists " << source.size() << " models.";
    return source;
}

ptm::ModificationTable read_modifications_file(const std::string& file_path) {
    std::ifstream in(file_path);
    if (!in)
        throw std::runtime_error("Cannot open modifications file: " + file_path);

    std::vector<std::string> modstrings;
    std::string line;
    while (std::getline(in, line)) {
        const auto trimmed = util::trim(line);
        if (trimmed.empty() || trimmed.front() == '#') continue;
        modstrings.emplace_back(trimmed);
    }
    auto table = ptm::ModificationTable::from_modstrings(modstrings);
    BOOST_LOG_TRIVIAL(info) << "Read " << table.size() << " modifications from " << file_path << ".";
    return table;
}

} // namespace config

} // namespace ms2pred

#pragma once

#include <functional>
#include <string>
#include <string_view>
#include <vector>

#include <boost/log/trivial.hpp>
#include <boost/program_options.hpp>

#include "ms2pred/batch.hpp"
#include "ms2pred/residue_table.hpp"
#include "ms2pred/spectrum.hpp"

namespace ms2pred::cli {

struct Config {
    std::string peprec_path; // necessary
    std::string manifest_path; // necessary
    std::string output_path; // necessary
    std::string errors_path; // optional; defaults to <output>.errors.csv
    std::string modifications_path; // optional; built-in modifications otherwise
    std::string method = "HCD"; // optional
    std::size_t chunk_size = 1000; // optional
    int threads = 0; // optional; 0 uses every core
    NormalizationMode normalization = NormalizationMode::RelativeMax; // optional
    LengthLimits limits; // optional
    boost::log::trivial::severity_level verbosity = boost::log::trivial::info; // optional
    // observed spectra, only for tools that correlate
    std::string spectra_path; // necessary with observed spectra
    std::string spectrum_id_pattern; // optional; native id is the spec_id otherwise
    double ms2_tolerance = 0.02; // optional; Da
};

/// Whether a tool reads observed spectra next to the PEPREC file.
enum class Spectra { None, Observed };

void log_config(const Config& config, std::string_view program);

[[noreturn]] void print_usage_and_exit(const boost::program_options::options_description& all,
                                       std::string_view program, int exit_code);

/// @brief Parse the command line, then the optional --config INI file.
/// Values given on the command line take precedence over the INI file.
Config parse_args(int argc, char* argv[], std::string_view program, Spectra spectra = Spectra::None);

using ResultWriter = std::function<void(const Config&, const std::vector<PeptideResult>&)>;

/**
 * @brief Shared driver of the command-line tools.
 *
 * Loads modifications, models and peptides, runs the batch and hands the
 * results to @p write. Failed peptides are always written to the errors file.
 *
 * @return 0 on success, 1 if models or inputs cannot be loaded or outputs written.
 */
int run_tool(int argc, char* argv[], std::string_view program, const ResultWriter& write,
             Spectra spectra = Spectra::None);

} // namespace ms2pred::cli

#include "ms2pred/cli.hpp"
#include "ms2pred/correlation.hpp"
#include "ms2pred/mzml_library.hpp"
#include "ms2pred/parsing.hpp"

int main(const int argc, char* argv[]) {
    return ms2pred::cli::run_tool(argc, argv, "ms2pred_correlate",
        [](const ms2pred::cli::Config& cfg, const std::vector<ms2pred::PeptideResult>& results) {
            const auto observed = ms2pred::mzml::load_observed_spectra(
                cfg.spectra_path, ms2pred::SpectrumIdPattern(cfg.spectrum_id_pattern));
            ms2pred::csv::write_correlations_csv(
                ms2pred::correlate_all(results, observed, cfg.ms2_tolerance), cfg.output_path);
        },
        ms2pred::cli::Spectra::Observed);
}

#include "ms2pred/cli.hpp"
#include "ms2pred/mzml_library.hpp"

int main(const int argc, char* argv[]) {
    return ms2pred::cli::run_tool(argc, argv, "ms2pred_library",
        [](const ms2pred::cli::Config& cfg, const std::vector<ms2pred::PeptideResult>& results) {
            ms2pred::mzml::write_mzml_library(results, cfg.output_path);
        });
}

#include "ms2pred/cli.hpp"
#include "ms2pred/parsing.hpp"

int main(const int argc, char* argv[]) {
    return ms2pred::cli::run_tool(argc, argv, "ms2pred_predict",
        [](const ms2pred::cli::Config& cfg, const std::vector<ms2pred::PeptideResult>& results) {
            ms2pred::csv::write_predictions_csv(results, cfg.output_path);
        });
}

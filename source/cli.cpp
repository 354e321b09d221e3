#include "ms2pred/cli.hpp"

#include <cstdlib>
#include <iostream>

#include "ms2pred/correlation.hpp"
#include "ms2pred/errors.hpp"
#include "ms2pred/fragmentation.hpp"
#include "ms2pred/logging.hpp"
#include "ms2pred/model_registry.hpp"
#include "ms2pred/parsing.hpp"

namespace po = boost::program_options;

namespace ms2pred::cli {

void log_config(const Config& config, const std::string_view program) {
    BOOST_LOG_TRIVIAL(info) << "Running " << program << " with parameters:"
    << " method=" << config.method
    << ", threads=" << config.threads
    << ", chunk_size=" << config.chunk_size
    << ", normalization=" << to_string(config.normalization)
    << ", min_length=" << config.limits.min_length
    << ", max_length=" << config.limits.max_length
    << ".";
    BOOST_LOG_TRIVIAL(info) << "Input files are:";
    BOOST_LOG_TRIVIAL(info) << "  peprec_file=" << config.peprec_path;
    BOOST_LOG_TRIVIAL(info) << "  model_manifest=" << config.manifest_path;
    if (!config.modifications_path.empty()) {
        BOOST_LOG_TRIVIAL(info) << "  modifications_file=" << config.modifications_path;
    }
    if (!config.spectra_path.empty()) {
        BOOST_LOG_TRIVIAL(info) << "  spectrum_file=" << config.spectra_path
                                << " (ms2_tolerance=" << config.ms2_tolerance << " Da"
                                << (config.spectrum_id_pattern.empty() ? "" : ", spectrum_id_pattern=")
                                << config.spectrum_id_pattern << ")";
    }
    BOOST_LOG_TRIVIAL(info) << "Output file is: " << config.output_path;
    BOOST_LOG_TRIVIAL(info) << "Errors file is: " << config.errors_path;
}

void print_usage_and_exit(const po::options_description& all, const std::string_view program, const int exit_code) {
    std::cout << "Usage:\n"
              << "  " << program << " <peprec> <model-manifest> <output> [options]\n\n"
              << all << "\n";
    std::exit(exit_code);
}

Config parse_args(const int argc, char* argv[], const std::string_view program, const Spectra spectra) {
    Config cfg;

    // Named options; all of them except help and config may also come from the INI file
    po::options_description named_opts("Options");
    named_opts.add_options()
        ("method,m", po::value<std::string>()->default_value("HCD"),
            "Fragmentation method: HCD, CID, ETD, EThcD, TMT, iTRAQ, iTRAQphospho, "
            "TTOF5600, HCDch2, CIDch2, Immuno-HCD (default: HCD)")
        ("threads,t", po::value<int>()->default_value(0),
            "Number of threads, 0 for all cores (default: 0)")
        ("chunk-size", po::value<std::size_t>()->default_value(1000),
            "Peptides per work chunk (default: 1000)")
        ("normalization,n", po::value<std::string>()->default_value("relative-max"),
            "Intensity normalization: raw, relative-max, tic, log (default: relative-max)")
        ("modifications", po::value<std::string>(),
            "Modification definitions, one 'name,mass,opt|fixed,target' per line")
        ("min-length", po::value<std::size_t>()->default_value(4),
            "Minimum peptide length (default: 4)")
        ("max-length", po::value<std::size_t>()->default_value(100),
            "Maximum peptide length (default: 100)")
        ("errors", po::value<std::string>(),
            "Errors CSV (default: <output>.errors.csv)")
        ("verbosity,v", po::value<std::string>()->default_value("info"),
            "Log level: trace, debug, info, warning, error, fatal (default: info)");

    if (spectra == Spectra::Observed) {
        po::options_description spectra_opts("Observed spectra");
        spectra_opts.add_options()
            ("spectra,s", po::value<std::string>(),
                "mzML file with the observed MS2 spectra (required)")
            ("spectrum-id-pattern,p", po::value<std::string>(),
                "Regex whose first group maps native spectrum ids to spec_ids (default: native id)")
            ("ms2-tolerance", po::value<double>()->default_value(0.02),
                "Fragment m/z tolerance in Da (default: 0.02)");
        named_opts.add(spectra_opts);
    }

    po::options_description generic_opts("Generic options");
    generic_opts.add_options()
        ("help,h", "Show help message")
        ("config,c", po::value<std::string>(), "INI file with any of the options above");

    // Positional arguments
    po::options_description positional_opts("Positional arguments");
    positional_opts.add_options()
        ("peprec_path", po::value<std::string>(), "PEPREC file (required)")
        ("manifest_path", po::value<std::string>(), "Model manifest (required)")
        ("output_path", po::value<std::string>(), "Output path (required)");

    po::options_description all;
    all.add(generic_opts).add(named_opts).add(positional_opts);

    po::positional_options_description pos;
    pos.add("peprec_path", 1);
    pos.add("manifest_path", 1);
    pos.add("output_path", 1);

    po::variables_map vm;

    try {
        po::store(po::command_line_parser(argc, argv)
                      .options(all)
                      .positional(pos)
                      .run(),
                  vm);
        if (vm.contains("config")) {
            po::store(po::parse_config_file<char>(vm["config"].as<std::string>().c_str(), named_opts), vm);
        }
        po::notify(vm);
    } catch (const std::exception& e) {
        std::cerr << "Error parsing arguments: " << e.what() << "\n\n";
        print_usage_and_exit(all, program, 1);
    }

    if (vm.contains("help")) {
        print_usage_and_exit(all, program, 0);
    }

    // Validate required positional arguments
    const char* required_positional[] = {
        "peprec_path",
        "manifest_path",
        "output_path"
    };

    for (const char* key : required_positional) {
        if (!vm.contains(key)) {
            std::cerr << "Error: missing required positional argument: "
                      << key << "\n\n";
            print_usage_and_exit(all, program, 1);
        }
    }

    // Assign values
    cfg.peprec_path = vm["peprec_path"].as<std::string>();
    cfg.manifest_path = vm["manifest_path"].as<std::string>();
    cfg.output_path = vm["output_path"].as<std::string>();
    cfg.errors_path = vm.contains("errors") ? vm["errors"].as<std::string>() : cfg.output_path + ".errors.csv";
    if (vm.contains("modifications")) {
        cfg.modifications_path = vm["modifications"].as<std::string>();
    }

    if (spectra == Spectra::Observed) {
        if (!vm.contains("spectra")) {
            std::cerr << "Error: missing required option --spectra\n\n";
            print_usage_and_exit(all, program, 1);
        }
        cfg.spectra_path = vm["spectra"].as<std::string>();
        if (vm.contains("spectrum-id-pattern")) {
            cfg.spectrum_id_pattern = vm["spectrum-id-pattern"].as<std::string>();
        }
        cfg.ms2_tolerance = vm["ms2-tolerance"].as<double>();
        if (!(cfg.ms2_tolerance > 0.0)) {
            std::cerr << "Error: ms2-tolerance must be > 0.\n\n";
            print_usage_and_exit(all, program, 1);
        }
    }

    cfg.method = vm["method"].as<std::string>();
    cfg.threads = vm["threads"].as<int>();
    cfg.chunk_size = vm["chunk-size"].as<std::size_t>();
    cfg.limits.min_length = vm["min-length"].as<std::size_t>();
    cfg.limits.max_length = vm["max-length"].as<std::size_t>();

    try {
        cfg.normalization = parse_normalization(vm["normalization"].as<std::string>());
        cfg.verbosity = parse_severity(vm["verbosity"].as<std::string>());
        static_cast<void>(parse_method(cfg.method));
        static_cast<void>(SpectrumIdPattern(cfg.spectrum_id_pattern));
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n\n";
        print_usage_and_exit(all, program, 1);
    }

    // Basic validation
    if (cfg.threads < 0) {
        std::cerr << "Error: threads must be >= 0.\n\n";
        print_usage_and_exit(all, program, 1);
    }
    if (cfg.chunk_size == 0) {
        std::cerr << "Error: chunk-size must be >= 1.\n\n";
        print_usage_and_exit(all, program, 1);
    }
    if (cfg.limits.min_length < 2 || cfg.limits.min_length > cfg.limits.max_length) {
        std::cerr << "Error: need 2 <= min-length <= max-length.\n\n";
        print_usage_and_exit(all, program, 1);
    }

    return cfg;
}

int run_tool(const int argc, char* argv[], const std::string_view program, const ResultWriter& write,
             const Spectra spectra) {
    const auto cfg = parse_args(argc, argv, program, spectra);
    init_logging(cfg.verbosity);
    log_config(cfg, program);

    try {
        auto modifications = cfg.modifications_path.empty()
            ? ptm::ModificationTable::defaults()
            : config::read_modifications_file(cfg.modifications_path);
        const ResidueTable residues(std::move(modifications), cfg.limits);
        for (const auto& mod : residues.modifications().all()) {
            BOOST_LOG_TRIVIAL(debug) << "Modification " << mod.name << ": " << mod.mass_delta << " Da"
                                     << (mod.type == ptm::PtmType::Fixed ? " (fixed)" : "");
        }

        const auto models = ModelRegistry::load_all(config::read_model_manifest(cfg.manifest_path));
        const auto peptides = peprec::read_peprec(cfg.peprec_path);

        const BatchPredictor predictor({residues, models}, {cfg.chunk_size, cfg.threads, cfg.normalization});
        const auto results = predictor.run(peptides, cfg.method);

        write(cfg, results);
        if (const auto failed = csv::write_errors_csv(results, cfg.errors_path); failed > 0) {
            BOOST_LOG_TRIVIAL(warning) << failed << " peptides could not be predicted, see " << cfg.errors_path << ".";
        }
    } catch (const ModelLoadError& e) {
        BOOST_LOG_TRIVIAL(error) << "Cannot load models: " << e.what();
        return 1;
    } catch (const std::exception& e) {
        BOOST_LOG_TRIVIAL(error) << e.what();
        return 1;
    }

    BOOST_LOG_TRIVIAL(info) << "Finished predicting.";
    return 0;
}

} // namespace ms2pred::cli

#include "ms2pred/batch.hpp"

#include <algorithm>
#include <chrono>
#include <stdexcept>

#include <boost/log/trivial.hpp>
#include <omp.h>

#include "ms2pred/encoder.hpp"

namespace ms2pred {

namespace {

void fail_range(std::vector<PeptideResult>& results, const PeptideRecords& peptides,
                const std::size_t begin, const std::size_t end, const ErrorKind kind, const std::string& message) {
    for (std::size_t i = begin; i < end; ++i) {
        results[i] = PeptideResult::failure(peptides[i].id, kind, message);
    }
}

}

PeptideResult PeptideResult::success(std::string id, PredictedSpectrum spectrum) {
    PeptideResult result;
    result.id = std::move(id);
    result.status = ResultStatus::Ok;
    result.spectrum.emplace(std::move(spectrum));
    return result;
}

PeptideResult PeptideResult::failure(std::string id, const ErrorKind kind, std::string message) {
    PeptideResult result;
    result.id = std::move(id);
    result.status = ResultStatus::Error;
    result.error = kind;
    result.message = std::move(message);
    return result;
}

BatchPredictor::BatchPredictor(const PredictionContext context, const BatchOptions options)
    : context_(context), options_(options), engine_(context.models), assembler_(options.normalization) {
    if (options_.chunk_size == 0) {
        throw std::invalid_argument("Chunk size must be positive");
    }
    if (options_.threads < 0) {
        throw std::invalid_argument("Thread count must not be negative");
    }
}

PeptideResult BatchPredictor::predict_one(const PeptideRecord& record, const FragmentationMethod method) const {
    try {
        const auto peptide = context_.residues.resolve(record);
        const auto matrix = encode(peptide, method);
        const auto predictions = engine_.predict(matrix, method);
        return PeptideResult::success(record.id, assembler_.assemble(peptide, method, predictions, matrix.labels()));
    } catch (const Error& e) {
        BOOST_LOG_TRIVIAL(debug) << record << " failed (" << to_string(e.kind()) << "): " << e.what();
        return PeptideResult::failure(record.id, e.kind(), e.what());
    }
}

std::vector<PeptideResult> BatchPredictor::run(const PeptideRecords& peptides,
                                               const std::string_view method,
                                               const CancellationToken* cancel) const {
    FragmentationMethod parsed;
    try {
        parsed = parse_method(method);
    } catch (const UnsupportedMethodError& e) {
        BOOST_LOG_TRIVIAL(error) << e.what();
        std::vector<PeptideResult> results(peptides.size());
        fail_range(results, peptides, 0, peptides.size(), e.kind(), e.what());
        return results;
    }
    return run(peptides, parsed, cancel);
}

std::vector<PeptideResult> BatchPredictor::run(const PeptideRecords& peptides,
                                               const FragmentationMethod method,
                                               const CancellationToken* cancel) const {
    const auto start = std::chrono::steady_clock::now();
    const std::size_t n = peptides.size();
    const std::size_t chunk_size = options_.chunk_size;
    const std::size_t n_chunks = (n + chunk_size - 1) / chunk_size;
    const int threads = options_.threads > 0 ? options_.threads : omp_get_max_threads();

    BOOST_LOG_TRIVIAL(info) << "Predicting " << n << " peptides with " << to_string(method) << " models in "
                            << n_chunks << " chunks on " << threads << " threads.";
    if (!context_.models.has_method(method)) {
        BOOST_LOG_TRIVIAL(warning) << "No models loaded for " << to_string(method)
                                   << "; every peptide will fail with ModelNotFound.";
    }

    // Each chunk owns the slots [begin, end) of this vector; nothing else is shared for writing.
    std::vector<PeptideResult> results(n);

#pragma omp parallel for schedule(dynamic, 1) num_threads(threads)
    for (std::size_t c = 0; c < n_chunks; ++c) {
        const std::size_t begin = c * chunk_size;
        const std::size_t end = std::min(n, begin + chunk_size);

        if (cancel && cancel->cancelled()) {
            fail_range(results, peptides, begin, end, ErrorKind::Cancelled, "Batch cancelled before chunk started");
            continue;
        }

        try {
            std::vector<PeptideResult> local;
            local.reserve(end - begin);
            for (std::size_t i = begin; i < end; ++i) {
                local.push_back(predict_one(peptides[i], method));
            }
            std::ranges::move(local, results.begin() + static_cast<std::ptrdiff_t>(begin));
        } catch (const std::exception& e) {
            BOOST_LOG_TRIVIAL(error) << "Chunk " << c << " (peptides " << begin << ".." << end - 1
                                     << ") failed: " << e.what();
            fail_range(results, peptides, begin, end, ErrorKind::Internal,
                       std::string("Chunk processing failed: ") + e.what());
        } catch (...) {
            BOOST_LOG_TRIVIAL(error) << "Chunk " << c << " (peptides " << begin << ".." << end - 1
                                     << ") failed with a non-standard exception";
            fail_range(results, peptides, begin, end, ErrorKind::Internal,
                       "Chunk processing failed with a non-standard exception");
        }
    }

    const auto ok = std::ranges::count_if(results, [](const PeptideResult& r) { return r.ok(); });
    const auto elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
    BOOST_LOG_TRIVIAL(info) << "Predicted " << ok << " of " << n << " peptides ("
                            << n - static_cast<std::size_t>(ok) << " errors) in " << elapsed << " s.";
    return results;
}

} // namespace ms2pred

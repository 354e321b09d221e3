#pragma once

#include <atomic>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "ms2pred/errors.hpp"
#include "ms2pred/model_registry.hpp"
#include "ms2pred/prediction.hpp"
#include "ms2pred/residue_table.hpp"
#include "ms2pred/spectrum.hpp"
#include "ms2pred/types.hpp"

namespace ms2pred {

/**
 * @brief Read-only state shared by every worker of a batch.
 *
 * Both tables must be fully constructed before a batch starts and outlive it.
 */
struct PredictionContext {
    const ResidueTable& residues;
    const ModelRegistry& models;
};

enum class ResultStatus { Ok, Error };

/// @brief Outcome for one input peptide: a complete spectrum or an error, never both.
struct PeptideResult {
    std::string id;
    ResultStatus status = ResultStatus::Error;
    std::optional<PredictedSpectrum> spectrum;
    std::optional<ErrorKind> error;
    std::string message;

    [[nodiscard]] bool ok() const noexcept { return status == ResultStatus::Ok; }

    static PeptideResult success(std::string id, PredictedSpectrum spectrum);
    static PeptideResult failure(std::string id, ErrorKind kind, std::string message);
};

struct BatchOptions {
    std::size_t chunk_size = 1000;
    int threads = 0;   ///< 0: OpenMP default
    NormalizationMode normalization = NormalizationMode::RelativeMax;
};

/// @brief Batch-level cancellation flag, settable from any thread.
class CancellationToken {
public:
    void cancel() noexcept { cancelled_.store(true, std::memory_order_relaxed); }
    [[nodiscard]] bool cancelled() const noexcept { return cancelled_.load(std::memory_order_relaxed); }

private:
    std::atomic<bool> cancelled_{false};
};

/**
 * @brief Runs resolve -> encode -> predict -> assemble over large peptide lists.
 *
 * The input is split into chunks of at most BatchOptions::chunk_size
 * peptides; an OpenMP team processes chunks independently and writes each
 * result at its input index, so the output order is the input order whatever
 * the thread count or completion order.
 *
 * Failures are isolated:
 *   - a pipeline Error affects only its own peptide,
 *   - any other exception marks exactly the peptides of its chunk as Internal,
 *   - after cancellation, chunks that have not started report Cancelled.
 */
class BatchPredictor {
public:
    /// @throws std::invalid_argument if chunk_size is 0.
    BatchPredictor(PredictionContext context, BatchOptions options = {});

    /// @brief Run with a method identifier; an unknown identifier yields UnsupportedMethod for every peptide.
    [[nodiscard]] std::vector<PeptideResult> run(const PeptideRecords& peptides,
                                                 std::string_view method,
                                                 const CancellationToken* cancel = nullptr) const;

    [[nodiscard]] std::vector<PeptideResult> run(const PeptideRecords& peptides,
                                                 FragmentationMethod method,
                                                 const CancellationToken* cancel = nullptr) const;

    /// @brief Full pipeline for a single peptide; pipeline errors become a failed result.
    [[nodiscard]] PeptideResult predict_one(const PeptideRecord& record, FragmentationMethod method) const;

    [[nodiscard]] const BatchOptions& options() const noexcept { return options_; }

private:
    PredictionContext context_;
    BatchOptions options_;
    PredictionEngine engine_;
    SpectrumAssembler assembler_;
};

} // namespace ms2pred

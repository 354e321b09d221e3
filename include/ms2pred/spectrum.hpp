#pragma once

#include <ostream>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "ms2pred/encoder.hpp"
#include "ms2pred/prediction.hpp"
#include "ms2pred/residue_table.hpp"

namespace ms2pred {

enum class NormalizationMode {
    Raw,           ///< model intensities as predicted
    RelativeMax,   ///< divided by the most intense ion, range [0, 1]
    Tic,           ///< divided by the summed intensity
    Log            ///< log2(tic + 0.001)
};

std::string_view to_string(NormalizationMode mode) noexcept;

/// @throws std::invalid_argument for unknown names ("raw", "relative-max", "tic", "log").
NormalizationMode parse_normalization(std::string_view name);

/// @brief Normalize @p values in place. An all-zero input stays zero (or log2(0.001) for Log).
void normalize_intensities(std::span<double> values, NormalizationMode mode) noexcept;

/**
 * @brief Final, immutable predicted spectrum of one peptide.
 *
 * Ions are sorted by series (b, y, c, z), then ion number, then charge.
 */
class PredictedSpectrum {
public:
    PredictedSpectrum(std::string id,
                      std::string sequence,
                      charge_t charge,
                      mz_t precursor_mz,
                      FragmentationMethod method,
                      NormalizationMode normalization,
                      std::vector<IonPrediction> ions)
        : id_(std::move(id)), sequence_(std::move(sequence)), charge_(charge), precursor_mz_(precursor_mz),
          method_(method), normalization_(normalization), ions_(std::move(ions)) {}

    [[nodiscard]] const std::string& id() const noexcept { return id_; }
    [[nodiscard]] const std::string& sequence() const noexcept { return sequence_; }
    [[nodiscard]] charge_t charge() const noexcept { return charge_; }
    [[nodiscard]] mz_t precursor_mz() const noexcept { return precursor_mz_; }
    [[nodiscard]] FragmentationMethod method() const noexcept { return method_; }
    [[nodiscard]] NormalizationMode normalization() const noexcept { return normalization_; }
    [[nodiscard]] const std::vector<IonPrediction>& ions() const noexcept { return ions_; }

    bool operator==(const PredictedSpectrum& other) const;

private:
    std::string id_;
    std::string sequence_;
    charge_t charge_;
    mz_t precursor_mz_;
    FragmentationMethod method_;
    NormalizationMode normalization_;
    std::vector<IonPrediction> ions_;
};

std::ostream& operator<<(std::ostream& os, const PredictedSpectrum& spectrum);

/**
 * @brief Turns per-ion predictions into an ordered, normalized spectrum.
 *
 * Sentinel policy: when a theoretical ion set is given, every theoretical
 * ion appears exactly once. Ions without a prediction get intensity 0,
 * repeated predictions keep the first one, predictions for ions outside the
 * set are dropped. The same policy applies to every peptide of a batch.
 */
class SpectrumAssembler {
public:
    explicit SpectrumAssembler(NormalizationMode mode = NormalizationMode::RelativeMax) : mode_(mode) {}

    /// @brief Sort, de-duplicate and normalize @p predictions without a theoretical set.
    /// Sequence, charge and precursor m/z of the result are left empty.
    [[nodiscard]] PredictedSpectrum assemble(const std::string& peptide_id,
                                             FragmentationMethod method,
                                             const std::vector<IonPrediction>& predictions) const;

    /// @brief Assemble against the theoretical ions @p theoretical (the encoder's row labels).
    [[nodiscard]] PredictedSpectrum assemble(const ResolvedPeptide& peptide,
                                             FragmentationMethod method,
                                             const std::vector<IonPrediction>& predictions,
                                             const std::vector<RowLabel>& theoretical) const;

    [[nodiscard]] NormalizationMode mode() const noexcept { return mode_; }

private:
    NormalizationMode mode_;

    void normalize(std::vector<IonPrediction>& ions) const;
};

} // namespace ms2pred

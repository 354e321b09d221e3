#pragma once

#include <optional>
#include <regex>
#include <span>
#include <string>
#include <unordered_map>
#include <vector>

#include "ms2pred/batch.hpp"
#include "ms2pred/spectrum.hpp"

namespace ms2pred {

/// @brief Centroided peaks of a measured MS2 spectrum, sorted by m/z.
struct ObservedSpectrum {
    std::string id;
    std::vector<mz_t> mz;
    std::vector<double> intensity;
};

/// Observed spectra keyed by the PEPREC spec_id they belong to.
using ObservedSpectra = std::unordered_map<std::string, ObservedSpectrum>;

/**
 * @brief Maps native spectrum ids of a run to PEPREC spec_ids.
 *
 * Without a pattern the native id is the spec_id. With a pattern, the first
 * capture group of the first match is (the whole match if the pattern has no
 * group); ids without a match belong to no peptide.
 */
class SpectrumIdPattern {
public:
    /// @throws std::invalid_argument if @p pattern is not a valid ECMAScript regex.
    explicit SpectrumIdPattern(const std::string& pattern = {});

    [[nodiscard]] std::optional<std::string> spec_id(const std::string& native_id) const;

private:
    std::optional<std::regex> regex_;
};

struct SpectrumCorrelation {
    std::string id;
    std::size_t ions = 0;             ///< predicted ions
    std::size_t matched = 0;          ///< predicted ions with an observed peak within tolerance
    std::optional<double> pearson;    ///< empty for fewer than two ions or constant intensities
};

/// @brief Pearson correlation of @p x and @p y, which must have the same size.
/// @throws std::invalid_argument on a size mismatch.
std::optional<double> pearson(std::span<const double> x, std::span<const double> y);

/**
 * @brief Observed intensity of every predicted ion, in the spectrum's ion order.
 *
 * An ion takes the most intense peak within @p tolerance (Da) of its m/z, or
 * 0 when there is none. The same peak may serve several ions.
 */
std::vector<double> match_peaks(const PredictedSpectrum& predicted, const ObservedSpectrum& observed, mz_t tolerance);

/// @brief Correlate predicted and matched observed intensities after normalizing
///        the observed ones the way @p predicted was normalized.
SpectrumCorrelation correlate(const PredictedSpectrum& predicted, const ObservedSpectrum& observed, mz_t tolerance);

/// @brief One entry per successful result that has an observed spectrum, in result order.
std::vector<SpectrumCorrelation> correlate_all(const std::vector<PeptideResult>& results,
                                               const ObservedSpectra& observed,
                                               mz_t tolerance);

} // namespace ms2pred

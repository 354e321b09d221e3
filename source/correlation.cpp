#include "ms2pred/correlation.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

#include <boost/log/trivial.hpp>

namespace ms2pred {

SpectrumIdPattern::SpectrumIdPattern(const std::string& pattern) {
    if (pattern.empty()) return;
    try {
        regex_.emplace(pattern);
    } catch (const std::regex_error& e) {
        throw std::invalid_argument("Invalid spectrum id pattern '" + pattern + "': " + e.what());
    }
}

std::optional<std::string> SpectrumIdPattern::spec_id(const std::string& native_id) const {
    if (!regex_) return native_id;
    std::smatch match;
    if (!std::regex_search(native_id, match, *regex_)) return std::nullopt;
    return match.size() > 1 ? match[1].str() : match[0].str();
}

std::optional<double> pearson(const std::span<const double> x, const std::span<const double> y) {
    if (x.size() != y.size()) {
        throw std::invalid_argument("Cannot correlate series of " + std::to_string(x.size()) + " and "
                                    + std::to_string(y.size()) + " values");
    }
    const std::size_t n = x.size();
    if (n < 2) return std::nullopt;

    double mean_x = 0.0, mean_y = 0.0;
    for (std::size_t i = 0; i < n; ++i) {
        mean_x += x[i];
        mean_y += y[i];
    }
    mean_x /= static_cast<double>(n);
    mean_y /= static_cast<double>(n);

    double sxy = 0.0, sxx = 0.0, syy = 0.0;
    for (std::size_t i = 0; i < n; ++i) {
        const double dx = x[i] - mean_x;
        const double dy = y[i] - mean_y;
        sxy += dx * dy;
        sxx += dx * dx;
        syy += dy * dy;
    }
    if (sxx <= 0.0 || syy <= 0.0) return std::nullopt;
    return std::clamp(sxy / std::sqrt(sxx * syy), -1.0, 1.0);
}

std::vector<double> match_peaks(const PredictedSpectrum& predicted, const ObservedSpectrum& observed,
                                const mz_t tolerance) {
    std::vector<double> matched;
    matched.reserve(predicted.ions().size());
    for (const auto& ion : predicted.ions()) {
        auto it = std::ranges::lower_bound(observed.mz, ion.mz - tolerance);
        double best = 0.0;
        for (; it != observed.mz.end() && *it <= ion.mz + tolerance; ++it) {
            best = std::max(best, observed.intensity[static_cast<std::size_t>(it - observed.mz.begin())]);
        }
        matched.push_back(best);
    }
    return matched;
}

SpectrumCorrelation correlate(const PredictedSpectrum& predicted, const ObservedSpectrum& observed,
                              const mz_t tolerance) {
    auto target = match_peaks(predicted, observed, tolerance);

    SpectrumCorrelation result;
    result.id = predicted.id();
    result.ions = target.size();
    result.matched = static_cast<std::size_t>(std::ranges::count_if(target, [](const double v) { return v > 0.0; }));

    normalize_intensities(target, predicted.normalization());
    std::vector<double> prediction;
    prediction.reserve(predicted.ions().size());
    for (const auto& ion : predicted.ions()) prediction.push_back(ion.intensity);

    result.pearson = pearson(prediction, target);
    return result;
}

std::vector<SpectrumCorrelation> correlate_all(const std::vector<PeptideResult>& results,
                                               const ObservedSpectra& observed,
                                               const mz_t tolerance) {
    std::vector<SpectrumCorrelation> correlations;
    std::size_t unobserved = 0;
    for (const auto& result : results) {
        if (!result.ok()) continue;
        const auto it = observed.find(result.id);
        if (it == observed.end()) {
            BOOST_LOG_TRIVIAL(debug) << "No observed spectrum for peptide " << result.id;
            ++unobserved;
            continue;
        }
        correlations.push_back(correlate(*result.spectrum, it->second, tolerance));
    }
    if (unobserved > 0) {
        BOOST_LOG_TRIVIAL(warning) << unobserved << " predicted peptides have no observed spectrum.";
    }
    BOOST_LOG_TRIVIAL(info) << "Correlated " << correlations.size() << " spectra within " << tolerance << " Da.";
    return correlations;
}

} // namespace ms2pred

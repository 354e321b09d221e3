#include "ms2pred/spectrum.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <map>
#include <stdexcept>
#include <tuple>

#include <boost/log/trivial.hpp>

namespace ms2pred {

namespace {

using ion_key_t = std::tuple<IonSeries, std::size_t, charge_t>;

ion_key_t key_of(const IonPrediction& ion) noexcept {
    return {ion.ion_type.series, ion.ion_number, ion.charge};
}

ion_key_t key_of(const RowLabel& label) noexcept {
    return {label.ion_type.series, label.ion_number, label.ion_type.charge};
}

void sort_ions(std::vector<IonPrediction>& ions) {
    std::ranges::stable_sort(ions, [](const IonPrediction& a, const IonPrediction& b) {
        return key_of(a) < key_of(b);
    });
}

}

std::string_view to_string(const NormalizationMode mode) noexcept {
    switch (mode) {
        case NormalizationMode::Raw: return "raw";
        case NormalizationMode::RelativeMax: return "relative-max";
        case NormalizationMode::Tic: return "tic";
        case NormalizationMode::Log: return "log";
    }
    return "unknown";
}

NormalizationMode parse_normalization(const std::string_view name) {
    if (name == "raw") return NormalizationMode::Raw;
    if (name == "relative-max") return NormalizationMode::RelativeMax;
    if (name == "tic") return NormalizationMode::Tic;
    if (name == "log") return NormalizationMode::Log;
    throw std::invalid_argument("Unknown normalization mode: " + std::string(name));
}

bool PredictedSpectrum::operator==(const PredictedSpectrum& other) const {
    if (id_ != other.id_ || sequence_ != other.sequence_ || charge_ != other.charge_
        || precursor_mz_ != other.precursor_mz_ || method_ != other.method_
        || normalization_ != other.normalization_ || ions_.size() != other.ions_.size()) {
        return false;
    }
    return std::ranges::equal(ions_, other.ions_, [](const IonPrediction& a, const IonPrediction& b) {
        return key_of(a) == key_of(b) && a.mz == b.mz && a.intensity == b.intensity;
    });
}

std::ostream& operator<<(std::ostream& os, const PredictedSpectrum& spectrum) {
    os << "PredictedSpectrum(id=" << spectrum.id()
       << ", seq=" << spectrum.sequence()
       << ", charge=" << spectrum.charge()
       << ", method=" << to_string(spectrum.method())
       << ", ions=[";
    for (std::size_t i = 0; i < spectrum.ions().size(); ++i) {
        const auto& ion = spectrum.ions()[i];
        if (i) os << ", ";
        os << to_string(ion.ion_type.series) << ion.ion_number;
        if (ion.charge > 1) os << "^" << ion.charge;
        os << "=" << std::setprecision(6) << ion.intensity;
    }
    return os << "])";
}

void normalize_intensities(const std::span<double> values, const NormalizationMode mode) noexcept {
    switch (mode) {
        case NormalizationMode::Raw:
            return;
        case NormalizationMode::RelativeMax: {
            double max = 0.0;
            for (const double v : values) max = std::max(max, v);
            if (max > 0.0) {
                for (double& v : values) v /= max;
            }
            return;
        }
        case NormalizationMode::Tic:
        case NormalizationMode::Log: {
            double total = 0.0;
            for (const double v : values) total += v;
            if (total > 0.0) {
                for (double& v : values) v /= total;
            }
            if (mode == NormalizationMode::Log) {
                for (double& v : values) v = std::log2(v + 0.001);
            }
            return;
        }
    }
}

void SpectrumAssembler::normalize(std::vector<IonPrediction>& ions) const {
    std::vector<double> values;
    values.reserve(ions.size());
    for (const auto& ion : ions) values.push_back(ion.intensity);
    normalize_intensities(values, mode_);
    for (std::size_t i = 0; i < ions.size(); ++i) ions[i].intensity = values[i];
}

PredictedSpectrum SpectrumAssembler::assemble(const std::string& peptide_id,
                                              const FragmentationMethod method,
                                              const std::vector<IonPrediction>& predictions) const {
    std::vector<IonPrediction> ions = predictions;
    sort_ions(ions);
    // stable sort keeps the first of equal keys in front
    const auto [first, last] = std::ranges::unique(ions, [](const IonPrediction& a, const IonPrediction& b) {
        return key_of(a) == key_of(b);
    });
    ions.erase(first, last);
    normalize(ions);
    return {peptide_id, {}, 0, 0.0, method, mode_, std::move(ions)};
}

PredictedSpectrum SpectrumAssembler::assemble(const ResolvedPeptide& peptide,
                                              const FragmentationMethod method,
                                              const std::vector<IonPrediction>& predictions,
                                              const std::vector<RowLabel>& theoretical) const {
    std::vector<IonPrediction> ions;
    ions.reserve(theoretical.size());
    std::map<ion_key_t, std::size_t> slots;
    for (const auto& label : theoretical) {
        if (slots.emplace(key_of(label), ions.size()).second) {
            ions.push_back({label.ion_type, label.ion_number, label.ion_type.charge, label.mz, 0.0});
        }
    }

    std::vector<bool> filled(ions.size(), false);
    std::size_t duplicates = 0, unexpected = 0;
    for (const auto& prediction : predictions) {
        const auto it = slots.find(key_of(prediction));
        if (it == slots.end()) {
            ++unexpected;
            continue;
        }
        if (filled[it->second]) {
            ++duplicates;
            continue;
        }
        filled[it->second] = true;
        ions[it->second].intensity = prediction.intensity;
    }

    if (const auto missing = std::count(filled.begin(), filled.end(), false); missing || duplicates || unexpected) {
        BOOST_LOG_TRIVIAL(warning) << "Peptide " << peptide.id << ": " << missing << " ions without prediction set to 0, "
                                   << duplicates << " duplicate and " << unexpected << " unexpected predictions dropped.";
    }

    sort_ions(ions);
    normalize(ions);
    return {peptide.id, peptide.sequence, peptide.charge, peptide.precursor_mz(), method, mode_, std::move(ions)};
}

} // namespace ms2pred

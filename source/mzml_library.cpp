#include "ms2pred/mzml_library.hpp"

#include <stdexcept>

#include <OpenMS/FORMAT/MzMLFile.h>
#include <OpenMS/KERNEL/MSSpectrum.h>
#include <OpenMS/KERNEL/Peak1D.h>
#include <OpenMS/METADATA/Precursor.h>

#include <boost/log/trivial.hpp>

namespace ms2pred::mzml {

namespace {

OpenMS::Precursor::ActivationMethod activation_method(const FragmentationMethod method) noexcept {
    switch (method) {
        case FragmentationMethod::ETD: return OpenMS::Precursor::ActivationMethod::ETD;
        case FragmentationMethod::EThcD: return OpenMS::Precursor::ActivationMethod::EThcD;
        case FragmentationMethod::CID:
        case FragmentationMethod::CIDch2:
        case FragmentationMethod::TTOF5600: return OpenMS::Precursor::ActivationMethod::CID;
        default: return OpenMS::Precursor::ActivationMethod::HCD;
    }
}

std::string ion_label(const IonPrediction& ion) {
    std::string label = std::string(to_string(ion.ion_type.series)) + std::to_string(ion.ion_number);
    if (ion.charge > 1) label += "^" + std::to_string(ion.charge);
    return label;
}

}

OpenMS::MSExperiment to_experiment(const std::vector<PeptideResult>& results) {
    OpenMS::MSExperiment exp;
    for (const auto& result : results) {
        if (!result.ok()) continue;
        const auto& predicted = *result.spectrum;

        OpenMS::MSSpectrum spectrum;
        spectrum.setMSLevel(2);
        spectrum.setNativeID(predicted.id());
        spectrum.setMetaValue("peptide_sequence", OpenMS::String(predicted.sequence()));

        OpenMS::Precursor precursor;
        precursor.setMZ(predicted.precursor_mz());
        precursor.setCharge(predicted.charge());
        precursor.setActivationMethods({activation_method(predicted.method())});
        spectrum.setPrecursors({precursor});

        OpenMS::MSSpectrum::StringDataArray labels;
        labels.setName("IonNames");
        for (const auto& ion : predicted.ions()) {
            spectrum.push_back(OpenMS::Peak1D(ion.mz, static_cast<float>(ion.intensity)));
            labels.push_back(ion_label(ion));
        }
        spectrum.getStringDataArrays().push_back(std::move(labels));
        spectrum.sortByPosition();

        exp.addSpectrum(std::move(spectrum));
    }
    return exp;
}

void write_mzml_library(const std::vector<PeptideResult>& results, const std::string& file_path) {
    const auto exp = to_experiment(results);
    try {
        OpenMS::MzMLFile mzml;
        mzml.store(file_path, exp);
    } catch (const std::exception& e) {
        throw std::runtime_error(std::string{"Failed to store mzML '"} + file_path + "': " + e.what());
    }
    BOOST_LOG_TRIVIAL(info) << "Wrote " << exp.size() << " spectra to " << file_path << ".";
}

ObservedSpectra to_observed(const OpenMS::MSExperiment& exp, const SpectrumIdPattern& pattern) {
    ObservedSpectra observed;
    std::size_t unmatched = 0, repeated = 0;
    for (const OpenMS::MSSpectrum& spectrum : exp) {
        if (spectrum.getMSLevel() != 2) continue; // MS2 only
        const auto id = pattern.spec_id(spectrum.getNativeID());
        if (!id) {
            ++unmatched;
            continue;
        }

        ObservedSpectrum peaks;
        peaks.id = *id;
        peaks.mz.reserve(spectrum.size());
        peaks.intensity.reserve(spectrum.size());
        OpenMS::MSSpectrum sorted = spectrum;
        sorted.sortByPosition();
        for (const OpenMS::Peak1D& p : sorted) {
            peaks.mz.push_back(p.getMZ());
            peaks.intensity.push_back(p.getIntensity());
        }
        if (!observed.emplace(*id, std::move(peaks)).second) ++repeated;
    }
    if (unmatched > 0) {
        BOOST_LOG_TRIVIAL(warning) << unmatched << " MS2 spectra have no spec_id under the spectrum id pattern.";
    }
    if (repeated > 0) {
        BOOST_LOG_TRIVIAL(warning) << repeated << " MS2 spectra repeat a spec_id; the first one was kept.";
    }
    return observed;
}

ObservedSpectra load_observed_spectra(const std::string& file_path, const SpectrumIdPattern& pattern) {
    OpenMS::MSExperiment exp;
    try {
        OpenMS::MzMLFile mzml;
        mzml.load(file_path, exp);
    } catch (const std::exception& e) {
        throw std::runtime_error(std::string{"Failed to load mzML '"} + file_path + "': " + e.what());
    }

    auto observed = to_observed(exp, pattern);
    BOOST_LOG_TRIVIAL(info) << "Read " << observed.size() << " observed MS2 spectra from " << file_path << ".";
    return observed;
}

} // namespace ms2pred::mzml

#pragma once

#include <string>
#include <vector>

#include <OpenMS/KERNEL/MSExperiment.h>

#include "ms2pred/batch.hpp"
#include "ms2pred/correlation.hpp"

namespace ms2pred::mzml {

/// @brief Convert successful results into MS2 spectra, in result order.
///
/// Each spectrum carries the peptide id as native id, the precursor m/z and
/// charge, the activation method, and the ion labels ("b3", "y2^2") as a
/// string data array named "IonNames". Peaks are sorted by m/z.
/// Failed results are skipped.
OpenMS::MSExperiment to_experiment(const std::vector<PeptideResult>& results);

/// @brief Store successful results as an mzML spectral library.
/// @throws std::runtime_error if OpenMS fails to write the file.
void write_mzml_library(const std::vector<PeptideResult>& results, const std::string& file_path);

/// @brief Collect the MS2 spectra of @p exp under the spec_id @p pattern derives
///        from their native ids. Spectra without one are skipped; of repeated
///        spec_ids the first spectrum is kept. Peaks are sorted by m/z.
ObservedSpectra to_observed(const OpenMS::MSExperiment& exp, const SpectrumIdPattern& pattern);

/// @throws std::runtime_error if OpenMS fails to read the file.
ObservedSpectra load_observed_spectra(const std::string& file_path, const SpectrumIdPattern& pattern);

} // namespace ms2pred::mzml

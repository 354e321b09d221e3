#pragma once

#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "ms2pred/batch.hpp"
#include "ms2pred/correlation.hpp"
#include "ms2pred/model_registry.hpp"
#include "ms2pred/modifications.hpp"
#include "ms2pred/types.hpp"

namespace ms2pred {

namespace peprec {

/// @brief Parse a PEPREC modification column.
///
/// The column lists "position|name" pairs joined by '|', e.g.
/// "0|Acetyl|3|Oxidation". Position 0 is the N-terminus, -1 the C-terminus.
/// "-" and the empty string mean no modifications.
///
/// @throws std::invalid_argument for an odd number of fields or a non-integer position.
std::vector<std::pair<site_t, std::string>> parse_modifications(std::string_view column);

/// @brief Read a PEPREC file into peptide records, in file order.
///
/// The header must contain the columns spec_id, modifications, peptide and
/// charge in any order; other columns are ignored. The separator is taken
/// from the header line: ',' if present, otherwise tab, otherwise space.
///
/// Only the file format is checked here. Sequences, modification names and
/// charges are validated per peptide by ResidueTable::resolve().
///
/// @throws std::runtime_error if the file cannot be read or a row is malformed.
PeptideRecords read_peprec(const std::string& file_path);

} // namespace peprec

namespace csv {

/// @brief Write successful predictions, one line per ion:
/// spec_id,charge,ion,ionnumber,mz,prediction. Failed peptides are skipped.
void write_predictions_csv(const std::vector<PeptideResult>& results, const std::string& file_path);

/// @brief Write failed peptides as spec_id,error,message. Returns the number of lines written.
std::size_t write_errors_csv(const std::vector<PeptideResult>& results, const std::string& file_path);

/// @brief Write spec_id,ions,matched,pearson; an undefined correlation is left empty.
void write_correlations_csv(const std::vector<SpectrumCorrelation>& correlations, const std::string& file_path);

} // namespace csv

namespace config {

/**
 * @brief Read a model manifest.
 *
 * INI file with one section per model, named "<method>.<ion type>":
 *
 *     [HCD.b]
 *     path = hcd_b.txt
 *     schema = 1
 *     transform = log2
 *     base_score = 0.5
 *     sha1 = 0a4d55a8d778e5022fab701977c5d840bbc486d0
 *
 * Only `path` is required. Relative paths are resolved against the
 * manifest's directory. `sha1` is the expected hex digest of the model file,
 * checked by ModelRegistry::load_all().
 *
 * @throws ModelLoadError if the file cannot be read or an entry is invalid.
 */
ModelSource read_model_manifest(const std::string& file_path);

/// @brief Read modification definitions, one "name,mass,opt|fixed,target" per line.
/// Empty lines and lines starting with '#' are skipped.
///
/// @throws std::runtime_error if the file cannot be read.
/// @throws InvalidModificationError for malformed definitions.
ptm::ModificationTable read_modifications_file(const std::string& file_path);

} // namespace config

} // namespace ms2pred

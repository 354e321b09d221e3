#include "ms2pred/encoder.hpp"

#include <cstring>
#include <stdexcept>

namespace ms2pred {

namespace {

using properties_t = std::array<double, aa::kPropertyCount>;

/**
 * Cumulative sums over the peptide, indexed by cleavage position i
 * (number of residues on the N-terminal side, 0..length).
 */
struct CumulativeSums {
    std::vector<double> prefix_mass;      // N-term mod + residues 1..i
    std::vector<double> prefix_mod_mass;  // mods on N-term and residues 1..i
    std::vector<properties_t> prefix_properties;

    double total_residue_mass = 0.0;      // all residues and residue mods, no termini
    double total_residue_mod_mass = 0.0;
    properties_t total_properties{};
};

CumulativeSums cumulative_sums(const ResolvedPeptide& peptide) {
    const std::size_t length = peptide.length();
    CumulativeSums sums;
    sums.prefix_mass.resize(length + 1);
    sums.prefix_mod_mass.resize(length + 1);
    sums.prefix_properties.resize(length + 1);

    sums.prefix_mass[0] = peptide.modification_mass(0);
    sums.prefix_mod_mass[0] = peptide.modification_mass(0);
    sums.prefix_properties[0] = {};

    for (std::size_t pos = 1; pos <= length; ++pos) {
        const auto& acid = aa::amino_acid(peptide.residues[pos - 1]);
        sums.prefix_mass[pos] = sums.prefix_mass[pos - 1] + peptide.modified_residue_mass(pos);
        sums.prefix_mod_mass[pos] = sums.prefix_mod_mass[pos - 1] + peptide.modification_mass(pos);
        for (std::size_t p = 0; p < aa::kPropertyCount; ++p) {
            sums.prefix_properties[pos][p] = sums.prefix_properties[pos - 1][p] + acid.properties[p];
        }
        sums.total_residue_mass += peptide.modified_residue_mass(pos);
        sums.total_residue_mod_mass += peptide.modification_mass(pos);
    }
    sums.total_properties = sums.prefix_properties[length];
    return sums;
}

}

FeatureBlock FeatureMatrix::block(const std::size_t first, const std::size_t count) const {
    if (first + count > rows()) {
        throw std::out_of_range("Feature block [" + std::to_string(first) + ", " + std::to_string(first + count)
                                + ") exceeds matrix of " + std::to_string(rows()) + " rows");
    }
    return {values_.data() + first * cols_, count, cols_, schema_version_};
}

std::span<feature_t> FeatureMatrix::append_row(const RowLabel& label) {
    const std::size_t offset = values_.size();
    values_.resize(offset + cols_, feature_t{0});
    labels_.push_back(label);
    return {values_.data() + offset, cols_};
}

bool FeatureMatrix::bit_identical(const FeatureMatrix& other) const noexcept {
    if (schema_version_ != other.schema_version_ || cols_ != other.cols_ || rows() != other.rows()) {
        return false;
    }
    for (std::size_t i = 0; i < labels_.size(); ++i) {
        const auto& a = labels_[i];
        const auto& b = other.labels_[i];
        if (!(a.ion_type == b.ion_type) || a.ion_number != b.ion_number
            || std::memcmp(&a.mz, &b.mz, sizeof(mz_t)) != 0) {
            return false;
        }
    }
    return values_.empty()
        || std::memcmp(values_.data(), other.values_.data(), values_.size() * sizeof(feature_t)) == 0;
}

FeatureMatrix encode(const ResolvedPeptide& peptide, const FragmentationMethod method) {
    const auto types = applicable_ion_types(method, peptide.charge);
    const std::size_t length = peptide.length();
    const auto n_ions = length - 1;
    const auto sums = cumulative_sums(peptide);

    const double n_term_mod = peptide.modification_mass(0);
    const double c_term_mod = peptide.modification_mass(length + 1);
    const double neutral_mass = sums.total_residue_mass + n_term_mod + c_term_mod + kWaterMass;

    FeatureMatrix matrix(kFeatureSchemaVersion, kFeatureCount);
    matrix.reserve(types.size() * n_ions);

    for (const auto& type : types) {
        for (std::size_t ion_number = 1; ion_number <= n_ions; ++ion_number) {
            // Cleavage after residue i.
            const std::size_t i = type.c_terminal() ? length - ion_number : ion_number;

            const double prefix_mass = sums.prefix_mass[i];
            const double suffix_mass = sums.total_residue_mass - (sums.prefix_mass[i] - n_term_mod) + c_term_mod;
            const double prefix_mod = sums.prefix_mod_mass[i];
            const double suffix_mod = sums.total_residue_mod_mass - (sums.prefix_mod_mass[i] - n_term_mod) + c_term_mod;

            const mz_t mz = fragment_mz(type.c_terminal() ? suffix_mass : prefix_mass, type);
            auto row = matrix.append_row({type, ion_number, mz});

            std::size_t f = 0;
            auto put = [&row, &f](const double value) { row[f++] = static_cast<feature_t>(value); };

            // Peptide-level features
            put(static_cast<double>(length));
            put(static_cast<double>(peptide.charge));
            put(neutral_mass);
            for (std::size_t p = 0; p < aa::kPropertyCount; ++p) {
                put(sums.total_properties[p] / static_cast<double>(length));
            }

            // Position
            put(static_cast<double>(i));
            put(static_cast<double>(length - i));
            put(static_cast<double>(i) / static_cast<double>(length));

            // Fragment masses
            put(prefix_mass);
            put(suffix_mass);
            put(prefix_mod);
            put(suffix_mod);

            // Fragment property sums
            for (std::size_t p = 0; p < aa::kPropertyCount; ++p) {
                put(sums.prefix_properties[i][p]);
            }
            for (std::size_t p = 0; p < aa::kPropertyCount; ++p) {
                put(sums.total_properties[p] - sums.prefix_properties[i][p]);
            }

            // Residue window i-R+1 .. i+R, zero outside the sequence
            const auto first = static_cast<long>(i) - static_cast<long>(kWindowRadius) + 1;
            const auto last = static_cast<long>(i) + static_cast<long>(kWindowRadius);
            for (long pos = first; pos <= last; ++pos) {
                if (pos < 1 || pos > static_cast<long>(length)) {
                    f += 1 + aa::kPropertyCount;
                    continue;
                }
                const auto upos = static_cast<std::size_t>(pos);
                put(peptide.modified_residue_mass(upos));
                for (const double property : aa::amino_acid(peptide.residues[upos - 1]).properties) {
                    put(property);
                }
            }

            // Ion
            put(static_cast<double>(ion_number));
            put(static_cast<double>(type.charge));
            put(type.c_terminal() ? 1.0 : 0.0);
        }
    }
    return matrix;
}

std::size_t theoretical_ion_count(const ResolvedPeptide& peptide, const FragmentationMethod method) {
    return applicable_ion_types(method, peptide.charge).size() * (peptide.length() - 1);
}

} // namespace ms2pred

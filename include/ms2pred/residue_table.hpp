#pragma once

#include <string>
#include <vector>

#include "ms2pred/amino_acids.hpp"
#include "ms2pred/modifications.hpp"
#include "ms2pred/types.hpp"

namespace ms2pred {

/**
 * @brief A peptide whose residues and modifications have been validated.
 *
 * `modifications` has one slot per site: index 0 is the N-terminus,
 * 1..length the residues and length + 1 the C-terminus. Slots point into
 * the ModificationTable of the ResidueTable that produced the peptide, or
 * are null for unmodified sites.
 */
struct ResolvedPeptide {
    std::string id;
    std::string sequence;                                  // upper case, as given
    std::vector<aa::residue_id_t> residues;                // one per residue, L encoded as I
    std::vector<const ptm::Modification*> modifications;   // length + 2 slots
    charge_t charge{};

    [[nodiscard]] std::size_t length() const noexcept { return residues.size(); }

    /// Mass delta of the modification at @p site, 0 when unmodified.
    [[nodiscard]] double modification_mass(const std::size_t site) const noexcept {
        const auto* mod = modifications[site];
        return mod ? mod->mass_delta : 0.0;
    }

    /// Residue mass at 1-based position @p pos including its modification.
    [[nodiscard]] double modified_residue_mass(const std::size_t pos) const noexcept {
        return aa::residue_mass(residues[pos - 1]) + modification_mass(pos);
    }

    /// Neutral monoisotopic mass including modifications.
    [[nodiscard]] double neutral_mass() const noexcept;

    [[nodiscard]] mz_t precursor_mz() const noexcept {
        return (neutral_mass() + charge * kProtonMass) / charge;
    }
};

struct LengthLimits {
    std::size_t min_length = 4;
    std::size_t max_length = 100;
};

/**
 * @brief Amino-acid and modification lookup used to validate input peptides.
 *
 * Built once before prediction starts and shared read-only by all workers.
 */
class ResidueTable {
public:
    /// @throws std::invalid_argument unless 2 <= min_length <= max_length.
    explicit ResidueTable(ptm::ModificationTable modifications, LengthLimits limits = {});

    // fixed_ points into modifications_
    ResidueTable(const ResidueTable&) = delete;
    ResidueTable& operator=(const ResidueTable&) = delete;
    ResidueTable(ResidueTable&&) = default;
    ResidueTable& operator=(ResidueTable&&) = default;

    /**
     * @brief Validate a peptide record and resolve its modification names.
     *
     * Fixed modifications of the table are applied to every matching site
     * that carries no explicit modification.
     *
     * @throws LengthError, InvalidResidueError, InvalidModificationError, InvalidChargeError
     */
    [[nodiscard]] ResolvedPeptide resolve(const PeptideRecord& record) const;

    [[nodiscard]] const ptm::ModificationTable& modifications() const noexcept { return modifications_; }

    [[nodiscard]] const LengthLimits& limits() const noexcept { return limits_; }

private:
    ptm::ModificationTable modifications_;
    std::vector<const ptm::Modification*> fixed_;
    LengthLimits limits_;
};

} // namespace ms2pred

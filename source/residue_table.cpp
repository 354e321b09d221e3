#include "ms2pred/residue_table.hpp"

#include <cctype>

#include "ms2pred/errors.hpp"

namespace ms2pred {

namespace {
inline char to_upper(const char c) {
    return static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
}
}

double ResolvedPeptide::neutral_mass() const noexcept {
    double mass = kWaterMass;
    for (const auto r : residues) {
        mass += aa::residue_mass(r);
    }
    for (const auto* mod : modifications) {
        if (mod) mass += mod->mass_delta;
    }
    return mass;
}

ResidueTable::ResidueTable(ptm::ModificationTable modifications, const LengthLimits limits)
    : modifications_(std::move(modifications)), limits_(limits) {
    if (limits_.min_length < 2 || limits_.min_length > limits_.max_length) {
        throw std::invalid_argument("Invalid peptide length limits: ["
                                    + std::to_string(limits_.min_length) + ", "
                                    + std::to_string(limits_.max_length) + "]");
    }
    fixed_ = modifications_.fixed();
}

ResolvedPeptide ResidueTable::resolve(const PeptideRecord& record) const {
    const std::size_t length = record.sequence.size();
    if (length < limits_.min_length || length > limits_.max_length) {
        throw LengthError("Peptide " + record.id + " has length " + std::to_string(length)
                          + ", supported range is [" + std::to_string(limits_.min_length) + ", "
                          + std::to_string(limits_.max_length) + "]");
    }

    ResolvedPeptide peptide;
    peptide.id = record.id;
    peptide.sequence.reserve(length);
    peptide.residues.reserve(length);
    for (const char c : record.sequence) {
        const char upper = to_upper(c);
        const auto id = aa::residue_index(upper);
        if (id == aa::kUnknownResidue) {
            throw InvalidResidueError("Unsupported amino acid '" + std::string(1, c)
                                      + "' in peptide " + record.id + " (" + record.sequence + ")");
        }
        peptide.sequence.push_back(upper);
        peptide.residues.push_back(id);
    }

    const auto last_site = static_cast<site_t>(length) + 1;
    peptide.modifications.assign(length + 2, nullptr);

    for (const auto& [position, name] : record.modifications) {
        // PEPREC writes C-terminal modifications at -1.
        const site_t site = position == -1 ? last_site : position;
        if (site < 0 || site > last_site) {
            throw InvalidModificationError("Modification " + name + " at position " + std::to_string(position)
                                           + " is outside peptide " + record.id + " of length "
                                           + std::to_string(length));
        }
        const auto* mod = modifications_.find(name);
        if (!mod) {
            throw InvalidModificationError("Unknown modification " + name + " in peptide " + record.id);
        }
        const char residue = (site >= 1 && site < last_site) ? peptide.sequence[site - 1] : '\0';
        if (!mod->fits(site, length, residue)) {
            throw InvalidModificationError("Modification " + name + " cannot be placed at position "
                                           + std::to_string(position) + " of peptide " + record.id);
        }
        auto& slot = peptide.modifications[static_cast<std::size_t>(site)];
        if (slot) {
            throw InvalidModificationError("Position " + std::to_string(position) + " of peptide " + record.id
                                           + " carries both " + slot->name + " and " + name);
        }
        slot = mod;
    }

    for (const auto* mod : fixed_) {
        for (site_t site = 0; site <= last_site; ++site) {
            auto& slot = peptide.modifications[static_cast<std::size_t>(site)];
            if (slot) continue;
            const char residue = (site >= 1 && site < last_site) ? peptide.sequence[site - 1] : '\0';
            if (mod->fits(site, length, residue)) slot = mod;
        }
    }

    if (record.charge < 1) {
        throw InvalidChargeError("Peptide " + record.id + " has invalid precursor charge "
                                 + std::to_string(record.charge));
    }
    peptide.charge = record.charge;
    return peptide;
}

} // namespace ms2pred

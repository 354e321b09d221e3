#pragma once

#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "ms2pred/types.hpp"

namespace ms2pred::ptm {
/// NTermResidue: a residue-specific modification allowed only on the first residue.
enum class PtmTarget { Residue, NTerm, CTerm, NTermResidue };
enum class PtmType { Fixed, Variable };

struct Modification {
    std::string name;
    double mass_delta;
    PtmTarget target_type;
    char target_residue;   // '\0' for NTerm and CTerm
    PtmType type;

    /// @brief Whether the modification may sit at @p site of a peptide with @p length residues
    ///        whose residue at that site is @p residue ('\0' for termini).
    [[nodiscard]] bool fits(site_t site, std::size_t length, char residue) const noexcept;
};

/**
 * @brief Immutable registry of modifications, keyed by name.
 *
 * The table owns its Modification objects; peptides resolved against it keep
 * plain pointers into it, so it must outlive every ResolvedPeptide.
 */
class ModificationTable {
public:
    ModificationTable() = default;

    /// @throws InvalidModificationError on duplicate names or an invalid target residue.
    explicit ModificationTable(std::vector<Modification> modifications);

    /**
     * @brief Build a table from modification strings "name,mass,opt|fixed,target".
     *
     * The target is a residue letter, "N-term", "C-term", or "N-term <letter>"
     * for a residue that may only be modified at the peptide's N-terminus.
     * "L" is stored as "I".
     *
     * @throws InvalidModificationError for malformed strings.
     */
    static ModificationTable from_modstrings(const std::vector<std::string>& modstrings);

    /// @brief Common variable modifications.
    static ModificationTable defaults();

    [[nodiscard]] const Modification* find(std::string_view name) const;

    [[nodiscard]] const std::vector<Modification>& all() const noexcept { return modifications_; }

    [[nodiscard]] std::vector<const Modification*> fixed() const;

    [[nodiscard]] std::size_t size() const noexcept { return modifications_.size(); }

private:
    std::vector<Modification> modifications_;
    std::unordered_map<std::string, std::size_t> by_name_;
};

/// @brief Parse a single modification string, see ModificationTable::from_modstrings().
Modification parse_modstring(const std::string& modstring);

}

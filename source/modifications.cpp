#include "ms2pred/modifications.hpp"

#include <sstream>

#include "ms2pred/amino_acids.hpp"
#include "ms2pred/errors.hpp"

namespace ms2pred::ptm {

namespace {

char normalize_residue(const char c) {
    return c == 'L' ? 'I' : c;
}

std::string trim(const std::string& s) {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return {};
    const auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

}

bool Modification::fits(const site_t site, const std::size_t length, const char residue) const noexcept {
    const auto last = static_cast<site_t>(length) + 1;
    switch (target_type) {
        case PtmTarget::NTerm:
            return site == 0;
        case PtmTarget::CTerm:
            return site == last;
        case PtmTarget::Residue:
            return site >= 1 && site < last && normalize_residue(residue) == target_residue;
        case PtmTarget::NTermResidue:
            return site == 1 && length >= 1 && normalize_residue(residue) == target_residue;
    }
    return false;
}

ModificationTable::ModificationTable(std::vector<Modification> modifications)
    : modifications_(std::move(modifications)) {
    by_name_.reserve(modifications_.size());
    for (std::size_t i = 0; i < modifications_.size(); ++i) {
        auto& mod = modifications_[i];
        if (mod.name.empty()) {
            throw InvalidModificationError("Modification with an empty name");
        }
        if (mod.target_type == PtmTarget::Residue || mod.target_type == PtmTarget::NTermResidue) {
            mod.target_residue = normalize_residue(mod.target_residue);
            if (aa::residue_index(mod.target_residue) == aa::kUnknownResidue) {
                throw InvalidModificationError("Modification " + mod.name + " targets unknown residue '"
                                               + std::string(1, mod.target_residue) + "'");
            }
        } else {
            mod.target_residue = '\0';
        }
        if (!by_name_.emplace(mod.name, i).second) {
            throw InvalidModificationError("Duplicate modification name: " + mod.name);
        }
    }
}

Modification parse_modstring(const std::string& modstring) {
    std::vector<std::string> fields;
    std::stringstream ss(modstring);
    std::string field;
    while (std::getline(ss, field, ',')) {
        fields.push_back(trim(field));
    }
    if (fields.size() != 4) {
        throw InvalidModificationError("Malformed modification string (expected name,mass,opt,target): " + modstring);
    }

    Modification mod;
    mod.name = fields[0];
    try {
        std::size_t consumed = 0;
        mod.mass_delta = std::stod(fields[1], &consumed);
        if (consumed != fields[1].size()) {
            throw std::invalid_argument(fields[1]);
        }
    } catch (const std::exception&) {
        throw InvalidModificationError("Invalid mass shift in modification string: " + modstring);
    }

    if (fields[2] == "fixed") {
        mod.type = PtmType::Fixed;
    } else if (fields[2] == "opt" || fields[2] == "variable") {
        mod.type = PtmType::Variable;
    } else {
        throw InvalidModificationError("Invalid modification type '" + fields[2] + "' in: " + modstring);
    }

    if (const auto& target = fields[3]; target == "N-term") {
        mod.target_type = PtmTarget::NTerm;
        mod.target_residue = '\0';
    } else if (target == "C-term") {
        mod.target_type = PtmTarget::CTerm;
        mod.target_residue = '\0';
    } else if (target.size() == 1) {
        mod.target_type = PtmTarget::Residue;
        mod.target_residue = target[0];
    } else if (target.size() == 8 && target.starts_with("N-term ")) {
        mod.target_type = PtmTarget::NTermResidue;
        mod.target_residue = target[7];
    } else {
        throw InvalidModificationError("Invalid modification target '" + target + "' in: " + modstring);
    }
    return mod;
}

ModificationTable ModificationTable::from_modstrings(const std::vector<std::string>& modstrings) {
    std::vector<Modification> mods;
    mods.reserve(modstrings.size());
    for (const auto& s : modstrings) {
        mods.push_back(parse_modstring(s));
    }
    return ModificationTable(std::move(mods));
}

ModificationTable ModificationTable::defaults() {
    return ModificationTable({
        {"Oxidation",       15.994915,  PtmTarget::Residue, 'M',  PtmType::Variable},
        {"Carbamidomethyl", 57.021464,  PtmTarget::Residue, 'C',  PtmType::Variable},
        {"Acetyl",          42.010565,  PtmTarget::NTerm,   '\0', PtmType::Variable},
        {"Phospho",         79.966331,  PtmTarget::Residue, 'S',  PtmType::Variable},
        {"PhosphoT",        79.966331,  PtmTarget::Residue, 'T',  PtmType::Variable},
        {"PhosphoY",        79.966331,  PtmTarget::Residue, 'Y',  PtmType::Variable},
        {"Deamidated",      0.984016,   PtmTarget::Residue, 'N',  PtmType::Variable},
        {"Gln->pyro-Glu",   -17.026549, PtmTarget::NTermResidue, 'Q', PtmType::Variable},
        {"Amidated",        -0.984016,  PtmTarget::CTerm,   '\0', PtmType::Variable},
    });
}

const Modification* ModificationTable::find(const std::string_view name) const {
    if (const auto it = by_name_.find(std::string(name)); it != by_name_.end()) {
        return &modifications_[it->second];
    }
    return nullptr;
}

std::vector<const Modification*> ModificationTable::fixed() const {
    std::vector<const Modification*> out;
    for (const auto& mod : modifications_) {
        if (mod.type == PtmType::Fixed) out.push_back(&mod);
    }
    return out;
}

}

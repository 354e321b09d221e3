#pragma once

#include <array>
#include <cstdint>
#include <limits>

#include "ms2pred/types.hpp"

namespace ms2pred::aa {

using residue_id_t = uint8_t;

constexpr int kAAOffset = 'A';
constexpr std::size_t kAALength = 'Z' - 'A' + 1;
constexpr std::size_t kPropertyCount = 4;
constexpr residue_id_t kUnknownResidue = std::numeric_limits<residue_id_t>::max();

struct AminoAcid {
    char symbol;
    Composition composition;                         ///< Residue without water
    std::array<double, kPropertyCount> properties;   ///< basicity, hydrophobicity, helicity, pI
};

// Leucine is not listed: it is isobaric with isoleucine and shares its properties.
constexpr std::array<AminoAcid, 19> kAminoAcids{{
    //      C, H, N, O, S, P, Se      basicity hydrophob helicity pI
    {'A', {3,5,1,1,0,0,0},          {{206.4,  0.16,  1.24,  6.00}}},
    {'C', {3,5,1,1,1,0,0},          {{206.2,  2.50,  0.79,  5.07}}},
    {'D', {4,5,1,3,0,0,0},          {{208.6, -2.49,  0.89,  2.77}}},
    {'E', {5,7,1,3,0,0,0},          {{215.6, -1.50,  0.85,  3.22}}},
    {'F', {9,9,1,1,0,0,0},          {{212.1,  5.00,  1.26,  5.48}}},
    {'G', {2,3,1,1,0,0,0},          {{202.7, -3.31,  1.15,  5.97}}},
    {'H', {6,7,3,1,0,0,0},          {{223.7, -4.63,  0.97,  7.59}}},
    {'I', {6,11,1,1,0,0,0},         {{210.8,  4.41,  1.29,  6.02}}},
    {'K', {6,12,2,1,0,0,0},         {{221.8, -5.00,  0.88,  9.74}}},
    {'M', {5,9,1,1,1,0,0},          {{213.3,  3.26,  1.22,  5.74}}},
    {'N', {4,6,2,2,0,0,0},          {{212.8, -3.79,  0.94,  5.41}}},
    {'P', {5,7,1,1,0,0,0},          {{214.4, -4.92,  0.57,  6.30}}},
    {'Q', {5,8,2,2,0,0,0},          {{214.2, -2.76,  0.96,  5.65}}},
    {'R', {6,12,4,1,0,0,0},         {{237.0, -2.77,  0.95, 10.76}}},
    {'S', {3,5,1,2,0,0,0},          {{207.6, -2.85,  1.00,  5.68}}},
    {'T', {4,7,1,2,0,0,0},          {{211.7, -1.08,  1.09,  5.60}}},
    {'V', {5,9,1,1,0,0,0},          {{208.7,  4.03,  1.27,  5.96}}},
    {'W', {11,10,2,1,0,0,0},        {{216.1,  4.88,  1.07,  5.89}}},
    {'Y', {9,9,1,2,0,0,0},          {{213.1,  2.00,  1.11,  5.66}}}
}};

constexpr std::array<residue_id_t, kAALength> make_residue_index() noexcept {
    std::array<residue_id_t, kAALength> index{};
    index.fill(kUnknownResidue);
    for (std::size_t i = 0; i < kAminoAcids.size(); ++i)
        index[kAminoAcids[i].symbol - kAAOffset] = static_cast<residue_id_t>(i);
    index['L' - kAAOffset] = index['I' - kAAOffset];
    return index;
}

constexpr std::array<residue_id_t, kAALength> kResidueIndex = make_residue_index();

/// Index into kAminoAcids, or kUnknownResidue. Expects upper case.
constexpr residue_id_t residue_index(const char aa) noexcept {
    return (aa >= 'A' && aa <= 'Z') ? kResidueIndex[aa - kAAOffset] : kUnknownResidue;
}

constexpr const AminoAcid& amino_acid(const residue_id_t id) noexcept {
    return kAminoAcids[id];
}

constexpr double residue_mass(const residue_id_t id) noexcept {
    return kAminoAcids[id].composition.monoisotopic_mass();
}

} // namespace ms2pred::aa

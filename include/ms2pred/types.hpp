#pragma once
#include <array>
#include <cstdint>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

namespace ms2pred {

using comp_t = int16_t;

// Monoisotopic element masses, same order as Composition::elements.
constexpr std::array<double, 7> kElementMasses{{
    12.0,              // C
    1.00782503207,     // H
    14.0030740048,     // N
    15.99491461956,    // O
    31.97207100,       // S
    30.97376163,       // P
    79.9165213         // Se
}};

constexpr double kProtonMass = 1.007276466812;

struct Composition {
    // Elements: C, H, N, O, S, P, Se
    std::array<comp_t, 7> elements{{0,0,0,0,0,0,0}};

    constexpr Composition() noexcept = default;

    constexpr Composition(const comp_t c, const comp_t h, const comp_t n, const comp_t o,
                         const comp_t s, const comp_t p, const comp_t se): elements{{c, h, n, o, s, p, se}} {}

    constexpr Composition& operator-=(const Composition& other) noexcept {
        for (std::size_t i = 0; i < elements.size(); ++i)
            elements[i] -= other.elements[i];
        return *this;
    }

    [[nodiscard]] constexpr double monoisotopic_mass() const noexcept {
        double mass = 0.0;
        for (std::size_t i = 0; i < elements.size(); ++i)
            mass += elements[i] * kElementMasses[i];
        return mass;
    }
};

constexpr Composition operator-(Composition a, const Composition& b) noexcept {
    return a -= b;
}

constexpr Composition kWater{0,2,0,1,0,0,0};
constexpr Composition kAmmonia{0,3,1,0,0,0,0};

constexpr double kWaterMass = kWater.monoisotopic_mass();
constexpr double kAmmoniaMass = kAmmonia.monoisotopic_mass();

using mz_t = double;
using intensity_t = double;
using charge_t = int;
using feature_t = float;

/// Position of a modification inside a peptide: 0 is the N-terminus,
/// length + 1 the C-terminus, 1..length the residues.
using site_t = int;

struct PeptideRecord {
    std::string id;
    std::string sequence;
    std::vector<std::pair<site_t, std::string>> modifications;  // (position, modification name)
    charge_t charge{};
};

using PeptideRecords = std::vector<PeptideRecord>;

inline std::ostream& operator<<(std::ostream& os, const PeptideRecord& rec) {
    os << "PeptideRecord(id=" << rec.id
       << ", seq=" << rec.sequence
       << ", charge=" << rec.charge
       << ", mods=[";
    for (std::size_t i = 0; i < rec.modifications.size(); ++i) {
        if (i) os << ", ";
        os << rec.modifications[i].first << ":" << rec.modifications[i].second;
    }
    return os << "])";
}

}

#pragma once

#include <array>
#include <span>
#include <string_view>
#include <vector>

#include "ms2pred/types.hpp"

namespace ms2pred {

enum class FragmentationMethod {
    HCD,
    CID,
    ETD,
    EThcD,
    TMT,
    iTRAQ,
    iTRAQphospho,
    TTOF5600,
    HCDch2,
    CIDch2,
    ImmunoHCD
};

constexpr std::array<FragmentationMethod, 11> kAllMethods{{
    FragmentationMethod::HCD, FragmentationMethod::CID, FragmentationMethod::ETD,
    FragmentationMethod::EThcD, FragmentationMethod::TMT, FragmentationMethod::iTRAQ,
    FragmentationMethod::iTRAQphospho, FragmentationMethod::TTOF5600, FragmentationMethod::HCDch2,
    FragmentationMethod::CIDch2, FragmentationMethod::ImmunoHCD
}};

/// Declaration order is the canonical spectrum order.
enum class IonSeries : uint8_t { B, Y, C, Z };

/**
 * @brief A fragment ion type: series plus fragment charge.
 *
 * The name identifies the model trained for this ion type ("b", "y", "b2", ...).
 */
struct IonType {
    IonSeries series;
    charge_t charge;
    std::string_view name;

    [[nodiscard]] constexpr bool c_terminal() const noexcept {
        return series == IonSeries::Y || series == IonSeries::Z;
    }

    constexpr bool operator==(const IonType& other) const noexcept {
        return series == other.series && charge == other.charge;
    }
};

namespace ion {
constexpr IonType b{IonSeries::B, 1, "b"};
constexpr IonType y{IonSeries::Y, 1, "y"};
constexpr IonType b2{IonSeries::B, 2, "b2"};
constexpr IonType y2{IonSeries::Y, 2, "y2"};
constexpr IonType c{IonSeries::C, 1, "c"};
constexpr IonType z{IonSeries::Z, 1, "z"};
}

std::string_view to_string(FragmentationMethod method) noexcept;

std::string_view to_string(IonSeries series) noexcept;

/// @brief Case-insensitive lookup of a method identifier ("HCD", "Immuno-HCD", ...).
/// @throws UnsupportedMethodError for unknown identifiers.
FragmentationMethod parse_method(std::string_view name);

/// @brief Ordered ion types predicted for @p method.
/// @throws UnsupportedMethodError when no ion-type mapping exists.
std::span<const IonType> ion_types(FragmentationMethod method);

/// @brief Ion types of @p method that a precursor of charge @p precursor_charge can produce.
std::vector<IonType> applicable_ion_types(FragmentationMethod method, charge_t precursor_charge);

/// @brief Theoretical neutral-to-m/z conversion for a fragment of the given series.
///
/// @param prefix_or_suffix Residue mass sum (with modifications) of the fragment
/// @param type Ion type, fixes series offset and charge
mz_t fragment_mz(double prefix_or_suffix, const IonType& type) noexcept;

} // namespace ms2pred

#include "ms2pred/fragmentation.hpp"

#include <algorithm>
#include <cctype>
#include <string>

#include "ms2pred/errors.hpp"

namespace ms2pred {

namespace {

struct MethodInfo {
    FragmentationMethod method;
    std::string_view name;
    std::span<const IonType> ion_types;
};

constexpr std::array<IonType, 2> kBY{{ion::b, ion::y}};
constexpr std::array<IonType, 4> kBYCharge2{{ion::b, ion::y, ion::b2, ion::y2}};
constexpr std::array<IonType, 2> kCZ{{ion::c, ion::z}};
constexpr std::array<IonType, 4> kBYCZ{{ion::b, ion::y, ion::c, ion::z}};

constexpr std::array<MethodInfo, 11> kMethods{{
    {FragmentationMethod::HCD,          "HCD",          kBY},
    {FragmentationMethod::CID,          "CID",          kBY},
    {FragmentationMethod::ETD,          "ETD",          kCZ},
    {FragmentationMethod::EThcD,        "EThcD",        kBYCZ},
    {FragmentationMethod::TMT,          "TMT",          kBY},
    {FragmentationMethod::iTRAQ,        "iTRAQ",        kBY},
    {FragmentationMethod::iTRAQphospho, "iTRAQphospho", kBY},
    {FragmentationMethod::TTOF5600,     "TTOF5600",     kBY},
    {FragmentationMethod::HCDch2,       "HCDch2",       kBYCharge2},
    {FragmentationMethod::CIDch2,       "CIDch2",       kBYCharge2},
    {FragmentationMethod::ImmunoHCD,    "Immuno-HCD",   kBY},
}};

// Mass of NH2, lost from a y ion to form the z-dot ion.
constexpr double kZIonOffset = (kAmmonia - Composition{0,1,0,0,0,0,0}).monoisotopic_mass();

const MethodInfo* find_method(const FragmentationMethod method) noexcept {
    const auto it = std::ranges::find(kMethods, method, &MethodInfo::method);
    return it == kMethods.end() ? nullptr : &*it;
}

bool iequals(const std::string_view a, const std::string_view b) noexcept {
    return std::ranges::equal(a, b, [](const char x, const char y) {
        return std::tolower(static_cast<unsigned char>(x)) == std::tolower(static_cast<unsigned char>(y));
    });
}

}

std::string_view to_string(const FragmentationMethod method) noexcept {
    const auto* info = find_method(method);
    return info ? info->name : "unknown";
}

std::string_view to_string(const IonSeries series) noexcept {
    switch (series) {
        case IonSeries::B: return "b";
        case IonSeries::Y: return "y";
        case IonSeries::C: return "c";
        case IonSeries::Z: return "z";
    }
    return "?";
}

FragmentationMethod parse_method(const std::string_view name) {
    for (const auto& info : kMethods) {
        if (iequals(info.name, name)) return info.method;
    }
    // "TMT-HCD" and "ImmunoHCD" spellings
    if (iequals(name, "TMT-HCD")) return FragmentationMethod::TMT;
    if (iequals(name, "ImmunoHCD")) return FragmentationMethod::ImmunoHCD;
    throw UnsupportedMethodError("Unsupported fragmentation method: " + std::string(name));
}

std::span<const IonType> ion_types(const FragmentationMethod method) {
    const auto* info = find_method(method);
    if (!info || info->ion_types.empty()) {
        throw UnsupportedMethodError("No ion types defined for fragmentation method "
                                     + std::to_string(static_cast<int>(method)));
    }
    return info->ion_types;
}

std::vector<IonType> applicable_ion_types(const FragmentationMethod method, const charge_t precursor_charge) {
    std::vector<IonType> out;
    for (const auto& type : ion_types(method)) {
        if (type.charge <= precursor_charge) out.push_back(type);
    }
    return out;
}

mz_t fragment_mz(const double prefix_or_suffix, const IonType& type) noexcept {
    double neutral = prefix_or_suffix;
    switch (type.series) {
        case IonSeries::B:
            break;
        case IonSeries::Y:
            neutral += kWaterMass;
            break;
        case IonSeries::C:
            neutral += kAmmoniaMass;
            break;
        case IonSeries::Z:
            neutral += kWaterMass - kZIonOffset;
            break;
    }
    return (neutral + type.charge * kProtonMass) / type.charge;
}

} // namespace ms2pred

#define BOOST_TEST_MODULE spectrum
#include <boost/test/unit_test.hpp>

#include <cmath>
#include <sstream>

#include "fixtures.hpp"
#include "ms2pred/spectrum.hpp"

using namespace ms2pred;
using testing::record;

namespace {

IonPrediction make_ion(const IonType& type, const std::size_t number, const intensity_t intensity, const mz_t mz = 100.0) {
    return {type, number, type.charge, mz, intensity};
}

struct SpectrumFixture {
    ResidueTable table{ptm::ModificationTable::defaults()};
    ResolvedPeptide peptide = table.resolve(record("p1", "ACDK", 2));
    FeatureMatrix matrix = encode(peptide, FragmentationMethod::HCD);
};

}

BOOST_FIXTURE_TEST_SUITE(spectrum, SpectrumFixture)

BOOST_AUTO_TEST_CASE(sorts_by_series_number_and_charge) {
    const SpectrumAssembler assembler(NormalizationMode::Raw);
    BOOST_TEST((assembler.mode() == NormalizationMode::Raw));
    const auto spectrum = assembler.assemble("p1", FragmentationMethod::HCDch2, {
        make_ion(ion::y, 2, 1.0), make_ion(ion::b2, 1, 2.0), make_ion(ion::y2, 1, 3.0),
        make_ion(ion::b, 3, 4.0), make_ion(ion::b, 1, 5.0), make_ion(ion::y, 1, 6.0),
    });
    const auto& ions = spectrum.ions();
    BOOST_REQUIRE(ions.size() == 6u);
    const std::vector<std::string_view> order{"b", "b2", "b", "y", "y2", "y"};
    const std::vector<std::size_t> numbers{1, 1, 3, 1, 1, 2};
    for (std::size_t i = 0; i < ions.size(); ++i) {
        BOOST_TEST(ions[i].ion_type.name == order[i]);
        BOOST_TEST(ions[i].ion_number == numbers[i]);
    }
    BOOST_TEST(spectrum.sequence().empty());
    BOOST_TEST(spectrum.charge() == 0);
}

BOOST_AUTO_TEST_CASE(keeps_first_of_duplicate_predictions) {
    const SpectrumAssembler assembler(NormalizationMode::Raw);
    const auto spectrum = assembler.assemble("p1", FragmentationMethod::HCD, {
        make_ion(ion::b, 1, 5.0), make_ion(ion::y, 1, 1.0), make_ion(ion::b, 1, 7.0),
    });
    BOOST_REQUIRE(spectrum.ions().size() == 2u);
    BOOST_TEST(spectrum.ions()[0].intensity == 5.0);
}

BOOST_AUTO_TEST_CASE(normalization_modes) {
    const std::vector<IonPrediction> raw{make_ion(ion::b, 1, 1.0), make_ion(ion::b, 2, 3.0), make_ion(ion::y, 1, 4.0)};

    const auto max = SpectrumAssembler(NormalizationMode::RelativeMax).assemble("p", FragmentationMethod::HCD, raw);
    BOOST_TEST(max.ions()[0].intensity == 0.25);
    BOOST_TEST(max.ions()[2].intensity == 1.0);

    const auto tic = SpectrumAssembler(NormalizationMode::Tic).assemble("p", FragmentationMethod::HCD, raw);
    BOOST_TEST(tic.ions()[1].intensity == 3.0 / 8.0);

    const auto log = SpectrumAssembler(NormalizationMode::Log).assemble("p", FragmentationMethod::HCD, raw);
    BOOST_CHECK_CLOSE(log.ions()[2].intensity, std::log2(0.5 + 0.001), 1e-9);

    const auto plain = SpectrumAssembler(NormalizationMode::Raw).assemble("p", FragmentationMethod::HCD, raw);
    BOOST_TEST(plain.ions()[2].intensity == 4.0);
    BOOST_TEST((plain.normalization() == NormalizationMode::Raw));
}

BOOST_AUTO_TEST_CASE(all_zero_spectrum_stays_zero) {
    const std::vector<IonPrediction> zeros{make_ion(ion::b, 1, 0.0), make_ion(ion::y, 1, 0.0)};
    for (const auto mode : {NormalizationMode::RelativeMax, NormalizationMode::Tic}) {
        const auto spectrum = SpectrumAssembler(mode).assemble("p", FragmentationMethod::HCD, zeros);
        for (const auto& i : spectrum.ions()) BOOST_TEST(i.intensity == 0.0);
    }
}

BOOST_AUTO_TEST_CASE(assembly_is_idempotent) {
    const SpectrumAssembler assembler;
    const std::vector<IonPrediction> input{make_ion(ion::y, 1, 2.0), make_ion(ion::b, 2, 8.0), make_ion(ion::b, 1, 4.0)};
    const auto once = assembler.assemble("p", FragmentationMethod::HCD, input);
    const auto twice = assembler.assemble("p", FragmentationMethod::HCD, once.ions());
    BOOST_TEST((once == twice));
}

BOOST_AUTO_TEST_CASE(fills_missing_theoretical_ions_with_zero) {
    const SpectrumAssembler assembler(NormalizationMode::Raw);
    // only b2 and y3 predicted, plus a duplicate and an ion outside the peptide
    const auto spectrum = assembler.assemble(peptide, FragmentationMethod::HCD, {
        make_ion(ion::b, 2, 5.0), make_ion(ion::y, 3, 2.0), make_ion(ion::b, 2, 9.0), make_ion(ion::c, 1, 1.0),
    }, matrix.labels());

    const auto& ions = spectrum.ions();
    BOOST_REQUIRE(ions.size() == 6u);
    BOOST_TEST(ions[0].intensity == 0.0);
    BOOST_TEST(ions[1].intensity == 5.0);
    BOOST_TEST(ions[5].intensity == 2.0);
    // theoretical m/z wins over the predicted one
    BOOST_TEST(ions[1].mz == matrix.label(1).mz);

    BOOST_TEST(spectrum.sequence() == "ACDK");
    BOOST_TEST(spectrum.charge() == 2);
    BOOST_CHECK_CLOSE(spectrum.precursor_mz(), peptide.precursor_mz(), 1e-12);
}

BOOST_AUTO_TEST_CASE(prints_readable_summary) {
    const auto spectrum = SpectrumAssembler(NormalizationMode::Raw).assemble(
        "p1", FragmentationMethod::HCD, {make_ion(ion::b, 1, 1.0), make_ion(ion::y2, 3, 2.0)});
    std::ostringstream os;
    os << spectrum;
    BOOST_TEST(os.str().find("b1=1") != std::string::npos);
    BOOST_TEST(os.str().find("y3^2=2") != std::string::npos);
}

BOOST_AUTO_TEST_CASE(normalization_names) {
    BOOST_TEST((parse_normalization("tic") == NormalizationMode::Tic));
    BOOST_TEST(to_string(NormalizationMode::RelativeMax) == "relative-max");
    BOOST_CHECK_THROW(parse_normalization("max"), std::invalid_argument);
}

BOOST_AUTO_TEST_SUITE_END()

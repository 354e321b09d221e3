#define BOOST_TEST_MODULE prediction
#include <boost/test/unit_test.hpp>

#include "fixtures.hpp"
#include "ms2pred/errors.hpp"
#include "ms2pred/prediction.hpp"

using namespace ms2pred;
using testing::record;

namespace {

struct PredictionFixture {
    ResidueTable table{ptm::ModificationTable::defaults()};
    ModelRegistry registry = testing::make_registry();
    PredictionEngine engine{registry};
};

}

BOOST_FIXTURE_TEST_SUITE(prediction, PredictionFixture)

BOOST_AUTO_TEST_CASE(one_prediction_per_row_in_row_order) {
    const auto matrix = encode(table.resolve(record("p1", "ACDEFK", 2)), FragmentationMethod::HCD);
    const auto predictions = engine.predict(matrix, FragmentationMethod::HCD);

    BOOST_REQUIRE(predictions.size() == matrix.rows());
    for (std::size_t r = 0; r < predictions.size(); ++r) {
        BOOST_TEST(predictions[r].ion_type.name == matrix.label(r).ion_type.name);
        BOOST_TEST(predictions[r].ion_number == matrix.label(r).ion_number);
        BOOST_TEST(predictions[r].mz == matrix.label(r).mz);
        BOOST_TEST(predictions[r].charge == 1);
    }

    // b: 1, 1, 3, 3, 3; y: same plus 0.5
    BOOST_TEST(predictions[0].intensity == 1.0);
    BOOST_TEST(predictions[2].intensity == 3.0);
    BOOST_TEST(predictions[5].intensity == 1.5);
    BOOST_TEST(predictions[9].intensity == 3.5);
}

BOOST_AUTO_TEST_CASE(routes_each_ion_type_to_its_model) {
    const auto matrix = encode(table.resolve(record("p1", "ACDEFK", 2)), FragmentationMethod::EThcD);
    const auto predictions = engine.predict(matrix, FragmentationMethod::EThcD);
    BOOST_REQUIRE(predictions.size() == 4 * 5u);
    BOOST_TEST(predictions[0].ion_type.name == "b");
    BOOST_TEST(predictions[10].ion_type.name == "c");
    BOOST_TEST(predictions[10].intensity == 2.0);   // c is third: 1 + 2 * 0.5
    BOOST_TEST(predictions[19].intensity == 4.5);   // z5: 3 + 3 * 0.5
}

BOOST_AUTO_TEST_CASE(charge_two_fragments) {
    const auto matrix = encode(table.resolve(record("p1", "ACDEFK", 3)), FragmentationMethod::HCDch2);
    const auto predictions = engine.predict(matrix, FragmentationMethod::HCDch2);
    BOOST_REQUIRE(predictions.size() == 4 * 5u);
    BOOST_TEST(predictions[10].ion_type.name == "b2");
    BOOST_TEST(predictions[10].charge == 2);
}

BOOST_AUTO_TEST_CASE(applies_inverse_transform) {
    std::map<ModelRegistry::Key, ModelRegistry::ModelPtr> models;
    models[{FragmentationMethod::HCD, "b"}] = testing::make_model(
        "b", testing::step_dump(1.0, 2.0, 0.0), kFeatureSchemaVersion, IntensityTransform::Log2);
    models[{FragmentationMethod::HCD, "y"}] = testing::make_model(
        "y", testing::step_dump(-30.0, -30.0, 0.0), kFeatureSchemaVersion, IntensityTransform::Log2);
    const ModelRegistry log_registry(models);
    const PredictionEngine log_engine(log_registry);

    const auto matrix = encode(table.resolve(record("p1", "ACDK", 2)), FragmentationMethod::HCD);
    const auto predictions = log_engine.predict(matrix, FragmentationMethod::HCD);
    BOOST_CHECK_CLOSE(predictions[0].intensity, 2.0 - 0.001, 1e-9);
    BOOST_CHECK_CLOSE(predictions[2].intensity, 4.0 - 0.001, 1e-9);
    BOOST_TEST(predictions[3].intensity == 0.0);
}

BOOST_AUTO_TEST_CASE(missing_model_is_reported) {
    std::map<ModelRegistry::Key, ModelRegistry::ModelPtr> models;
    models[{FragmentationMethod::ETD, "c"}] = testing::make_model("c", testing::step_dump(1, 2, 0));
    models[{FragmentationMethod::ETD, "z"}] = testing::make_model("z", testing::step_dump(1, 2, 0));
    const ModelRegistry etd_only(models);
    const PredictionEngine etd_engine(etd_only);

    const auto matrix = encode(table.resolve(record("p1", "ACDK", 2)), FragmentationMethod::HCD);
    BOOST_CHECK_THROW(static_cast<void>(etd_engine.predict(matrix, FragmentationMethod::HCD)), ModelNotFoundError);
}

BOOST_AUTO_TEST_CASE(schema_mismatch_is_reported) {
    const auto v2 = testing::make_registry(kFeatureSchemaVersion + 1);
    const PredictionEngine v2_engine(v2);
    const auto matrix = encode(table.resolve(record("p1", "ACDK", 2)), FragmentationMethod::HCD);
    BOOST_CHECK_THROW(static_cast<void>(v2_engine.predict(matrix, FragmentationMethod::HCD)), ModelMismatchError);
}

BOOST_AUTO_TEST_CASE(width_mismatch_is_reported) {
    FeatureMatrix narrow(kFeatureSchemaVersion, 10);
    static_cast<void>(narrow.append_row({ion::b, 1, 100.0}));
    BOOST_CHECK_THROW(static_cast<void>(engine.predict(narrow, FragmentationMethod::HCD)), ModelMismatchError);
}

BOOST_AUTO_TEST_SUITE_END()

#define BOOST_TEST_MODULE model
#include <boost/test/unit_test.hpp>

#include <cmath>
#include <limits>
#include <sstream>

#include "fixtures.hpp"
#include "ms2pred/errors.hpp"
#include "ms2pred/model.hpp"

using namespace ms2pred;

namespace {

// Two features; NaN in f1 goes to the `no` branch.
constexpr auto kDump = R"(booster[0]:
0:[f0<0.5] yes=1,no=2,missing=1
	1:leaf=0.25
	2:[f1<10] yes=3,no=4,missing=4
		3:leaf=-0.5
		4:leaf=1.5
booster[1]:
0:leaf=0.125
)";

TreeEnsembleModel load(const std::string& dump, const double base_score = 0.5) {
    std::istringstream in(dump);
    return TreeEnsembleModel::from_xgboost_dump(in, "test", base_score, kFeatureSchemaVersion,
                                                IntensityTransform::None);
}

double score(const TreeEnsembleModel& model, std::vector<feature_t> row) {
    return model.score_row(row);
}

}

BOOST_AUTO_TEST_SUITE(tree_ensemble)

BOOST_AUTO_TEST_CASE(parses_xgboost_dump) {
    const auto model = load(kDump);
    BOOST_TEST(model.tree_count() == 2u);
    BOOST_TEST(model.feature_count() == 2u);
    BOOST_TEST(model.base_score() == 0.5);
    BOOST_TEST(model.name() == "test");

    // Pruned trees skip the ids of removed subtrees (3 and 4 here).
    const auto pruned = load(R"(booster[0]:
0:[f0<5] yes=1,no=2,missing=1
	1:leaf=0.1
	2:[f1<3] yes=5,no=6,missing=5
		5:leaf=0.2
		6:leaf=0.3
)", 0.0);
    BOOST_TEST(pruned.tree_count() == 1u);
    BOOST_TEST(pruned.feature_count() == 2u);
    BOOST_CHECK_CLOSE(score(pruned, {1.0f, 0.0f}), 0.1, 1e-9);
    BOOST_CHECK_CLOSE(score(pruned, {7.0f, 1.0f}), 0.2, 1e-9);
    BOOST_CHECK_CLOSE(score(pruned, {7.0f, 4.0f}), 0.3, 1e-9);
}

BOOST_AUTO_TEST_CASE(validates_tree_shape) {
    const auto split = [](const int32_t feature, const int32_t yes, const int32_t no) {
        TreeEnsembleModel::Node node;
        node.feature = feature;
        node.yes = yes;
        node.no = no;
        node.missing = yes;
        return node;
    };
    const TreeEnsembleModel::Node leaf;
    const auto build = [](TreeEnsembleModel::Tree tree) {
        return TreeEnsembleModel("built", {std::move(tree)}, 0.0, kFeatureSchemaVersion, IntensityTransform::None);
    };

    // Children may precede their parent as long as the tree is well formed.
    BOOST_CHECK_NO_THROW(build({split(0, 3, 1), leaf, leaf, split(1, 2, 4), leaf}));
    BOOST_CHECK_THROW(build({split(0, 1, 2), split(1, 0, 2), leaf}), ModelLoadError); // cycle
    BOOST_CHECK_THROW(build({leaf, leaf}), ModelLoadError);                          // unreachable
    BOOST_CHECK_THROW(build({split(0, 1, 5), leaf}), ModelLoadError);                // out of range
}

BOOST_AUTO_TEST_CASE(rejects_rows_narrower_than_the_model) {
    const auto model = load(kDump);
    BOOST_CHECK_THROW(static_cast<void>(score(model, {1.0f})), ModelMismatchError);
    BOOST_CHECK_NO_THROW(static_cast<void>(score(model, {1.0f, 2.0f, 3.0f})));
}

BOOST_AUTO_TEST_CASE(scores_base_plus_leaves) {
    const auto model = load(kDump);
    BOOST_TEST(score(model, {0.0f, 0.0f}) == 0.5 + 0.25 + 0.125);
    BOOST_TEST(score(model, {1.0f, 5.0f}) == 0.5 - 0.5 + 0.125);
    BOOST_TEST(score(model, {1.0f, 50.0f}) == 0.5 + 1.5 + 0.125);
}

BOOST_AUTO_TEST_CASE(missing_values_follow_default_branch) {
    const auto model = load(kDump);
    const auto nan = std::numeric_limits<feature_t>::quiet_NaN();
    BOOST_TEST(score(model, {nan, 50.0f}) == 0.5 + 0.25 + 0.125);
    BOOST_TEST(score(model, {1.0f, nan}) == 0.5 + 1.5 + 0.125);
}

BOOST_AUTO_TEST_CASE(scores_blocks_row_by_row) {
    const auto model = load(kDump);
    const std::vector<feature_t> values{0.0f, 0.0f, 0.0f, 1.0f, 5.0f, 0.0f};
    const FeatureBlock block{values.data(), 2, 3, kFeatureSchemaVersion};
    const auto scores = model.score(block);
    BOOST_REQUIRE(scores.size() == 2u);
    BOOST_TEST(scores[0] == 0.875);
    BOOST_TEST(scores[1] == 0.125);

    const FeatureBlock narrow{values.data(), 6, 1, kFeatureSchemaVersion};
    BOOST_CHECK_THROW(static_cast<void>(model.score(narrow)), ModelMismatchError);
}

BOOST_AUTO_TEST_CASE(rejects_malformed_dumps) {
    BOOST_CHECK_THROW(load(""), ModelLoadError);
    BOOST_CHECK_THROW(load("0:leaf=1\n"), ModelLoadError);                                   // no booster header
    BOOST_CHECK_THROW(load("booster[0]:\n0:[f0<1] yes=1,no=2\n1:leaf=1\n"), ModelLoadError);  // child 2 missing
    BOOST_CHECK_THROW(load("booster[0]:\n0:[f0<1] yes=1,no=0\n1:leaf=1\n"), ModelLoadError);  // cycle
    BOOST_CHECK_THROW(load("booster[0]:\n0:[fx<1] yes=1,no=2\n1:leaf=1\n2:leaf=2\n"), ModelLoadError);
    BOOST_CHECK_THROW(load("booster[0]:\n0:leaf=abc\n"), ModelLoadError);
    BOOST_CHECK_THROW(load("booster[0]:\n0:leaf=1\n2:leaf=1\n"), ModelLoadError);            // unreachable node
    BOOST_CHECK_THROW(load("booster[0]:\n1:[f0<1] yes=2,no=3\n2:leaf=1\n3:leaf=2\n"), ModelLoadError); // no root
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(transforms)

BOOST_AUTO_TEST_CASE(inverts_training_transforms) {
    BOOST_CHECK_CLOSE(invert(IntensityTransform::Log2, 3.0), 8.0 - 0.001, 1e-9);
    BOOST_CHECK_CLOSE(invert(IntensityTransform::Log1p, std::log1p(4.0)), 4.0, 1e-9);
    BOOST_TEST(invert(IntensityTransform::None, 2.5) == 2.5);
}

BOOST_AUTO_TEST_CASE(clips_to_non_negative_finite) {
    BOOST_TEST(invert(IntensityTransform::None, -1.0) == 0.0);
    BOOST_TEST(invert(IntensityTransform::Log2, -20.0) == 0.0);
    BOOST_TEST(invert(IntensityTransform::Log2, std::numeric_limits<double>::quiet_NaN()) == 0.0);
    BOOST_TEST(invert(IntensityTransform::Log2, 5000.0) == 0.0);
    BOOST_TEST(invert(IntensityTransform::None, std::numeric_limits<double>::infinity()) == 0.0);
}

BOOST_AUTO_TEST_CASE(transform_names) {
    BOOST_TEST((parse_transform("log2") == IntensityTransform::Log2));
    BOOST_TEST(to_string(IntensityTransform::Log1p) == "log1p");
    BOOST_CHECK_THROW(parse_transform("sqrt"), std::invalid_argument);
}

BOOST_AUTO_TEST_SUITE_END()

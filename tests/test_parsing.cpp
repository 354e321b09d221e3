#define BOOST_TEST_MODULE parsing
#include <boost/test/unit_test.hpp>

#include "fixtures.hpp"
#include "temp_dir.hpp"
#include "ms2pred/errors.hpp"
#include "ms2pred/logging.hpp"
#include "ms2pred/parsing.hpp"

using namespace ms2pred;
using testing::record;

BOOST_AUTO_TEST_SUITE(peprec_reader)

BOOST_AUTO_TEST_CASE(parses_modification_column) {
    const auto mods = peprec::parse_modifications("0|Acetyl|3|Oxidation|-1|Amidated");
    BOOST_REQUIRE(mods.size() == 3u);
    BOOST_TEST(mods[0].first == 0);
    BOOST_TEST(mods[0].second == "Acetyl");
    BOOST_TEST(mods[1].first == 3);
    BOOST_TEST(mods[2].first == -1);

    BOOST_TEST(peprec::parse_modifications("-").empty());
    BOOST_TEST(peprec::parse_modifications("").empty());
    BOOST_CHECK_THROW(peprec::parse_modifications("3|Oxidation|5"), std::invalid_argument);
    BOOST_CHECK_THROW(peprec::parse_modifications("x|Oxidation"), std::invalid_argument);
}

BOOST_AUTO_TEST_CASE(reads_comma_separated_file) {
    const testing::TempDir dir;
    const auto path = dir.write("in.peprec",
        "spec_id,modifications,peptide,charge\n"
        "pep1,-,ACDEFGHIK,2\n"
        "\n"
        "pep2,0|Acetyl|3|Oxidation,ACMDEFK,3\r\n");
    const auto records = peprec::read_peprec(path);
    BOOST_REQUIRE(records.size() == 2u);
    BOOST_TEST(records[0].id == "pep1");
    BOOST_TEST(records[0].sequence == "ACDEFGHIK");
    BOOST_TEST(records[0].modifications.empty());
    BOOST_TEST(records[0].charge == 2);
    BOOST_TEST(records[1].modifications.size() == 2u);
    BOOST_TEST(records[1].charge == 3);
}

BOOST_AUTO_TEST_CASE(reads_space_separated_file_with_extra_columns) {
    const testing::TempDir dir;
    const auto path = dir.write("in.peprec",
        "spec_id peptide modifications charge protein\n"
        "s1 PEPTIDEK 1|Acetyl 2 P12345\n");
    const auto records = peprec::read_peprec(path);
    BOOST_REQUIRE(records.size() == 1u);
    BOOST_TEST(records[0].sequence == "PEPTIDEK");
    BOOST_TEST(records[0].modifications[0].second == "Acetyl");
}

BOOST_AUTO_TEST_CASE(rejects_malformed_files) {
    const testing::TempDir dir;
    BOOST_CHECK_THROW(peprec::read_peprec((dir.path() / "missing").string()), std::runtime_error);
    BOOST_CHECK_THROW(peprec::read_peprec(dir.write("a", "spec_id,peptide,charge\np,ACDK,2\n")), std::runtime_error);
    BOOST_CHECK_THROW(peprec::read_peprec(dir.write("b", "spec_id,modifications,peptide,charge\np,-,ACDK\n")),
                      std::runtime_error);
    BOOST_CHECK_THROW(peprec::read_peprec(dir.write("c", "spec_id,modifications,peptide,charge\np,-,ACDK,two\n")),
                      std::runtime_error);
    BOOST_CHECK_THROW(peprec::read_peprec(dir.write("d", "spec_id,modifications,peptide,charge\np,3|,ACDK,2\n")),
                      std::runtime_error);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(csv_writers)

BOOST_AUTO_TEST_CASE(writes_predictions_and_errors) {
    const testing::TempDir dir;
    const ResidueTable table(ptm::ModificationTable::defaults());
    const auto registry = testing::make_registry();
    const BatchPredictor predictor({table, registry}, {10, 1, NormalizationMode::Raw});
    const auto results = predictor.run({record("ok", "ACDK", 2), record("bad", "ACXK", 2)}, "HCD");

    const auto predictions = (dir.path() / "out.csv").string();
    csv::write_predictions_csv(results, predictions);
    const auto text = dir.read("out.csv");
    BOOST_TEST(text.starts_with("spec_id,charge,ion,ionnumber,mz,prediction\n"));
    BOOST_TEST(text.find("ok,2,b,1,72.04") != std::string::npos);
    BOOST_TEST(text.find("ok,2,y,3,") != std::string::npos);
    BOOST_TEST(text.find("bad") == std::string::npos);

    BOOST_TEST(csv::write_errors_csv(results, (dir.path() / "errors.csv").string()) == 1u);
    const auto errors = dir.read("errors.csv");
    BOOST_TEST(errors.find("bad,InvalidResidue,\"") != std::string::npos);
}

BOOST_AUTO_TEST_CASE(quotes_ids_with_separators) {
    const testing::TempDir dir;
    const ResidueTable table(ptm::ModificationTable::defaults());
    const auto registry = testing::make_registry();
    const BatchPredictor predictor({table, registry}, {10, 1, NormalizationMode::Raw});
    const auto results = predictor.run({record("scan=1,file=a", "ACDK", 2), record("say \"hi\"", "ACXK", 2)}, "HCD");

    csv::write_predictions_csv(results, (dir.path() / "out.csv").string());
    const auto text = dir.read("out.csv");
    BOOST_TEST(text.find("\"scan=1,file=a\",2,b,1,") != std::string::npos);
    BOOST_TEST(text.find("\nscan=1,file=a,") == std::string::npos);

    BOOST_TEST(csv::write_errors_csv(results, (dir.path() / "errors.csv").string()) == 1u);
    const auto errors = dir.read("errors.csv");
    BOOST_TEST(errors.find("\n\"say \"\"hi\"\"\",InvalidResidue,\"") != std::string::npos);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(config_files)

BOOST_AUTO_TEST_CASE(reads_model_manifest) {
    const testing::TempDir dir;
    const auto manifest = dir.write("models.ini",
        "# HCD models\n"
        "[HCD.b]\n"
        "path = hcd_b.txt\n"
        "transform = log1p\n"
        "[HCD.y]\n"
        "path = /models/hcd_y.txt\n"
        "schema = 2\n"
        "base_score = 0.25\n"
        "sha1 = A9993E364706816ABA3E25717850C26C9CD0D89D\n");

    const auto source = config::read_model_manifest(manifest);
    BOOST_REQUIRE(source.size() == 2u);
    BOOST_TEST((source[0].method == FragmentationMethod::HCD));
    BOOST_TEST(source[0].ion_type == "b");
    BOOST_TEST(source[0].path == (dir.path() / "hcd_b.txt").string());
    BOOST_TEST((source[0].transform == IntensityTransform::Log1p));
    BOOST_TEST(source[0].schema_version == kFeatureSchemaVersion);
    BOOST_TEST(source[1].path == "/models/hcd_y.txt");
    BOOST_TEST(source[1].schema_version == 2u);
    BOOST_TEST(source[1].base_score == 0.25);
    BOOST_TEST(source[0].sha1.empty());
    BOOST_TEST(source[1].sha1 == "a9993e364706816aba3e25717850c26c9cd0d89d");
}

BOOST_AUTO_TEST_CASE(manifest_feeds_registry) {
    const testing::TempDir dir;
    dir.write("b.txt", testing::step_dump(1, 2, 0));
    dir.write("y.txt", testing::step_dump(1, 2, 0));
    const auto manifest = dir.write("models.ini", "[ETD.c]\npath = b.txt\n[ETD.z]\npath = y.txt\n");
    const auto registry = ModelRegistry::load_all(config::read_model_manifest(manifest));
    BOOST_TEST(registry.has_method(FragmentationMethod::ETD));
}

BOOST_AUTO_TEST_CASE(rejects_invalid_manifests) {
    const testing::TempDir dir;
    BOOST_CHECK_THROW(config::read_model_manifest((dir.path() / "none.ini").string()), ModelLoadError);
    BOOST_CHECK_THROW(config::read_model_manifest(dir.write("a.ini", "[XYZ.b]\npath = b.txt\n")), ModelLoadError);
    BOOST_CHECK_THROW(config::read_model_manifest(dir.write("s.ini", "[HCD.b]\npath = b.txt\nsha1 = abc\n")),
                      ModelLoadError);
    BOOST_CHECK_THROW(config::read_model_manifest(dir.write("b.ini", "[HCD.b]\nschema = 1\n")), ModelLoadError);
    BOOST_CHECK_THROW(config::read_model_manifest(dir.write("c.ini", "[HCD.b]\npath = b\ncolour = red\n")),
                      ModelLoadError);
    BOOST_CHECK_THROW(config::read_model_manifest(dir.write("d.ini", "[HCD.b]\npath = b\ntransform = sqrt\n")),
                      ModelLoadError);
    BOOST_CHECK_THROW(config::read_model_manifest(dir.write("e.ini", "[HCD]\npath = b\n")), ModelLoadError);
}

BOOST_AUTO_TEST_CASE(reads_modifications_file) {
    const testing::TempDir dir;
    const auto path = dir.write("mods.txt",
        "# name,mass,type,target\n"
        "Carbamidomethyl,57.021464,fixed,C\n"
        "\n"
        "Oxidation,15.994915,opt,M\n");
    const auto table = config::read_modifications_file(path);
    BOOST_TEST(table.size() == 2u);
    BOOST_TEST(table.fixed().size() == 1u);
    BOOST_CHECK_THROW(config::read_modifications_file(dir.write("bad.txt", "Oxidation,15.99\n")),
                      InvalidModificationError);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(logging)

BOOST_AUTO_TEST_CASE(parses_severity_names) {
    BOOST_TEST((parse_severity("debug") == boost::log::trivial::debug));
    BOOST_TEST((parse_severity("warning") == boost::log::trivial::warning));
    BOOST_CHECK_THROW(parse_severity("loud"), std::invalid_argument);
    init_logging(boost::log::trivial::warning);
    init_logging();
}

BOOST_AUTO_TEST_SUITE_END()

#pragma once

#include <map>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>

#include "ms2pred/fragmentation.hpp"
#include "ms2pred/model.hpp"
#include "ms2pred/model_registry.hpp"
#include "ms2pred/modifications.hpp"
#include "ms2pred/residue_table.hpp"

namespace ms2pred::testing {

// Column of the ion number in a schema v1 row.
constexpr std::size_t kIonNumberFeature = kFeatureCount - 3;

/// Two trees: a step on the ion number (low below 2.5, high above) plus a constant offset.
inline std::string step_dump(const double low, const double high, const double offset) {
    std::ostringstream out;
    out << "booster[0]:\n"
        << "0:[f" << kIonNumberFeature << "<2.5] yes=1,no=2,missing=1\n"
        << "\t1:leaf=" << low << "\n"
        << "\t2:leaf=" << high << "\n"
        << "booster[1]:\n"
        << "0:leaf=" << offset << "\n";
    return out.str();
}

inline ModelRegistry::ModelPtr make_model(const std::string& name,
                                          const std::string& dump,
                                          const schema_version_t schema_version = kFeatureSchemaVersion,
                                          const IntensityTransform transform = IntensityTransform::None,
                                          const double base_score = 0.0) {
    std::istringstream in(dump);
    return std::make_shared<const TreeEnsembleModel>(
        TreeEnsembleModel::from_xgboost_dump(in, name, base_score, schema_version, transform));
}

/**
 * Registry covering every method. Intensities are untransformed:
 * ion numbers 1 and 2 score 1, higher ones 3, plus 0.5 per position of the
 * ion type in the method's list (b +0, y +0.5, ...).
 */
inline ModelRegistry make_registry(const schema_version_t schema_version = kFeatureSchemaVersion) {
    std::map<ModelRegistry::Key, ModelRegistry::ModelPtr> models;
    for (const auto method : kAllMethods) {
        const auto types = ion_types(method);
        for (std::size_t t = 0; t < types.size(); ++t) {
            const std::string ion(types[t].name);
            models.emplace(ModelRegistry::Key{method, ion},
                           make_model(std::string(to_string(method)) + "/" + ion,
                                      step_dump(1.0, 3.0, 0.5 * static_cast<double>(t)), schema_version));
        }
    }
    return ModelRegistry(std::move(models));
}

/// Scores like a regular model but throws a non-pipeline exception for peptides of length 13.
class ExplodingModel final : public Model {
public:
    explicit ExplodingModel(std::string name) : name_(std::move(name)) {}

    [[nodiscard]] std::vector<double> score(const FeatureBlock& block) const override {
        std::vector<double> scores;
        for (std::size_t r = 0; r < block.rows; ++r) {
            if (block.row(r)[0] == 13.0f) throw std::logic_error("exploded on purpose");
            scores.push_back(1.0);
        }
        return scores;
    }

    [[nodiscard]] schema_version_t schema_version() const noexcept override { return kFeatureSchemaVersion; }
    [[nodiscard]] std::size_t feature_count() const noexcept override { return kFeatureCount; }
    [[nodiscard]] IntensityTransform transform() const noexcept override { return IntensityTransform::None; }
    [[nodiscard]] const std::string& name() const noexcept override { return name_; }

private:
    std::string name_;
};

inline PeptideRecord record(std::string id, std::string sequence, const charge_t charge,
                            std::vector<std::pair<site_t, std::string>> modifications = {}) {
    return {std::move(id), std::move(sequence), std::move(modifications), charge};
}

} // namespace ms2pred::testing

#include "ms2pred/prediction.hpp"

#include <string>

#include "ms2pred/errors.hpp"

namespace ms2pred {

std::vector<IonPrediction> PredictionEngine::predict(const FeatureMatrix& matrix,
                                                     const FragmentationMethod method) const {
    std::vector<IonPrediction> predictions;
    predictions.reserve(matrix.rows());

    std::size_t first = 0;
    while (first < matrix.rows()) {
        const auto& type = matrix.label(first).ion_type;
        std::size_t end = first + 1;
        while (end < matrix.rows() && matrix.label(end).ion_type == type) ++end;

        const Model& model = registry_.lookup(method, type.name);
        if (model.schema_version() != matrix.schema_version()) {
            throw ModelMismatchError("Model " + model.name() + " expects feature schema v"
                                     + std::to_string(model.schema_version()) + ", got v"
                                     + std::to_string(matrix.schema_version()));
        }
        if (model.feature_count() > matrix.cols()) {
            throw ModelMismatchError("Model " + model.name() + " reads " + std::to_string(model.feature_count())
                                     + " features, rows have " + std::to_string(matrix.cols()));
        }

        const auto scores = model.score(matrix.block(first, end - first));
        if (scores.size() != end - first) {
            throw ModelMismatchError("Model " + model.name() + " returned " + std::to_string(scores.size())
                                     + " scores for " + std::to_string(end - first) + " rows");
        }
        for (std::size_t r = first; r < end; ++r) {
            const auto& label = matrix.label(r);
            predictions.push_back({label.ion_type, label.ion_number, label.ion_type.charge, label.mz,
                                   invert(model.transform(), scores[r - first])});
        }
        first = end;
    }
    return predictions;
}

} // namespace ms2pred

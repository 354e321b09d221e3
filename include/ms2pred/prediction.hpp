#pragma once

#include <vector>

#include "ms2pred/encoder.hpp"
#include "ms2pred/model_registry.hpp"

namespace ms2pred {

/// @brief Predicted intensity of one fragment ion.
struct IonPrediction {
    IonType ion_type;
    std::size_t ion_number;
    charge_t charge;
    mz_t mz;
    intensity_t intensity;
};

/**
 * @brief Scores feature matrices with the models of a registry.
 *
 * Holds a reference to the registry only; predict() is const and may run
 * concurrently on any number of threads.
 */
class PredictionEngine {
public:
    explicit PredictionEngine(const ModelRegistry& registry) : registry_(registry) {}

    /**
     * @brief Predict one intensity per row of @p matrix, in row order.
     *
     * Rows are scored per contiguous ion-type block by the model registered
     * for (method, ion type); raw scores are mapped to intensities with the
     * model's inverse transform.
     *
     * @throws ModelNotFoundError if a block has no model.
     * @throws ModelMismatchError if the matrix schema or width does not match the model.
     */
    [[nodiscard]] std::vector<IonPrediction> predict(const FeatureMatrix& matrix, FragmentationMethod method) const;

private:
    const ModelRegistry& registry_;
};

} // namespace ms2pred

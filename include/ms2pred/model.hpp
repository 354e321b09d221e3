#pragma once

#include <cstdint>
#include <istream>
#include <string>
#include <string_view>
#include <vector>

#include "ms2pred/encoder.hpp"

namespace ms2pred {

/**
 * @brief Transform applied to intensities at training time.
 *
 * A model's raw score lives in the transformed space; invert() maps it back
 * to a non-negative intensity.
 */
enum class IntensityTransform {
    None,    ///< score is the intensity
    Log2,    ///< score = log2(I + 0.001), the ms2pip training target
    Log1p    ///< score = log(1 + I)
};

std::string_view to_string(IntensityTransform transform) noexcept;

/// @throws std::invalid_argument for unknown names.
IntensityTransform parse_transform(std::string_view name);

/// @brief Inverse of @p transform, clipped at zero. Non-finite scores map to 0.
double invert(IntensityTransform transform, double score) noexcept;

/**
 * @brief A pretrained scoring function over fixed-schema feature vectors.
 *
 * Implementations are immutable after construction; score() may be called
 * concurrently from any number of threads.
 */
class Model {
public:
    virtual ~Model() = default;

    /// @brief Raw score for every row of @p block, in row order.
    [[nodiscard]] virtual std::vector<double> score(const FeatureBlock& block) const = 0;

    /// Feature schema the model was trained against.
    [[nodiscard]] virtual schema_version_t schema_version() const noexcept = 0;

    /// Minimum number of columns an input row must have.
    [[nodiscard]] virtual std::size_t feature_count() const noexcept = 0;

    [[nodiscard]] virtual IntensityTransform transform() const noexcept = 0;

    [[nodiscard]] virtual const std::string& name() const noexcept = 0;
};

/**
 * @brief Additive ensemble of binary regression trees (gradient-boosted trees).
 *
 * Each tree is stored as a flat array of nodes; node 0 is the root. Node ids
 * from a dump are renumbered densely, so pruned ids leave no holes. A split
 * node sends a row to `yes` when feature < threshold, to `no` otherwise, and
 * to `missing` when the feature is NaN. The ensemble output is
 * base_score + sum of the leaves reached in every tree.
 */
class TreeEnsembleModel final : public Model {
public:
    struct Node {
        int32_t feature = -1;    ///< -1 for leaves
        float threshold = 0.0f;
        int32_t yes = -1;
        int32_t no = -1;
        int32_t missing = -1;
        double leaf = 0.0;

        [[nodiscard]] bool is_leaf() const noexcept { return feature < 0; }
    };

    using Tree = std::vector<Node>;

    /// @throws ModelLoadError unless every tree is a proper tree rooted at node 0:
    ///         children in range, no node reached twice, no unreachable node.
    TreeEnsembleModel(std::string name,
                      std::vector<Tree> trees,
                      double base_score,
                      schema_version_t schema_version,
                      IntensityTransform transform);

    /**
     * @brief Read trees from an XGBoost text dump.
     *
     * Expected layout, one node per line, indentation ignored:
     * @code
     * booster[0]:
     * 0:[f7<3.5] yes=1,no=2,missing=1
     *     1:leaf=0.25
     *     2:leaf=-0.1
     * @endcode
     *
     * @throws ModelLoadError on malformed input.
     */
    static TreeEnsembleModel from_xgboost_dump(std::istream& in,
                                               std::string name,
                                               double base_score,
                                               schema_version_t schema_version,
                                               IntensityTransform transform);

    [[nodiscard]] std::vector<double> score(const FeatureBlock& block) const override;

    /// @throws ModelMismatchError if @p row is narrower than feature_count().
    [[nodiscard]] double score_row(std::span<const feature_t> row) const;

    [[nodiscard]] schema_version_t schema_version() const noexcept override { return schema_version_; }
    [[nodiscard]] std::size_t feature_count() const noexcept override { return feature_count_; }
    [[nodiscard]] IntensityTransform transform() const noexcept override { return transform_; }
    [[nodiscard]] const std::string& name() const noexcept override { return name_; }

    [[nodiscard]] std::size_t tree_count() const noexcept { return trees_.size(); }
    [[nodiscard]] double base_score() const noexcept { return base_score_; }

private:
    std::string name_;
    std::vector<Tree> trees_;
    double base_score_;
    schema_version_t schema_version_;
    IntensityTransform transform_;
    std::size_t feature_count_ = 0;
};

} // namespace ms2pred

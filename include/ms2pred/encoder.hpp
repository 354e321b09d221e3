#pragma once

#include <cstdint>
#include <span>
#include <vector>

#include "ms2pred/fragmentation.hpp"
#include "ms2pred/residue_table.hpp"
#include "ms2pred/types.hpp"

namespace ms2pred {

using schema_version_t = uint32_t;

/// Version of the feature layout produced by encode(). Models declare the version they were trained on.
constexpr schema_version_t kFeatureSchemaVersion = 1;

/// Residues on each side of a cleavage site that enter the window features.
constexpr std::size_t kWindowRadius = 2;

constexpr std::size_t kGlobalFeatureCount = 3 + aa::kPropertyCount;
constexpr std::size_t kPositionFeatureCount = 3;
constexpr std::size_t kMassFeatureCount = 4;
constexpr std::size_t kFragmentPropertyFeatureCount = 2 * aa::kPropertyCount;
constexpr std::size_t kWindowFeatureCount = 2 * kWindowRadius * (1 + aa::kPropertyCount);
constexpr std::size_t kIonFeatureCount = 3;

constexpr std::size_t kFeatureCount = kGlobalFeatureCount + kPositionFeatureCount + kMassFeatureCount
                                      + kFragmentPropertyFeatureCount + kWindowFeatureCount + kIonFeatureCount;

static_assert(kFeatureCount == 45, "feature layout changed, bump kFeatureSchemaVersion");

/// @brief Identity of one feature row: which ion it describes.
struct RowLabel {
    IonType ion_type;
    std::size_t ion_number;   ///< b3 -> 3, y1 -> 1
    mz_t mz;                  ///< Theoretical fragment m/z
};

/**
 * @brief Non-owning view on consecutive rows of a FeatureMatrix.
 *
 * This is what a Model scores.
 */
struct FeatureBlock {
    const feature_t* data = nullptr;
    std::size_t rows = 0;
    std::size_t cols = 0;
    schema_version_t schema_version = 0;

    [[nodiscard]] std::span<const feature_t> row(const std::size_t i) const noexcept {
        return {data + i * cols, cols};
    }
};

/**
 * @brief Row-major matrix of feature vectors with one label per row.
 *
 * Rows are grouped by ion type (in the fragmentation method's order) and
 * sorted by ion number inside each group.
 */
class FeatureMatrix {
public:
    FeatureMatrix(schema_version_t schema_version, std::size_t cols) : schema_version_(schema_version), cols_(cols) {}

    [[nodiscard]] std::size_t rows() const noexcept { return labels_.size(); }
    [[nodiscard]] std::size_t cols() const noexcept { return cols_; }
    [[nodiscard]] schema_version_t schema_version() const noexcept { return schema_version_; }

    [[nodiscard]] std::span<const feature_t> row(const std::size_t i) const noexcept {
        return {values_.data() + i * cols_, cols_};
    }

    [[nodiscard]] const RowLabel& label(const std::size_t i) const noexcept { return labels_[i]; }
    [[nodiscard]] const std::vector<RowLabel>& labels() const noexcept { return labels_; }
    [[nodiscard]] const std::vector<feature_t>& values() const noexcept { return values_; }

    [[nodiscard]] FeatureBlock block(std::size_t first, std::size_t count) const;

    /// @brief Append a zero-filled row and return it for writing.
    std::span<feature_t> append_row(const RowLabel& label);

    void reserve(const std::size_t rows) {
        values_.reserve(rows * cols_);
        labels_.reserve(rows);
    }

    /// @brief Bitwise comparison of schema, shape, labels and values.
    [[nodiscard]] bool bit_identical(const FeatureMatrix& other) const noexcept;

private:
    schema_version_t schema_version_;
    std::size_t cols_;
    std::vector<feature_t> values_;
    std::vector<RowLabel> labels_;
};

/**
 * @brief Encode a resolved peptide into one feature row per (ion type, ion number).
 *
 * For every ion type of @p method that the precursor charge allows and every
 * ion number 1..length-1, a row of kFeatureCount values is produced:
 *   - peptide length, precursor charge, neutral mass, mean residue properties,
 *   - cleavage position (absolute, from the C-terminus, normalized),
 *   - N- and C-terminal fragment masses and their modification share,
 *   - N- and C-terminal fragment property sums,
 *   - a window of 2 * kWindowRadius residues around the cleavage site, zero-padded,
 *   - ion number, fragment charge and a C-terminal flag.
 *
 * The output depends only on its arguments, so equal inputs give bit-identical matrices.
 *
 * @throws UnsupportedMethodError if the method has no ion-type mapping.
 */
FeatureMatrix encode(const ResolvedPeptide& peptide, FragmentationMethod method);

/// @brief Number of rows encode() produces for @p peptide and @p method.
std::size_t theoretical_ion_count(const ResolvedPeptide& peptide, FragmentationMethod method);

} // namespace ms2pred

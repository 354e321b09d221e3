#pragma once

#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "ms2pred/fragmentation.hpp"
#include "ms2pred/model.hpp"

namespace ms2pred {

/// @brief Where to find one model and how it was trained.
struct ModelSpec {
    FragmentationMethod method;
    std::string ion_type;          ///< IonType::name, e.g. "b" or "y2"
    std::string path;              ///< XGBoost text dump
    schema_version_t schema_version = kFeatureSchemaVersion;
    IntensityTransform transform = IntensityTransform::Log2;
    double base_score = 0.5;       ///< XGBoost default base_score
    std::string sha1;              ///< expected digest of the file, lower-case hex; empty skips the check
};

/// @brief SHA-1 digest of @p data as 40 lower-case hex digits.
std::string sha1_hex(std::string_view data);

using ModelSource = std::vector<ModelSpec>;

/**
 * @brief Immutable mapping (fragmentation method, ion type) -> model.
 *
 * Constructed once at startup and shared read-only by every worker; lookups
 * take no locks.
 */
class ModelRegistry {
public:
    using ModelPtr = std::shared_ptr<const Model>;
    using Key = std::pair<FragmentationMethod, std::string>;

    /**
     * @brief Build a registry from already constructed models.
     *
     * @throws ModelLoadError if a model is null, an ion type does not belong to
     *         its method, or a method is only partially covered.
     */
    explicit ModelRegistry(std::map<Key, ModelPtr> models);

    /**
     * @brief Load every model of @p source.
     *
     * Models whose declared schema version differs from kFeatureSchemaVersion
     * are kept (and logged); predictions with them fail with ModelMismatchError.
     *
     * @throws ModelLoadError if any artifact cannot be read, does not match its
     *         expected SHA-1, or the registry is inconsistent.
     */
    static ModelRegistry load_all(const ModelSource& source);

    /// @throws ModelNotFoundError
    [[nodiscard]] const Model& lookup(FragmentationMethod method, std::string_view ion_type) const;

    [[nodiscard]] bool has_method(FragmentationMethod method) const noexcept;

    [[nodiscard]] std::vector<FragmentationMethod> methods() const;

    [[nodiscard]] std::size_t size() const noexcept { return models_.size(); }

private:
    std::map<Key, ModelPtr> models_;
};

} // namespace ms2pred

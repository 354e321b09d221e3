#include "ms2pred/model_registry.hpp"

#include <algorithm>
#include <fstream>
#include <iomanip>
#include <ranges>
#include <set>
#include <sstream>

#include <boost/log/trivial.hpp>
#include <boost/uuid/detail/sha1.hpp>

#include "ms2pred/errors.hpp"

namespace ms2pred {

std::string sha1_hex(const std::string_view data) {
    boost::uuids::detail::sha1 hash;
    hash.process_bytes(data.data(), data.size());
    boost::uuids::detail::sha1::digest_type digest;
    hash.get_digest(digest);

    // Digest parts are big-endian words or bytes depending on the Boost release.
    std::ostringstream out;
    out << std::hex << std::setfill('0');
    for (const auto part : digest) {
        out << std::setw(static_cast<int>(2 * sizeof(part))) << static_cast<unsigned long>(part);
    }
    return out.str();
}

ModelRegistry::ModelRegistry(std::map<Key, ModelPtr> models) : models_(std::move(models)) {
    std::set<FragmentationMethod> covered;
    for (const auto& [key, model] : models_) {
        const auto& [method, ion_name] = key;
        if (!model) {
            throw ModelLoadError("No model given for " + std::string(to_string(method)) + "/" + ion_name);
        }
        const auto types = ion_types(method);
        if (std::ranges::none_of(types, [&](const IonType& t) { return t.name == ion_name; })) {
            throw ModelLoadError("Ion type '" + ion_name + "' is not produced by fragmentation method "
                                 + std::string(to_string(method)));
        }
        covered.insert(method);
    }

    for (const auto method : covered) {
        for (const auto& type : ion_types(method)) {
            if (!models_.contains(Key{method, std::string(type.name)})) {
                throw ModelLoadError("Fragmentation method " + std::string(to_string(method))
                                     + " has no model for ion type " + std::string(type.name));
            }
        }
    }
}

ModelRegistry ModelRegistry::load_all(const ModelSource& source) {
    if (source.empty()) {
        throw ModelLoadError("Model source is empty");
    }

    std::map<Key, ModelPtr> models;
    for (const auto& entry : source) {
        const std::string label = std::string(to_string(entry.method)) + "/" + entry.ion_type;

        std::ifstream file(entry.path, std::ios::binary);
        if (!file) {
            throw ModelLoadError("Cannot open model file for " + label + ": " + entry.path);
        }
        std::ostringstream buffer;
        buffer << file.rdbuf();
        const std::string content = buffer.str();

        if (!entry.sha1.empty()) {
            if (const auto actual = sha1_hex(content); actual != entry.sha1) {
                throw ModelLoadError("Model file for " + label + " (" + entry.path + ") has SHA-1 " + actual
                                     + ", expected " + entry.sha1);
            }
        }

        std::istringstream in(content);
        auto model = std::make_shared<const TreeEnsembleModel>(TreeEnsembleModel::from_xgboost_dump(
            in, label, entry.base_score, entry.schema_version, entry.transform));

        if (entry.schema_version != kFeatureSchemaVersion) {
            BOOST_LOG_TRIVIAL(warning) << "Model " << label << " declares feature schema v" << entry.schema_version
                                       << ", encoder produces v" << kFeatureSchemaVersion
                                       << "; predictions with it will fail.";
        }
        BOOST_LOG_TRIVIAL(debug) << "Loaded model " << label << " from " << entry.path
                                 << " (" << model->tree_count() << " trees, "
                                 << model->feature_count() << " features, transform="
                                 << to_string(entry.transform) << ")";

        if (!models.emplace(Key{entry.method, entry.ion_type}, std::move(model)).second) {
            throw ModelLoadError("Duplicate model for " + label);
        }
    }

    ModelRegistry registry(std::move(models));
    BOOST_LOG_TRIVIAL(info) << "Model registry holds " << registry.size() << " models for "
                            << registry.methods().size() << " fragmentation methods.";
    return registry;
}

const Model& ModelRegistry::lookup(const FragmentationMethod method, const std::string_view ion_type) const {
    if (const auto it = models_.find(Key{method, std::string(ion_type)}); it != models_.end()) {
        return *it->second;
    }
    throw ModelNotFoundError("No model loaded for " + std::string(to_string(method)) + "/" + std::string(ion_type));
}

bool ModelRegistry::has_method(const FragmentationMethod method) const noexcept {
    const auto it = models_.lower_bound(Key{method, std::string()});
    return it != models_.end() && it->first.first == method;
}

std::vector<FragmentationMethod> ModelRegistry::methods() const {
    std::vector<FragmentationMethod> out;
    for (const auto& key : models_ | std::views::keys) {
        if (out.empty() || out.back() != key.first) out.push_back(key.first);
    }
    return out;
}

} // namespace ms2pred

#include "ms2pred/model.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <map>
#include <stdexcept>

#include "ms2pred/errors.hpp"

namespace ms2pred {

// ----------------- Transforms -----------------

std::string_view to_string(const IntensityTransform transform) noexcept {
    switch (transform) {
        case IntensityTransform::None: return "none";
        case IntensityTransform::Log2: return "log2";
        case IntensityTransform::Log1p: return "log1p";
    }
    return "unknown";
}

IntensityTransform parse_transform(const std::string_view name) {
    if (name == "none") return IntensityTransform::None;
    if (name == "log2") return IntensityTransform::Log2;
    if (name == "log1p") return IntensityTransform::Log1p;
    throw std::invalid_argument("Unknown intensity transform: " + std::string(name));
}

double invert(const IntensityTransform transform, const double score) noexcept {
    if (!std::isfinite(score)) return 0.0;
    double intensity = score;
    switch (transform) {
        case IntensityTransform::None:
            break;
        case IntensityTransform::Log2:
            intensity = std::exp2(score) - 0.001;
            break;
        case IntensityTransform::Log1p:
            intensity = std::expm1(score);
            break;
    }
    return std::isfinite(intensity) ? std::max(0.0, intensity) : 0.0;
}

// ----------------- Tree ensemble -----------------

TreeEnsembleModel::TreeEnsembleModel(std::string name,
                                     std::vector<Tree> trees,
                                     const double base_score,
                                     const schema_version_t schema_version,
                                     const IntensityTransform transform)
    : name_(std::move(name)), trees_(std::move(trees)), base_score_(base_score),
      schema_version_(schema_version), transform_(transform) {
    for (std::size_t t = 0; t < trees_.size(); ++t) {
        const auto& tree = trees_[t];
        const std::string where = "Model " + name_ + ": tree " + std::to_string(t);
        if (tree.empty()) {
            throw ModelLoadError(where + " is empty");
        }
        const auto size = static_cast<int32_t>(tree.size());

        // Walk from the root; every node must be reached exactly once.
        std::vector<bool> seen(tree.size(), false);
        std::vector<int32_t> pending{0};
        while (!pending.empty()) {
            const int32_t id = pending.back();
            pending.pop_back();
            if (seen[static_cast<std::size_t>(id)]) {
                throw ModelLoadError(where + " node " + std::to_string(id) + " is reached twice");
            }
            seen[static_cast<std::size_t>(id)] = true;

            const auto& node = tree[static_cast<std::size_t>(id)];
            if (node.is_leaf()) continue;
            for (const int32_t child : {node.yes, node.no, node.missing}) {
                if (child < 0 || child >= size) {
                    throw ModelLoadError(where + " node " + std::to_string(id)
                                         + " has invalid child " + std::to_string(child));
                }
            }
            pending.push_back(node.yes);
            if (node.no != node.yes) pending.push_back(node.no);
            if (node.missing != node.yes && node.missing != node.no) pending.push_back(node.missing);
            feature_count_ = std::max(feature_count_, static_cast<std::size_t>(node.feature) + 1);
        }
        if (const auto it = std::find(seen.begin(), seen.end(), false); it != seen.end()) {
            throw ModelLoadError(where + " node " + std::to_string(it - seen.begin())
                                 + " is unreachable from the root");
        }
    }
}

double TreeEnsembleModel::score_row(const std::span<const feature_t> row) const {
    if (row.size() < feature_count_) {
        throw ModelMismatchError("Model " + name_ + " needs " + std::to_string(feature_count_)
                                 + " features, got " + std::to_string(row.size()));
    }
    double sum = base_score_;
    for (const auto& tree : trees_) {
        std::size_t idx = 0;
        while (!tree[idx].is_leaf()) {
            const auto& node = tree[idx];
            const feature_t value = row[static_cast<std::size_t>(node.feature)];
            int32_t next;
            if (std::isnan(value)) {
                next = node.missing;
            } else {
                next = value < node.threshold ? node.yes : node.no;
            }
            idx = static_cast<std::size_t>(next);
        }
        sum += tree[idx].leaf;
    }
    return sum;
}

std::vector<double> TreeEnsembleModel::score(const FeatureBlock& block) const {
    if (block.cols < feature_count_) {
        throw ModelMismatchError("Model " + name_ + " needs " + std::to_string(feature_count_)
                                 + " features, got " + std::to_string(block.cols));
    }
    std::vector<double> scores;
    scores.reserve(block.rows);
    for (std::size_t r = 0; r < block.rows; ++r) {
        scores.push_back(score_row(block.row(r)));
    }
    return scores;
}

// ----------------- XGBoost text dump -----------------
namespace {

std::string_view trim(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
    return s;
}

template <typename T>
bool parse_number(std::string_view s, T& out) {
    s = trim(s);
    const auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
    return ec == std::errc() && ptr == s.data() + s.size();
}

// Value of `key=` inside a comma separated "k=v,k=v" list.
bool find_attribute(const std::string_view attrs, const std::string_view key, std::string_view& value) {
    std::size_t start = 0;
    while (start <= attrs.size()) {
        const auto end = std::min(attrs.find(',', start), attrs.size());
        const auto item = trim(attrs.substr(start, end - start));
        if (const auto eq = item.find('='); eq != std::string_view::npos && trim(item.substr(0, eq)) == key) {
            value = item.substr(eq + 1);
            return true;
        }
        start = end + 1;
    }
    return false;
}

TreeEnsembleModel::Node parse_node_line(const std::string_view body, const std::string& where) {
    TreeEnsembleModel::Node node;
    if (body.starts_with("leaf=")) {
        std::string_view value = body.substr(5);
        value = value.substr(0, value.find(','));
        if (!parse_number(value, node.leaf)) {
            throw ModelLoadError(where + ": invalid leaf value");
        }
        return node;
    }

    // [f12<0.5] yes=1,no=2,missing=1
    const auto close = body.find(']');
    if (!body.starts_with("[f") || close == std::string_view::npos) {
        throw ModelLoadError(where + ": expected split '[fN<threshold]' or 'leaf='");
    }
    const auto cond = body.substr(2, close - 2);
    const auto lt = cond.find('<');
    if (lt == std::string_view::npos
        || !parse_number(cond.substr(0, lt), node.feature)
        || !parse_number(cond.substr(lt + 1), node.threshold)
        || node.feature < 0) {
        throw ModelLoadError(where + ": invalid split condition '" + std::string(cond) + "'");
    }

    const auto attrs = trim(body.substr(close + 1));
    std::string_view yes, no, missing;
    if (!find_attribute(attrs, "yes", yes) || !find_attribute(attrs, "no", no)
        || !parse_number(yes, node.yes) || !parse_number(no, node.no)) {
        throw ModelLoadError(where + ": split without valid yes/no children");
    }
    if (!find_attribute(attrs, "missing", missing)) {
        node.missing = node.yes;
    } else if (!parse_number(missing, node.missing)) {
        throw ModelLoadError(where + ": invalid missing child");
    }
    return node;
}

// Dump ids may have gaps where the pruner removed subtrees; renumber densely in id order.
TreeEnsembleModel::Tree flatten(const std::map<int32_t, TreeEnsembleModel::Node>& nodes,
                                const std::string& where) {
    if (!nodes.contains(0)) {
        throw ModelLoadError(where + ": tree has no root node 0");
    }
    std::map<int32_t, int32_t> index;
    for (const auto& [id, node] : nodes) {
        index.emplace(id, static_cast<int32_t>(index.size()));
    }
    const auto remap = [&](const int32_t parent, const int32_t child) {
        const auto it = index.find(child);
        if (it == index.end()) {
            throw ModelLoadError(where + ": node " + std::to_string(parent) + " references unknown node "
                                 + std::to_string(child));
        }
        return it->second;
    };

    TreeEnsembleModel::Tree tree;
    tree.reserve(nodes.size());
    for (const auto& [id, node] : nodes) {
        auto dense = node;
        if (!dense.is_leaf()) {
            dense.yes = remap(id, node.yes);
            dense.no = remap(id, node.no);
            dense.missing = remap(id, node.missing);
        }
        tree.push_back(dense);
    }
    return tree;
}

}

TreeEnsembleModel TreeEnsembleModel::from_xgboost_dump(std::istream& in,
                                                       std::string name,
                                                       const double base_score,
                                                       const schema_version_t schema_version,
                                                       const IntensityTransform transform) {
    std::vector<Tree> trees;
    std::map<int32_t, Node> current;
    bool in_tree = false;
    std::string line;
    std::size_t line_no = 0;

    while (std::getline(in, line)) {
        ++line_no;
        const auto text = trim(line);
        if (text.empty()) continue;
        const std::string where = name + ":" + std::to_string(line_no);

        if (text.starts_with("booster[")) {
            if (in_tree) {
                trees.push_back(flatten(current, where));
                current.clear();
            }
            in_tree = true;
            continue;
        }
        if (!in_tree) {
            throw ModelLoadError(where + ": node before the first 'booster[k]:' header");
        }

        const auto colon = text.find(':');
        int32_t id = -1;
        if (colon == std::string_view::npos || !parse_number(text.substr(0, colon), id) || id < 0) {
            throw ModelLoadError(where + ": expected '<id>:'");
        }
        if (!current.emplace(id, parse_node_line(trim(text.substr(colon + 1)), where)).second) {
            throw ModelLoadError(where + ": duplicate node id " + std::to_string(id));
        }
    }
    if (in_tree) {
        trees.push_back(flatten(current, name + ":" + std::to_string(line_no)));
    }
    if (trees.empty()) {
        throw ModelLoadError("Model " + name + " contains no trees");
    }
    return {std::move(name), std::move(trees), base_score, schema_version, transform};
}

} // namespace ms2pred

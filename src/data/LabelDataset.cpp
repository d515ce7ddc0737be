#include "anchorfit/data/LabelDataset.hpp"
#include "anchorfit/common/Errors.hpp"
#include "anchorfit/common/StringUtils.hpp"

#include <algorithm>
#include <charconv>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <yaml-cpp/yaml.h>

namespace anchorfit::data {

namespace fs = std::filesystem;

size_t LabelDataset::numLabels() const {
    size_t total = 0;
    for (const auto& set : labels) {
        total += set.size();
    }
    return total;
}

void LabelDataset::validate() const {
    if (shapes.size() != labels.size()) {
        throw common::ConfigurationError(
            "dataset has " + std::to_string(shapes.size()) + " image shapes but " +
            std::to_string(labels.size()) + " label sets");
    }
    for (size_t i = 0; i < shapes.size(); ++i) {
        if (shapes[i].width <= 0 || shapes[i].height <= 0) {
            throw common::ConfigurationError("image " + std::to_string(i) +
                                             " has a non-positive shape");
        }
    }
}

namespace {

bool parseInt(const std::string& token, int& out) {
    const char* begin = token.data();
    const char* end = begin + token.size();
    auto [ptr, ec] = std::from_chars(begin, end, out);
    return ec == std::errc() && ptr == end;
}

// Finite decimal only; rejects nan, inf and trailing characters.
bool parseFloat(const std::string& token, float& out) {
    const char* begin = token.data();
    const char* end = begin + token.size();
    auto [ptr, ec] = std::from_chars(begin, end, out);
    return ec == std::errc() && ptr == end && std::isfinite(out);
}

fs::path resolve(const fs::path& base, const std::string& entry) {
    fs::path p(entry);
    return p.is_absolute() ? p : base / p;
}

std::vector<std::string> readNames(const YAML::Node& node) {
    std::vector<std::string> names;
    if (!node) {
        return names;
    }
    if (node.IsSequence()) {
        for (const auto& n : node) {
            names.push_back(n.as<std::string>());
        }
    } else if (node.IsMap()) {
        // {0: plane, 1: ship, ...}
        for (const auto& kv : node) {
            const int idx = kv.first.as<int>();
            if (idx < 0) {
                throw common::ConfigurationError("negative class index in 'names'");
            }
            if (static_cast<size_t>(idx) >= names.size()) {
                names.resize(idx + 1);
            }
            names[idx] = kv.second.as<std::string>();
        }
    } else {
        throw common::ConfigurationError("'names' must be a list or a map");
    }
    return names;
}

std::vector<fs::path> listLabelFiles(const fs::path& dir) {
    std::vector<fs::path> files;
    try {
        for (const auto& entry : fs::directory_iterator(dir)) {
            if (!entry.is_regular_file()) continue;
            if (common::toLowerCopy(entry.path().extension().string()) == ".txt") {
                files.push_back(entry.path());
            }
        }
    } catch (const fs::filesystem_error& e) {
        throw common::ConfigurationError("Failed to list label directory " + dir.string() + ": " +
                                         e.what());
    }
    std::sort(files.begin(), files.end());
    return files;
}

}  // namespace

std::unordered_map<std::string, ImageShape> readShapes(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw common::ConfigurationError("Failed to open shapes file: " + path);
    }

    std::unordered_map<std::string, ImageShape> shapes;
    std::string line;
    int line_no = 0;
    while (std::getline(file, line)) {
        ++line_no;
        line = common::trimCopy(line);
        if (line.empty() || line[0] == '#') continue;

        std::istringstream is(line);
        std::string stem;
        ImageShape shape;
        if (!(is >> stem >> shape.width >> shape.height) || shape.width <= 0 || shape.height <= 0) {
            throw common::ConfigurationError("Malformed shapes entry at " + path + ":" +
                                             std::to_string(line_no));
        }
        shapes[fs::path(stem).stem().string()] = shape;
    }
    return shapes;
}

std::optional<LabelRecord> parseDotaLine(const std::string& line,
                                         const ImageShape& shape,
                                         const std::unordered_map<std::string, int>& name_to_id) {
    const std::vector<std::string> tokens = common::splitAny(line, " \t\r\n");
    if (tokens.size() < 9 || shape.width <= 0 || shape.height <= 0) {
        return std::nullopt;
    }

    LabelRecord record;
    const float inv_w = 1.0f / static_cast<float>(shape.width);
    const float inv_h = 1.0f / static_cast<float>(shape.height);
    for (int i = 0; i < 4; ++i) {
        float x = 0.0f;
        float y = 0.0f;
        if (!parseFloat(tokens[2 * i], x) || !parseFloat(tokens[2 * i + 1], y)) {
            return std::nullopt;
        }
        record.poly[i].x = x * inv_w;
        record.poly[i].y = y * inv_h;
    }

    const auto it = name_to_id.find(tokens[8]);
    if (it != name_to_id.end()) {
        record.class_id = it->second;
    } else if (!parseInt(tokens[8], record.class_id) || record.class_id < 0) {
        return std::nullopt;
    }
    return record;
}

LabelDataset LabelDataset::fromYaml(const std::string& yaml_path, common::ILogger& logger) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(yaml_path);
    } catch (const YAML::BadFile&) {
        throw common::ConfigurationError("Dataset config not found: " + yaml_path);
    } catch (const YAML::Exception& e) {
        throw common::ConfigurationError("Failed to parse dataset config '" + yaml_path +
                                         "': " + e.what());
    }
    if (!root.IsMap()) {
        throw common::ConfigurationError("Dataset config '" + yaml_path + "' is not a map");
    }

    LabelDataset dataset;
    fs::path label_dir;
    fs::path shapes_path;
    try {
        fs::path base = fs::path(yaml_path).parent_path();
        if (root["path"]) {
            base = resolve(base, root["path"].as<std::string>());
        }
        if (!root["train"] || !root["train"].IsScalar()) {
            throw common::ConfigurationError("Dataset config '" + yaml_path +
                                             "' has no 'train' entry");
        }
        label_dir = resolve(base, root["train"].as<std::string>());
        if (root["shapes"]) {
            shapes_path = resolve(base, root["shapes"].as<std::string>());
        } else {
            shapes_path = label_dir.parent_path() / (label_dir.filename().string() + ".shapes");
        }
        dataset.names = readNames(root["names"]);
    } catch (const YAML::Exception& e) {
        throw common::ConfigurationError("Invalid dataset config '" + yaml_path + "': " + e.what());
    }

    if (!fs::is_directory(label_dir)) {
        throw common::ConfigurationError("Label directory does not exist: " + label_dir.string());
    }
    const auto shapes = readShapes(shapes_path.string());

    std::unordered_map<std::string, int> name_to_id;
    for (size_t i = 0; i < dataset.names.size(); ++i) {
        if (!dataset.names[i].empty()) {
            name_to_id[dataset.names[i]] = static_cast<int>(i);
        }
    }

    size_t skipped_lines = 0;
    size_t missing_shapes = 0;
    for (const auto& file : listLabelFiles(label_dir)) {
        const auto shape_it = shapes.find(file.stem().string());
        if (shape_it == shapes.end()) {
            ++missing_shapes;
            continue;
        }

        std::ifstream in(file);
        if (!in.is_open()) {
            AF_LOGW(logger, "Failed to open label file: ", file.string());
            continue;
        }

        LabelSet set;
        std::string line;
        while (std::getline(in, line)) {
            const std::string trimmed = common::trimCopy(line);
            // DOTA v1.0 headers
            if (trimmed.empty() || trimmed.rfind("imagesource:", 0) == 0 ||
                trimmed.rfind("gsd:", 0) == 0) {
                continue;
            }
            if (auto record = parseDotaLine(trimmed, shape_it->second, name_to_id)) {
                set.push_back(*record);
            } else {
                ++skipped_lines;
            }
        }
        dataset.shapes.push_back(shape_it->second);
        dataset.labels.push_back(std::move(set));
    }

    if (missing_shapes > 0) {
        AF_LOGW(logger, missing_shapes, " label files have no entry in ", shapes_path.string(),
                " and were ignored");
    }
    if (skipped_lines > 0) {
        AF_LOGW(logger, "Skipped ", skipped_lines, " malformed or unknown-class label lines");
    }
    AF_LOGI(logger, "Loaded ", dataset.numLabels(), " labels from ", dataset.size(),
            " images in ", label_dir.string());
    return dataset;
}

} // namespace anchorfit::data

#include "anchorfit/model/DetectionModel.hpp"
#include "anchorfit/anchor/AnchorOrder.hpp"
#include "anchorfit/common/Errors.hpp"

#include <cmath>
#include <filesystem>
#include <fstream>
#include <yaml-cpp/yaml.h>

namespace anchorfit::model {

AnchorModel AnchorModel::fromPixelAnchors(const anchor::AnchorSet& pixels,
                                          const anchor::StrideSequence& strides) {
    DetectHead head;
    head.anchors = pixels.dividedByStrides(strides);
    head.strides = strides;
    return AnchorModel(std::move(head));
}

DetectionModel& unwrapModel(DetectionModel& model) {
    DetectionModel* current = &model;
    while (auto* wrapper = dynamic_cast<ParallelModelWrapper*>(current)) {
        current = &wrapper->module();
    }
    return *current;
}

bool checkAnchorOrder(DetectHead& head, common::ILogger& logger) {
    const bool reversed = anchor::checkAnchorOrder(head.anchors, head.strides);
    if (reversed) {
        AF_LOGI(logger, "AutoAnchor: Reversing anchor order");
    }
    return reversed;
}

namespace {

anchor::AnchorLevel parseLevel(const YAML::Node& node, size_t level) {
    if (!node.IsSequence() || node.size() == 0 || node.size() % 2 != 0) {
        throw common::ConfigurationError("anchors level " + std::to_string(level) +
                                         " must be a non-empty list of w,h pairs");
    }
    anchor::AnchorLevel out;
    for (size_t i = 0; i < node.size(); i += 2) {
        const anchor::BoxEdge a{node[i].as<float>(), node[i + 1].as<float>()};
        if (!(a.w > 0.0f) || !(a.h > 0.0f)) {
            throw common::ConfigurationError("anchors level " + std::to_string(level) +
                                             " contains a non-positive edge");
        }
        out.push_back(a);
    }
    return out;
}

}  // namespace

AnchorModel loadAnchorsYaml(const std::string& path) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(path);
    } catch (const YAML::BadFile&) {
        throw common::ConfigurationError("Model config not found: " + path);
    } catch (const YAML::Exception& e) {
        throw common::ConfigurationError("Failed to parse model config '" + path + "': " + e.what());
    }

    try {
        const YAML::Node anchors = root["anchors"];
        if (!anchors || !anchors.IsSequence() || anchors.size() == 0) {
            throw common::ConfigurationError("Model config '" + path + "' has no 'anchors' list");
        }

        anchor::AnchorSet pixels;
        for (size_t l = 0; l < anchors.size(); ++l) {
            pixels.levels.push_back(parseLevel(anchors[l], l));
        }
        anchor::requireUniform(pixels);

        anchor::StrideSequence strides;
        if (root["strides"]) {
            strides = root["strides"].as<std::vector<float>>();
        } else {
            // P3, P4, P5, ... heads
            for (size_t l = 0; l < pixels.numLevels(); ++l) {
                strides.push_back(8.0f * std::pow(2.0f, static_cast<float>(l)));
            }
        }
        if (strides.size() != pixels.numLevels()) {
            throw common::ConfigurationError("Model config '" + path + "' has " +
                                             std::to_string(pixels.numLevels()) +
                                             " anchor levels but " +
                                             std::to_string(strides.size()) + " strides");
        }
        return AnchorModel::fromPixelAnchors(pixels, strides);
    } catch (const YAML::Exception& e) {
        throw common::ConfigurationError("Invalid model config '" + path + "': " + e.what());
    }
}

void saveAnchorsYaml(const DetectionModel& model, const std::string& path) {
    YAML::Node root;
    if (std::filesystem::exists(path)) {
        try {
            root = YAML::LoadFile(path);
        } catch (const YAML::Exception& e) {
            throw common::ConfigurationError("Failed to parse model config '" + path + "': " + e.what());
        }
    }

    const DetectHead& head = model.detectHead();
    const anchor::AnchorSet pixels = head.pixelAnchors();

    YAML::Node anchors(YAML::NodeType::Sequence);
    for (const auto& level : pixels.levels) {
        YAML::Node row(YAML::NodeType::Sequence);
        row.SetStyle(YAML::EmitterStyle::Flow);
        for (const auto& a : level) {
            row.push_back(std::lround(a.w));
            row.push_back(std::lround(a.h));
        }
        anchors.push_back(row);
    }
    YAML::Node strides(YAML::NodeType::Sequence);
    strides.SetStyle(YAML::EmitterStyle::Flow);
    for (float s : head.strides) {
        strides.push_back(s);
    }
    root["anchors"] = anchors;
    root["strides"] = strides;

    std::ofstream out(path);
    if (!out.is_open()) {
        throw common::ConfigurationError("Failed to write model config: " + path);
    }
    YAML::Emitter emitter;
    emitter << root;
    out << emitter.c_str() << "\n";
}

} // namespace anchorfit::model

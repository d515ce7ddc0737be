#include "anchorfit/pipeline/ToolConfig.hpp"
#include "anchorfit/common/Errors.hpp"
#include "anchorfit/common/StringUtils.hpp"

#include <filesystem>
#include <yaml-cpp/yaml.h>

namespace anchorfit::pipeline {

void applyYaml(const YAML::Node& yaml, ToolConfig& config) {
    if (!yaml.IsMap()) {
        throw common::ConfigurationError("tool config must be a map");
    }
    try {
        if (yaml["mode"]) config.mode = common::toLowerCopy(yaml["mode"].as<std::string>());
        if (yaml["data"]) config.data = yaml["data"].as<std::string>();
        if (yaml["model"]) config.model = yaml["model"].as<std::string>();
        if (yaml["save"]) config.save = yaml["save"].as<std::string>();

        if (yaml["n"]) config.n = yaml["n"].as<int>();
        if (yaml["img_size"]) config.img_size = yaml["img_size"].as<int>();
        // hyp files call the ratio threshold anchor_t
        if (yaml["anchor_t"]) config.thr = yaml["anchor_t"].as<float>();
        if (yaml["thr"]) config.thr = yaml["thr"].as<float>();
        if (yaml["gen"]) config.gen = yaml["gen"].as<int>();
        if (yaml["verbose"]) config.verbose = yaml["verbose"].as<bool>();

        if (yaml["seed"]) config.seed = yaml["seed"].as<uint32_t>();
        if (yaml["edge_convention"]) {
            config.convention = data::parseEdgeConvention(yaml["edge_convention"].as<std::string>());
        }

        if (yaml["logging"] && yaml["logging"]["level"]) {
            config.log_level = yaml["logging"]["level"].as<std::string>();
        } else if (yaml["log_level"]) {
            config.log_level = yaml["log_level"].as<std::string>();
        }
    } catch (const YAML::Exception& e) {
        throw common::ConfigurationError(std::string("Invalid tool config value: ") + e.what());
    }
}

ToolConfig loadToolConfig(const std::string& path, common::ILogger& logger) {
    ToolConfig config;
    if (!std::filesystem::exists(path)) {
        AF_LOGW(logger, "Configuration file not found: ", path, ", using defaults");
        return config;
    }

    YAML::Node yaml;
    try {
        yaml = YAML::LoadFile(path);
    } catch (const YAML::Exception& e) {
        throw common::ConfigurationError("Failed to parse config '" + path + "': " + e.what());
    }
    if (yaml.IsNull()) {
        return config;  // empty file
    }
    applyYaml(yaml, config);
    AF_LOGI(logger, "Loaded configuration from ", path);
    return config;
}

anchor::OptimizerConfig toOptimizerConfig(const ToolConfig& config) {
    anchor::OptimizerConfig oc;
    oc.n_anchors = config.n;
    oc.img_size = config.img_size;
    oc.thr = config.thr;
    oc.generations = config.gen;
    oc.verbose = config.verbose;
    oc.convention = config.convention;
    return oc;
}

AutoAnchorConfig toAutoAnchorConfig(const ToolConfig& config) {
    AutoAnchorConfig ac;
    ac.thr = config.thr;
    ac.img_size = config.img_size;
    ac.generations = config.gen;
    ac.convention = config.convention;
    return ac;
}

} // namespace anchorfit::pipeline

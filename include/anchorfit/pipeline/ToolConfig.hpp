#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <yaml-cpp/yaml.h>

#include "anchorfit/anchor/AnchorOptimizer.hpp"
#include "anchorfit/common/log.hpp"
#include "anchorfit/data/EdgeExtractor.hpp"
#include "anchorfit/pipeline/AutoAnchor.hpp"

namespace anchorfit::pipeline {

/**
 * @brief Settings of the anchorfit command line tool
 */
struct ToolConfig {
    std::string mode = "kmeans";      // kmeans|check
    std::string data;                 // dataset YAML
    std::string model;                // model anchors YAML (check mode)
    std::string save;                 // where to write updated anchors (check mode)

    int n = 9;                        // anchor count
    int img_size = 640;
    float thr = 4.0f;
    int gen = 1000;
    bool verbose = true;

    std::optional<uint32_t> seed;
    data::EdgeConvention convention = data::EdgeConvention::LongEdge;
    std::string log_level = "INFO";
};

/**
 * @brief Overlay the keys present in @p node onto @p config
 *
 * Keys: mode, data, model, save, n, img_size, thr (or anchor_t), gen, verbose,
 * seed, edge_convention, log_level (or logging.level).
 *
 * @throws common::ConfigurationError on values of the wrong type
 */
void applyYaml(const YAML::Node& node, ToolConfig& config);

/**
 * @brief Load a tool config file
 *
 * A missing file only logs a warning and yields the defaults.
 * @throws common::ConfigurationError if the file cannot be parsed
 */
ToolConfig loadToolConfig(const std::string& path, common::ILogger& logger);

anchor::OptimizerConfig toOptimizerConfig(const ToolConfig& config);
AutoAnchorConfig toAutoAnchorConfig(const ToolConfig& config);

} // namespace anchorfit::pipeline

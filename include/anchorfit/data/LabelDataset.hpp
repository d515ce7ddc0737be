#pragma once

#include <array>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include <opencv2/core.hpp>

#include "anchorfit/common/log.hpp"

namespace anchorfit::data {

/// Original image size in pixels.
struct ImageShape {
    int width = 0;
    int height = 0;
};

/**
 * @brief One oriented ground-truth annotation
 *
 * Corners are image fractions in [0, 1] (x divided by width, y by height).
 */
struct LabelRecord {
    int class_id = 0;
    std::array<cv::Point2f, 4> poly{};
};

using LabelSet = std::vector<LabelRecord>;

/**
 * @brief Per-image shapes and labels, in a fixed iteration order
 *
 * @c shapes[i] and @c labels[i] always describe the same image.
 */
struct LabelDataset {
    std::vector<ImageShape> shapes;
    std::vector<LabelSet> labels;
    std::vector<std::string> names;

    size_t size() const { return shapes.size(); }
    size_t numLabels() const;

    /// @throws common::ConfigurationError on mismatched sizes or bad shapes
    void validate() const;

    /**
     * @brief Load a dataset described by a YAML file
     *
     * Recognized keys:
     * - @c path   optional root for relative entries (default: the YAML's directory)
     * - @c train  directory of DOTA label files (x1 y1 ... x4 y4 class [difficulty], pixels)
     * - @c shapes text file of "<stem> <width> <height>" lines
     *             (default: "<train>.shapes" next to the label directory)
     * - @c names  class names, as a list or an index -> name map
     *
     * @throws common::ConfigurationError if the reference is malformed
     */
    static LabelDataset fromYaml(const std::string& yaml_path, common::ILogger& logger);
};

/// Reads a shapes file into stem -> shape. @throws common::ConfigurationError
std::unordered_map<std::string, ImageShape> readShapes(const std::string& path);

/**
 * @brief Parse one DOTA label line into a normalized record
 *
 * The class token is resolved against @p names, falling back to a numeric id.
 * Returns nullopt for headers ("imagesource:", "gsd:"), blank lines, unknown
 * classes and malformed lines.
 */
std::optional<LabelRecord> parseDotaLine(const std::string& line,
                                         const ImageShape& shape,
                                         const std::unordered_map<std::string, int>& name_to_id);

} // namespace anchorfit::data

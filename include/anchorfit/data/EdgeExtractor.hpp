#pragma once

#include <array>
#include <string>
#include <opencv2/core.hpp>

#include "anchorfit/anchor/Types.hpp"
#include "anchorfit/common/Random.hpp"
#include "anchorfit/data/LabelDataset.hpp"

namespace anchorfit::data {

/// Which rotated-box side becomes the width.
enum class EdgeConvention {
    LongEdge,     // width is the longer side, angle in [-90, 90) degrees
    AxisAligned,  // width is the side closest to the x axis, angle in [-45, 45)
};

/// Parses "long_edge" / "axis_aligned" (case-insensitive). @throws common::ConfigurationError
EdgeConvention parseEdgeConvention(const std::string& name);
const char* toString(EdgeConvention convention);

struct RotatedBox {
    float cx = 0.0f;
    float cy = 0.0f;
    float w = 0.0f;
    float h = 0.0f;
    float angle = 0.0f;  // radians
};

/// Minimum-area rotated rectangle around a 4-point polygon (pixel coordinates).
RotatedBox polyToRotatedBox(const std::array<cv::Point2f, 4>& poly, EdgeConvention convention);

struct ExtractOptions {
    int img_size = 640;             // long side of the normalized image
    float min_edge = 5.0f;          // boxes with both edges below are noise
    EdgeConvention convention = EdgeConvention::LongEdge;
    bool augment = false;           // per-image random scale jitter
    double jitter_min = 0.9;
    double jitter_max = 1.1;
};

/**
 * @brief Edge-length pairs of every label, scaled to @c options.img_size
 *
 * Each image is scaled by img_size / max(width, height), times a uniform
 * factor in [jitter_min, jitter_max] drawn once per image when augmenting.
 * @p rng is only consulted when @c options.augment is set.
 *
 * @throws common::ConfigurationError if the dataset is inconsistent
 */
anchor::EdgeCollections extractEdges(const LabelDataset& dataset,
                                     const ExtractOptions& options,
                                     common::Rng& rng);

} // namespace anchorfit::data

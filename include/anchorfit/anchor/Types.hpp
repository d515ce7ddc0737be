#pragma once

#include <cstddef>
#include <vector>
#include <opencv2/core.hpp>

namespace anchorfit::anchor {

/// Edge-length pair (width, height) in pixels at the normalized image scale.
struct BoxEdge {
    float w = 0.0f;
    float h = 0.0f;

    float area() const { return w * h; }
};

/// Flattened K x 2 anchor list in pixels.
using AnchorList = std::vector<BoxEdge>;
using AnchorLevel = std::vector<BoxEdge>;
using StrideSequence = std::vector<float>;

/**
 * @brief Anchors grouped by detection scale level (levels x anchors-per-level)
 *
 * Units depend on the owner: a model stores each level divided by its stride,
 * the optimizer works in pixels.
 */
struct AnchorSet {
    std::vector<AnchorLevel> levels;

    size_t numLevels() const { return levels.size(); }
    size_t numAnchors() const;
    bool uniform() const;  // every level holds the same number of anchors

    AnchorList flatten() const;

    /// Splits a flat list into @p num_levels equally sized levels.
    static AnchorSet fromFlat(const AnchorList& flat, size_t num_levels);

    /// Multiplies (or divides) every level by its stride.
    AnchorSet scaledByStrides(const StrideSequence& strides) const;
    AnchorSet dividedByStrides(const StrideSequence& strides) const;
};

/// @throws common::ConfigurationError if @p set and @p strides differ in level count
void requireLevelCount(const AnchorSet& set, const StrideSequence& strides);

/// @throws common::ConfigurationError unless every level holds the same number of anchors
void requireUniform(const AnchorSet& set);

struct FitnessReport {
    double best_possible_recall = 0.0;     // fraction of boxes with a fitting anchor
    double anchors_above_threshold = 0.0;  // mean fitting anchors per box
};

/**
 * @brief Box collections produced by one extraction pass
 *
 * Reporting uses @c unfiltered, fitting uses @c filtered. Keep them apart.
 */
struct EdgeCollections {
    std::vector<BoxEdge> unfiltered;
    std::vector<BoxEdge> filtered;
    size_t small_count = 0;  // boxes with either edge below the minimum size
};

/// N x 2 CV_32F matrix (one row per box) sharing no memory with @p edges.
cv::Mat toEdgeMatrix(const std::vector<BoxEdge>& edges);

/// Sorts by area, smallest first.
void sortByArea(AnchorList& anchors);

} // namespace anchorfit::anchor

#pragma once

#include <vector>
#include <opencv2/core.hpp>

#include "anchorfit/anchor/Types.hpp"

namespace anchorfit::anchor {

/**
 * @brief Width/height ratio metric between every box and every anchor
 *
 * score(box, anchor) = min over {w, h} of min(box/anchor, anchor/box), so 1.0
 * means identical size and aspect. Unlike IoU it does not depend on box
 * position or on the evaluation image scale.
 *
 * @param anchors K anchors in pixels
 * @param edges   N x 2 CV_32F box edges (see toEdgeMatrix)
 * @return N x K CV_32F score matrix
 */
cv::Mat ratioMetric(const AnchorList& anchors, const cv::Mat& edges);

/// Row-wise maximum of a score matrix: N x 1 best score per box.
cv::Mat bestFit(const cv::Mat& metric);

/**
 * @brief Fitness summary of @p anchors against @p boxes
 *
 * @param threshold_ratio anchor/box ratio limit; a score counts when it exceeds
 *                        1 / threshold_ratio (4.0 -> 0.25)
 * @throws common::DataError if @p boxes is empty
 */
FitnessReport evaluateFit(const AnchorList& anchors,
                          const std::vector<BoxEdge>& boxes,
                          float threshold_ratio);

/**
 * @brief Search objective of the anchor evolution
 *
 * Mean over boxes of best score, with boxes whose best score does not exceed
 * @p min_score contributing zero.
 */
double anchorFitness(const AnchorList& anchors, const cv::Mat& edges, float min_score);

} // namespace anchorfit::anchor

#pragma once

#include "anchorfit/anchor/Types.hpp"

namespace anchorfit::anchor {

/**
 * @brief Align anchor level order with stride order
 *
 * Compares the sign of (mean area of last level - mean area of first level)
 * with the sign of (last stride - first stride). When they disagree the level
 * sequence is reversed in place; anchors inside a level keep their order.
 * A zero difference on either side counts as consistent, so a second call
 * never reorders.
 *
 * @return true if the levels were reversed
 * @throws common::ConfigurationError if level and stride counts differ
 */
bool checkAnchorOrder(AnchorSet& anchors, const StrideSequence& strides);

/// Mean anchor area of every level.
std::vector<double> levelMeanAreas(const AnchorSet& anchors);

} // namespace anchorfit::anchor

#include "anchorfit/anchor/AnchorOrder.hpp"

#include <algorithm>

namespace anchorfit::anchor {

namespace {

int sign(double v) {
    return (v > 0.0) - (v < 0.0);
}

}  // namespace

std::vector<double> levelMeanAreas(const AnchorSet& anchors) {
    std::vector<double> areas;
    areas.reserve(anchors.numLevels());
    for (const auto& level : anchors.levels) {
        double sum = 0.0;
        for (const auto& a : level) {
            sum += static_cast<double>(a.w) * a.h;
        }
        areas.push_back(level.empty() ? 0.0 : sum / static_cast<double>(level.size()));
    }
    return areas;
}

bool checkAnchorOrder(AnchorSet& anchors, const StrideSequence& strides) {
    requireLevelCount(anchors, strides);
    if (anchors.numLevels() < 2) {
        return false;
    }

    const std::vector<double> areas = levelMeanAreas(anchors);
    const int da = sign(areas.back() - areas.front());
    const int ds = sign(static_cast<double>(strides.back()) - strides.front());
    if (da == 0 || ds == 0 || da == ds) {
        return false;
    }

    std::reverse(anchors.levels.begin(), anchors.levels.end());
    return true;
}

} // namespace anchorfit::anchor

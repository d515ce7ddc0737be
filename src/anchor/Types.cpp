#include "anchorfit/anchor/Types.hpp"
#include "anchorfit/common/Errors.hpp"

#include <algorithm>
#include <string>

namespace anchorfit::anchor {

size_t AnchorSet::numAnchors() const {
    size_t total = 0;
    for (const auto& level : levels) {
        total += level.size();
    }
    return total;
}

bool AnchorSet::uniform() const {
    if (levels.empty()) return true;
    const size_t per_level = levels.front().size();
    return std::all_of(levels.begin(), levels.end(),
                       [per_level](const AnchorLevel& l) { return l.size() == per_level; });
}

AnchorList AnchorSet::flatten() const {
    AnchorList flat;
    flat.reserve(numAnchors());
    for (const auto& level : levels) {
        flat.insert(flat.end(), level.begin(), level.end());
    }
    return flat;
}

AnchorSet AnchorSet::fromFlat(const AnchorList& flat, size_t num_levels) {
    if (num_levels == 0 || flat.size() % num_levels != 0) {
        throw common::ConfigurationError(
            "cannot split " + std::to_string(flat.size()) + " anchors into " +
            std::to_string(num_levels) + " levels");
    }
    const size_t per_level = flat.size() / num_levels;
    AnchorSet set;
    set.levels.reserve(num_levels);
    for (size_t l = 0; l < num_levels; ++l) {
        set.levels.emplace_back(flat.begin() + l * per_level, flat.begin() + (l + 1) * per_level);
    }
    return set;
}

void requireLevelCount(const AnchorSet& set, const StrideSequence& strides) {
    if (set.numLevels() != strides.size()) {
        throw common::ConfigurationError(
            "anchor levels (" + std::to_string(set.numLevels()) + ") do not match strides (" +
            std::to_string(strides.size()) + ")");
    }
}

void requireUniform(const AnchorSet& set) {
    if (!set.uniform()) {
        std::string sizes;
        for (const auto& level : set.levels) {
            if (!sizes.empty()) sizes += "+";
            sizes += std::to_string(level.size());
        }
        throw common::ConfigurationError("anchor levels must hold the same number of anchors, got " +
                                         sizes);
    }
}

AnchorSet AnchorSet::scaledByStrides(const StrideSequence& strides) const {
    requireLevelCount(*this, strides);
    AnchorSet out = *this;
    for (size_t l = 0; l < out.levels.size(); ++l) {
        for (auto& a : out.levels[l]) {
            a.w *= strides[l];
            a.h *= strides[l];
        }
    }
    return out;
}

AnchorSet AnchorSet::dividedByStrides(const StrideSequence& strides) const {
    requireLevelCount(*this, strides);
    for (float s : strides) {
        if (s <= 0.0f) {
            throw common::ConfigurationError("strides must be positive");
        }
    }
    AnchorSet out = *this;
    for (size_t l = 0; l < out.levels.size(); ++l) {
        for (auto& a : out.levels[l]) {
            a.w /= strides[l];
            a.h /= strides[l];
        }
    }
    return out;
}

cv::Mat toEdgeMatrix(const std::vector<BoxEdge>& edges) {
    cv::Mat m(static_cast<int>(edges.size()), 2, CV_32F);
    for (int i = 0; i < m.rows; ++i) {
        float* row = m.ptr<float>(i);
        row[0] = edges[i].w;
        row[1] = edges[i].h;
    }
    return m;
}

void sortByArea(AnchorList& anchors) {
    std::stable_sort(anchors.begin(), anchors.end(),
                     [](const BoxEdge& a, const BoxEdge& b) { return a.area() < b.area(); });
}

} // namespace anchorfit::anchor

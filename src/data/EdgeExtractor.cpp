#include "anchorfit/data/EdgeExtractor.hpp"
#include "anchorfit/common/Errors.hpp"
#include "anchorfit/common/StringUtils.hpp"

#include <algorithm>
#include <cmath>
#include <utility>
#include <vector>
#include <opencv2/imgproc.hpp>

namespace anchorfit::data {

EdgeConvention parseEdgeConvention(const std::string& name) {
    const std::string lower = common::toLowerCopy(common::trimCopy(name));
    if (lower == "long_edge" || lower == "le90" || lower == "long") return EdgeConvention::LongEdge;
    if (lower == "axis_aligned" || lower == "axis") return EdgeConvention::AxisAligned;
    throw common::ConfigurationError("Unknown edge convention '" + name +
                                     "' (expected long_edge or axis_aligned)");
}

const char* toString(EdgeConvention convention) {
    return convention == EdgeConvention::LongEdge ? "long_edge" : "axis_aligned";
}

RotatedBox polyToRotatedBox(const std::array<cv::Point2f, 4>& poly, EdgeConvention convention) {
    const std::vector<cv::Point2f> points(poly.begin(), poly.end());
    const cv::RotatedRect rect = cv::minAreaRect(points);

    float w = rect.size.width;
    float h = rect.size.height;
    float angle = rect.angle;  // degrees; the range differs between OpenCV releases

    // A rectangle turned by 90 degrees is the same rectangle with its sides swapped.
    if (convention == EdgeConvention::LongEdge) {
        if (w < h) {
            std::swap(w, h);
            angle += 90.0f;
        }
        while (angle >= 90.0f) angle -= 180.0f;
        while (angle < -90.0f) angle += 180.0f;
    } else {
        while (angle >= 45.0f) {
            angle -= 90.0f;
            std::swap(w, h);
        }
        while (angle < -45.0f) {
            angle += 90.0f;
            std::swap(w, h);
        }
    }

    RotatedBox box;
    box.cx = rect.center.x;
    box.cy = rect.center.y;
    box.w = w;
    box.h = h;
    box.angle = angle * static_cast<float>(CV_PI / 180.0);
    return box;
}

anchor::EdgeCollections extractEdges(const LabelDataset& dataset,
                                     const ExtractOptions& options,
                                     common::Rng& rng) {
    dataset.validate();
    if (options.img_size <= 0) {
        throw common::ConfigurationError("img_size must be positive");
    }

    anchor::EdgeCollections edges;
    edges.unfiltered.reserve(dataset.numLabels());

    for (size_t i = 0; i < dataset.size(); ++i) {
        const ImageShape& shape = dataset.shapes[i];
        double ratio = static_cast<double>(options.img_size) / std::max(shape.width, shape.height);
        if (options.augment) {
            ratio *= rng.uniform(options.jitter_min, options.jitter_max);
        }
        const float sx = static_cast<float>(shape.width * ratio);
        const float sy = static_cast<float>(shape.height * ratio);

        for (const auto& label : dataset.labels[i]) {
            std::array<cv::Point2f, 4> pixels;
            for (size_t p = 0; p < pixels.size(); ++p) {
                pixels[p] = cv::Point2f(label.poly[p].x * sx, label.poly[p].y * sy);
            }
            const RotatedBox box = polyToRotatedBox(pixels, options.convention);
            edges.unfiltered.push_back({box.w, box.h});
        }
    }

    for (const auto& e : edges.unfiltered) {
        if (e.w < options.min_edge || e.h < options.min_edge) {
            ++edges.small_count;
        }
        if (e.w >= options.min_edge || e.h >= options.min_edge) {
            edges.filtered.push_back(e);
        }
    }
    return edges;
}

} // namespace anchorfit::data

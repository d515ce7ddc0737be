#include "anchorfit/anchor/AnchorFitness.hpp"
#include "anchorfit/common/Errors.hpp"

#include <string>

namespace anchorfit::anchor {

namespace {

// min(x / a, a / x) for a whole column; zero edges score zero.
void edgeRatio(const cv::Mat& column, float anchor_edge, cv::Mat& out) {
    cv::Mat ratio = column * (1.0 / anchor_edge);
    cv::Mat inverse;
    cv::divide(1.0, ratio, inverse);  // OpenCV yields 0 for division by zero
    cv::min(ratio, inverse, out);
}

}  // namespace

cv::Mat ratioMetric(const AnchorList& anchors, const cv::Mat& edges) {
    CV_Assert(edges.type() == CV_32F && edges.cols == 2);

    const int n = edges.rows;
    const int k = static_cast<int>(anchors.size());
    cv::Mat metric = cv::Mat::zeros(n, k, CV_32F);
    if (n == 0) {
        return metric;
    }

    const cv::Mat widths = edges.col(0);
    const cv::Mat heights = edges.col(1);
    cv::Mat rw, rh;
    for (int j = 0; j < k; ++j) {
        const BoxEdge& a = anchors[j];
        if (a.w <= 0.0f || a.h <= 0.0f) {
            continue;  // degenerate anchor never fits
        }
        edgeRatio(widths, a.w, rw);
        edgeRatio(heights, a.h, rh);
        cv::Mat column = metric.col(j);
        cv::min(rw, rh, column);
    }
    return metric;
}

cv::Mat bestFit(const cv::Mat& metric) {
    if (metric.cols == 0) {
        return cv::Mat::zeros(metric.rows, 1, CV_32F);
    }
    cv::Mat best;
    cv::reduce(metric, best, 1, cv::REDUCE_MAX);
    return best;
}

FitnessReport evaluateFit(const AnchorList& anchors,
                          const std::vector<BoxEdge>& boxes,
                          float threshold_ratio) {
    if (boxes.empty()) {
        throw common::DataError("cannot evaluate anchor fit on an empty box collection");
    }
    if (threshold_ratio <= 0.0f) {
        throw common::ConfigurationError("threshold ratio must be positive, got " +
                                         std::to_string(threshold_ratio));
    }

    const float min_score = 1.0f / threshold_ratio;
    const cv::Mat metric = ratioMetric(anchors, toEdgeMatrix(boxes));
    const cv::Mat best = bestFit(metric);
    const double n = static_cast<double>(boxes.size());

    const cv::Mat recalled = best > min_score;
    FitnessReport report;
    report.best_possible_recall = cv::countNonZero(recalled) / n;
    if (!metric.empty()) {
        const cv::Mat above = metric > min_score;
        report.anchors_above_threshold = cv::countNonZero(above) / n;
    }
    return report;
}

double anchorFitness(const AnchorList& anchors, const cv::Mat& edges, float min_score) {
    if (edges.rows == 0) {
        throw common::DataError("cannot compute anchor fitness without boxes");
    }
    cv::Mat best = bestFit(ratioMetric(anchors, edges));
    const cv::Mat below = best <= min_score;
    best.setTo(0.0f, below);
    return cv::mean(best)[0];
}

} // namespace anchorfit::anchor

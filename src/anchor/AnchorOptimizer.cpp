#include "anchorfit/anchor/AnchorOptimizer.hpp"
#include "anchorfit/anchor/AnchorFitness.hpp"
#include "anchorfit/common/Errors.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <set>
#include <sstream>
#include <utility>
#include <opencv2/core.hpp>

namespace anchorfit::anchor {

namespace {

constexpr const char* kPrefix = "AutoAnchor: ";
constexpr double kMinSigma = 1e-6;

}  // namespace

void OptimizerConfig::validate() const {
    if (n_anchors <= 0) throw common::ConfigurationError("n must be positive");
    if (img_size <= 0) throw common::ConfigurationError("img_size must be positive");
    if (thr <= 0.0f) throw common::ConfigurationError("thr must be positive");
    if (generations < 0) throw common::ConfigurationError("gen must not be negative");
    if (kmeans_iterations <= 0 || kmeans_restarts <= 0) {
        throw common::ConfigurationError("k-means iterations and restarts must be positive");
    }
    if (!(mutation_sigma > 0.0)) {
        throw common::ConfigurationError("mutation sigma must be positive");
    }
    if (mutation_prob <= 0.0 || mutation_prob > 1.0) {
        throw common::ConfigurationError("mutation probability must be in (0, 1]");
    }
    if (mutation_min <= 0.0 || mutation_min > mutation_max) {
        throw common::ConfigurationError("invalid mutation clip range");
    }
}

AnchorSummary summarizeAnchors(const AnchorList& anchors, const std::vector<BoxEdge>& boxes,
                               float min_score) {
    AnchorSummary summary;
    if (boxes.empty() || anchors.empty()) {
        return summary;
    }

    const cv::Mat metric = ratioMetric(anchors, toEdgeMatrix(boxes));
    const cv::Mat best = bestFit(metric);
    const double n = static_cast<double>(boxes.size());

    const cv::Mat recalled = best > min_score;
    const cv::Mat past = metric > min_score;
    const int past_count = cv::countNonZero(past);

    summary.best_possible_recall = cv::countNonZero(recalled) / n;
    summary.anchors_past_threshold = past_count / n;
    summary.metric_mean = cv::mean(metric)[0];
    summary.best_mean = cv::mean(best)[0];
    summary.past_threshold_mean = past_count > 0 ? cv::mean(metric, past)[0] : 0.0;
    return summary;
}

std::string formatReport(const AnchorList& anchors, const std::vector<BoxEdge>& unfiltered,
                         const OptimizerConfig& config) {
    AnchorList sorted = anchors;
    sortByArea(sorted);

    const float min_score = 1.0f / config.thr;
    const AnchorSummary s = summarizeAnchors(sorted, unfiltered, min_score);

    std::ostringstream os;
    os << std::fixed;
    os << kPrefix << "thr=" << std::setprecision(2) << min_score << ": "
       << std::setprecision(4) << s.best_possible_recall << " best possible recall, "
       << std::setprecision(2) << s.anchors_past_threshold << " anchors past thr\n";
    os << kPrefix << "n=" << config.n_anchors << ", img_size=" << config.img_size
       << ", metric_all=" << std::setprecision(3) << s.metric_mean << "/" << s.best_mean
       << "-mean/best, past_thr=" << s.past_threshold_mean << "-mean: ";
    for (size_t i = 0; i < sorted.size(); ++i) {
        if (i > 0) os << ", ";
        os << std::lround(sorted[i].w) << "," << std::lround(sorted[i].h);
    }
    return os.str();
}

AnchorList mutate(const AnchorList& anchors, const cv::Mat& mask, float min_anchor) {
    CV_Assert(mask.type() == CV_64F && mask.rows == static_cast<int>(anchors.size()) && mask.cols == 2);
    AnchorList out(anchors.size());
    for (int i = 0; i < mask.rows; ++i) {
        const double* v = mask.ptr<double>(i);
        out[i].w = std::max(static_cast<float>(anchors[i].w * v[0]), min_anchor);
        out[i].h = std::max(static_cast<float>(anchors[i].h * v[1]), min_anchor);
    }
    return out;
}

AnchorOptimizer::AnchorOptimizer(common::Rng& rng, common::ILogger& logger)
    : rng_(rng), logger_(logger) {}

AnchorList AnchorOptimizer::optimize(const data::LabelDataset& dataset, const OptimizerConfig& config) {
    return run(dataset, config).anchors;
}

AnchorList AnchorOptimizer::optimize(const std::string& dataset_yaml, const OptimizerConfig& config) {
    const data::LabelDataset dataset = data::LabelDataset::fromYaml(dataset_yaml, logger_);
    return optimize(dataset, config);
}

EvolutionResult AnchorOptimizer::run(const data::LabelDataset& dataset, const OptimizerConfig& config) {
    config.validate();

    data::ExtractOptions options;
    options.img_size = config.img_size;
    options.min_edge = config.min_edge;
    options.convention = config.convention;
    options.augment = false;
    const EdgeCollections edges = data::extractEdges(dataset, options, rng_);

    if (edges.small_count > 0) {
        AF_LOGW(logger_, kPrefix, "WARNING: Extremely small objects found. ", edges.small_count,
                " of ", edges.unfiltered.size(), " poly labels are < ", config.min_edge,
                " pixels in size.");
    }
    if (edges.filtered.empty()) {
        throw common::DataError(std::string(kPrefix) + "no labels with an edge of at least " +
                                std::to_string(config.min_edge) + " pixels");
    }

    AF_LOGI(logger_, kPrefix, "Running kmeans for ", config.n_anchors, " anchors on ",
            edges.filtered.size(), " points...");
    const AnchorList seed = kmeansSeed(edges.filtered, config.n_anchors,
                                       config.kmeans_iterations, config.kmeans_restarts);

    AF_LOGI(logger_, kPrefix, "Evolving anchors with Genetic Algorithm for ",
            config.generations, " generations");
    EvolutionResult result = evolve(seed, edges.filtered, edges.unfiltered, config);

    AF_LOGI(logger_, formatReport(result.anchors, edges.unfiltered, config));
    return result;
}

AnchorList AnchorOptimizer::kmeansSeed(const std::vector<BoxEdge>& boxes, int n,
                                       int iterations, int restarts) {
    if (n <= 0) {
        throw common::ConfigurationError("k-means needs a positive cluster count");
    }
    if (boxes.size() < static_cast<size_t>(n)) {
        throw common::DataError(std::string(kPrefix) + "ERROR: kmeans requested " +
                                std::to_string(n) + " points but only " +
                                std::to_string(boxes.size()) + " boxes are available");
    }

    // cv::kmeans fills empty clusters with copies of existing points, so the
    // distinct-centroid requirement has to be checked on the input.
    std::set<std::pair<float, float>> distinct;
    for (const auto& b : boxes) {
        distinct.emplace(b.w, b.h);
    }
    if (distinct.size() < static_cast<size_t>(n)) {
        throw common::DataError(std::string(kPrefix) + "ERROR: kmeans requested " +
                                std::to_string(n) + " points but only " +
                                std::to_string(distinct.size()) + " distinct boxes are available");
    }

    cv::Mat data = toEdgeMatrix(boxes);
    double sigma[2];
    for (int c = 0; c < 2; ++c) {
        cv::Scalar mean, stddev;
        cv::meanStdDev(data.col(c), mean, stddev);
        sigma[c] = stddev[0] > kMinSigma ? stddev[0] : 1.0;  // constant column: leave as is
        cv::Mat column = data.col(c);
        column.convertTo(column, CV_32F, 1.0 / sigma[c]);
    }

    cv::theRNG() = cv::RNG(rng_.nextSeed());
    cv::Mat labels, centers;
    try {
        cv::kmeans(data, n, labels,
                   cv::TermCriteria(cv::TermCriteria::COUNT + cv::TermCriteria::EPS, iterations, 1e-5),
                   restarts, cv::KMEANS_PP_CENTERS, centers);
    } catch (const cv::Exception& e) {
        throw common::DataError(std::string(kPrefix) + "ERROR: kmeans failed: " + e.what());
    }

    AnchorList anchors;
    anchors.reserve(centers.rows);
    for (int i = 0; i < centers.rows; ++i) {
        const float* row = centers.ptr<float>(i);
        const BoxEdge a{static_cast<float>(row[0] * sigma[0]), static_cast<float>(row[1] * sigma[1])};
        const bool duplicate = std::any_of(anchors.begin(), anchors.end(), [&a](const BoxEdge& b) {
            return b.w == a.w && b.h == a.h;
        });
        if (!duplicate) {
            anchors.push_back(a);
        }
    }
    if (anchors.size() != static_cast<size_t>(n)) {
        throw common::DataError(std::string(kPrefix) + "ERROR: kmeans requested " +
                                std::to_string(n) + " points but returned only " +
                                std::to_string(anchors.size()));
    }

    sortByArea(anchors);
    return anchors;
}

cv::Mat AnchorOptimizer::mutationMask(int num_anchors, const OptimizerConfig& config) {
    cv::Mat mask(num_anchors, 2, CV_64F, cv::Scalar(1.0));
    if (num_anchors <= 0) {
        return mask;
    }

    bool identity = true;
    while (identity) {
        // One magnitude for the whole generation: small r means a gentle step for
        // every mutated entry, large r a bold one.
        const double magnitude = rng_.uniform();
        for (int i = 0; i < num_anchors; ++i) {
            double* row = mask.ptr<double>(i);
            for (int j = 0; j < 2; ++j) {
                const bool mutated = rng_.uniform() < config.mutation_prob;
                const double noise = rng_.normal();
                const double v = mutated ? 1.0 + magnitude * noise * config.mutation_sigma : 1.0;
                row[j] = std::clamp(v, config.mutation_min, config.mutation_max);
                if (row[j] != 1.0) {
                    identity = false;
                }
            }
        }
    }
    return mask;
}

EvolutionResult AnchorOptimizer::evolve(const AnchorList& seed, const std::vector<BoxEdge>& filtered,
                                        const std::vector<BoxEdge>& unfiltered,
                                        const OptimizerConfig& config) {
    const float min_score = 1.0f / config.thr;
    const cv::Mat edges = toEdgeMatrix(filtered);
    const int k = static_cast<int>(seed.size());

    EvolutionResult result;
    result.anchors = seed;
    result.fitness = anchorFitness(seed, edges, min_score);
    result.fitness_history.reserve(config.generations);

    for (int g = 0; g < config.generations; ++g) {
        const cv::Mat v = mutationMask(k, config);
        AnchorList candidate = mutate(result.anchors, v, config.min_anchor);
        const double fg = anchorFitness(candidate, edges, min_score);
        if (fg > result.fitness) {
            result.fitness = fg;
            result.anchors = std::move(candidate);
            ++result.accepted;
            AF_LOGD(logger_, kPrefix, "generation ", g, ": fitness = ", std::fixed,
                    std::setprecision(4), result.fitness);
            if (config.verbose) {
                AF_LOGI(logger_, formatReport(result.anchors, unfiltered, config));
            }
        }
        result.fitness_history.push_back(result.fitness);
    }

    sortByArea(result.anchors);
    return result;
}

} // namespace anchorfit::anchor

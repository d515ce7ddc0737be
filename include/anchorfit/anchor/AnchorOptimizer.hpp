#pragma once

#include <string>
#include <vector>
#include <opencv2/core.hpp>

#include "anchorfit/anchor/Types.hpp"
#include "anchorfit/common/Random.hpp"
#include "anchorfit/common/log.hpp"
#include "anchorfit/data/EdgeExtractor.hpp"
#include "anchorfit/data/LabelDataset.hpp"

namespace anchorfit::anchor {

struct OptimizerConfig {
    int n_anchors = 9;
    int img_size = 640;
    float thr = 4.0f;          // anchor/box ratio limit, scores must exceed 1 / thr
    int generations = 1000;
    bool verbose = true;       // report every accepted generation

    float min_edge = 5.0f;     // boxes with both edges below are not fitted
    float min_anchor = 2.0f;   // evolved anchors never shrink below this
    int kmeans_iterations = 30;
    int kmeans_restarts = 30;
    double mutation_prob = 0.9;
    double mutation_sigma = 0.1;
    double mutation_min = 0.3;
    double mutation_max = 3.0;
    data::EdgeConvention convention = data::EdgeConvention::LongEdge;

    /// @throws common::ConfigurationError on out-of-range values
    void validate() const;
};

/// Trace of one evolution run.
struct EvolutionResult {
    AnchorList anchors;                   // sorted by area
    double fitness = 0.0;
    std::vector<double> fitness_history;  // best fitness after each generation
    int accepted = 0;                     // generations that improved
};

/// Statistics printed by the anchor report.
struct AnchorSummary {
    double best_possible_recall = 0.0;
    double anchors_past_threshold = 0.0;  // mean per box
    double metric_mean = 0.0;             // over every box/anchor pair
    double best_mean = 0.0;               // over every box's best anchor
    double past_threshold_mean = 0.0;     // over pairs above threshold
};

AnchorSummary summarizeAnchors(const AnchorList& anchors, const std::vector<BoxEdge>& boxes,
                               float min_score);

/**
 * @brief Human-readable report of an anchor set against the unfiltered boxes
 *
 * Anchors are listed smallest first as rounded "w,h" pairs.
 */
std::string formatReport(const AnchorList& anchors, const std::vector<BoxEdge>& unfiltered,
                         const OptimizerConfig& config);

/**
 * @brief Apply a K x 2 multiplicative mask and clip every edge at @p min_anchor
 */
AnchorList mutate(const AnchorList& anchors, const cv::Mat& mask, float min_anchor);

/**
 * @brief Anchor generator used by the check-and-improve policy
 */
class IAnchorOptimizer {
public:
    virtual ~IAnchorOptimizer() = default;

    /**
     * @return @c config.n_anchors anchors in pixels, sorted by area
     * @throws common::DataError if the dataset cannot support the fit
     */
    virtual AnchorList optimize(const data::LabelDataset& dataset, const OptimizerConfig& config) = 0;
};

/**
 * @brief K-means seeded, evolution-refined anchor generator
 *
 * Pipeline: extract edges (no augmentation) -> drop boxes with both edges below
 * @c min_edge -> k-means on std-whitened edges -> (1+1) evolution of the
 * centroids against the thresholded fitness -> report.
 *
 * Usage:
 * @code
 *   common::Rng rng(0);
 *   common::StderrLogger logger;
 *   AnchorOptimizer optimizer(rng, logger);
 *   OptimizerConfig cfg;
 *   cfg.n_anchors = 9;
 *   AnchorList anchors = optimizer.optimize("data/dota.yaml", cfg);
 * @endcode
 */
class AnchorOptimizer : public IAnchorOptimizer {
public:
    AnchorOptimizer(common::Rng& rng, common::ILogger& logger);

    AnchorList optimize(const data::LabelDataset& dataset, const OptimizerConfig& config) override;

    /// Loads the dataset YAML first. @throws common::ConfigurationError on a bad reference
    AnchorList optimize(const std::string& dataset_yaml, const OptimizerConfig& config);

    /// Full run, including the convergence trace.
    EvolutionResult run(const data::LabelDataset& dataset, const OptimizerConfig& config);

    /**
     * @brief K-means centroids of @p boxes in pixel units, sorted by area
     *
     * Edges are divided by their per-dimension standard deviation before
     * clustering and multiplied back afterwards.
     *
     * @throws common::DataError if @p boxes hold fewer than @p n distinct edge pairs
     *         or fewer than @p n distinct centroids come out
     */
    AnchorList kmeansSeed(const std::vector<BoxEdge>& boxes, int n, int iterations, int restarts);

    /**
     * @brief (1+1) elitist evolution of @p seed
     *
     * Only strict fitness improvements replace the current best, so the
     * recorded history never decreases.
     *
     * @param unfiltered used for verbose reporting only
     */
    EvolutionResult evolve(const AnchorList& seed, const std::vector<BoxEdge>& filtered,
                           const std::vector<BoxEdge>& unfiltered, const OptimizerConfig& config);

    /**
     * @brief Multiplicative mutation mask for @p num_anchors anchors
     *
     * Each entry mutates with probability @c mutation_prob to
     * 1 + r * N(0, 1) * mutation_sigma, where the magnitude r ~ U(0, 1) is drawn
     * once for the whole mask. Entries are clipped to
     * [mutation_min, mutation_max]. An all-ones mask is redrawn.
     *
     * @return num_anchors x 2 CV_64F
     */
    cv::Mat mutationMask(int num_anchors, const OptimizerConfig& config);

private:
    common::Rng& rng_;
    common::ILogger& logger_;
};

} // namespace anchorfit::anchor

#include "anchorfit/pipeline/AutoAnchor.hpp"
#include "anchorfit/anchor/AnchorFitness.hpp"
#include "anchorfit/common/Errors.hpp"

#include <iomanip>
#include <sstream>
#include <opencv2/core.hpp>

namespace anchorfit::pipeline {

namespace {

constexpr const char* kPrefix = "AutoAnchor: ";

}  // namespace

const char* toString(CheckOutcome outcome) {
    switch (outcome) {
        case CheckOutcome::GoodFit: return "good_fit";
        case CheckOutcome::Adopted: return "adopted";
        case CheckOutcome::Rejected: return "rejected";
        case CheckOutcome::OptimizerFailed: return "optimizer_failed";
        default: return "no_labels";
    }
}

CheckResult checkAnchors(model::DetectionModel& model,
                         const data::LabelDataset& dataset,
                         const AutoAnchorConfig& config,
                         anchor::IAnchorOptimizer& optimizer,
                         common::Rng& rng,
                         common::ILogger& logger) {
    CheckResult result;
    model::DetectHead& head = model::unwrapModel(model).detectHead();
    // adopted candidates are split evenly over the levels
    anchor::requireUniform(head.anchors);
    anchor::requireLevelCount(head.anchors, head.strides);
    const anchor::AnchorList current = head.pixelAnchors().flatten();

    data::ExtractOptions options;
    options.img_size = config.img_size;
    options.min_edge = config.min_edge;
    options.convention = config.convention;
    options.augment = true;
    const anchor::EdgeCollections augmented = data::extractEdges(dataset, options, rng);
    if (augmented.unfiltered.empty()) {
        AF_LOGW(logger, kPrefix, "No labels found in dataset, skipping anchor check");
        return result;
    }

    result.current = anchor::evaluateFit(current, augmented.unfiltered, config.thr);
    std::ostringstream summary;
    summary << std::fixed << kPrefix << std::setprecision(2) << result.current.anchors_above_threshold
            << " anchors/target, " << std::setprecision(3) << result.current.best_possible_recall
            << " Best Possible Recall (BPR). ";

    if (result.current.best_possible_recall > config.good_fit_bpr) {
        AF_LOGI(logger, summary.str(), "Current anchors are a good fit to dataset");
        result.outcome = CheckOutcome::GoodFit;
        return result;
    }
    AF_LOGW(logger, summary.str(), "Anchors are a poor fit to dataset, attempting to improve...");

    anchor::OptimizerConfig oc;
    oc.n_anchors = static_cast<int>(current.size());
    oc.img_size = config.img_size;
    oc.thr = config.thr;
    oc.generations = config.generations;
    oc.verbose = false;
    oc.min_edge = config.min_edge;
    oc.convention = config.convention;

    anchor::AnchorList candidate;
    try {
        candidate = optimizer.optimize(dataset, oc);
    } catch (const common::DataError& e) {
        AF_LOGE(logger, kPrefix, "ERROR: ", e.what());
        result.outcome = CheckOutcome::OptimizerFailed;
        return result;
    } catch (const cv::Exception& e) {
        AF_LOGE(logger, kPrefix, "ERROR: ", e.what());
        result.outcome = CheckOutcome::OptimizerFailed;
        return result;
    }
    if (candidate.size() != current.size()) {
        AF_LOGE(logger, kPrefix, "ERROR: optimizer returned ", candidate.size(),
                " anchors, model expects ", current.size());
        result.outcome = CheckOutcome::OptimizerFailed;
        return result;
    }

    result.candidate = anchor::evaluateFit(candidate, augmented.unfiltered, config.thr);
    if (result.candidate.best_possible_recall > result.current.best_possible_recall) {
        const auto pixels = anchor::AnchorSet::fromFlat(candidate, head.strides.size());
        head.anchors = pixels.dividedByStrides(head.strides);
        model::checkAnchorOrder(head, logger);
        AF_LOGI(logger, kPrefix, "New anchors saved to model. Update model config to use these anchors in the future.");
        result.outcome = CheckOutcome::Adopted;
    } else {
        AF_LOGI(logger, kPrefix, "Original anchors better than new anchors. Proceeding with original anchors.");
        result.outcome = CheckOutcome::Rejected;
    }
    return result;
}

} // namespace anchorfit::pipeline

#pragma once

#include "anchorfit/anchor/AnchorOptimizer.hpp"
#include "anchorfit/anchor/Types.hpp"
#include "anchorfit/common/Random.hpp"
#include "anchorfit/common/log.hpp"
#include "anchorfit/data/EdgeExtractor.hpp"
#include "anchorfit/data/LabelDataset.hpp"
#include "anchorfit/model/DetectionModel.hpp"

namespace anchorfit::pipeline {

/**
 * @brief Settings of the check-and-improve policy
 */
struct AutoAnchorConfig {
    float thr = 4.0f;                 // anchor/box ratio limit
    int img_size = 640;               // long side of the training image
    double good_fit_bpr = 0.98;       // BPR above which anchors are kept untouched
    int generations = 1000;           // evolution budget of the optimizer
    float min_edge = 5.0f;
    data::EdgeConvention convention = data::EdgeConvention::LongEdge;
};

enum class CheckOutcome {
    GoodFit,          // current anchors kept, optimizer not run
    Adopted,          // candidate written into the model
    Rejected,         // candidate did not beat the current anchors
    OptimizerFailed,  // optimizer raised, current anchors kept
    NoLabels,         // dataset has no boxes to check against
};

const char* toString(CheckOutcome outcome);

struct CheckResult {
    CheckOutcome outcome = CheckOutcome::NoLabels;
    anchor::FitnessReport current;    // model anchors on the augmented boxes
    anchor::FitnessReport candidate;  // only set when a candidate was evaluated
};

/**
 * @brief Check the model's anchors against the dataset and improve them if needed
 *
 * Current anchors are scored on the unfiltered boxes of a jittered extraction
 * (scale factor in [0.9, 1.1] per image). With BPR above @c good_fit_bpr
 * nothing else happens. Otherwise @p optimizer produces a candidate from an
 * unjittered extraction; the candidate replaces the model anchors (divided by
 * stride, level order re-checked) only if its BPR is strictly higher.
 *
 * Optimizer DataErrors are logged and leave the model untouched.
 * ConfigurationErrors propagate, including a head whose levels hold different
 * anchor counts (checked before anything else runs).
 */
CheckResult checkAnchors(model::DetectionModel& model,
                         const data::LabelDataset& dataset,
                         const AutoAnchorConfig& config,
                         anchor::IAnchorOptimizer& optimizer,
                         common::Rng& rng,
                         common::ILogger& logger);

} // namespace anchorfit::pipeline

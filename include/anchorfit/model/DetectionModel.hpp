#pragma once

#include <string>
#include <utility>

#include "anchorfit/anchor/Types.hpp"
#include "anchorfit/common/log.hpp"

namespace anchorfit::model {

/**
 * @brief Detection head state relevant to anchors
 *
 * @c anchors holds levels x anchors-per-level pairs divided by the level's
 * stride (stored value * stride = pixels).
 */
struct DetectHead {
    anchor::AnchorSet anchors;
    anchor::StrideSequence strides;

    anchor::AnchorSet pixelAnchors() const { return anchors.scaledByStrides(strides); }
};

class DetectionModel {
public:
    virtual ~DetectionModel() = default;

    virtual DetectHead& detectHead() = 0;
    virtual const DetectHead& detectHead() const = 0;
};

/// Plain model holding its own detection head.
class AnchorModel : public DetectionModel {
public:
    AnchorModel() = default;
    explicit AnchorModel(DetectHead head) : head_(std::move(head)) {}

    /// Builds a model from pixel-unit anchors, dividing each level by its stride.
    static AnchorModel fromPixelAnchors(const anchor::AnchorSet& pixels,
                                        const anchor::StrideSequence& strides);

    DetectHead& detectHead() override { return head_; }
    const DetectHead& detectHead() const override { return head_; }

private:
    DetectHead head_;
};

/**
 * @brief Wrapper used when a model is replicated for parallel execution
 *
 * Forwards to the wrapped module; use unwrapModel() to reach it explicitly.
 */
class ParallelModelWrapper : public DetectionModel {
public:
    explicit ParallelModelWrapper(DetectionModel& module) : module_(module) {}

    // Non-copyable
    ParallelModelWrapper(const ParallelModelWrapper&) = delete;
    ParallelModelWrapper& operator=(const ParallelModelWrapper&) = delete;

    DetectionModel& module() { return module_; }
    const DetectionModel& module() const { return module_; }

    DetectHead& detectHead() override { return module_.detectHead(); }
    const DetectHead& detectHead() const override { return module_.detectHead(); }

private:
    DetectionModel& module_;
};

/// Strips any number of ParallelModelWrapper layers.
DetectionModel& unwrapModel(DetectionModel& model);

/**
 * @brief Align the head's anchor level order with its strides, logging a flip
 * @return true if the levels were reversed
 */
bool checkAnchorOrder(DetectHead& head, common::ILogger& logger);

/**
 * @brief Read a model YAML carrying YOLO-style anchors
 *
 * @code
 *   anchors:
 *     - [10,13, 16,30, 33,23]       # P3/8
 *     - [30,61, 62,45, 59,119]      # P4/16
 *     - [116,90, 156,198, 373,326]  # P5/32
 *   strides: [8, 16, 32]            # optional, defaults to 8 * 2^level
 * @endcode
 *
 * Anchors in the file are pixels. Every level must list the same number of
 * anchors.
 * @throws common::ConfigurationError if the file is missing or malformed
 */
AnchorModel loadAnchorsYaml(const std::string& path);

/**
 * @brief Write the model's anchors (in pixels) and strides to @p path
 *
 * Other keys of an existing file are preserved.
 */
void saveAnchorsYaml(const DetectionModel& model, const std::string& path);

} // namespace anchorfit::model

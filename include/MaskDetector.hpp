#pragma once

#include "EngineConfig.hpp"
#include "FaceTypes.hpp"
#include <opencv2/core.hpp>

namespace presence {

/**
 * @brief Colour heuristic for a covered lower face
 *
 * Counts skin-coloured pixels (HSV in [0,20,70]..[20,255,255]) over the
 * lower half of the face region. Little skin there means the mouth and
 * nose are covered.
 */
class MaskDetector {
public:
    explicit MaskDetector(const MaskConfig& config = MaskConfig());

    /**
     * @param image BGR frame (CV_8UC3)
     * @param region Face region; clamped to the image bounds
     * @return Degraded result without a mask when the crop is empty or the image is not BGR
     */
    MaskResult detect(const cv::Mat& image, const FaceRegion& region) const;

    /** Share of skin pixels in the lower half of a BGR face crop */
    static double lower_face_skin_ratio(const cv::Mat& face_bgr);

private:
    MaskConfig config_;
};

} // namespace presence

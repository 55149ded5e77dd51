#pragma once

#include <opencv2/core.hpp>
#include <opencv2/video/tracking.hpp>

#include "core/config.hpp"
#include "core/detections.hpp"

namespace pcc {

/*
    MotionPredictor is the per-track constant velocity Kalman filter.

    State is 8 dimensional: [cx, cy, w, h, vx, vy, vw, vh], one step per frame.
    Measurement is 4 dimensional: [cx, cy, w, h], taken straight from the matched detection box.

    predict() advances the state by its velocity and inflates the covariance. update() blends the prediction
    with a detection box. A track that keeps missing only predicts, so its uncertainty keeps growing.
*/
class MotionPredictor {
public:
  MotionPredictor(const BBox& initial, const KalmanConfig& cfg);

  // cv::Mat copies share data, a track's filter must never be aliased
  MotionPredictor(const MotionPredictor&) = delete;
  MotionPredictor& operator=(const MotionPredictor&) = delete;
  MotionPredictor(MotionPredictor&&) = default;
  MotionPredictor& operator=(MotionPredictor&&) = default;

  void predict();
  void update(const BBox& measured);

  // Current estimate as a box, width and height kept positive
  BBox box() const;
  cv::Point2f centroid() const;
  cv::Point2f velocity() const;

  // Positional spread, sqrt(var(cx) + var(cy))
  float uncertainty() const;

private:
  cv::KalmanFilter kf_;
  cv::Mat measurement_;
};

} // namespace pcc

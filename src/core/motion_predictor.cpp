#include "core/motion_predictor.hpp"

#include <algorithm>
#include <cmath>
#include <initializer_list>

#include "core/geometry.hpp"

namespace pcc {

static constexpr int kStateDim = 8;
static constexpr int kMeasDim = 4;
static constexpr float kMinSide = 1.f;

MotionPredictor::MotionPredictor(const BBox& initial, const KalmanConfig& cfg)
    : kf_(kStateDim, kMeasDim, 0, CV_32F), measurement_(kMeasDim, 1, CV_32F, cv::Scalar(0)) {
  // x' = x + v, one frame per step
  cv::setIdentity(kf_.transitionMatrix);
  for (int i = 0; i < kMeasDim; ++i) kf_.transitionMatrix.at<float>(i, i + kMeasDim) = 1.f;

  kf_.measurementMatrix = cv::Mat::zeros(kMeasDim, kStateDim, CV_32F);
  for (int i = 0; i < kMeasDim; ++i) kf_.measurementMatrix.at<float>(i, i) = 1.f;

  kf_.processNoiseCov = cv::Mat::zeros(kStateDim, kStateDim, CV_32F);
  kf_.errorCovPost = cv::Mat::zeros(kStateDim, kStateDim, CV_32F);
  for (int i = 0; i < kMeasDim; ++i) {
    kf_.processNoiseCov.at<float>(i, i) = cfg.process_noise_pos;
    kf_.processNoiseCov.at<float>(i + kMeasDim, i + kMeasDim) = cfg.process_noise_vel;
    kf_.errorCovPost.at<float>(i, i) = cfg.measurement_noise;
    kf_.errorCovPost.at<float>(i + kMeasDim, i + kMeasDim) = cfg.initial_velocity_variance;
  }
  cv::setIdentity(kf_.measurementNoiseCov, cv::Scalar::all(cfg.measurement_noise));

  const cv::Point2f c = Centroid(initial);
  kf_.statePost = cv::Mat::zeros(kStateDim, 1, CV_32F);
  kf_.statePost.at<float>(0) = c.x;
  kf_.statePost.at<float>(1) = c.y;
  kf_.statePost.at<float>(2) = initial.w;
  kf_.statePost.at<float>(3) = initial.h;
}

void MotionPredictor::predict() {
  // predict() also copies the prior into statePost/errorCovPost, so repeated misses keep accumulating
  kf_.predict();

  // A shrinking box must not collapse, the prior feeds the next correct()
  for (cv::Mat* s : {&kf_.statePre, &kf_.statePost}) {
    float& w = s->at<float>(2);
    float& h = s->at<float>(3);
    if (w < kMinSide) w = kMinSide;
    if (h < kMinSide) h = kMinSide;
  }
}

void MotionPredictor::update(const BBox& measured) {
  const cv::Point2f c = Centroid(measured);
  measurement_.at<float>(0) = c.x;
  measurement_.at<float>(1) = c.y;
  measurement_.at<float>(2) = measured.w;
  measurement_.at<float>(3) = measured.h;
  kf_.correct(measurement_);
}

BBox MotionPredictor::box() const {
  const cv::Mat& s = kf_.statePost;
  const float w = std::max(kMinSide, s.at<float>(2));
  const float h = std::max(kMinSide, s.at<float>(3));
  return BoxFromCentroid(s.at<float>(0), s.at<float>(1), w, h);
}

cv::Point2f MotionPredictor::centroid() const {
  return cv::Point2f(kf_.statePost.at<float>(0), kf_.statePost.at<float>(1));
}

cv::Point2f MotionPredictor::velocity() const {
  return cv::Point2f(kf_.statePost.at<float>(4), kf_.statePost.at<float>(5));
}

float MotionPredictor::uncertainty() const {
  const cv::Mat& p = kf_.errorCovPost;
  const float var = p.at<float>(0, 0) + p.at<float>(1, 1);
  return std::sqrt(std::max(0.f, var));
}

} // namespace pcc

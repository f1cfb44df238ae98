#include <vigil/vision/pnp_pose_solver.hpp>
#include <opencv2/calib3d.hpp>
#include <opencv2/core.hpp>
#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace vigil::vision {

std::expected<std::vector<ModelPoint>, vigil::core::AnalysisError>
load_model_points(const std::string& path, std::size_t expected_count) {
  std::ifstream f(path);
  if (!f) {
    return std::unexpected(vigil::core::AnalysisError::LoadFailed);
  }

  std::vector<float> values;
  float v = 0.f;
  while (f >> v) {
    values.push_back(v);
  }
  if (!f.eof() || values.empty() || values.size() % 3 != 0) {
    return std::unexpected(vigil::core::AnalysisError::LoadFailed);
  }

  const std::size_t n = values.size() / 3;
  if (expected_count != 0 && n != expected_count) {
    return std::unexpected(vigil::core::AnalysisError::LoadFailed);
  }

  std::vector<ModelPoint> points(n);
  for (std::size_t i = 0; i < n; ++i) {
    points[i].x = values[i];
    points[i].y = values[n + i];
    points[i].z = -values[2 * n + i];
  }
  return points;
}

PnpPoseSolver::PnpPoseSolver(std::vector<ModelPoint> model_points)
    : model_points_(std::move(model_points)) {
  if (model_points_.size() < 4) {
    throw std::invalid_argument("PnpPoseSolver: at least 4 model points are required");
  }
}

PnpPoseSolver PnpPoseSolver::from_file(const std::string& path) {
  auto points = load_model_points(path);
  if (!points) {
    throw std::runtime_error("PnpPoseSolver: cannot load 3D face model from " + path);
  }
  return PnpPoseSolver(std::move(*points));
}

std::expected<vigil::core::PoseEstimate, vigil::core::AnalysisError>
PnpPoseSolver::solve_pose(const vigil::core::LandmarkSet& image_points,
                          std::uint32_t image_width,
                          std::uint32_t image_height) const {
  using vigil::core::AnalysisError;

  if (image_points.size() != model_points_.size() || image_width == 0 || image_height == 0) {
    return std::unexpected(AnalysisError::PoseFailed);
  }

  std::vector<cv::Point3d> object_pts;
  object_pts.reserve(model_points_.size());
  for (const auto& p : model_points_) {
    object_pts.emplace_back(p.x, p.y, p.z);
  }
  std::vector<cv::Point2d> image_pts;
  image_pts.reserve(image_points.size());
  for (const auto& m : image_points) {
    image_pts.emplace_back(m.x, m.y);
  }

  const double focal_length = static_cast<double>(image_width);
  const cv::Point2d center(image_width / 2.0, image_height / 2.0);
  const cv::Mat camera_matrix = (cv::Mat_<double>(3, 3) << focal_length, 0, center.x,
                                 0, focal_length, center.y,
                                 0, 0, 1);
  const cv::Mat dist_coeffs = cv::Mat::zeros(4, 1, CV_64F);

  cv::Mat rvec = (cv::Mat_<double>(3, 1) << kInitialRotation[0], kInitialRotation[1],
                  kInitialRotation[2]);
  cv::Mat tvec = (cv::Mat_<double>(3, 1) << kInitialTranslation[0], kInitialTranslation[1],
                  kInitialTranslation[2]);

  bool success = false;
  try {
    success = cv::solvePnP(object_pts, image_pts, camera_matrix, dist_coeffs, rvec, tvec,
                           true, cv::SOLVEPNP_ITERATIVE);
  } catch (const cv::Exception&) {
    return std::unexpected(AnalysisError::PoseFailed);
  }
  if (!success) {
    return std::unexpected(AnalysisError::PoseFailed);
  }

  vigil::core::PoseEstimate pose;
  pose.rotation = {rvec.at<double>(0), rvec.at<double>(1), rvec.at<double>(2)};
  pose.translation = {tvec.at<double>(0), tvec.at<double>(1), tvec.at<double>(2)};
  return pose;
}

}  // namespace vigil::vision

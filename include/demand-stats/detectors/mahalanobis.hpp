#pragma once

#include "demand-stats/detectors/ioutlier_detector.hpp"

#include <Eigen/Dense>
#include <memory>
#include <vector>

namespace demandstats::detectors {

/**
 * @brief How each row's Mahalanobis distance is measured.
 *
 * Pooled compares every row against the mean and covariance of all rows.
 * LeaveOneOut compares each row against the mean and covariance of the other
 * rows. Auto picks LeaveOneOut when rows <= features + 1, where pooled
 * distances are identical for every row, and Pooled otherwise. A single row
 * is always measured pooled and sits at distance 0.
 */
enum class DistanceMode { Auto, Pooled, LeaveOneOut };

class MahalanobisDetectorBuilder;

/**
 * @class MahalanobisDetector
 * @brief Multivariate distance-based detector.
 *
 * Flags rows whose distance exceeds the (1 - contamination) percentile of all
 * distances. Singular covariance matrices are inverted with a pseudo-inverse.
 * One-dimensional input is treated as one feature per point.
 */
class MahalanobisDetector final : public IOutlierDetector {
public:
	friend class MahalanobisDetectorBuilder;

	/// Univariate use; missing values are skipped and never flagged.
	OutlierResult detect(const core::TimeSeries &ts) override;

	/**
	 * @brief Detects outlying rows of an observation matrix (rows = points).
	 * @throws std::invalid_argument With no rows, no columns or non-finite entries.
	 */
	OutlierResult detect(const Eigen::MatrixXd &points);

	/// @throws std::invalid_argument Additionally when rows have different widths.
	OutlierResult detect(const std::vector<std::vector<double>> &points);

	std::string getName() const override {
		return "MahalanobisDetector";
	}

	double contamination() const {
		return contamination_;
	}

	DistanceMode mode() const {
		return mode_;
	}

	/// Mahalanobis distance of every row under the resolved distance mode.
	Eigen::VectorXd distances(const Eigen::MatrixXd &points) const;

private:
	MahalanobisDetector(double contamination, DistanceMode mode);

	double contamination_;
	DistanceMode mode_;
};

class MahalanobisDetectorBuilder {
public:
	/// Expected share of outliers, strictly between 0 and 1.
	MahalanobisDetectorBuilder &withContamination(double contamination);
	MahalanobisDetectorBuilder &withDistanceMode(DistanceMode mode);

	/// @throws std::invalid_argument If contamination is outside (0, 1).
	std::unique_ptr<MahalanobisDetector> build();

private:
	double contamination_ = 0.1;
	DistanceMode mode_ = DistanceMode::Auto;
};

} // namespace demandstats::detectors

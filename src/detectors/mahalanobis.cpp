#include "demand-stats/detectors/mahalanobis.hpp"

#include "demand-stats/utils/logging.hpp"
#include "demand-stats/utils/statistics.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>

namespace demandstats::detectors {

namespace {

constexpr double kSingularityThreshold = 1e-10;

struct Moments {
	Eigen::RowVectorXd mean;
	Eigen::MatrixXd covariance;
};

// Sample mean and covariance (ddof 1); a single row has zero covariance.
Moments moments(const Eigen::MatrixXd &rows) {
	Moments m;
	m.mean = rows.colwise().mean();
	const Eigen::MatrixXd centered = rows.rowwise() - m.mean;
	if (rows.rows() < 2) {
		m.covariance = Eigen::MatrixXd::Zero(rows.cols(), rows.cols());
	} else {
		m.covariance = (centered.transpose() * centered) / static_cast<double>(rows.rows() - 1);
	}
	return m;
}

Eigen::MatrixXd invertCovariance(const Eigen::MatrixXd &covariance) {
	if (covariance.isZero(0.0)) {
		DEMANDSTATS_DEBUG("Covariance matrix is zero; all distances collapse to zero");
		return Eigen::MatrixXd::Zero(covariance.rows(), covariance.cols());
	}
	Eigen::FullPivLU<Eigen::MatrixXd> lu(covariance);
	lu.setThreshold(kSingularityThreshold);
	if (lu.isInvertible()) {
		return lu.inverse();
	}
	DEMANDSTATS_DEBUG("Covariance matrix is singular (rank {} of {}); using pseudo-inverse", lu.rank(),
	                  covariance.rows());
	Eigen::CompleteOrthogonalDecomposition<Eigen::MatrixXd> cod(covariance);
	cod.setThreshold(kSingularityThreshold);
	return cod.pseudoInverse();
}

double distance(const Eigen::RowVectorXd &row, const Moments &m, const Eigen::MatrixXd &inverse) {
	const Eigen::RowVectorXd d = row - m.mean;
	const double squared = (d * inverse * d.transpose())(0, 0);
	// Pseudo-inverse round-off can leave tiny negative quadratic forms.
	return std::sqrt(std::max(squared, 0.0));
}

Eigen::MatrixXd withoutRow(const Eigen::MatrixXd &points, Eigen::Index skip) {
	Eigen::MatrixXd rest(points.rows() - 1, points.cols());
	Eigen::Index out = 0;
	for (Eigen::Index r = 0; r < points.rows(); ++r) {
		if (r != skip) {
			rest.row(out++) = points.row(r);
		}
	}
	return rest;
}

void validatePoints(const Eigen::MatrixXd &points) {
	if (points.rows() < 1) {
		throw std::invalid_argument("Distance-based detection requires at least one point.");
	}
	if (points.cols() < 1) {
		throw std::invalid_argument("Distance-based detection requires at least one feature.");
	}
	if (!points.allFinite()) {
		throw std::invalid_argument("Distance-based detection requires finite feature values.");
	}
}

} // namespace

MahalanobisDetector::MahalanobisDetector(double contamination, DistanceMode mode)
    : contamination_(contamination), mode_(mode) {
	if (!(contamination_ > 0.0 && contamination_ < 1.0)) {
		throw std::invalid_argument("Contamination must lie strictly between 0 and 1.");
	}
}

Eigen::VectorXd MahalanobisDetector::distances(const Eigen::MatrixXd &points) const {
	validatePoints(points);
	const Eigen::Index n = points.rows();
	DistanceMode resolved = mode_;
	if (n == 1) {
		// No other rows to leave out; the lone point sits on its own mean.
		resolved = DistanceMode::Pooled;
	} else if (resolved == DistanceMode::Auto) {
		resolved = n <= points.cols() + 1 ? DistanceMode::LeaveOneOut : DistanceMode::Pooled;
	}

	Eigen::VectorXd result(n);
	if (resolved == DistanceMode::Pooled) {
		const Moments m = moments(points);
		const Eigen::MatrixXd inverse = invertCovariance(m.covariance);
		for (Eigen::Index r = 0; r < n; ++r) {
			result(r) = distance(points.row(r), m, inverse);
		}
		return result;
	}

	DEMANDSTATS_DEBUG("Using leave-one-out distances for {} points in {} dimensions", n, points.cols());
	for (Eigen::Index r = 0; r < n; ++r) {
		const Moments m = moments(withoutRow(points, r));
		const Eigen::MatrixXd inverse = invertCovariance(m.covariance);
		result(r) = distance(points.row(r), m, inverse);
	}
	return result;
}

OutlierResult MahalanobisDetector::detect(const Eigen::MatrixXd &points) {
	const Eigen::VectorXd dist = distances(points);
	const auto n = static_cast<std::size_t>(dist.size());

	OutlierResult result;
	result.flags.assign(n, false);
	result.scores.assign(dist.data(), dist.data() + dist.size());
	result.threshold = utils::Statistics::percentile(result.scores, (1.0 - contamination_) * 100.0);

	const double spread = dist.maxCoeff() - dist.minCoeff();
	if (spread <= 1e-12 * std::max(1.0, dist.maxCoeff())) {
		DEMANDSTATS_DEBUG("All distances are equal. No outliers will be detected.");
		return result;
	}

	for (std::size_t i = 0; i < n; ++i) {
		if (result.scores[i] > result.threshold) {
			result.markOutlier(i);
		}
	}
	DEMANDSTATS_DEBUG("MahalanobisDetector found {} outliers (threshold {}).", result.count(), result.threshold);
	return result;
}

OutlierResult MahalanobisDetector::detect(const std::vector<std::vector<double>> &points) {
	if (points.empty()) {
		throw std::invalid_argument("Distance-based detection requires at least one point.");
	}
	const std::size_t width = points.front().size();
	Eigen::MatrixXd matrix(static_cast<Eigen::Index>(points.size()), static_cast<Eigen::Index>(width));
	for (std::size_t r = 0; r < points.size(); ++r) {
		if (points[r].size() != width) {
			throw std::invalid_argument("All points must have the same number of features.");
		}
		for (std::size_t c = 0; c < width; ++c) {
			matrix(static_cast<Eigen::Index>(r), static_cast<Eigen::Index>(c)) = points[r][c];
		}
	}
	return detect(matrix);
}

OutlierResult MahalanobisDetector::detect(const core::TimeSeries &ts) {
	const auto &values = ts.getValues();
	std::vector<std::size_t> positions;
	positions.reserve(values.size());
	for (std::size_t i = 0; i < values.size(); ++i) {
		if (std::isfinite(values[i])) {
			positions.push_back(i);
		}
	}

	if (positions.empty()) {
		DEMANDSTATS_WARN("MahalanobisDetector received no finite observations. Returning no outliers.");
		OutlierResult empty;
		empty.flags.assign(values.size(), false);
		empty.scores.assign(values.size(), std::numeric_limits<double>::quiet_NaN());
		empty.threshold = std::numeric_limits<double>::quiet_NaN();
		return empty;
	}

	Eigen::MatrixXd column(static_cast<Eigen::Index>(positions.size()), 1);
	for (std::size_t k = 0; k < positions.size(); ++k) {
		column(static_cast<Eigen::Index>(k), 0) = values[positions[k]];
	}
	const OutlierResult compact = detect(column);
	if (positions.size() == values.size()) {
		return compact;
	}

	OutlierResult result;
	result.flags.assign(values.size(), false);
	result.scores.assign(values.size(), std::numeric_limits<double>::quiet_NaN());
	result.threshold = compact.threshold;
	for (std::size_t k = 0; k < positions.size(); ++k) {
		result.scores[positions[k]] = compact.scores[k];
		if (compact.flags[k]) {
			result.markOutlier(positions[k]);
		}
	}
	return result;
}

MahalanobisDetectorBuilder &MahalanobisDetectorBuilder::withContamination(double contamination) {
	contamination_ = contamination;
	return *this;
}

MahalanobisDetectorBuilder &MahalanobisDetectorBuilder::withDistanceMode(DistanceMode mode) {
	mode_ = mode;
	return *this;
}

std::unique_ptr<MahalanobisDetector> MahalanobisDetectorBuilder::build() {
	DEMANDSTATS_DEBUG("Building MahalanobisDetector with contamination {}.", contamination_);
	return std::unique_ptr<MahalanobisDetector>(new MahalanobisDetector(contamination_, mode_));
}

} // namespace demandstats::detectors

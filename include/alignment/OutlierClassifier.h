#pragma once

#include "landmarks/PointSet.h"
#include <Eigen/Dense>
#include <vector>

namespace landmark_eval {

/**
 * Per-correspondence outcome of the affine outlier test
 */
struct OutlierResult {
    std::vector<bool> is_outlier;  // residual above threshold
    Eigen::VectorXd residuals;     // distance after affine alignment
    double threshold = 0.0;        // std_coef * population std of residuals

    /**
     * Number of correspondences flagged as outliers
     */
    int numOutliers() const;
};

/**
 * Flag landmark correspondences inconsistent with a global affine transform.
 *
 * Both sets are truncated to their common length, points_0 is aligned onto
 * points_1 by the least-squares affine transform, and a point is an outlier
 * when its residual exceeds std_coef times the population standard deviation
 * of all residuals (the flagged points included).
 *
 * @param points_0 Source landmarks (N x 2)
 * @param points_1 Target landmarks (M x 2)
 * @param std_coef Threshold in standard deviations
 * @return Outlier flags and residuals, one per common position
 * @throws DimensionMismatchError if either input is not N x 2
 */
OutlierResult classifyOutliers(const Eigen::MatrixXd& points_0,
                               const Eigen::MatrixXd& points_1,
                               double std_coef = 5.0);

/**
 * Overloaded version using point sets
 */
OutlierResult classifyOutliers(const PointSet& points_0,
                               const PointSet& points_1,
                               double std_coef = 5.0);

} // namespace landmark_eval

#include "alignment/OutlierClassifier.h"
#include "alignment/AffineEstimator.h"
#include "analysis/LandmarkStatistics.h"
#include <algorithm>

namespace landmark_eval {

int OutlierResult::numOutliers() const {
    return static_cast<int>(std::count(is_outlier.begin(), is_outlier.end(), true));
}

OutlierResult classifyOutliers(const Eigen::MatrixXd& points_0,
                               const Eigen::MatrixXd& points_1,
                               double std_coef) {
    checkTwoColumns(points_0, "Source points");
    checkTwoColumns(points_1, "Target points");

    Eigen::Index nb = std::min(points_0.rows(), points_1.rows());
    Eigen::MatrixXd source = points_0.topRows(nb);
    Eigen::MatrixXd target = points_1.topRows(nb);

    AffineEstimate estimate = estimateAffineTransform(source, target);

    OutlierResult result;
    result.residuals = (target - estimate.source_warped).rowwise().norm();
    result.threshold = std_coef * populationStdDev(result.residuals);

    result.is_outlier.resize(static_cast<size_t>(nb));
    for (Eigen::Index i = 0; i < nb; ++i) {
        result.is_outlier[static_cast<size_t>(i)] = result.residuals(i) > result.threshold;
    }

    return result;
}

OutlierResult classifyOutliers(const PointSet& points_0,
                               const PointSet& points_1,
                               double std_coef) {
    return classifyOutliers(points_0.matrix(), points_1.matrix(), std_coef);
}

} // namespace landmark_eval

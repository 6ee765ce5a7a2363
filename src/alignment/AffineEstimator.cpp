/**
 * Affine Alignment
 *
 * Estimates the least-squares affine transform between two 2D landmark sets
 * and warps each set into the other's frame.
 * Used by the outlier classifier and the annotation statistics.
 */

#include "alignment/AffineEstimator.h"
#include <algorithm>

namespace landmark_eval {

namespace {

// Append a column of ones so the transform can translate
Eigen::MatrixXd toHomogeneous(const Eigen::MatrixXd& points) {
    Eigen::MatrixXd padded(points.rows(), 3);
    padded.leftCols(2) = points;
    padded.col(2).setOnes();
    return padded;
}

} // namespace

Eigen::MatrixXd pseudoInverse(const Eigen::MatrixXd& matrix, double rcond) {
    if (matrix.size() == 0) {
        return Eigen::MatrixXd::Zero(matrix.cols(), matrix.rows());
    }

    // SVD: M = U * S * V^T, so pinv(M) = V * S^+ * U^T
    Eigen::JacobiSVD<Eigen::MatrixXd> svd(matrix, Eigen::ComputeThinU | Eigen::ComputeThinV);
    const Eigen::VectorXd& singular = svd.singularValues();

    double cutoff = rcond * singular.maxCoeff();
    Eigen::VectorXd singular_inv = Eigen::VectorXd::Zero(singular.size());
    for (int i = 0; i < singular.size(); ++i) {
        if (singular(i) > cutoff) {
            singular_inv(i) = 1.0 / singular(i);
        }
    }

    return svd.matrixV() * singular_inv.asDiagonal() * svd.matrixU().transpose();
}

Eigen::MatrixXd AffineTransform::apply(const Eigen::MatrixXd& points) const {
    checkTwoColumns(points, "Transformed points");
    return (toHomogeneous(points) * matrix).leftCols(2);
}

Eigen::Matrix3d AffineTransform::pseudoInverse() const {
    return landmark_eval::pseudoInverse(matrix);
}

Eigen::MatrixXd AffineTransform::applyInverse(const Eigen::MatrixXd& points) const {
    checkTwoColumns(points, "Transformed points");
    return (toHomogeneous(points) * pseudoInverse()).leftCols(2);
}

AffineEstimate estimateAffineTransform(
    const Eigen::MatrixXd& source_points,
    const Eigen::MatrixXd& target_points) {

    checkTwoColumns(source_points, "Source points");
    checkTwoColumns(target_points, "Target points");

    // Shorter set decides how many correspondences are used
    Eigen::Index nb = std::min(source_points.rows(), target_points.rows());

    AffineEstimate estimate;
    if (nb == 0) {
        estimate.transform = AffineTransform(Eigen::Matrix3d::Zero());
        estimate.source_warped = Eigen::MatrixXd(0, 2);
        estimate.target_warped = Eigen::MatrixXd(0, 2);
        return estimate;
    }

    Eigen::MatrixXd source = source_points.topRows(nb);
    Eigen::MatrixXd target = target_points.topRows(nb);

    Eigen::MatrixXd X = toHomogeneous(source);
    Eigen::MatrixXd Y = toHomogeneous(target);

    // Solve X * A = Y; SVD gives the minimum-norm solution for rank-deficient X
    Eigen::JacobiSVD<Eigen::MatrixXd> svd(X, Eigen::ComputeThinU | Eigen::ComputeThinV);
    Eigen::Matrix3d A = svd.solve(Y);

    estimate.transform = AffineTransform(A);
    estimate.source_warped = estimate.transform.apply(source);
    estimate.target_warped = estimate.transform.applyInverse(target);

    return estimate;
}

AffineEstimate estimateAffineTransform(
    const PointSet& source_points,
    const PointSet& target_points) {
    return estimateAffineTransform(source_points.matrix(), target_points.matrix());
}

} // namespace landmark_eval

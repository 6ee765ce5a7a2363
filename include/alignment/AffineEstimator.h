#pragma once

#include "landmarks/PointSet.h"
#include <Eigen/Dense>

namespace landmark_eval {

/**
 * 2D affine transform in homogeneous row-vector form:
 *   [x' y' 1] ~= [x y 1] * matrix
 * The last row holds the translation.
 */
struct AffineTransform {
    Eigen::Matrix3d matrix;

    AffineTransform() : matrix(Eigen::Matrix3d::Identity()) {}
    explicit AffineTransform(const Eigen::Matrix3d& m) : matrix(m) {}

    /**
     * Apply transform to points (N x 2 matrix)
     */
    Eigen::MatrixXd apply(const Eigen::MatrixXd& points) const;

    /**
     * Apply the Moore-Penrose pseudo-inverse of the transform to points.
     * Well defined also when the fitted matrix is singular.
     */
    Eigen::MatrixXd applyInverse(const Eigen::MatrixXd& points) const;

    /**
     * SVD based pseudo-inverse of the 3x3 matrix
     */
    Eigen::Matrix3d pseudoInverse() const;
};

/**
 * Result of affine estimation: the transform and both point sets warped
 * into the other's coordinate frame.
 */
struct AffineEstimate {
    AffineTransform transform;
    Eigen::MatrixXd source_warped;  // source mapped by transform (nb x 2)
    Eigen::MatrixXd target_warped;  // target mapped by pseudo-inverse (nb x 2)
};

/**
 * Estimate the least-squares affine transform mapping source onto target.
 *
 * Only the first nb = min(#source, #target) points of each set are used
 * and warped; the rest are ignored. The system X * A = Y is solved with
 * SVD, so collinear or too few points give a minimum-norm solution
 * instead of an error.
 *
 * @param source_points Source 2D points (N x 2 matrix)
 * @param target_points Target 2D points (M x 2 matrix, same order as source)
 * @return Transform and warped point sets
 * @throws DimensionMismatchError if either input is not N x 2
 */
AffineEstimate estimateAffineTransform(
    const Eigen::MatrixXd& source_points,
    const Eigen::MatrixXd& target_points);

/**
 * Overloaded version using point sets
 */
AffineEstimate estimateAffineTransform(
    const PointSet& source_points,
    const PointSet& target_points);

/**
 * Moore-Penrose pseudo-inverse of a general matrix via SVD.
 * Singular values below rcond * max singular value are treated as zero.
 */
Eigen::MatrixXd pseudoInverse(const Eigen::MatrixXd& matrix, double rcond = 1e-15);

} // namespace landmark_eval

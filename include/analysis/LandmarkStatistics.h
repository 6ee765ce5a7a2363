#pragma once

#include "landmarks/PointSet.h"
#include <Eigen/Dense>
#include <map>
#include <string>

namespace landmark_eval {

/**
 * Distribution of landmark errors between a reference and a sensed set,
 * plus the image extent implied by the landmarks themselves.
 */
struct LandmarkStatistics {
    double count = 0.0;
    double mean = 0.0;
    double stddev = 0.0;   // sample standard deviation (n - 1 divisor)
    double min = 0.0;
    double max = 0.0;
    double median = 0.0;
    Eigen::Vector2d image_size = Eigen::Vector2d::Zero();  // max + min over all landmarks
    double image_diagonal = 0.0;

    /**
     * Named view of all values; image_size is split into
     * image_size_x and image_size_y.
     */
    std::map<std::string, double> toMap() const;

    /**
     * Render as a JSON object
     */
    std::string toJSON() const;
};

/**
 * Compute error statistics between reference and sensed landmarks.
 *
 * Errors are Euclidean distances between corresponding points over the
 * common length of both sets, either raw or after affine alignment of the
 * reference onto the sensed set (outlier residuals with std_coef = 5).
 * image_size is the element-wise max plus min over both complete sets.
 *
 * @param landmarks_ref Reference landmarks (N x 2)
 * @param landmarks_in Sensed landmarks (M x 2)
 * @param use_affine Measure errors after affine alignment
 * @throws InvalidInputError if either set is empty
 * @throws DimensionMismatchError if either input is not N x 2
 */
LandmarkStatistics computeLandmarkStatistics(const Eigen::MatrixXd& landmarks_ref,
                                             const Eigen::MatrixXd& landmarks_in,
                                             bool use_affine = false);

/**
 * Overloaded version using point sets
 */
LandmarkStatistics computeLandmarkStatistics(const PointSet& landmarks_ref,
                                             const PointSet& landmarks_in,
                                             bool use_affine = false);

/**
 * Standard deviation with divisor n (NaN for an empty vector)
 */
double populationStdDev(const Eigen::VectorXd& values);

/**
 * Standard deviation with divisor n - 1 (NaN for fewer than 2 values)
 */
double sampleStdDev(const Eigen::VectorXd& values);

/**
 * Middle value, or mean of the two middle values (NaN for an empty vector)
 */
double median(const Eigen::VectorXd& values);

} // namespace landmark_eval

/**
 * Landmark Error Statistics
 *
 * Summarizes distances between two landmark sets (count, mean, std, min,
 * max, median) and the image extent implied by the landmarks.
 * Used by evaluate_annotations to compare each annotator against the consensus.
 */

#include "analysis/LandmarkStatistics.h"
#include "alignment/OutlierClassifier.h"
#include "utils/Errors.h"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <limits>
#include <sstream>
#include <vector>

namespace landmark_eval {

namespace {

double sumSquaredDeviations(const Eigen::VectorXd& values) {
    return (values.array() - values.mean()).square().sum();
}

void writeJSONNumber(std::ostream& out, double value) {
    if (std::isfinite(value)) {
        out << value;
    } else {
        out << "null";
    }
}

} // namespace

double populationStdDev(const Eigen::VectorXd& values) {
    if (values.size() == 0) {
        return std::numeric_limits<double>::quiet_NaN();
    }
    return std::sqrt(sumSquaredDeviations(values) / static_cast<double>(values.size()));
}

double sampleStdDev(const Eigen::VectorXd& values) {
    if (values.size() < 2) {
        return std::numeric_limits<double>::quiet_NaN();
    }
    return std::sqrt(sumSquaredDeviations(values) / static_cast<double>(values.size() - 1));
}

double median(const Eigen::VectorXd& values) {
    if (values.size() == 0) {
        return std::numeric_limits<double>::quiet_NaN();
    }
    std::vector<double> sorted(values.data(), values.data() + values.size());
    std::sort(sorted.begin(), sorted.end());
    size_t mid = sorted.size() / 2;
    if (sorted.size() % 2 == 1) {
        return sorted[mid];
    }
    return 0.5 * (sorted[mid - 1] + sorted[mid]);
}

std::map<std::string, double> LandmarkStatistics::toMap() const {
    std::map<std::string, double> values;
    values["count"] = count;
    values["mean"] = mean;
    values["std"] = stddev;
    values["min"] = min;
    values["max"] = max;
    values["median"] = median;
    values["image_size_x"] = image_size.x();
    values["image_size_y"] = image_size.y();
    values["image_diagonal"] = image_diagonal;
    return values;
}

std::string LandmarkStatistics::toJSON() const {
    std::ostringstream out;
    out << std::setprecision(10);
    out << "{";
    out << "\"count\": "; writeJSONNumber(out, count);
    out << ", \"mean\": "; writeJSONNumber(out, mean);
    out << ", \"std\": "; writeJSONNumber(out, stddev);
    out << ", \"min\": "; writeJSONNumber(out, min);
    out << ", \"max\": "; writeJSONNumber(out, max);
    out << ", \"median\": "; writeJSONNumber(out, median);
    out << ", \"image_size\": [";
    writeJSONNumber(out, image_size.x());
    out << ", ";
    writeJSONNumber(out, image_size.y());
    out << "], \"image_diagonal\": "; writeJSONNumber(out, image_diagonal);
    out << "}";
    return out.str();
}

LandmarkStatistics computeLandmarkStatistics(const Eigen::MatrixXd& landmarks_ref,
                                             const Eigen::MatrixXd& landmarks_in,
                                             bool use_affine) {
    checkTwoColumns(landmarks_ref, "Reference landmarks");
    checkTwoColumns(landmarks_in, "Sensed landmarks");
    if (landmarks_ref.rows() == 0 || landmarks_in.rows() == 0) {
        throw InvalidInputError("Landmark statistics need non-empty reference and sensed landmarks");
    }

    Eigen::VectorXd errors;
    if (use_affine) {
        errors = classifyOutliers(landmarks_ref, landmarks_in).residuals;
    } else {
        Eigen::Index nb = std::min(landmarks_ref.rows(), landmarks_in.rows());
        errors = (landmarks_ref.topRows(nb) - landmarks_in.topRows(nb)).rowwise().norm();
    }

    LandmarkStatistics stats;
    stats.count = static_cast<double>(errors.size());
    stats.mean = errors.mean();
    stats.stddev = sampleStdDev(errors);
    stats.min = errors.minCoeff();
    stats.max = errors.maxCoeff();
    stats.median = median(errors);

    // Extent estimate taken literally as max + min of all landmarks
    Eigen::MatrixXd all(landmarks_ref.rows() + landmarks_in.rows(), 2);
    all << landmarks_ref, landmarks_in;
    stats.image_size = (all.colwise().maxCoeff() + all.colwise().minCoeff()).transpose();
    stats.image_diagonal = stats.image_size.norm();

    return stats;
}

LandmarkStatistics computeLandmarkStatistics(const PointSet& landmarks_ref,
                                             const PointSet& landmarks_in,
                                             bool use_affine) {
    return computeLandmarkStatistics(landmarks_ref.matrix(), landmarks_in.matrix(), use_affine);
}

} // namespace landmark_eval

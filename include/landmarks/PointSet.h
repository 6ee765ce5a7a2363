#pragma once

#include <Eigen/Dense>
#include <string>
#include <vector>

namespace landmark_eval {

/**
 * Ordered set of 2D landmarks placed by one annotator on one image.
 *
 * The position of a point is its correspondence key: point i of one set
 * marks the same feature as point i of any other set of the same image.
 * Sets describing the same image may have different lengths when an
 * annotator skipped trailing points.
 */
class PointSet {
public:
    PointSet() : points_(0, 2), x_label_("X"), y_label_("Y") {}

    /**
     * Wrap an N x 2 matrix of coordinates.
     * @throws DimensionMismatchError if the matrix does not have two columns
     */
    explicit PointSet(const Eigen::MatrixXd& points,
                      const std::string& x_label = "X",
                      const std::string& y_label = "Y");

    /**
     * Load landmarks from CSV file
     * Expected format (index column optional):
     *   ,X,Y
     *   0,120.5,88.0
     *   1,340.0,17.25
     */
    bool loadFromCSV(const std::string& filepath);

    /**
     * Save landmarks to CSV file, with a leading index column
     */
    bool saveToCSV(const std::string& filepath) const;

    /**
     * Add a landmark at the end of the set
     */
    void addPoint(double x, double y);

    /**
     * Get coordinates as N x 2 matrix
     */
    const Eigen::MatrixXd& matrix() const { return points_; }

    /**
     * Get number of landmarks
     */
    size_t size() const { return static_cast<size_t>(points_.rows()); }

    bool empty() const { return points_.rows() == 0; }

    /**
     * Get landmark at index
     */
    Eigen::Vector2d operator[](size_t idx) const {
        return points_.row(static_cast<Eigen::Index>(idx)).transpose();
    }

    /**
     * First n landmarks (all of them if n >= size())
     */
    PointSet head(size_t n) const;

    /**
     * Copy with all coordinates multiplied by factor
     */
    PointSet scaled(double factor) const;

    const std::string& xLabel() const { return x_label_; }
    const std::string& yLabel() const { return y_label_; }

    void setLabels(const std::string& x_label, const std::string& y_label) {
        x_label_ = x_label;
        y_label_ = y_label;
    }

    void clear() { points_.resize(0, 2); }

private:
    Eigen::MatrixXd points_;  // N x 2, one landmark per row
    std::string x_label_;
    std::string y_label_;
};

/**
 * Throws DimensionMismatchError unless points has exactly two columns.
 * @param what Name of the argument, used in the error message
 */
void checkTwoColumns(const Eigen::MatrixXd& points, const std::string& what);

} // namespace landmark_eval

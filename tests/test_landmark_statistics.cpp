/**
 * Landmark Statistics Test
 *
 * Verifies error statistics between two landmark sets, raw and after
 * affine alignment, including the sample std convention and the
 * max + min image extent.
 *
 * Usage:
 *   build/bin/test_landmark_statistics
 */

#include "analysis/LandmarkStatistics.h"
#include "alignment/OutlierClassifier.h"
#include "utils/Errors.h"
#include <iostream>
#include <iomanip>
#include <string>
#include <map>
#include <cmath>

using namespace landmark_eval;

bool check(const std::string& name, double value, double expected, double tol) {
    if (std::abs(value - expected) > tol) {
        std::cerr << "  FAIL: " << name << " = " << std::setprecision(10) << value
                  << ", expected " << expected << std::endl;
        return false;
    }
    return true;
}

int main() {
    Eigen::MatrixXd lnds0(8, 2), lnds1(8, 2);
    lnds0 << 4, 116,
             4, 4,
             26, 4,
             26, 116,
             18, 45,
             0, 0,
             -12, 8,
             1, 1;
    lnds1 << 61, 56,
             61, -56,
             39, -56,
             39, 56,
             47, -15,
             65, -60,
             77, -52,
             0, 0;

    // Test 1: Statistics after affine alignment
    std::cout << "\n--- Test 1: Affine-aligned statistics ---" << std::endl;
    {
        LandmarkStatistics stats = computeLandmarkStatistics(lnds0, lnds1, true);
        bool ok = true;
        ok &= check("count", stats.count, 8.0, 0.0);
        ok &= check("mean", stats.mean, 18.6076, 1e-3);
        ok &= check("std", stats.stddev, 21.4895, 1e-3);
        ok &= check("min", stats.min, 1.0205, 1e-3);
        ok &= check("max", stats.max, 68.9582, 1e-3);
        ok &= check("median", stats.median, 13.5339, 1e-3);
        ok &= check("image_size.x", stats.image_size.x(), 65.0, 1e-12);
        ok &= check("image_size.y", stats.image_size.y(), 56.0, 1e-12);
        ok &= check("image_diagonal", stats.image_diagonal, std::sqrt(65.0 * 65.0 + 56.0 * 56.0), 1e-9);
        if (!ok) return 1;
        std::cout << "  PASS: count 8, mean 18.61, median 13.53, image size [65, 56]" << std::endl;
    }

    // Test 2: Raw statistics without alignment
    std::cout << "\n--- Test 2: Raw statistics ---" << std::endl;
    {
        LandmarkStatistics stats = computeLandmarkStatistics(PointSet(lnds0), PointSet(lnds1));
        bool ok = true;
        ok &= check("count", stats.count, 8.0, 0.0);
        ok &= check("mean", stats.mean, 69.01896597, 1e-6);
        ok &= check("min", stats.min, std::sqrt(2.0), 1e-9);
        ok &= check("median", stats.median, 74.69975684, 1e-6);
        ok &= check("std", stats.stddev, 31.43260066, 1e-6);
        if (!ok) return 1;
        std::cout << "  PASS: mean 69.019 without alignment" << std::endl;
    }

    // Test 3: Sample std of the summary vs population std of the outlier threshold
    std::cout << "\n--- Test 3: Std conventions ---" << std::endl;
    {
        OutlierResult outliers = classifyOutliers(lnds0, lnds1);
        LandmarkStatistics stats = computeLandmarkStatistics(lnds0, lnds1, true);

        double n = static_cast<double>(outliers.residuals.size());
        double population = populationStdDev(outliers.residuals);
        double ratio = stats.stddev / population;
        if (!check("std ratio", ratio, std::sqrt(n / (n - 1.0)), 1e-12)) return 1;
        if (!check("threshold", outliers.threshold, 5.0 * population, 1e-12)) return 1;
        std::cout << "  PASS: std / population std = sqrt(n / (n - 1))" << std::endl;
    }

    // Test 4: Image size is literally max + min, not max - min
    std::cout << "\n--- Test 4: Image size formula ---" << std::endl;
    {
        Eigen::MatrixXd ref(2, 2), sensed(2, 2);
        ref << 10, 20,
               30, 40;
        sensed << 12, 22,
                  100, 5;
        LandmarkStatistics stats = computeLandmarkStatistics(ref, sensed);
        bool ok = true;
        ok &= check("image_size.x", stats.image_size.x(), 110.0, 1e-12);
        ok &= check("image_size.y", stats.image_size.y(), 45.0, 1e-12);
        ok &= check("image_diagonal", stats.image_diagonal, std::sqrt(110.0 * 110.0 + 45.0 * 45.0), 1e-9);
        if (!ok) return 1;
        std::cout << "  PASS: image size [110, 45]" << std::endl;
    }

    // Test 5: Ranges and truncation to the common length
    std::cout << "\n--- Test 5: Range invariants ---" << std::endl;
    {
        LandmarkStatistics stats = computeLandmarkStatistics(lnds0, lnds1.topRows(5));
        if (stats.count != 5.0) {
            std::cerr << "  FAIL: count = " << stats.count << ", expected 5" << std::endl;
            return 1;
        }
        if (!(stats.min >= 0.0 && stats.min <= stats.mean && stats.mean <= stats.max &&
              stats.min <= stats.median && stats.median <= stats.max)) {
            std::cerr << "  FAIL: min <= mean, median <= max violated" << std::endl;
            return 1;
        }
        // Extent still covers all points of both complete sets
        if (!check("image_size.x", stats.image_size.x(), 61.0 + (-12.0), 1e-12)) return 1;

        Eigen::MatrixXd one(1, 2);
        one << 3, 4;
        LandmarkStatistics single = computeLandmarkStatistics(one, Eigen::MatrixXd::Zero(1, 2));
        if (!check("single mean", single.mean, 5.0, 1e-12) || !std::isnan(single.stddev)) {
            std::cerr << "  FAIL: single residual should give mean 5 and undefined std" << std::endl;
            return 1;
        }
        std::cout << "  PASS: count follows common length, min <= mean <= max" << std::endl;
    }

    // Test 6: Empty sets and wrong dimensions are rejected
    std::cout << "\n--- Test 6: Invalid input ---" << std::endl;
    {
        bool empty_thrown = false;
        try {
            computeLandmarkStatistics(Eigen::MatrixXd(0, 2), lnds1);
        } catch (const InvalidInputError&) {
            empty_thrown = true;
        }
        bool dims_thrown = false;
        try {
            computeLandmarkStatistics(lnds0, Eigen::MatrixXd::Zero(8, 3));
        } catch (const DimensionMismatchError&) {
            dims_thrown = true;
        }
        if (!empty_thrown || !dims_thrown) {
            std::cerr << "  FAIL: Expected InvalidInputError and DimensionMismatchError" << std::endl;
            return 1;
        }
        std::cout << "  PASS: Errors raised" << std::endl;
    }

    // Test 7: Named view and JSON
    std::cout << "\n--- Test 7: Map and JSON views ---" << std::endl;
    {
        LandmarkStatistics stats = computeLandmarkStatistics(lnds0, lnds1, true);
        std::map<std::string, double> values = stats.toMap();
        if (values.size() != 9 || values["count"] != 8.0 || values["image_size_x"] != 65.0) {
            std::cerr << "  FAIL: Unexpected map view" << std::endl;
            return 1;
        }
        std::string json = stats.toJSON();
        if (json.find("\"count\": 8") == std::string::npos ||
            json.find("\"image_size\": [65, 56]") == std::string::npos) {
            std::cerr << "  FAIL: Unexpected JSON " << json << std::endl;
            return 1;
        }
        std::cout << "  PASS: " << json << std::endl;
    }

    std::cout << "\n=== Landmark Statistics Test ===" << std::endl;
    std::cout << "RESULT: PASS" << std::endl;
    return 0;
}

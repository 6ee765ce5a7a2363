/**
 * Landmark Consensus
 *
 * Per-position mean over annotations of unequal length.
 * Used by the dataset layer to build one reference set per image.
 */

#include "landmarks/Consensus.h"
#include "utils/Errors.h"

namespace landmark_eval {

PointSet computeConsensus(const std::vector<PointSet>& annotations) {
    if (annotations.empty()) {
        throw InvalidInputError("Consensus needs at least one set of landmarks");
    }

    // Longest set gives the output shape and labels; ties go to the first one
    size_t base = 0;
    for (size_t i = 1; i < annotations.size(); ++i) {
        if (annotations[i].size() > annotations[base].size()) {
            base = i;
        }
    }
    const Eigen::Index length = static_cast<Eigen::Index>(annotations[base].size());

    Eigen::MatrixXd sums = Eigen::MatrixXd::Zero(length, 2);
    Eigen::VectorXd counts = Eigen::VectorXd::Zero(length);

    for (const auto& annotation : annotations) {
        const Eigen::Index n = static_cast<Eigen::Index>(annotation.size());
        sums.topRows(n) += annotation.matrix();
        counts.head(n).array() += 1.0;
    }

    // Every position below the maximal length has at least the base set contributing
    Eigen::MatrixXd mean = (sums.array().colwise() / counts.array()).matrix();

    return PointSet(mean, annotations[base].xLabel(), annotations[base].yLabel());
}

} // namespace landmark_eval

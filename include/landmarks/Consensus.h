#pragma once

#include "landmarks/PointSet.h"
#include <vector>

namespace landmark_eval {

/**
 * Fuse repeated annotations of the same image into one consensus set.
 *
 * Point i of the result is the mean of point i over all inputs that have
 * more than i points, so the result is as long as the longest input and
 * an annotator who skipped trailing points simply does not contribute to
 * them. Column labels are taken from the first longest input.
 *
 * @param annotations Point sets of the same image, in any length
 * @return Consensus point set
 * @throws InvalidInputError if annotations is empty
 */
PointSet computeConsensus(const std::vector<PointSet>& annotations);

} // namespace landmark_eval

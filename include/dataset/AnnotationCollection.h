#pragma once

#include "landmarks/PointSet.h"
#include <map>
#include <string>
#include <vector>

namespace landmark_eval {

/**
 * One annotator's folder of landmark files for one image set,
 * named user-<name>_scale-<N>pc
 */
struct AnnotationFolder {
    std::string path;
    std::string set_name;  // name of the parent folder
    std::string user;
    int scale = -1;        // percent of full image resolution
};

/**
 * Consensus landmarks per image (keyed by landmark file name) together with
 * the number of annotations each consensus was built from
 */
struct ConsensusCollection {
    std::map<std::string, PointSet> landmarks;
    std::map<std::string, int> annotation_counts;
};

/**
 * Landmark files of one annotation folder, loaded at full resolution
 */
struct UserAnnotations {
    AnnotationFolder folder;
    std::map<std::string, PointSet> landmarks;  // keyed by file name
};

/**
 * Recursively find all annotation folders below root, sorted by path
 */
std::vector<AnnotationFolder> collectAnnotationFolders(const std::string& root);

/**
 * Group annotation folders by set name
 */
std::map<std::string, std::vector<AnnotationFolder>> groupBySet(
    const std::vector<AnnotationFolder>& folders);

/**
 * Load all CSV landmark files of a folder and rescale them to full
 * resolution (coordinates divided by scale / 100).
 * Files that fail to load are reported and skipped.
 * @return Landmarks keyed by file name
 */
std::map<std::string, PointSet> loadUserAnnotations(const AnnotationFolder& folder);

/**
 * Load every folder of an image set once, in folder order
 */
std::vector<UserAnnotations> loadSetAnnotations(const std::vector<AnnotationFolder>& folders);

/**
 * Build consensus landmarks over all annotators of an image set.
 *
 * Landmark files with the same name in different folders are annotations
 * of the same image. With equal_size, every consensus set is trimmed to
 * the length of the shortest one.
 */
ConsensusCollection createConsensusLandmarks(const std::vector<AnnotationFolder>& folders,
                                             bool equal_size = true);

// Same as above on annotations that were already loaded
ConsensusCollection createConsensusLandmarks(const std::vector<UserAnnotations>& annotations,
                                             bool equal_size = true);

} // namespace landmark_eval

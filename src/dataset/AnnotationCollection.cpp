/**
 * Annotation Collection
 *
 * Finds annotator folders in the annotation tree, loads their landmark
 * files at full resolution and fuses them into per-image consensus sets.
 * Used by the create_consensus and evaluate_annotations tools.
 */

#include "dataset/AnnotationCollection.h"
#include "landmarks/Consensus.h"
#include "utils/PathUtils.h"
#include <algorithm>
#include <iostream>
#include <cctype>

namespace landmark_eval {

namespace {

bool hasExtension(const std::string& path, const std::string& ext) {
    if (path.size() < ext.size()) return false;
    std::string tail = path.substr(path.size() - ext.size());
    std::transform(tail.begin(), tail.end(), tail.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return tail == ext;
}

void collectRecursive(const std::string& dir, std::vector<AnnotationFolder>& folders) {
    for (const auto& sub_dir : listDirectory(dir, true)) {
        std::pair<std::string, int> user_scale = parseUserScale(sub_dir);
        if (user_scale.second < 0) {
            collectRecursive(sub_dir, folders);
            continue;
        }

        AnnotationFolder folder;
        folder.path = sub_dir;
        folder.set_name = baseName(dir);
        folder.user = user_scale.first;
        folder.scale = user_scale.second;
        folders.push_back(folder);
    }
}

} // namespace

std::vector<AnnotationFolder> collectAnnotationFolders(const std::string& root) {
    std::vector<AnnotationFolder> folders;
    if (!isDirectory(root)) {
        std::cerr << "Annotation folder does not exist: " << root << std::endl;
        return folders;
    }

    collectRecursive(root, folders);
    std::sort(folders.begin(), folders.end(),
              [](const AnnotationFolder& a, const AnnotationFolder& b) { return a.path < b.path; });
    return folders;
}

std::map<std::string, std::vector<AnnotationFolder>> groupBySet(
    const std::vector<AnnotationFolder>& folders) {
    std::map<std::string, std::vector<AnnotationFolder>> sets;
    for (const auto& folder : folders) {
        sets[folder.set_name].push_back(folder);
    }
    return sets;
}

std::map<std::string, PointSet> loadUserAnnotations(const AnnotationFolder& folder) {
    std::map<std::string, PointSet> annotations;
    if (folder.scale <= 0) {
        std::cerr << "Warning: Invalid scale " << folder.scale << " for " << folder.path << std::endl;
        return annotations;
    }

    for (const auto& path : listDirectory(folder.path)) {
        if (!hasExtension(path, ".csv")) continue;

        PointSet landmarks;
        if (!landmarks.loadFromCSV(path)) {
            std::cerr << "Warning: Skipping landmark file " << path << std::endl;
            continue;
        }
        // Landmarks were placed on an image downscaled to scale percent
        annotations[baseName(path)] = landmarks.scaled(100.0 / folder.scale);
    }
    return annotations;
}

std::vector<UserAnnotations> loadSetAnnotations(const std::vector<AnnotationFolder>& folders) {
    std::vector<UserAnnotations> annotations;
    annotations.reserve(folders.size());
    for (const auto& folder : folders) {
        UserAnnotations user;
        user.folder = folder;
        user.landmarks = loadUserAnnotations(folder);
        annotations.push_back(user);
    }
    return annotations;
}

ConsensusCollection createConsensusLandmarks(const std::vector<AnnotationFolder>& folders,
                                             bool equal_size) {
    return createConsensusLandmarks(loadSetAnnotations(folders), equal_size);
}

ConsensusCollection createConsensusLandmarks(const std::vector<UserAnnotations>& annotations,
                                             bool equal_size) {
    std::map<std::string, std::vector<PointSet>> annotations_per_image;
    for (const auto& user : annotations) {
        for (const auto& entry : user.landmarks) {
            annotations_per_image[entry.first].push_back(entry.second);
        }
    }

    ConsensusCollection collection;
    for (const auto& entry : annotations_per_image) {
        collection.annotation_counts[entry.first] = static_cast<int>(entry.second.size());
        collection.landmarks[entry.first] = computeConsensus(entry.second);
    }

    // Take the minimal number of landmarks over the whole set
    if (equal_size && !collection.landmarks.empty()) {
        size_t nb_min = collection.landmarks.begin()->second.size();
        for (const auto& entry : collection.landmarks) {
            nb_min = std::min(nb_min, entry.second.size());
        }
        for (auto& entry : collection.landmarks) {
            entry.second = entry.second.head(nb_min);
        }
    }

    return collection;
}

} // namespace landmark_eval

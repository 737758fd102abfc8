#include "types.hpp"
#include <algorithm>

const char* category_label(Category c) {
    switch (c) {
        case Category::DerivedData:     return "DerivedData";
        case Category::Archives:        return "Archives";
        case Category::CoreSimulator:   return "CoreSimulator";
        case Category::HomebrewCache:   return "Homebrew cache";
        case Category::PythonCache:     return "Python cache";
        case Category::NodeCache:       return "Node cache";
        case Category::CocoaPodsCache:  return "CocoaPods cache";
        case Category::GradleCache:     return "Gradle cache";
        case Category::JetBrainsCache:  return "JetBrains cache";
        case Category::VSCodeCache:     return "VSCode cache";
        case Category::SlackCache:      return "Slack cache";
        case Category::ProjectArtifact: return "Project artifact";
    }
    return "Unknown";
}

const char* category_group(Category c) {
    switch (c) {
        case Category::DerivedData:
        case Category::Archives:
        case Category::CoreSimulator:   return "Xcode";
        case Category::HomebrewCache:   return "Homebrew";
        case Category::PythonCache:     return "Python";
        case Category::NodeCache:       return "Node";
        case Category::CocoaPodsCache:  return "CocoaPods";
        case Category::GradleCache:     return "Gradle";
        case Category::JetBrainsCache:  return "JetBrains";
        case Category::VSCodeCache:     return "VSCode";
        case Category::SlackCache:      return "Slack";
        case Category::ProjectArtifact: return "Project";
    }
    return "Unknown";
}

RetentionPolicy retention_policy(Category c) {
    switch (c) {
        case Category::DerivedData:
        case Category::Archives:
            return RetentionPolicy::KeepLatestDerived;
        case Category::HomebrewCache:
            return RetentionPolicy::KeepLatestCache;
        default:
            return RetentionPolicy::None;
    }
}

size_t DeletionReport::succeeded() const {
    return static_cast<size_t>(std::count_if(outcomes.begin(), outcomes.end(),
        [](const DeletionOutcome& o) { return o.success; }));
}

size_t DeletionReport::failed() const {
    return outcomes.size() - succeeded();
}

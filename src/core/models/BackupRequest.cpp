#include "BackupRequest.hpp"
#include <stdexcept>

BackupRequest::BackupRequest(const std::vector<std::string>& sourceList, const std::string& destRoot,
                             bool archive, bool incrementalEnabled)
    : sources(sourceList), destinationRoot(destRoot), archiveMode(archive),
      incremental(archive ? false : incrementalEnabled) {
    if (sources.size() > MAX_SOURCES) {
        throw std::invalid_argument("At most " + std::to_string(MAX_SOURCES) +
                                    " source directories are supported, got " +
                                    std::to_string(sources.size()));
    }
}

const std::vector<std::string>& BackupRequest::getSources() const {
    return sources;
}

const std::string& BackupRequest::getDestinationRoot() const {
    return destinationRoot;
}

bool BackupRequest::isArchiveMode() const {
    return archiveMode;
}

bool BackupRequest::isIncremental() const {
    return incremental;
}

TransferMode BackupRequest::getMode() const {
    return archiveMode ? TransferMode::ARCHIVE : TransferMode::MIRROR;
}

std::string BackupRequest::describeMode() const {
    if (archiveMode) {
        return "ZIP archive";
    }
    return incremental ? "Incremental mirror" : "Full mirror";
}

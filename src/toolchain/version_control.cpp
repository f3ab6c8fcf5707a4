/**
 * @file version_control.cpp
 * @brief Build identifier from git
 */

#include "version_control.hpp"
#include "logger.hpp"

VersionControl::VersionControl(const ProcessRunner& runner,
                               const std::string& git,
                               const std::string& dirty_suffix)
    : runner_(runner), git_(git), dirty_suffix_(dirty_suffix) {
}

bool VersionControl::describe(const std::string& project_dir, BuildId& build_id) const {
    ProcessResult rev = runner_.run({git_, "rev-parse", "--short", "HEAD"}, project_dir);
    if (!rev.spawned) {
        Logger::error() << "[GIT] ✗ " << rev.error << "\n";
        return false;
    }
    if (rev.exit_code != 0) {
        Logger::error() << "[GIT] ✗ rev-parse failed (exit " << rev.exit_code << "): "
                        << normalizeHash(rev.err) << "\n";
        return false;
    }
    
    build_id.hash = normalizeHash(rev.out);
    if (build_id.hash.empty()) {
        Logger::error() << "[GIT] ✗ rev-parse returned an empty hash\n";
        return false;
    }
    
    ProcessResult status = runner_.run({git_, "status", "--porcelain"}, project_dir);
    if (!status.success()) {
        Logger::error() << "[GIT] ✗ status failed: " << (status.spawned ? status.err : status.error) << "\n";
        return false;
    }
    build_id.dirty = !status.out.empty();
    build_id.version = composeVersion(build_id.hash, build_id.dirty, dirty_suffix_);
    
    Logger::info() << "[GIT] Git hash: " << build_id.version << "\n";
    return true;
}

std::string VersionControl::normalizeHash(const std::string& raw) {
    std::string hash;
    hash.reserve(raw.size());
    for (char c : raw) {
        if (c != ' ' && c != '\t' && c != '\n' && c != '\r') {
            hash.push_back(c);
        }
    }
    return hash;
}

std::string VersionControl::composeVersion(const std::string& hash, bool dirty, const std::string& dirty_suffix) {
    return dirty ? hash + dirty_suffix : hash;
}

/**
 * @file version_control.hpp
 * @brief Build identifier from git (short hash + dirty marker)
 */

#ifndef VERSION_CONTROL_HPP
#define VERSION_CONTROL_HPP

#include <string>
#include "process_runner.hpp"

struct BuildId {
    std::string hash;               /* Short commit hash */
    bool dirty;                     /* Uncommitted changes present */
    std::string version;            /* hash (+ dirty suffix) */
};

class VersionControl {
public:
    VersionControl(const ProcessRunner& runner,
                   const std::string& git = "git",
                   const std::string& dirty_suffix = "-dirty");
    
    /**
     * @brief Describe the checkout containing project_dir
     * @return true if successful
     */
    bool describe(const std::string& project_dir, BuildId& build_id) const;
    
    /**
     * @brief Strip spaces, tabs and newlines from rev-parse output
     */
    static std::string normalizeHash(const std::string& raw);
    
    static std::string composeVersion(const std::string& hash, bool dirty, const std::string& dirty_suffix);

private:
    const ProcessRunner& runner_;
    std::string git_;
    std::string dirty_suffix_;
};

#endif // VERSION_CONTROL_HPP

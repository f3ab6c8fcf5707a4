/**
 * @file project_manifest.hpp
 * @brief Firmware project metadata (cargo metadata JSON)
 */

#ifndef PROJECT_MANIFEST_HPP
#define PROJECT_MANIFEST_HPP

#include <string>
#include <vector>
#include "process_runner.hpp"

struct ProjectManifest {
    std::string name;               /* Package name (also the ELF name) */
    std::string version;            /* Package version from the manifest */
    std::string manifest_path;      /* Path to Cargo.toml */
    std::string target_directory;   /* Cargo target directory */
    std::vector<std::string> dependencies;
    
    /**
     * @brief Any dependency whose name contains the given text
     */
    bool hasDependency(const std::string& needle) const;
    
    /**
     * @brief <target_directory>/<target_triple>/<profile>/<name>
     */
    std::string elfPath(const std::string& target_triple, const std::string& profile) const;
};

/**
 * @brief Reads project metadata through `cargo metadata`
 */
class ManifestReader {
public:
    ManifestReader(const ProcessRunner& runner, const std::string& cargo = "cargo");
    
    /**
     * @brief Read manifest of the project in project_dir
     * @return true if successful
     */
    bool read(const std::string& project_dir, ProjectManifest& manifest) const;
    
    /**
     * @brief Parse `cargo metadata --format-version 1` output
     * 
     * Picks the package whose manifest sits in project_dir, else the first one.
     * 
     * @return true if successful (error describes the failure otherwise)
     */
    static bool parseCargoMetadata(const std::string& json_text,
                                   const std::string& project_dir,
                                   ProjectManifest& manifest,
                                   std::string& error);

private:
    const ProcessRunner& runner_;
    std::string cargo_;
};

#endif // PROJECT_MANIFEST_HPP

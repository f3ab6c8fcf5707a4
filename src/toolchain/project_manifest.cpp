/**
 * @file project_manifest.cpp
 * @brief Firmware project metadata implementation
 */

#include "project_manifest.hpp"
#include "logger.hpp"
#include <climits>
#include <cstdlib>
#include <nlohmann/json.hpp>

namespace {

std::string trimTrailingSlash(const std::string& path) {
    std::string trimmed = path;
    while (trimmed.size() > 1 && trimmed.back() == '/') {
        trimmed.pop_back();
    }
    return trimmed;
}

} // namespace

bool ProjectManifest::hasDependency(const std::string& needle) const {
    for (const auto& dependency : dependencies) {
        if (dependency.find(needle) != std::string::npos) {
            return true;
        }
    }
    return false;
}

std::string ProjectManifest::elfPath(const std::string& target_triple, const std::string& profile) const {
    return trimTrailingSlash(target_directory) + "/" + target_triple + "/" + profile + "/" + name;
}

ManifestReader::ManifestReader(const ProcessRunner& runner, const std::string& cargo)
    : runner_(runner), cargo_(cargo) {
}

bool ManifestReader::read(const std::string& project_dir, ProjectManifest& manifest) const {
    char resolved[PATH_MAX];
    std::string canonical_dir = project_dir;
    if (realpath(project_dir.c_str(), resolved) != nullptr) {
        canonical_dir = resolved;
    }
    
    ProcessResult metadata = runner_.run(
        {cargo_, "metadata", "--format-version", "1", "--no-deps"}, canonical_dir);
    if (!metadata.spawned) {
        Logger::error() << "[CARGO] ✗ " << metadata.error << "\n";
        return false;
    }
    if (metadata.exit_code != 0) {
        Logger::error() << "[CARGO] ✗ cargo metadata failed (exit " << metadata.exit_code << ")\n"
                        << metadata.err;
        return false;
    }
    
    std::string error;
    if (!parseCargoMetadata(metadata.out, canonical_dir, manifest, error)) {
        Logger::error() << "[CARGO] ✗ " << error << "\n";
        return false;
    }
    
    Logger::info() << "[CARGO] Project name: " << manifest.name << " (v" << manifest.version << ")\n";
    return true;
}

bool ManifestReader::parseCargoMetadata(const std::string& json_text,
                                        const std::string& project_dir,
                                        ProjectManifest& manifest,
                                        std::string& error) {
    nlohmann::json metadata;
    try {
        metadata = nlohmann::json::parse(json_text);
    } catch (const std::exception& e) {
        error = std::string("invalid cargo metadata: ") + e.what();
        return false;
    }
    
    if (!metadata.is_object() || !metadata.contains("packages") || !metadata["packages"].is_array()) {
        error = "cargo metadata has no package list";
        return false;
    }
    const nlohmann::json& packages = metadata["packages"];
    if (packages.empty()) {
        error = "cargo metadata lists no packages";
        return false;
    }
    
    try {
        // Prefer the package defined by <project_dir>/Cargo.toml (workspaces list several)
        const std::string expected_manifest = trimTrailingSlash(project_dir) + "/Cargo.toml";
        const nlohmann::json* package = &packages.front();
        for (const auto& candidate : packages) {
            if (candidate.value("manifest_path", "") == expected_manifest) {
                package = &candidate;
                break;
            }
        }
    
        if (!package->contains("name") || !(*package)["name"].is_string()) {
            error = "package entry has no name";
            return false;
        }
    
        manifest.name = (*package)["name"].get<std::string>();
        manifest.version = package->value("version", "");
        manifest.manifest_path = package->value("manifest_path", "");
        manifest.target_directory = metadata.value("target_directory", trimTrailingSlash(project_dir) + "/target");
    
        manifest.dependencies.clear();
        if (package->contains("dependencies") && (*package)["dependencies"].is_array()) {
            for (const auto& dependency : (*package)["dependencies"]) {
                if (dependency.is_object() && dependency.contains("name") && dependency["name"].is_string()) {
                    manifest.dependencies.push_back(dependency["name"].get<std::string>());
                }
            }
        }
    } catch (const nlohmann::json::exception& e) {
        error = std::string("unexpected cargo metadata layout: ") + e.what();
        return false;
    }
    
    return true;
}

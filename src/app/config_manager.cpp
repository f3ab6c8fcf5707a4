/**
 * @file config_manager.cpp
 * @brief Configuration Management Module Implementation
 */

#include "config_manager.hpp"
#include "logger.hpp"
#include <fstream>

namespace {

enum class KeyType { STRING, BOOLEAN };

struct KnownKey {
    const char* section;
    const char* key;
    KeyType type;
};

const KnownKey kKnownKeys[] = {
    {"toolchain", "objcopy",             KeyType::STRING},
    {"toolchain", "input_target",        KeyType::STRING},
    {"toolchain", "output_target",       KeyType::STRING},
    {"build",     "target_triple",       KeyType::STRING},
    {"build",     "profile",             KeyType::STRING},
    {"build",     "required_dependency", KeyType::STRING},
    {"build",     "cargo",               KeyType::STRING},
    {"vcs",       "git",                 KeyType::STRING},
    {"vcs",       "dirty_suffix",        KeyType::STRING},
    {"output",    "directory",           KeyType::STRING},
    {"output",    "temp_file",           KeyType::STRING},
    {"logging",   "level",               KeyType::STRING},
    {"logging",   "console_output",      KeyType::BOOLEAN},
};

} // namespace

ConfigManager::ConfigManager(const std::string& config_file, bool required)
    : config_file_(config_file), required_(required), config_(nlohmann::json::object()), loaded_(false) {
}

bool ConfigManager::load() {
    std::ifstream file(config_file_);
    if (!file.is_open()) {
        if (required_) {
            Logger::error() << "[CONFIG] Failed to open: " << config_file_ << std::endl;
            return false;
        }
        Logger::debug() << "[CONFIG] " << config_file_ << " not found, using defaults" << std::endl;
        config_ = nlohmann::json::object();
        loaded_ = true;
        return true;
    }
    
    try {
        nlohmann::json parsed;
        file >> parsed;
        if (!apply(parsed)) {
            return false;
        }
        Logger::debug() << "[CONFIG] ✓ Loaded from " << config_file_ << std::endl;
        return true;
    } catch (const std::exception& e) {
        Logger::error() << "[CONFIG] Parse error: " << e.what() << std::endl;
        return false;
    }
}

bool ConfigManager::loadFromString(const std::string& text) {
    try {
        return apply(nlohmann::json::parse(text));
    } catch (const std::exception& e) {
        Logger::error() << "[CONFIG] Parse error: " << e.what() << std::endl;
        return false;
    }
}

bool ConfigManager::apply(const nlohmann::json& parsed) {
    if (!parsed.is_object()) {
        Logger::error() << "[CONFIG] Top level of " << config_file_ << " must be a JSON object" << std::endl;
        return false;
    }
    config_ = parsed;
    loaded_ = true;
    reportTypeErrors();
    return true;
}

void ConfigManager::reportTypeErrors() const {
    for (const auto& known : kKnownKeys) {
        const nlohmann::json* value = find(known.section, known.key);
        if (value == nullptr) {
            continue;
        }
        bool ok = (known.type == KeyType::STRING) ? value->is_string() : value->is_boolean();
        if (!ok) {
            Logger::warn() << "[CONFIG] " << known.section << "." << known.key << " must be a "
                           << (known.type == KeyType::STRING ? "string" : "boolean")
                           << ", using default" << std::endl;
        }
    }
}

// ========================================
// Toolchain Configuration
// ========================================

std::string ConfigManager::getObjcopy() const {
    return getString("toolchain", "objcopy", DEFAULT_OBJCOPY);
}

std::string ConfigManager::getObjcopyInputTarget() const {
    return getString("toolchain", "input_target", DEFAULT_OBJCOPY_INPUT_TARGET);
}

std::string ConfigManager::getObjcopyOutputTarget() const {
    return getString("toolchain", "output_target", DEFAULT_OBJCOPY_OUTPUT_TARGET);
}

// ========================================
// Build Configuration
// ========================================

std::string ConfigManager::getTargetTriple() const {
    return getString("build", "target_triple", DEFAULT_TARGET_TRIPLE);
}

std::string ConfigManager::getBuildProfile() const {
    return getString("build", "profile", DEFAULT_BUILD_PROFILE);
}

std::string ConfigManager::getRequiredDependency() const {
    return getString("build", "required_dependency", DEFAULT_REQUIRED_DEPENDENCY);
}

std::string ConfigManager::getCargo() const {
    return getString("build", "cargo", DEFAULT_CARGO);
}

// ========================================
// Version Control Configuration
// ========================================

std::string ConfigManager::getGit() const {
    return getString("vcs", "git", DEFAULT_GIT);
}

std::string ConfigManager::getDirtySuffix() const {
    return getString("vcs", "dirty_suffix", DEFAULT_DIRTY_SUFFIX);
}

// ========================================
// Output Configuration
// ========================================

std::string ConfigManager::getOutputDirectory() const {
    return getString("output", "directory", "");
}

std::string ConfigManager::getTempFileName() const {
    return getString("output", "temp_file", DEFAULT_TEMP_FILE);
}

// ========================================
// Logging Configuration
// ========================================

std::string ConfigManager::getLogLevel() const {
    return getString("logging", "level", DEFAULT_LOG_LEVEL);
}

bool ConfigManager::isConsoleOutputEnabled() const {
    return getBool("logging", "console_output", true);
}

// ========================================
// Helper Functions
// ========================================

const nlohmann::json* ConfigManager::find(const char* section, const char* key) const {
    auto section_it = config_.find(section);
    if (section_it == config_.end() || !section_it->is_object()) {
        return nullptr;
    }
    auto key_it = section_it->find(key);
    if (key_it == section_it->end()) {
        return nullptr;
    }
    return &(*key_it);
}

std::string ConfigManager::getString(const char* section, const char* key, const std::string& fallback) const {
    const nlohmann::json* value = find(section, key);
    if (value == nullptr || !value->is_string()) {
        return fallback;
    }
    return value->get<std::string>();
}

bool ConfigManager::getBool(const char* section, const char* key, bool fallback) const {
    const nlohmann::json* value = find(section, key);
    if (value == nullptr || !value->is_boolean()) {
        return fallback;
    }
    return value->get<bool>();
}

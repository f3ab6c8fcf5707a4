/**
 * @file config_manager.hpp
 * @brief Configuration Management Module
 * 
 * Loads OTA packer settings from a JSON file. Every key is optional;
 * missing or wrong-typed keys fall back to the defaults below.
 */

#ifndef CONFIG_MANAGER_HPP
#define CONFIG_MANAGER_HPP

#include <string>
#include <nlohmann/json.hpp>

// ==================== Defaults ====================

#define DEFAULT_CONFIG_FILE             "ota_packer.json"

#define DEFAULT_OBJCOPY                 "arm-none-eabi-objcopy"
#define DEFAULT_OBJCOPY_INPUT_TARGET    "elf32-littlearm"
#define DEFAULT_OBJCOPY_OUTPUT_TARGET   "binary"
#define DEFAULT_TARGET_TRIPLE           "thumbv7em-none-eabihf"
#define DEFAULT_BUILD_PROFILE           "release"
#define DEFAULT_REQUIRED_DEPENDENCY     "embassy"
#define DEFAULT_CARGO                   "cargo"
#define DEFAULT_GIT                     "git"
#define DEFAULT_DIRTY_SUFFIX            "-dirty"
#define DEFAULT_TEMP_FILE               "xstd-app-tool-temp.bin"
#define DEFAULT_LOG_LEVEL               "info"

/**
 * @brief Configuration Manager Class
 */
class ConfigManager {
public:
    /**
     * @brief Constructor
     * @param config_file Path to the JSON config
     * @param required When false a missing file means "use defaults"
     */
    explicit ConfigManager(const std::string& config_file = DEFAULT_CONFIG_FILE, bool required = false);
    
    /**
     * @brief Load configuration from file
     * @return true if successful, false otherwise
     */
    bool load();
    
    /**
     * @brief Load configuration from a JSON string
     */
    bool loadFromString(const std::string& text);
    
    /**
     * @brief Check if configuration is loaded
     */
    bool isLoaded() const { return loaded_; }
    
    // ========================================
    // Toolchain Configuration
    // ========================================
    
    std::string getObjcopy() const;
    std::string getObjcopyInputTarget() const;
    std::string getObjcopyOutputTarget() const;
    
    // ========================================
    // Build Configuration
    // ========================================
    
    std::string getTargetTriple() const;
    std::string getBuildProfile() const;
    std::string getRequiredDependency() const;
    std::string getCargo() const;
    
    // ========================================
    // Version Control Configuration
    // ========================================
    
    std::string getGit() const;
    std::string getDirtySuffix() const;
    
    // ========================================
    // Output Configuration
    // ========================================
    
    std::string getOutputDirectory() const;
    std::string getTempFileName() const;
    
    // ========================================
    // Logging Configuration
    // ========================================
    
    std::string getLogLevel() const;
    bool isConsoleOutputEnabled() const;
    
    // ========================================
    // Raw JSON Access (for advanced use)
    // ========================================
    
    const nlohmann::json& getRawConfig() const { return config_; }

private:
    std::string config_file_;
    bool required_;
    nlohmann::json config_;
    bool loaded_;
    
    bool apply(const nlohmann::json& parsed);
    void reportTypeErrors() const;
    
    const nlohmann::json* find(const char* section, const char* key) const;
    std::string getString(const char* section, const char* key, const std::string& fallback) const;
    bool getBool(const char* section, const char* key, bool fallback) const;
};

#endif // CONFIG_MANAGER_HPP

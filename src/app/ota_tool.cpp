/**
 * @file ota_tool.cpp
 * @brief OTA Tool Implementation
 */

#include "ota_tool.hpp"
#include "firmware_extractor.hpp"
#include "logger.hpp"
#include "project_manifest.hpp"
#include "version_control.hpp"
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <iterator>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>
#include <nlohmann/json.hpp>

OtaTool::OtaTool(const ConfigManager& config)
    : config_(config) {
}

// ==================== Encode ====================

bool OtaTool::encode(const std::string& project_dir) {
    struct stat st;
    if (stat(project_dir.c_str(), &st) != 0 || !S_ISDIR(st.st_mode)) {
        Logger::error() << "[OTA] ✗ Project directory does not exist: " << project_dir << "\n";
        return false;
    }
    
    // 1. Project metadata
    ManifestReader manifest_reader(runner_, config_.getCargo());
    ProjectManifest manifest;
    if (!manifest_reader.read(project_dir, manifest)) {
        return false;
    }
    
    const std::string required = config_.getRequiredDependency();
    if (!required.empty() && !manifest.hasDependency(required)) {
        Logger::error() << "[OTA] ✗ Cargo.toml does not seem to depend on " << required
                        << ", are you sure this is an embedded project?\n";
        return false;
    }
    
    // 2. Linked firmware
    const std::string elf_path = manifest.elfPath(config_.getTargetTriple(), config_.getBuildProfile());
    if (stat(elf_path.c_str(), &st) != 0) {
        Logger::error() << "[OTA] ✗ ELF file does not exist: " << elf_path
                        << ". Did you run cargo build --" << config_.getBuildProfile() << " first?\n";
        return false;
    }
    
    // 3. Build id
    VersionControl vcs(runner_, config_.getGit(), config_.getDirtySuffix());
    BuildId build_id;
    if (!vcs.describe(project_dir, build_id)) {
        return false;
    }
    
    // 4. Raw firmware
    FirmwareExtractor extractor(config_, runner_);
    std::vector<uint8_t> firmware;
    if (!extractor.extract(elf_path, project_dir, firmware)) {
        return false;
    }
    
    // 5. OTA image
    std::string output_dir = config_.getOutputDirectory();
    if (output_dir.empty()) {
        output_dir = project_dir;
    }
    const std::string output_path = output_dir + "/" + outputFileName(manifest.name, build_id.version);
    
    return encodeFirmware(manifest.name, build_id.version, firmware, output_path);
}

bool OtaTool::encodeFirmware(const std::string& project_name, const std::string& version,
                             const std::vector<uint8_t>& firmware, const std::string& output_path) {
    OtaPackageBuilder builder(project_name, version);
    OtaEncodeResult result = builder.build(firmware);
    if (!result.success) {
        Logger::error() << "[OTA] ✗ " << otaErrorToString(result.error) << " (" << result.field
                        << "): " << result.message << "\n";
        return false;
    }
    
    if (Logger::enabled(LogLevel::LOG_DEBUG)) {
        printHeader(result.header);
    }
    
    if (!writeFile(output_path, result.image)) {
        return false;
    }
    
    Logger::info() << "[OTA] ✓ Created OTA bin file at " << output_path << " ("
                   << result.image.size() << " bytes, CRC 0x" << std::hex << std::uppercase
                   << result.header.crc << std::dec << std::nouppercase << ")\n";
    return true;
}

// ==================== Decode ====================

bool OtaTool::decode(const std::string& file_path, bool json_output) {
    std::vector<uint8_t> image;
    if (!readFile(file_path, image)) {
        return false;
    }
    
    OtaPackageParser parser(image);
    OtaDecodeResult result = parser.decode();
    if (!result.success) {
        Logger::error() << "[OTA] ✗ " << otaErrorToString(result.error) << ": " << result.message << "\n";
        return false;
    }
    
    const OtaSummary& summary = result.summary;
    if (summary.firmware_size != summary.payload_length) {
        Logger::warn() << "[OTA] ⚠️  Header size " << summary.firmware_size << " does not match the "
                       << summary.payload_length << " firmware bytes in the file\n";
    }
    
    PayloadDigest digest;
    if (!calculatePayloadDigest(parser.firmware(), parser.firmwareSize(), digest)) {
        Logger::error() << "[OTA] ✗ Failed to calculate firmware digest\n";
        return false;
    }
    
    if (json_output) {
        std::cout << summaryToJson(summary, digest) << std::endl;
    } else {
        printSummary(summary, digest);
    }
    return true;
}

// ==================== Helper Functions ====================

std::string OtaTool::outputFileName(const std::string& project_name, const std::string& version) {
    return project_name + "-" + version + "-ota.bin";
}

std::string OtaTool::summaryToJson(const OtaSummary& summary, const PayloadDigest& digest) {
    nlohmann::json j;
    j["project_name"] = summary.project_name;
    j["version"] = summary.version;
    j["timestamp"] = summary.timestamp;
    j["created_at"] = summary.build_time;
    j["firmware_size"] = summary.firmware_size;
    j["payload_length"] = summary.payload_length;
    j["crc16"] = summary.crc;
    j["crc32"] = digest.crc32;
    j["sha256"] = digest.sha256_hex;
    return j.dump(2);
}

bool OtaTool::readFile(const std::string& path, std::vector<uint8_t>& data) const {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        Logger::error() << "[OTA] ✗ Failed to open " << path << "\n";
        return false;
    }
    
    data.assign(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
    if (file.bad()) {
        Logger::error() << "[OTA] ✗ Failed to read " << path << "\n";
        return false;
    }
    return true;
}

bool OtaTool::writeFile(const std::string& path, const std::vector<uint8_t>& data) const {
    int fd = open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644);
    if (fd < 0) {
        Logger::error() << "[OTA] ✗ Failed to create " << path << ": " << std::strerror(errno) << "\n";
        return false;
    }
    
    size_t written = 0;
    while (written < data.size()) {
        ssize_t n = write(fd, data.data() + written, data.size() - written);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            Logger::error() << "[OTA] ✗ Failed to write " << path << ": " << std::strerror(errno) << "\n";
            close(fd);
            std::remove(path.c_str());
            return false;
        }
        written += static_cast<size_t>(n);
    }
    
    if (fsync(fd) != 0 || close(fd) != 0) {
        Logger::error() << "[OTA] ✗ Failed to flush " << path << ": " << std::strerror(errno) << "\n";
        std::remove(path.c_str());
        return false;
    }
    return true;
}

void OtaTool::printSummary(const OtaSummary& summary, const PayloadDigest& digest) const {
    std::ostream& out = std::cout;
    std::ios::fmtflags flags = out.flags();
    std::streamsize precision = out.precision();
    
    out << "\n";
    out << "========================================\n";
    out << "  Valid OTA Bin File!\n";
    out << "========================================\n";
    out << "Project Name:  " << summary.project_name << "\n";
    out << "Version:       " << summary.version << "\n";
    out << "Created at:    " << summary.build_time << "\n";
    out << "Firmware Size: " << summary.firmware_size << "B ("
        << std::fixed << std::setprecision(2) << (summary.firmware_size / 1024.0) << "KB)\n";
    out << "CRC16:         0x" << std::hex << std::uppercase << summary.crc << "\n";
    out << "CRC32:         0x" << std::setw(8) << std::setfill('0') << digest.crc32
        << std::dec << std::nouppercase << std::setfill(' ') << "\n";
    out << "SHA256:        " << digest.sha256_hex << "\n";
    out << "========================================\n\n";
    
    out.flags(flags);
    out.precision(precision);
}

void OtaTool::printHeader(const OtaHeader& header) const {
    std::ostream& out = Logger::debug();
    out << "[OTA] OTA head:\n";
    out << "[OTA]   magic_word:   0x" << std::hex << std::uppercase << header.magic_word << "\n";
    out << "[OTA]   crc:          0x" << header.crc << std::dec << std::nouppercase << "\n";
    out << "[OTA]   version:      " << otaFieldToString(header.version, OTA_VERSION_SIZE) << "\n";
    out << "[OTA]   project_name: " << otaFieldToString(header.project_name, OTA_PROJECT_NAME_SIZE) << "\n";
    out << "[OTA]   timestamp:    " << header.timestamp << " ("
        << OtaPackageParser::formatBuildTime(header.timestamp) << ")\n";
    out << "[OTA]   size:         " << header.size << "\n";
}

#include "io/result_writer.hpp"
#include "io/geojson_writer.hpp"
#include "io/result_serializer.hpp"
#include <fstream>
#include <iostream>
#include <boost/filesystem.hpp>
namespace fs = boost::filesystem;

namespace evindex {
namespace io {

ResultWriter::ResultWriter(const ResultWriterConfig& config)
    : config_(config) {
}

bool ResultWriter::writeJson(const nlohmann::json& document) {
    if (config_.output_file_path.empty()) {
        last_error_ = "No output file path configured";
        return false;
    }
    if (!ensureParentDirectory()) {
        return false;
    }

    std::ofstream file(config_.output_file_path);
    if (!file.is_open()) {
        last_error_ = "Failed to open file for writing: " + config_.output_file_path;
        return false;
    }

    file << document.dump(config_.indent) << std::endl;
    file.close();
    if (file.fail()) {
        last_error_ = "Error writing file " + config_.output_file_path;
        return false;
    }

    std::cout << "Results written to: " << config_.output_file_path << std::endl;
    return true;
}

bool ResultWriter::writeCoverage(const std::vector<analytics::CoverageAreaRow>& rows) {
    if (config_.output_file_path.empty()) {
        last_error_ = "No output file path configured";
        return false;
    }

    if (!GeoJSONWriter::writeToFile(coverageToDataset(rows), config_.output_file_path)) {
        last_error_ = GeoJSONWriter::getLastError();
        return false;
    }

    std::cout << "Wrote " << rows.size() << " coverage areas to: " << config_.output_file_path << std::endl;
    return true;
}

bool ResultWriter::ensureParentDirectory() {
    try {
        fs::path parent = fs::path(config_.output_file_path).parent_path();
        if (!parent.empty() && !fs::exists(parent)) {
            fs::create_directories(parent);
        }
        return true;
    } catch (const fs::filesystem_error& e) {
        last_error_ = "Failed to create output directory: " + std::string(e.what());
        return false;
    }
}

} // namespace io
} // namespace evindex

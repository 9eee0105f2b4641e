#ifndef EVINDEX_RESULT_WRITER_HPP
#define EVINDEX_RESULT_WRITER_HPP

#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "analytics/analytics_engine.hpp"

namespace evindex {
namespace io {

/**
 * Configuration for query result output
 */
struct ResultWriterConfig {
    std::string output_file_path;   // Output file path (JSON, or GeoJSON for coverage)
    int indent;                     // JSON indentation, negative for compact output

    ResultWriterConfig() : indent(2) {}
};

/**
 * Writes query results to disk
 */
class ResultWriter {
public:
    explicit ResultWriter(const ResultWriterConfig& config);
    ~ResultWriter() = default;

    // Disable copy constructor and assignment
    ResultWriter(const ResultWriter&) = delete;
    ResultWriter& operator=(const ResultWriter&) = delete;

    /**
     * Write a JSON document
     * @param document Query response or row array
     * @return true if successful, false otherwise
     */
    bool writeJson(const nlohmann::json& document);

    /**
     * Write coverage hulls as a GeoJSON FeatureCollection in EPSG:4326
     * @return true if successful, false otherwise
     */
    bool writeCoverage(const std::vector<analytics::CoverageAreaRow>& rows);

    std::string getLastError() const { return last_error_; }

    void clearError() { last_error_.clear(); }

private:
    ResultWriterConfig config_;
    std::string last_error_;

    bool ensureParentDirectory();
};

} // namespace io
} // namespace evindex

#endif // EVINDEX_RESULT_WRITER_HPP

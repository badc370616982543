#ifndef MAGNETMESH_SERIALIZATION_JSON_SERIALIZATION_HPP
#define MAGNETMESH_SERIALIZATION_JSON_SERIALIZATION_HPP

#include <common/errors.hpp>

#include <nlohmann/json.hpp>
#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <string>

namespace magnetmesh::json {

// Reports sharing the major number are readable by this version
constexpr const char* REPORT_FORMAT_VERSION = "1.0";

// Envelope written around the outcome of one pipeline run
struct Report {
    std::string version = REPORT_FORMAT_VERSION;
    std::string pipeline;      // compile, sector, rotate or interchange
    std::string model;
    std::string created_at;
    std::string source_file;
    nlohmann::json config;
    nlohmann::json stats;
    nlohmann::json data;
};

inline std::string major_version(const std::string& version) {
    return version.substr(0, version.find('.'));
}

inline void to_json(nlohmann::json& j, const Report& report) {
    j = {
        {"version", report.version},
        {"pipeline", report.pipeline},
        {"model", report.model},
        {"data", report.data}
    };
    if (!report.created_at.empty()) j["created_at"] = report.created_at;
    if (!report.source_file.empty()) j["source_file"] = report.source_file;
    if (!report.config.is_null()) j["config"] = report.config;
    if (!report.stats.is_null()) j["stats"] = report.stats;
}

inline void from_json(const nlohmann::json& j, Report& report) {
    report.version = j.value("version", "");
    if (major_version(report.version) != major_version(REPORT_FORMAT_VERSION)) {
        throw ValidationError("unsupported report version '" + report.version + "'");
    }
    report.pipeline = j.value("pipeline", "");
    report.model = j.value("model", "");
    report.created_at = j.value("created_at", "");
    report.source_file = j.value("source_file", "");
    report.config = j.value("config", nlohmann::json());
    report.stats = j.value("stats", nlohmann::json());
    report.data = j.value("data", nlohmann::json());
}

// UTC time in ISO 8601
inline std::string utc_timestamp() {
    const std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm utc{};
    gmtime_r(&now, &utc);
    std::ostringstream oss;
    oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

inline void write_json_file(const std::string& path, const nlohmann::json& j) {
    std::ofstream file(path);
    if (!file) {
        throw Error("cannot write " + path);
    }
    file << j.dump(2) << '\n';
}

// Parse errors become ValidationError naming the file
inline nlohmann::json read_json_file(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw Error("cannot open " + path);
    }
    try {
        return nlohmann::json::parse(file);
    } catch (const nlohmann::json::parse_error& e) {
        throw ValidationError("malformed JSON in " + path + ": " + e.what());
    }
}

inline void write_report(const std::string& path, const Report& report) {
    write_json_file(path, report);
}

inline Report read_report(const std::string& path) {
    return read_json_file(path).get<Report>();
}

}  // namespace magnetmesh::json

#endif // MAGNETMESH_SERIALIZATION_JSON_SERIALIZATION_HPP

// src/combine_result.cpp
#include "combine_result.hpp"
#include <chrono>
#include <ctime>
#include <fstream>
#include <stdexcept> // For std::runtime_error

#include "combine_errors.hpp"

namespace fs = std::filesystem;

namespace ChunkCombiner {
namespace Report {

CombineResult::CombineResult(fs::path output_path,
                             uint64_t total_bytes,
                             std::string md5,
                             std::string sha256,
                             std::vector<std::string> chunk_names,
                             std::string created_at)
    : output_path(std::move(output_path)),
      total_bytes(total_bytes),
      md5_hex(std::move(md5)),
      sha256_hex(std::move(sha256)),
      chunk_names(std::move(chunk_names)),
      created_at(std::move(created_at))
{
}

std::string CombineResult::currentTimestamp() {
    auto now = std::chrono::system_clock::now();
    std::time_t now_c = std::chrono::system_clock::to_time_t(now);
    std::tm utc{};
    gmtime_r(&now_c, &utc);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &utc);
    return buf;
}

// Helpers so nlohmann/json can convert CombineResult implicitly
void to_json(nlohmann::json& j, const CombineResult& result) {
    j = nlohmann::json{
        {"output", result.outputPath().string()},
        {"size", result.totalBytes()},
        {"md5", result.md5()},
        {"sha256", result.sha256()},
        {"chunks", result.chunkNames()},
        {"created_at", result.createdAt()}
    };
}

void from_json(const nlohmann::json& j, CombineResult& result) {
    result.output_path = fs::path(j.at("output").get<std::string>());
    j.at("size").get_to(result.total_bytes);
    j.at("md5").get_to(result.md5_hex);
    j.at("sha256").get_to(result.sha256_hex);
    j.at("chunks").get_to(result.chunk_names);
    j.at("created_at").get_to(result.created_at);
}

nlohmann::json CombineResult::toJson() const {
    return *this; // Uses the to_json helper function
}

CombineResult CombineResult::fromJson(const nlohmann::json& j) {
    CombineResult result;
    j.get_to(result); // Uses the from_json helper function
    return result;
}

void CombineResult::save(const fs::path& report_path) const {
    std::ofstream ofs(report_path);
    if (!ofs.is_open()) {
        throw IOFailure("Failed to open file for writing report: " + report_path.string());
    }
    ofs << toJson().dump(4) << '\n'; // Pretty print with 4 spaces
    ofs.close();
    if (!ofs) {
        throw IOFailure("Failed to write all data to report file: " + report_path.string());
    }
}

CombineResult CombineResult::load(const fs::path& report_path) {
    std::ifstream ifs(report_path);
    if (!ifs.is_open()) {
        throw IOFailure("Failed to open report file for reading: " + report_path.string());
    }

    nlohmann::json j;
    try {
        ifs >> j;
        return fromJson(j);
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error("Error parsing JSON report file " + report_path.string() + ": " + e.what());
    }
}

} // namespace Report
} // namespace ChunkCombiner

// include/combine_result.hpp
#pragma once

#include <string>
#include <vector>
#include <filesystem>
#include <cstdint>

#include <nlohmann/json.hpp> // For JSON handling

namespace ChunkCombiner
{
    namespace Report
    {

        // Outcome of one combine run. Immutable once constructed.
        class CombineResult
        {
        public:
            CombineResult(std::filesystem::path output_path,
                          uint64_t total_bytes,
                          std::string md5,
                          std::string sha256,
                          std::vector<std::string> chunk_names,
                          std::string created_at = currentTimestamp());

            const std::filesystem::path &outputPath() const { return output_path; }
            uint64_t totalBytes() const { return total_bytes; }
            const std::string &md5() const { return md5_hex; }
            const std::string &sha256() const { return sha256_hex; }
            const std::vector<std::string> &chunkNames() const { return chunk_names; }
            const std::string &createdAt() const { return created_at; }

            nlohmann::json toJson() const;
            static CombineResult fromJson(const nlohmann::json &j);

            // Write the report as pretty-printed JSON, replacing any existing file.
            void save(const std::filesystem::path &report_path) const;

            static CombineResult load(const std::filesystem::path &report_path);

            // Current UTC time as "YYYY-MM-DDTHH:MM:SSZ"
            static std::string currentTimestamp();

        private:
            // Only for from_json, which fills every field.
            CombineResult() : total_bytes(0) {}
            friend void from_json(const nlohmann::json &j, CombineResult &result);

            std::filesystem::path output_path;
            uint64_t total_bytes;
            std::string md5_hex;
            std::string sha256_hex;
            std::vector<std::string> chunk_names; // In concatenation order
            std::string created_at;
        };

        // nlohmann/json ADL hooks; toJson/fromJson go through these.
        void to_json(nlohmann::json &j, const CombineResult &result);
        void from_json(const nlohmann::json &j, CombineResult &result);

    } // namespace Report
} // namespace ChunkCombiner

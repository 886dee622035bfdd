// src/console_reporter.cpp
#include "console_reporter.hpp"
#include "combine_config.hpp"
#include <algorithm>
#include <iomanip>
#include <sstream>

namespace fs = std::filesystem;

namespace ChunkCombiner
{
    namespace Console
    {

        std::string formatMegabytes(uint64_t bytes)
        {
            std::ostringstream ss;
            ss << std::fixed << std::setprecision(2)
               << static_cast<double>(bytes) / static_cast<double>(Config::CombineConfig::BYTES_PER_MB);
            return ss.str();
        }

        std::string formatWithSeparators(uint64_t value)
        {
            std::string digits = std::to_string(value);
            std::string out;
            out.reserve(digits.size() + digits.size() / 3);
            size_t lead = digits.size() % 3;
            for (size_t i = 0; i < digits.size(); ++i)
            {
                if (i != 0 && (i - lead) % 3 == 0)
                {
                    out.push_back(',');
                }
                out.push_back(digits[i]);
            }
            return out;
        }

        void printChunkList(std::ostream &out, const Chunks::ChunkSet &chunk_set)
        {
            out << "Found " << chunk_set.chunks.size() << " chunk(s):" << std::endl;
            for (const fs::path &chunk : chunk_set.chunks)
            {
                out << "  " << chunk.filename().string() << std::endl;
            }
            out << std::endl;
        }

        void printPlan(std::ostream &out, size_t chunk_count, const fs::path &output_path, uint64_t total_bytes)
        {
            out << "Combining " << chunk_count << " chunks into: " << output_path.string() << std::endl;
            out << "Total size: " << formatMegabytes(total_bytes) << " MB" << std::endl;
            out << std::endl;
        }

        void printSummary(std::ostream &out, const Report::CombineResult &result)
        {
            out << std::endl;
            out << "Done! Output: " << result.outputPath().string() << std::endl;
            out << "  Size:   " << formatWithSeparators(result.totalBytes()) << " bytes" << std::endl;
            out << "  MD5:    " << result.md5() << std::endl;
            out << "  SHA256: " << result.sha256() << std::endl;
        }

        bool confirmOverwrite(std::istream &in, std::ostream &out, const fs::path &output_path)
        {
            out << "Output file '" << output_path.string() << "' already exists. Overwrite? [y/N]: " << std::flush;
            std::string answer;
            if (!std::getline(in, answer))
            {
                return false;
            }
            const auto &yes = Config::CombineConfig::AFFIRMATIVE_ANSWERS;
            return std::find(yes.begin(), yes.end(), answer) != yes.end();
        }

        void ProgressPrinter::operator()(const CombineProgress &progress)
        {
            if (progress.chunk_started)
            {
                finish();
                out << "  [" << progress.chunk_index << "/" << progress.chunk_count << "] "
                    << progress.chunk_name << " (" << formatMegabytes(progress.chunk_size) << " MB)" << std::endl;
                return;
            }
            out << "\r    Progress: " << std::fixed << std::setprecision(2) << std::setw(6)
                << progress.fraction() * 100.0 << "%" << std::flush;
            line_open = true;
        }

        void ProgressPrinter::finish()
        {
            if (line_open)
            {
                out << std::endl;
                line_open = false;
            }
        }

        ProgressListener ProgressPrinter::listener()
        {
            return [this](const CombineProgress &progress) { (*this)(progress); };
        }

    } // namespace Console
} // namespace ChunkCombiner

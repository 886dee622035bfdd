// include/console_reporter.hpp
#pragma once

#include <string>
#include <iostream>
#include <filesystem>
#include <cstdint>

#include "chunk_resolver.hpp"
#include "combine_result.hpp"
#include "stream_combiner.hpp"

namespace ChunkCombiner
{
    namespace Console
    {

        // "12.34" for a byte count expressed in MB
        std::string formatMegabytes(uint64_t bytes);

        // "1,234,567"
        std::string formatWithSeparators(uint64_t value);

        void printChunkList(std::ostream &out, const Chunks::ChunkSet &chunk_set);

        void printPlan(std::ostream &out, size_t chunk_count, const std::filesystem::path &output_path,
                       uint64_t total_bytes);

        void printSummary(std::ostream &out, const Report::CombineResult &result);

        // Ask before clobbering an existing output. Only "y" or "Y" counts as yes;
        // end of input counts as no.
        bool confirmOverwrite(std::istream &in, std::ostream &out, const std::filesystem::path &output_path);

        // Turns combiner progress events into a per-chunk header plus a
        // carriage-return-refreshed percentage line.
        class ProgressPrinter
        {
        public:
            explicit ProgressPrinter(std::ostream &out) : out(out), line_open(false) {}

            void operator()(const CombineProgress &progress);

            // Terminate the last progress line.
            void finish();

            ProgressListener listener();

        private:
            std::ostream &out;
            bool line_open;
        };

    } // namespace Console
} // namespace ChunkCombiner

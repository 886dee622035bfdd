// src/combine_app.cpp
#include "combine_app.hpp"
#include "chunk_resolver.hpp"
#include "cli_options.hpp"
#include "combine_config.hpp"
#include "combine_errors.hpp"
#include "console_reporter.hpp"
#include "stream_combiner.hpp"
#include <filesystem>

namespace fs = std::filesystem;

namespace ChunkCombiner
{

    namespace
    {
        int combineWithOptions(const Cli::CliOptions &options, std::istream &in, std::ostream &out)
        {
            Chunks::ChunkSet chunk_set = Chunks::ChunkResolver::resolve(options.input);

            fs::path output_path = options.output.empty()
                                       ? Chunks::ChunkResolver::deriveOutputName(chunk_set.chunks.front())
                                       : fs::absolute(options.output);

            Console::printChunkList(out, chunk_set);

            if (fs::exists(output_path) && !options.assume_yes)
            {
                if (!Console::confirmOverwrite(in, out, output_path))
                {
                    out << "Aborted." << std::endl;
                    return EXIT_OK;
                }
            }

            Console::printPlan(out, chunk_set.chunks.size(), output_path,
                               StreamCombiner::totalSize(chunk_set));

            Console::ProgressPrinter printer(out);
            Report::CombineResult result = StreamCombiner::combine(
                chunk_set, output_path,
                Config::CombineConfig::bufferBytesFromMegabytes(options.buffer_size_mb),
                printer.listener());
            printer.finish();

            Console::printSummary(out, result);

            if (!options.report.empty())
            {
                result.save(options.report);
                out << "  Report: " << options.report << std::endl;
            }
            return EXIT_OK;
        }
    } // namespace

    int runCombine(const std::vector<std::string> &args, std::istream &in, std::ostream &out, std::ostream &err)
    {
        const std::string program = args.empty() ? "chunk-combine" : fs::path(args.front()).filename().string();

        Cli::CliOptions options;
        try
        {
            options = Cli::parseArguments(args);
        }
        catch (const UsageError &e)
        {
            err << "Error: " << e.what() << std::endl;
            err << Cli::usage(program);
            return EXIT_USAGE;
        }

        if (options.show_help)
        {
            out << Cli::usage(program);
            return EXIT_OK;
        }

        try
        {
            return combineWithOptions(options, in, out);
        }
        catch (const CombineError &e)
        {
            out << std::endl;
            err << "Error: " << e.what() << std::endl;
            return EXIT_FAILED;
        }
        catch (const std::exception &e)
        {
            out << std::endl;
            err << "Error: " << e.what() << std::endl;
            return EXIT_FAILED;
        }
    }

} // namespace ChunkCombiner

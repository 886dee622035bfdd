// src/cli_options.cpp
#include "cli_options.hpp"
#include "combine_config.hpp"
#include <getopt.h>
#include <cerrno>
#include <cstdlib>
#include <sstream>

namespace ChunkCombiner
{
    namespace Cli
    {

        namespace
        {
            size_t parseMegabytes(const std::string &text)
            {
                if (text.empty() || text.find_first_not_of("0123456789") != std::string::npos)
                {
                    throw UsageError("Buffer size must be a positive whole number of MB, got '" + text + "'.");
                }
                errno = 0;
                unsigned long long value = std::strtoull(text.c_str(), nullptr, 10);
                if (errno == ERANGE || value == 0)
                {
                    throw UsageError("Buffer size must be a positive whole number of MB, got '" + text + "'.");
                }
                try
                {
                    Config::CombineConfig::bufferBytesFromMegabytes(static_cast<size_t>(value));
                }
                catch (const std::invalid_argument &e)
                {
                    throw UsageError(e.what());
                }
                return static_cast<size_t>(value);
            }
        } // namespace

        CliOptions parseArguments(const std::vector<std::string> &args)
        {
            CliOptions options;
            options.buffer_size_mb = Config::CombineConfig::DEFAULT_BUFFER_SIZE_MB;

            // getopt_long wants a mutable, null-terminated argv.
            std::vector<std::string> storage(args);
            if (storage.empty())
            {
                storage.push_back("chunk-combine");
            }
            std::vector<char *> argv;
            for (std::string &arg : storage)
            {
                argv.push_back(&arg[0]);
            }
            argv.push_back(nullptr);
            int argc = static_cast<int>(storage.size());

            static const struct option long_options[] = {
                {"output", required_argument, nullptr, 'o'},
                {"buffer-size", required_argument, nullptr, 'b'},
                {"report", required_argument, nullptr, 'r'},
                {"yes", no_argument, nullptr, 'y'},
                {"help", no_argument, nullptr, 'h'},
                {nullptr, 0, nullptr, 0}};

            optind = 0; // Full reset, so parsing can run more than once per process
            opterr = 0;
            int c;
            while ((c = getopt_long(argc, argv.data(), ":o:b:r:yh", long_options, nullptr)) != -1)
            {
                switch (c)
                {
                case 'o':
                    options.output = optarg;
                    break;
                case 'b':
                    options.buffer_size_mb = parseMegabytes(optarg);
                    break;
                case 'r':
                    options.report = optarg;
                    break;
                case 'y':
                    options.assume_yes = true;
                    break;
                case 'h':
                    options.show_help = true;
                    return options;
                case ':':
                    throw UsageError("Option '" + std::string(argv[optind - 1]) + "' requires an argument.");
                default:
                    if (optopt != 0)
                    {
                        throw UsageError("Unknown option '-" + std::string(1, static_cast<char>(optopt)) + "'.");
                    }
                    throw UsageError("Unknown option '" + std::string(argv[optind - 1]) + "'.");
                }
            }

            if (optind >= argc)
            {
                throw UsageError("Missing path to a chunk file.");
            }
            if (argc - optind > 1)
            {
                throw UsageError("Expected exactly one chunk file, got " + std::to_string(argc - optind) + ".");
            }
            options.input = argv[optind];
            return options;
        }

        std::string usage(const std::string &program_name)
        {
            std::ostringstream ss;
            ss << "Usage: " << program_name << " [-o OUTPUT] [-b MB] [-r REPORT] [-y] <chunk_file>\n"
               << "\n"
               << "Combine chunked files (e.g. backup.tar.gz.001) into a single file.\n"
               << "Recognized suffixes: .001, .aa, .part1, .chunk1\n"
               << "\n"
               << "  -o, --output PATH       Output file path (default: chunk name without its suffix)\n"
               << "  -b, --buffer-size MB    Read buffer size in MB (default: "
               << Config::CombineConfig::DEFAULT_BUFFER_SIZE_MB << ")\n"
               << "  -r, --report PATH       Also write size and digests as JSON to PATH\n"
               << "  -y, --yes               Overwrite an existing output without asking\n"
               << "  -h, --help              Show this help\n";
            return ss.str();
        }

    } // namespace Cli
} // namespace ChunkCombiner

// include/combine_errors.hpp
#pragma once

#include <string>
#include <stdexcept> // For std::runtime_error

namespace ChunkCombiner
{

    // Base of every failure that ends a run.
    class CombineError : public std::runtime_error
    {
    public:
        explicit CombineError(const std::string &message) : std::runtime_error(message) {}
    };

    // The reference filename carries none of the known chunk suffixes.
    class UnrecognizedSuffix : public CombineError
    {
    public:
        explicit UnrecognizedSuffix(const std::string &message) : CombineError(message) {}
    };

    // A base name was inferred but no sibling chunk matched it.
    class NoChunksFound : public CombineError
    {
    public:
        explicit NoChunksFound(const std::string &message) : CombineError(message) {}
    };

    // A read or write failed while combining. The partial output is left in place.
    class IOFailure : public CombineError
    {
    public:
        explicit IOFailure(const std::string &message) : CombineError(message) {}
    };

    // Malformed command line.
    class UsageError : public CombineError
    {
    public:
        explicit UsageError(const std::string &message) : CombineError(message) {}
    };

} // namespace ChunkCombiner

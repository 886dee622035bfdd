// include/naming_convention.hpp
#pragma once

#include <string>
#include <vector>
#include <utility>  // For std::pair
#include <optional>
#include <cstddef>

namespace ChunkCombiner
{
    namespace Naming
    {

        // The closed set of suffix shapes a chunk name can carry.
        enum class Convention
        {
            Numeric, // file.001
            Alpha,   // file.aa (split's default suffix)
            Part,    // file.part1
            Chunk    // file.chunk1
        };

        // Sort key for one suffix: (significant digit count, digits) for the numbered
        // conventions, (0, raw suffix) for Alpha. Comparing keys with operator<
        // yields the concatenation order.
        using OrderKey = std::pair<size_t, std::string>;

        // One entry of the dispatch table: how a convention recognizes and orders suffixes.
        struct ConventionRule
        {
            Convention convention;
            const char *name;
            bool (*matches)(const std::string &suffix);
            OrderKey (*orderKey)(const std::string &suffix);
        };

        // All rules, in matching priority order: Numeric, Alpha, Part, Chunk.
        // The shapes are mutually exclusive, so at most one rule accepts a given suffix.
        const std::vector<ConventionRule> &conventionRules();

        const ConventionRule &ruleFor(Convention convention);

        // Human-readable convention name ("numeric", "alpha", "part", "chunk").
        std::string conventionName(Convention convention);

        // Examples of every accepted suffix, for error messages.
        std::string expectedPatterns();

        // The convention whose shape `suffix` (the text after the final '.') has, if any.
        std::optional<Convention> classifySuffix(const std::string &suffix);

        // Split "<base>.<suffix>" at the final '.', if the suffix has a known shape
        // and the base is not empty.
        struct SplitName
        {
            std::string base;
            std::string suffix;
            Convention convention;
        };
        std::optional<SplitName> splitChunkName(const std::string &filename);

        // Strict-weak ordering of two suffixes of the same convention.
        // Equal numeric values fall back to the raw suffix so "1" and "01" still order deterministically.
        bool suffixLess(Convention convention, const std::string &lhs, const std::string &rhs);

    } // namespace Naming
} // namespace ChunkCombiner

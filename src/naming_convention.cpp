// src/naming_convention.cpp
#include "naming_convention.hpp"
#include <algorithm>
#include <stdexcept>

namespace ChunkCombiner
{
    namespace Naming
    {

        namespace
        {
            const std::string PART_LABEL = "part";
            const std::string CHUNK_LABEL = "chunk";

            bool isDigit(char c) { return c >= '0' && c <= '9'; }
            bool isLowerAlpha(char c) { return c >= 'a' && c <= 'z'; }

            bool allDigits(const std::string &text, size_t from)
            {
                if (from >= text.size())
                {
                    return false;
                }
                return std::all_of(text.begin() + from, text.end(), isDigit);
            }

            bool hasLabel(const std::string &suffix, const std::string &label)
            {
                return suffix.compare(0, label.size(), label) == 0 && allDigits(suffix, label.size());
            }

            // Digits with leading zeros dropped, keyed by their count so that
            // arbitrarily long numbers compare by value without overflow.
            OrderKey numberKey(const std::string &suffix, size_t from)
            {
                size_t first = suffix.find_first_not_of('0', from);
                std::string digits = (first == std::string::npos) ? std::string() : suffix.substr(first);
                return OrderKey(digits.size(), digits);
            }

            bool matchesNumeric(const std::string &suffix) { return allDigits(suffix, 0); }

            // split's alphabetic suffixes: "aa".."yz", then widened by two letters
            // behind each extra leading 'z' ("zaaa".."zyzz", "zzaaaa", ...).
            bool matchesAlpha(const std::string &suffix)
            {
                if (suffix.size() < 2 || suffix.size() % 2 != 0)
                {
                    return false;
                }
                if (!std::all_of(suffix.begin(), suffix.end(), isLowerAlpha))
                {
                    return false;
                }
                size_t leading_z = (suffix.size() - 2) / 2;
                return suffix.find_first_not_of('z') >= leading_z;
            }

            bool matchesPart(const std::string &suffix) { return hasLabel(suffix, PART_LABEL); }
            bool matchesChunk(const std::string &suffix) { return hasLabel(suffix, CHUNK_LABEL); }

            OrderKey numericKey(const std::string &suffix) { return numberKey(suffix, 0); }
            OrderKey alphaKey(const std::string &suffix) { return OrderKey(0, suffix); }
            OrderKey partKey(const std::string &suffix) { return numberKey(suffix, PART_LABEL.size()); }
            OrderKey chunkKey(const std::string &suffix) { return numberKey(suffix, CHUNK_LABEL.size()); }
        } // namespace

        const std::vector<ConventionRule> &conventionRules()
        {
            static const std::vector<ConventionRule> rules = {
                {Convention::Numeric, "numeric", matchesNumeric, numericKey},
                {Convention::Alpha, "alpha", matchesAlpha, alphaKey},
                {Convention::Part, "part", matchesPart, partKey},
                {Convention::Chunk, "chunk", matchesChunk, chunkKey},
            };
            return rules;
        }

        const ConventionRule &ruleFor(Convention convention)
        {
            for (const auto &rule : conventionRules())
            {
                if (rule.convention == convention)
                {
                    return rule;
                }
            }
            throw std::logic_error("No rule registered for naming convention.");
        }

        std::string conventionName(Convention convention)
        {
            return ruleFor(convention).name;
        }

        std::string expectedPatterns()
        {
            return ".001, .aa, .part1, .chunk1";
        }

        std::optional<Convention> classifySuffix(const std::string &suffix)
        {
            for (const auto &rule : conventionRules())
            {
                if (rule.matches(suffix))
                {
                    return rule.convention;
                }
            }
            return std::nullopt;
        }

        std::optional<SplitName> splitChunkName(const std::string &filename)
        {
            size_t dot = filename.rfind('.');
            if (dot == std::string::npos || dot == 0)
            {
                return std::nullopt;
            }

            std::string suffix = filename.substr(dot + 1);
            std::optional<Convention> convention = classifySuffix(suffix);
            if (!convention)
            {
                return std::nullopt;
            }
            return SplitName{filename.substr(0, dot), suffix, *convention};
        }

        bool suffixLess(Convention convention, const std::string &lhs, const std::string &rhs)
        {
            const ConventionRule &rule = ruleFor(convention);
            OrderKey lhs_key = rule.orderKey(lhs);
            OrderKey rhs_key = rule.orderKey(rhs);
            if (lhs_key != rhs_key)
            {
                return lhs_key < rhs_key;
            }
            return lhs < rhs;
        }

    } // namespace Naming
} // namespace ChunkCombiner

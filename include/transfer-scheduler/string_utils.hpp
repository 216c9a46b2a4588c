#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace TransferScheduler
{

/**
 * String helpers shared by the logger, the config layer and the demo CLI
 */
class StringUtils
{
    public:
    /**
     * ASCII lower-casing, used for case-insensitive option values
     * @param str Input string
     * @return Lower-cased copy
     */
    static std::string toLower(std::string_view str);

    /**
     * Strip leading and trailing whitespace
     */
    static std::string trim(std::string_view str);

    /**
     * Split on a single delimiter, keeping empty fields
     */
    static std::vector<std::string> split(std::string_view str, char delimiter);

    /**
     * Parse a non-negative decimal integer
     * @param str Candidate string
     * @return The value, or std::nullopt if the string is not entirely a number
     */
    static std::optional<std::uint64_t> parseUnsigned(std::string_view str);

    /**
     * Get next command-line argument safely
     * @param argv Command-line arguments array
     * @param index Current argument index (will be incremented)
     * @param argc Total argument count
     * @return Next argument, or nullptr if no more arguments
     */
    static const char *getNextArg(char *argv[], int &index, int argc);

    /**
     * Human-readable byte count ("1.50 MB")
     */
    static std::string formatBytes(std::uint64_t bytes);
};

} // namespace TransferScheduler

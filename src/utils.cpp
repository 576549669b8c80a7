#include "beach/utils.hpp"

#include <sstream>

namespace Beach {

/**
 * @brief Concatenates items with `separator` between them.
 */
std::string joinList(const std::vector<std::string>& items, const std::string& separator)
{
    std::string joined;

    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) {
            joined += separator;
        }
        joined += items[i];
    }
    return joined;
}

/**
 * @brief Splits `input` on `delimiter`, skipping empty tokens.
 */
std::vector<std::string> splitList(const std::string& input, char delimiter)
{
    std::vector<std::string> items;
    std::istringstream iss(input);
    std::string token;

    while (std::getline(iss, token, delimiter)) {
        if (!token.empty()) {
            items.push_back(token);
        }
    }
    return items;
}

std::string shellQuote(const std::string& word)
{
    if (word.empty()) {
        return "''";
    }

    static const std::string safeChars =
        "abcdefghijklmnopqrstuvwxyz"
        "ABCDEFGHIJKLMNOPQRSTUVWXYZ"
        "0123456789"
        "_@%+=:,./-";

    if (word.find_first_not_of(safeChars) == std::string::npos) {
        return word;
    }

    // Close the quote, emit an escaped quote, reopen
    std::string quoted = "'";
    for (char c : word) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    quoted += "'";
    return quoted;
}

} // namespace Beach

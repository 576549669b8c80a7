#ifndef BEACH_UTILS_HPP
#define BEACH_UTILS_HPP

#include <string>
#include <vector>
#include <ostream>
#include <iostream>

// ANSI color codes for console output.
#define BEACH_COLOR_RESET "\033[0m"
#define BEACH_COLOR_INFO  "\033[32m"
#define BEACH_COLOR_WARN  "\033[33m"
#define BEACH_COLOR_ERROR "\033[31m"

namespace Beach {

/**
 * @brief Logs an informational message to standard error with green coloring.
 *
 * @param message The message to log.
 */
inline void log_message(const std::string &message)
{
    std::cerr << BEACH_COLOR_INFO << "[INFO] " << BEACH_COLOR_RESET << message << std::endl;
}

/**
 * @brief Logs a warning message to standard error with yellow coloring.
 *
 * @param message The warning message to log.
 */
inline void log_warning(const std::string &message)
{
    std::cerr << BEACH_COLOR_WARN << "[WARN] " << BEACH_COLOR_RESET << message << std::endl;
}

/**
 * @brief Logs an error message to standard error with red coloring.
 *
 * @param message The error message to log.
 */
inline void log_error(const std::string &message)
{
    std::cerr << BEACH_COLOR_ERROR << "[ERROR] " << BEACH_COLOR_RESET << message << std::endl;
}

// ---------------------------------------------------------------------------
// String helpers
// ---------------------------------------------------------------------------

/**
 * @brief Joins the items with the given separator, keeping order and duplicates.
 *
 * @param items     The strings to join.
 * @param separator Placed between consecutive items.
 * @return The joined string; empty if there are no items.
 */
std::string joinList(const std::vector<std::string>& items, const std::string& separator);

/**
 * @brief Splits a delimited list such as "wheel,docker".
 *
 * Empty items (",," or a trailing ',') are dropped.
 *
 * @param input     The list to split.
 * @param delimiter The separating character.
 * @return The non-empty items in input order.
 */
std::vector<std::string> splitList(const std::string& input, char delimiter = ',');

/**
 * @brief Quotes a single word for a POSIX shell.
 *
 * Words consisting only of safe characters are returned unchanged.
 */
std::string shellQuote(const std::string& word);

} // namespace Beach

#endif // BEACH_UTILS_HPP

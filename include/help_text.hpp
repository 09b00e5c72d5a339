#ifndef HELP_TEXT_HPP
#define HELP_TEXT_HPP

#include <ostream>

/**
 * @brief Print usage and the option table grouped by category.
 *
 * @param os   Destination stream.
 * @param prog Program name shown in the usage line.
 */
void print_help(std::ostream& os, const char* prog);

#endif // HELP_TEXT_HPP

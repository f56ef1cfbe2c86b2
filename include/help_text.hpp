#ifndef HELP_TEXT_HPP
#define HELP_TEXT_HPP
#include <iosfwd>

/** @brief Print usage and the option table to @p out. */
void print_help(const char* prog, std::ostream& out);

/** @brief Print the one-line usage synopsis to @p out. */
void print_usage(const char* prog, std::ostream& out);

#endif // HELP_TEXT_HPP

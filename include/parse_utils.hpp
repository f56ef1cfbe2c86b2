#ifndef PARSE_UTILS_HPP
#define PARSE_UTILS_HPP

#include <cstddef>
#include <string>

// Parse an unsigned integer from a string.
// Format: decimal digits only.
// Bounds: inclusive [min, max].
// Invalid input: conversion failure or out-of-range sets ok=false and returns 0.
unsigned int parse_uint(const std::string& value, unsigned int min, unsigned int max, bool& ok);

// Parse a size_t from a string.
// Format: decimal digits only.
// Bounds: inclusive [min, max].
// Invalid input: conversion failure or out-of-range sets ok=false and returns 0.
size_t parse_size_t(const std::string& value, size_t min, size_t max, bool& ok);

// Parse byte size with optional unit suffix.
// Format: decimal digits followed by an optional K, M or G (case-insensitive,
// optional trailing B). Units are powers of 1024.
// Invalid input: conversion failure, unknown suffix or overflow sets ok=false
// and returns 0.
size_t parse_bytes(const std::string& value, bool& ok);

// Interpret a config value as a boolean switch.
// Empty, "1", "true", "yes" and "on" (any case) count as set.
bool parse_bool_value(const std::string& value);

#endif // PARSE_UTILS_HPP

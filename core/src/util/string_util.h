#pragma once

#include <string>
#include <string_view>

namespace sqlfrag::util {

/// Converts a string to uppercase for case-insensitive type-name matching.
/// MUST avoid locale-sensitive behavior to keep output deterministic.
std::string to_upper(const std::string& s);
/// Trims leading and trailing ASCII whitespace.
/// MUST preserve internal whitespace and MUST not modify the input.
std::string trim_ws(const std::string& s);
/// Tests whether text matches [A-Za-z_][A-Za-z0-9_]*.
bool is_identifier(std::string_view text);

}  // namespace sqlfrag::util

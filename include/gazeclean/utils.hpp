#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace gazeclean {

std::string trim(const std::string& s);

// Remove a UTF-8 BOM (0xEF,0xBB,0xBF) from the beginning of a string if present.
// Some recorder exports emit a BOM, which breaks header parsing if not removed.
std::string strip_utf8_bom(std::string s);

std::vector<std::string> split(const std::string& s, char delim);

// Split a comma-separated list ("pup_l, pup_r") into trimmed, non-empty items.
std::vector<std::string> split_list(const std::string& s);

// Split a single CSV row into fields.
//
// Supports the common RFC-4180 behaviors (quoted fields, "" escapes) for
// single-line rows. Returned fields are unquoted and unescaped.
std::vector<std::string> split_csv_row(const std::string& row, char delim);

std::string to_lower(std::string s);

bool ends_with(const std::string& s, const std::string& suffix);

// Strict numeric parsing helpers.
//
// These trim surrounding whitespace and then require that the entire remaining
// string is a valid number. Parsing uses the classic "C" locale; a single
// decimal comma ("0,5") is accepted when no '.' is present.
int to_int(const std::string& s);
double to_double(const std::string& s);

void ensure_directory(const std::string& path);

// ISO-8601 UTC timestamp, e.g. 2026-01-15T18:37:42Z (best-effort).
std::string now_string_utc();

} // namespace gazeclean

#include "gazeclean/utils.hpp"

#include <algorithm>
#include <cctype>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <locale>
#include <sstream>
#include <stdexcept>

namespace gazeclean {

static inline bool is_space(char c) {
  return std::isspace(static_cast<unsigned char>(c)) != 0;
}

std::string trim(const std::string& s) {
  size_t b = 0;
  while (b < s.size() && is_space(s[b])) ++b;
  size_t e = s.size();
  while (e > b && is_space(s[e - 1])) --e;
  return s.substr(b, e - b);
}

std::string strip_utf8_bom(std::string s) {
  if (s.size() >= 3) {
    const unsigned char b0 = static_cast<unsigned char>(s[0]);
    const unsigned char b1 = static_cast<unsigned char>(s[1]);
    const unsigned char b2 = static_cast<unsigned char>(s[2]);
    if (b0 == 0xEF && b1 == 0xBB && b2 == 0xBF) {
      return s.substr(3);
    }
  }
  return s;
}

std::vector<std::string> split(const std::string& s, char delim) {
  std::vector<std::string> out;
  std::stringstream ss(s);
  std::string item;
  while (std::getline(ss, item, delim)) {
    out.push_back(item);
  }
  // Handle trailing empty field
  if (!s.empty() && s.back() == delim) out.emplace_back("");
  return out;
}

std::vector<std::string> split_list(const std::string& s) {
  std::vector<std::string> out;
  for (const auto& item : split(s, ',')) {
    const std::string t = trim(item);
    if (!t.empty()) out.push_back(t);
  }
  return out;
}

std::vector<std::string> split_csv_row(const std::string& row, char delim) {
  std::vector<std::string> out;
  std::string field;
  field.reserve(row.size());

  bool in_quotes = false;
  bool after_closing_quote = false;

  for (size_t i = 0; i < row.size(); ++i) {
    const char c = row[i];

    // getline() strips '\n' but not the '\r' of Windows line endings.
    if (!in_quotes && c == '\r') continue;

    if (in_quotes) {
      if (c == '"') {
        if ((i + 1) < row.size() && row[i + 1] == '"') {
          field.push_back('"');
          ++i;
        } else {
          in_quotes = false;
          after_closing_quote = true;
        }
      } else {
        field.push_back(c);
      }
      continue;
    }

    if (after_closing_quote) {
      // Tolerate whitespace between a closing quote and the delimiter.
      if (c == delim) {
        out.push_back(field);
        field.clear();
        after_closing_quote = false;
        continue;
      }
      if (is_space(c)) continue;
      after_closing_quote = false;
      field.push_back(c);
      continue;
    }

    if (c == delim) {
      out.push_back(field);
      field.clear();
      continue;
    }

    if (c == '"' && trim(field).empty()) {
      field.clear();
      in_quotes = true;
      continue;
    }

    field.push_back(c);
  }

  if (in_quotes) {
    throw std::runtime_error("split_csv_row: unterminated quoted field");
  }

  out.push_back(field);
  return out;
}

std::string to_lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

bool ends_with(const std::string& s, const std::string& suffix) {
  return s.size() >= suffix.size() &&
         s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

int to_int(const std::string& s) {
  try {
    const std::string t = trim(s);
    size_t idx = 0;
    const int v = std::stoi(t, &idx, 10);
    if (idx == 0) throw std::invalid_argument("no digits");
    if (idx != t.size()) throw std::invalid_argument("trailing characters");
    return v;
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to parse int from '" + s + "': " + e.what());
  }
}

double to_double(const std::string& s) {
  try {
    const std::string t = trim(s);
    if (t.empty()) throw std::invalid_argument("empty");

    auto parse_classic = [](const std::string& x, double* out) -> bool {
      if (!out) return false;
      std::istringstream iss(x);
      iss.imbue(std::locale::classic());
      double v = 0.0;
      iss >> v;
      if (!iss) return false;
      iss >> std::ws;
      if (!iss.eof()) return false;
      *out = v;
      return true;
    };

    double v = 0.0;
    if (parse_classic(t, &v)) return v;

    // Decimal comma ("0,5"): stod would silently parse "0", so either parse it
    // properly or fail.
    if (t.find('.') == std::string::npos) {
      const size_t cpos = t.find(',');
      if (cpos != std::string::npos && t.find(',', cpos + 1) == std::string::npos) {
        std::string tc = t;
        tc[cpos] = '.';
        if (parse_classic(tc, &v)) return v;
      }
    }

    throw std::invalid_argument("invalid");
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to parse double from '" + s + "': " + e.what());
  }
}

void ensure_directory(const std::string& path) {
  if (path.empty()) return;
  std::filesystem::create_directories(std::filesystem::u8path(path));
}

std::string now_string_utc() {
  const std::time_t t = std::time(nullptr);

  std::tm tm{};
#if defined(_WIN32)
  if (gmtime_s(&tm, &t) != 0) return std::string();
#else
  if (gmtime_r(&t, &tm) == nullptr) return std::string();
#endif

  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
  return oss.str();
}

} // namespace gazeclean

#include "util.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>
#include <string>
#include <vector>

std::string trim(std::string s) {
  auto notspace = [](int ch){ return !std::isspace(ch); };
  s.erase(s.begin(), std::find_if(s.begin(), s.end(), notspace));
  s.erase(std::find_if(s.rbegin(), s.rend(), notspace).base(), s.end());
  return s;
}

std::string to_lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
  return s;
}

std::vector<std::string> split(const std::string &line) {
  std::istringstream iss(line);
  std::vector<std::string> out;
  std::string tok;
  while (iss >> tok) out.push_back(tok);
  return out;
}

std::string resource_label(uint32_t resource_id) {
  return "R" + std::to_string(resource_id);
}

std::string join_ids(const std::vector<uint32_t> &ids, const std::string &prefix) {
  std::ostringstream oss;
  for (size_t i = 0; i < ids.size(); ++i) {
    if (i > 0) oss << ", ";
    oss << prefix << ids[i];
  }
  return oss.str();
}

static std::vector<std::string> split_lines(const std::string &s) {
  std::vector<std::string> lines;
  std::istringstream iss(s);
  std::string line;
  while (std::getline(iss, line)) lines.push_back(line);
  return lines;
}

// Wrap long lines so both columns stay aligned
static std::vector<std::string> wrap_paragraph(const std::vector<std::string> &lines, size_t width) {
  std::vector<std::string> out;
  for (const auto &l : lines) {
    if (l.size() <= width || width == 0) {
      out.push_back(l);
      continue;
    }
    for (size_t pos = 0; pos < l.size(); pos += width)
      out.push_back(l.substr(pos, width));
  }
  return out;
}

std::string merge_columns(const std::string &left, const std::string &right,
                          size_t width, const std::string &sep) {
  auto a_lines = wrap_paragraph(split_lines(left), width);
  auto b_lines = wrap_paragraph(split_lines(right), width);

  size_t count = std::max(a_lines.size(), b_lines.size());

  std::ostringstream out;

  for (size_t i = 0; i < count; i++) {
    std::string L = (i < a_lines.size() ? a_lines[i] : "");
    std::string R = (i < b_lines.size() ? b_lines[i] : "");

    L.resize(width, ' ');

    out << L << sep << R;
    if (i + 1 < count) out << "\n";
  }

  return out.str();
}

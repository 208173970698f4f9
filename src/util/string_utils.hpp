#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace StringUtils {
// Split on runs of spaces/tabs, dropping empty tokens.
std::vector<std::string> split_whitespace(const std::string& str);
std::string join(const std::vector<std::string>& parts, const std::string& sep);
std::string trim(const std::string& str);
bool starts_with(std::string_view str, std::string_view prefix);

// Quote a path for an sftp command line when it contains whitespace or quotes.
std::string quote_path(const std::string& path);
// Last path component ("dir/file.txt" -> "file.txt").
std::string basename(const std::string& path);
}

#ifndef TVLINK_STRING_UTILS_H
#define TVLINK_STRING_UTILS_H

#include <initializer_list>
#include <string>
#include <vector>

namespace tvlink {

std::string to_lower(std::string value);
std::string trim(const std::string& value);
bool contains_ci(const std::string& haystack, const std::string& needle);
bool contains_any(const std::string& lowered, std::initializer_list<const char*> tokens);
bool equals_ci(const std::string& a, const std::string& b);
std::vector<std::string> split(const std::string& value, char delimiter);

} // namespace tvlink

#endif // TVLINK_STRING_UTILS_H

#pragma once

#include <string>
#include <vector>


class StringUtils {
public:
    static std::string to_lower(const std::string& str);
    static void trim(std::string& str);
    static std::string trimmed(const std::string& str);
    static bool starts_with(const std::string& str, const std::string& prefix);
    static std::vector<std::string> split(const std::string& str, char delimiter);
    static std::string join(const std::vector<std::string>& parts, const std::string& separator);

    // UTF-8 aware; invalid sequences count one character per byte
    static std::vector<std::string> utf8_chars(const std::string& str);
    static size_t utf8_length(const std::string& str);

    // POSIX sh single-quote escaping; plain words are returned unchanged
    static std::string shell_quote(const std::string& arg);
};

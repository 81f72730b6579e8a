#include "StringUtils.hpp"
#include <cassert>
#include <iostream>

void test_lower_and_trim() {
    assert(StringUtils::to_lower("MiXeD") == "mixed");
    std::string text = "  padded\t\n";
    StringUtils::trim(text);
    assert(text == "padded");
    assert(StringUtils::trimmed("   ") == "");
    std::cout << "test_lower_and_trim passed" << std::endl;
}

void test_split_and_join() {
    auto parts = StringUtils::split("a,b,,c", ',');
    assert(parts.size() == 4);
    assert(parts[2].empty());
    assert(StringUtils::split("a,", ',').size() == 2);
    assert(StringUtils::split("", ',').empty());
    assert(StringUtils::join(parts, "|") == "a|b||c");
    assert(StringUtils::join({}, "|") == "");
    assert(StringUtils::starts_with("--config-file", "--"));
    assert(!StringUtils::starts_with("-", "--"));
    std::cout << "test_split_and_join passed" << std::endl;
}

void test_shell_quote() {
    assert(StringUtils::shell_quote("plain-word_1.txt") == "plain-word_1.txt");
    assert(StringUtils::shell_quote("--opt=a,b") == "--opt=a,b");
    assert(StringUtils::shell_quote("two words") == "'two words'");
    assert(StringUtils::shell_quote("") == "''");
    assert(StringUtils::shell_quote("it's") == "'it'\\''s'");
    assert(StringUtils::shell_quote("$HOME") == "'$HOME'");
    std::cout << "test_shell_quote passed" << std::endl;
}

void test_utf8_chars() {
    auto chars = StringUtils::utf8_chars("a\xd0\xbf\xe2\x82\xac");
    assert(chars.size() == 3);
    assert(chars[1] == "\xd0\xbf");
    assert(chars[2] == "\xe2\x82\xac");
    assert(StringUtils::utf8_length("\xd0\xbf\xd1\x80") == 2);
    // A truncated sequence falls back to single bytes
    assert(StringUtils::utf8_length("\xd0") == 1);
    assert(StringUtils::utf8_length("") == 0);
    std::cout << "test_utf8_chars passed" << std::endl;
}

int main() {
    test_lower_and_trim();
    test_split_and_join();
    test_shell_quote();
    test_utf8_chars();

    std::cout << "All StringUtils tests passed!" << std::endl;
    return 0;
}

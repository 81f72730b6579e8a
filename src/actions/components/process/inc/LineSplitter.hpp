#pragma once

#include <string>
#include <vector>

// Incremental line splitter for child output. Both '\n' and a bare '\r' end a line,
// so progress bars redrawn with carriage returns surface as separate lines.
// Empty lines are dropped.
class LineSplitter {
public:
    std::vector<std::string> feed(const char* data, size_t size);
    std::vector<std::string> feed(const std::string& chunk) { return feed(chunk.data(), chunk.size()); }

    // Trailing text without a terminator, empty when there is none
    std::string finish();

private:
    std::string buffer_;
};

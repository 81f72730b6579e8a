#include "LineSplitter.hpp"

std::vector<std::string> LineSplitter::feed(const char* data, size_t size) {
    std::vector<std::string> lines;
    for (size_t i = 0; i < size; ++i) {
        const char ch = data[i];
        if (ch == '\n' || ch == '\r') {
            if (!buffer_.empty()) {
                lines.push_back(std::move(buffer_));
                buffer_.clear();
            }
        } else {
            buffer_ += ch;
        }
    }
    return lines;
}

std::string LineSplitter::finish() {
    std::string rest = std::move(buffer_);
    buffer_.clear();
    return rest;
}

#include "line_splitter.hpp"
#include <util/string_utils.hpp>

void LineSplitter::emit(std::vector<std::string>& out) {
    std::string line = StringUtils::trim(partial_);
    partial_.clear();
    if (!line.empty()) {
        out.push_back(std::move(line));
    }
}

std::vector<std::string> LineSplitter::feed(std::string_view chunk) {
    std::vector<std::string> lines;
    for (char c : chunk) {
        if (c == '\n' || c == '\r') {
            // "\r\n" yields one empty line after the first break, which emit() drops.
            emit(lines);
        } else {
            partial_ += c;
        }
    }
    return lines;
}

std::optional<std::string> LineSplitter::flush() {
    std::vector<std::string> lines;
    emit(lines);
    if (lines.empty()) return std::nullopt;
    return lines.front();
}

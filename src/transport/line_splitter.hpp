#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

// Turns arbitrary output chunks into trimmed, non-empty lines.
// "\n", "\r\n" and a lone "\r" all terminate a line. An unterminated tail is
// held back until more bytes arrive or flush() is called at end of stream.
class LineSplitter {
public:
    std::vector<std::string> feed(std::string_view chunk);
    std::optional<std::string> flush();

    size_t pending_bytes() const { return partial_.size(); }

private:
    std::string partial_;

    void emit(std::vector<std::string>& out);
};

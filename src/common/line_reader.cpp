#include "pch.h"
#include "common/line_reader.hpp"
#include "common/errors.hpp"

namespace slnscan {

StringLineReader::StringLineReader(const std::string& text, std::string source_name)
    : LineReader(std::move(source_name)) {
    size_t start = 0;
    while (true) {
        size_t pos = text.find('\n', start);
        if (pos == std::string::npos) {
            lines_.push_back(text.substr(start));
            break;
        }
        size_t end = pos;
        if (end > start && text[end - 1] == '\r') {
            --end;
        }
        lines_.push_back(text.substr(start, end - start));
        start = pos + 1;
    }
}

bool StringLineReader::has_more() {
    return next_ < lines_.size();
}

std::string StringLineReader::read_line() {
    if (!has_more()) {
        throw EndOfInputError("read past end of input" +
                              (source_name().empty() ? std::string() : ": " + source_name()));
    }
    ++line_number_;
    return lines_[next_++];
}

FileLineReader::FileLineReader(const std::string& filepath)
    : LineReader(filepath), file_(filepath) {
    if (!file_.is_open()) {
        throw NotFoundError("Cannot open file: " + filepath);
    }
}

bool FileLineReader::has_more() {
    return file_.peek() != std::ifstream::traits_type::eof();
}

std::string FileLineReader::read_line() {
    std::string line;
    if (!has_more() || !std::getline(file_, line)) {
        throw EndOfInputError("read past end of input: " + source_name());
    }
    // Windows line endings read the same on every platform
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
    ++line_number_;
    return line;
}

LineReaderFactory file_line_reader_factory() {
    return [](const std::string& filepath) {
        return std::make_unique<FileLineReader>(filepath);
    };
}

} // namespace slnscan

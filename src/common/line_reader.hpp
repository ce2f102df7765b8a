#pragma once

#include <fstream>
#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace slnscan {

// Forward-only, single pass line source.
// read_line() throws EndOfInputError once has_more() is false.
class LineReader {
public:
    virtual ~LineReader() = default;

    virtual bool has_more() = 0;
    virtual std::string read_line() = 0;

    // Number of lines handed out so far (1-based number of the last line read)
    int line_number() const { return line_number_; }

    // Name used in error messages (file path, or empty for in-memory text)
    const std::string& source_name() const { return source_name_; }

protected:
    explicit LineReader(std::string source_name) : source_name_(std::move(source_name)) {}

    int line_number_ = 0;

private:
    std::string source_name_;
};

// Reader over in-memory text. Both "\r\n" and "\n" separate lines.
class StringLineReader : public LineReader {
public:
    explicit StringLineReader(const std::string& text, std::string source_name = "");

    bool has_more() override;
    std::string read_line() override;

private:
    std::vector<std::string> lines_;
    size_t next_ = 0;
};

// Reader over a file on disk. The stream is closed when the reader is destroyed.
class FileLineReader : public LineReader {
public:
    explicit FileLineReader(const std::string& filepath);

    bool has_more() override;
    std::string read_line() override;

private:
    std::ifstream file_;
};

using LineReaderFactory = std::function<std::unique_ptr<LineReader>(const std::string&)>;

// Factory producing FileLineReader instances
LineReaderFactory file_line_reader_factory();

} // namespace slnscan

#include "cuke/gherkin/source.hpp"

#include <algorithm>
#include <fstream>
#include <sstream>

namespace cuke::gherkin {

namespace {

constexpr std::string_view UTF8_BOM = "\xEF\xBB\xBF";

} // namespace

Source::Source(std::string filename, std::string content)
    : filename_(std::move(filename)), content_(std::move(content)) {
    if (std::string_view(content_).starts_with(UTF8_BOM)) {
        content_.erase(0, UTF8_BOM.size());
    }
    build_line_index();
}

void Source::build_line_index() {
    line_offsets_.clear();
    line_offsets_.push_back(0);

    for (size_t i = 0; i < content_.size(); ++i) {
        if (content_[i] == '\n' && i + 1 < content_.size()) {
            line_offsets_.push_back(i + 1);
        }
    }
}

auto Source::line(uint32_t line_num) const -> std::string_view {
    if (line_num == 0 || line_num > line_offsets_.size()) {
        return {};
    }

    size_t start = line_offsets_[line_num - 1];
    size_t end = line_num < line_offsets_.size() ? line_offsets_[line_num] : content_.size();

    if (end > start && content_[end - 1] == '\n') {
        --end;
    }
    if (end > start && content_[end - 1] == '\r') {
        --end;
    }

    return std::string_view(content_).substr(start, end - start);
}

auto Source::line_offset(uint32_t line_num) const -> size_t {
    if (line_num == 0 || line_num > line_offsets_.size()) {
        return content_.size();
    }
    return line_offsets_[line_num - 1];
}

auto Source::line_count() const -> uint32_t {
    if (content_.empty()) {
        return 0;
    }
    return static_cast<uint32_t>(line_offsets_.size());
}

auto Source::snippet(size_t offset, size_t max_bytes) const -> std::string_view {
    if (offset >= content_.size()) {
        return {};
    }

    size_t end = std::min(content_.size(), offset + max_bytes);
    // Back off from UTF-8 continuation bytes (10xxxxxx).
    while (end < content_.size() && end > offset &&
           (static_cast<unsigned char>(content_[end]) & 0xC0) == 0x80) {
        --end;
    }

    return std::string_view(content_).substr(offset, end - offset);
}

auto Source::from_file(const std::string& path) -> Result<Source, std::string> {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return "Failed to open file: " + path;
    }

    std::ostringstream buffer;
    buffer << file.rdbuf();

    if (file.fail() && !file.eof()) {
        return "Failed to read file: " + path;
    }

    return Source(path, buffer.str());
}

auto Source::from_string(std::string content, std::string name) -> Source {
    return Source(std::move(name), std::move(content));
}

} // namespace cuke::gherkin

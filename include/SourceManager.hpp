#pragma once
#include <sstream>
#include <string>
#include <vector>

namespace pytch {

// Owns a source buffer and renders the line context shown under diagnostics.
class SourceManager {
   public:
    std::string filename;
    std::string source;

    SourceManager(const std::string& fname, const std::string& src)
        : filename(fname), source(src) {
        index_lines();
    }

    // 1-based; "" outside the buffer. The trailing '\n' is not included.
    std::string get_line(int line_num) const {
        if (line_num < 1 || line_num > line_count()) return "";
        size_t start = line_starts[line_num - 1];
        size_t end = source.find('\n', start);
        if (end == std::string::npos) end = source.size();
        return source.substr(start, end - start);
    }

    int line_count() const {
        return static_cast<int>(line_starts.size());
    }

    // Renders the source line with a caret under `col` (1-based, code points)
    // and tildes for the rest of a `width`-long span.
    std::string format_error_context(int line, int col, int width = 1) const {
        std::stringstream prefix;
        prefix << " * " << line << " | ";
        std::string line_text = get_line(line);

        std::stringstream ss;
        ss << prefix.str() << line_text << "\n";
        ss << std::string(prefix.str().size() + (col > 0 ? col - 1 : 0), ' ') << "^";
        if (width > 1) ss << std::string(width - 1, '~');
        return ss.str();
    }

   private:
    // byte offset where each line begins
    std::vector<size_t> line_starts;

    void index_lines() {
        line_starts.push_back(0);
        for (size_t i = 0; i < source.size(); ++i) {
            if (source[i] == '\n' && i + 1 < source.size()) {
                line_starts.push_back(i + 1);
            }
        }
    }
};

}  // namespace pytch

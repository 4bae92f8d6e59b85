#include "nonogram_ga/segment.hpp"
#include <sstream>

namespace nonogram_ga {

LineConstraints encode_line(const Line& line) {
    LineConstraints segments;
    Color previous = BACKGROUND;
    size_t length = 0;

    for (Color color : line) {
        if (color == previous) {
            ++length;
            continue;
        }
        if (previous != BACKGROUND && length > 0) {
            segments.push_back(Segment{previous, length});
        }
        previous = color;
        length = 1;
    }
    if (previous != BACKGROUND && length > 0) {
        segments.push_back(Segment{previous, length});
    }
    return segments;
}

size_t required_separators(const LineConstraints& segments) {
    size_t count = 0;
    for (size_t i = 1; i < segments.size(); ++i) {
        if (segments[i - 1].color == segments[i].color) {
            ++count;
        }
    }
    return count;
}

size_t minimum_width(const LineConstraints& segments) {
    size_t width = 0;
    for (const auto& seg : segments) {
        width += seg.length;
    }
    return width + required_separators(segments);
}

std::string to_string(const LineConstraints& segments) {
    std::ostringstream oss;
    bool first = true;
    for (const auto& seg : segments) {
        if (!first) oss << ' ';
        first = false;
        oss << seg.color << 'x' << seg.length;
    }
    return oss.str();
}

} // namespace nonogram_ga

#pragma once

#include <optional>
#include <string>

namespace lintel {

struct Position {
    unsigned line   = 0;    // 1-based; 0 when unknown
    unsigned column = 0;
    int offset      = -1;
};

struct Location {
    std::string file;
    std::optional<Position> start;
    std::optional<Position> end;
    std::string message;    // optional note attached to this location

    static Location create(std::string file) {
        Location loc;
        loc.file = std::move(file);
        return loc;
    }

    static Location create(std::string file, unsigned line, unsigned column = 0) {
        Location loc;
        loc.file = std::move(file);
        loc.start = Position{line, column, -1};
        return loc;
    }
};

} // namespace lintel

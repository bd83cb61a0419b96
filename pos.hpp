#pragma once

#include <string>

namespace ember {

// Used to store the line, column and source name where an entity originated from
struct Pos {
    int line = 1;
    int column = 1;
    std::string filename;
};

}  // namespace ember

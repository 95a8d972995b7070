#pragma once

#include <chrono>
#include <string>

namespace sc {
    // <dir>/[<label>_]<stem>_YYYYmmdd_HHMMSS<ext>; a numeric suffix is appended if the name is taken.
    std::string make_output_path(const std::string& dir,
                                 const std::string& stem,
                                 const std::string& label,
                                 const std::string& ext,
                                 std::chrono::system_clock::time_point when = std::chrono::system_clock::now());
}

#include <common/output_paths.hpp>

#include <ctime>
#include <filesystem>
#include <iomanip>
#include <sstream>

namespace sc {
    std::string make_output_path(const std::string& dir,
                                 const std::string& stem,
                                 const std::string& label,
                                 const std::string& ext,
                                 std::chrono::system_clock::time_point when) {
        namespace fs = std::filesystem;

        const std::time_t t = std::chrono::system_clock::to_time_t(when);
        std::tm tm{};
        localtime_r(&t, &tm);

        std::ostringstream name;
        if (!label.empty()) name << label << "_";
        name << stem << "_" << std::put_time(&tm, "%Y%m%d_%H%M%S");
        const std::string base = name.str();

        fs::path p = fs::path(dir) / (base + ext);
        for (int i = 1; fs::exists(p); ++i) {
            p = fs::path(dir) / (base + "_" + std::to_string(i) + ext);
        }
        return p.string();
    }
}

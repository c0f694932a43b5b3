/**
 * @file File.cpp
 * @brief File layer over the line parser and writer
 */

#include "plaincfg/File.hpp"
#include "plaincfg/Errors.hpp"
#include "plaincfg/Lines.hpp"
#include "plaincfg/Writer.hpp"

#include <fstream>
#include <system_error>

namespace plaincfg {

ReadResult read_config_file(const std::string& path, ReadOptions options) {
    std::ifstream ifs(path, std::ios::binary);
    if (!ifs) {
        throw FileNotFoundError(path);
    }
    if (options.source_name.empty()) {
        options.source_name = path;
    }
    StreamLineSource source(ifs);
    return read_config(source, options);
}

void write_config_file(const std::string& path, const Mapping& data,
                       const Structure& structure, const WriteOptions& options) {
    const auto lines = render_config(data, structure, options);

    std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
    if (!ofs) {
        throw FileWriteError(path);
    }

    // Restrict the mode before any content reaches the file
    std::error_code ec;
    std::filesystem::permissions(path, default_file_mode,
                                 std::filesystem::perm_options::replace, ec);
    if (ec) {
        Diagnostic d;
        d.severity = Severity::Warning;
        d.message = "could not restrict permissions: " + ec.message();
        d.source = path;
        report(options.diagnostics, std::move(d));
    }

    for (const auto& line : lines) {
        ofs << line;
    }
    ofs.close();
    if (!ofs) {
        throw FileWriteError(path);
    }
}

} // namespace plaincfg

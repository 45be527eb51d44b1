#include "playlist.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>

namespace fs = std::filesystem;

std::optional<PlaylistFormat> parse_playlist_format(const std::string& name) {
    if (name == "pls") return PlaylistFormat::Pls;
    return std::nullopt;
}

std::string render_pls(const Manifest& manifest) {
    std::ostringstream pls;
    pls << "[playlist]\n\n";
    size_t n = 1;
    for (const auto& m : manifest) {
        pls << "File" << n << "=" << m.filename << "\n"
            << "Title" << n << "=" << m.title << "\n\n";
        ++n;
    }
    return pls.str();
}

bool write_playlist(const Manifest& manifest,
                    const std::string& output_dir,
                    const std::string& format,
                    bool dry_run,
                    std::ostream& out,
                    std::ostream& err) {
    auto fmt = parse_playlist_format(format);
    if (!fmt) {
        err << "Unsupported playlist format: " << format << std::endl;
        return false;
    }

    const std::string file = (fs::path(output_dir) / ("playlist." + format)).string();

    std::error_code ec;
    if (fs::exists(file, ec)) {
        out << "File " << file << " already exists! Ignoring..." << std::endl;
        return false;
    }

    if (dry_run) {
        out << "Playlist would be saved to " << file << std::endl;
        return true;
    }

    std::string text;
    switch (*fmt) {
        case PlaylistFormat::Pls: text = render_pls(manifest); break;
    }

    std::ofstream ofs(file);
    if (ofs) ofs << text;
    if (!ofs) {
        err << "Error writing to " << file << std::endl;
        return false;
    }
    out << "Playlist saved to " << file << std::endl;
    return true;
}

#pragma once

#include "manifest.hpp"

#include <iostream>
#include <optional>
#include <string>

enum class PlaylistFormat {
    Pls
};

std::optional<PlaylistFormat> parse_playlist_format(const std::string& name);

// "[playlist]" header, then a File{n}/Title{n} block per entry followed by a blank line.
std::string render_pls(const Manifest& manifest);

// Writes {output_dir}/playlist.{format}. Returns false without writing for an
// unknown format, an existing target or an I/O error. In dry-run mode only
// the target path is reported.
bool write_playlist(const Manifest& manifest,
                    const std::string& output_dir,
                    const std::string& format,
                    bool dry_run,
                    std::ostream& out = std::cout,
                    std::ostream& err = std::cerr);

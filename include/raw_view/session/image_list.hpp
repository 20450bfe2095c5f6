#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace raw_view::session {

namespace fs = std::filesystem;

/**
 * Sorted list of viewable images in the directory of the current one, for
 * next/previous navigation. The directory is rescanned only when the
 * current image moves to another directory.
 */
class ImageList {
public:
    explicit ImageList(std::vector<std::string> extensions);

    // Make `path` current; rescans its directory when it differs from the
    // one already listed. Returns false if the directory could not be read.
    bool update(const fs::path& path);

    // Replace the listing without touching the filesystem.
    void assign(std::vector<fs::path> entries);
    void set_current(const fs::path& path);

    std::optional<fs::path> next() const;
    std::optional<fs::path> previous() const;

    bool accepts(const fs::path& path) const;

    const std::vector<fs::path>& entries() const { return entries_; }
    const std::optional<fs::path>& current() const { return current_; }

private:
    std::optional<size_t> current_index() const;

    std::vector<std::string> extensions_;
    std::vector<fs::path> entries_;
    std::optional<fs::path> current_;
};

} // namespace raw_view::session

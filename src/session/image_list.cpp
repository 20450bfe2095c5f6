#include "raw_view/session/image_list.hpp"
#include "raw_view/core/utils.hpp"

#include <algorithm>
#include <iostream>
#include <system_error>

namespace raw_view::session {

ImageList::ImageList(std::vector<std::string> extensions) : extensions_(std::move(extensions)) {
    for (auto& ext : extensions_) {
        ext = core::to_lower(ext);
    }
}

bool ImageList::accepts(const fs::path& path) const {
    const std::string ext = core::extension_of(path);
    return std::find(extensions_.begin(), extensions_.end(), ext) != extensions_.end();
}

bool ImageList::update(const fs::path& path) {
    current_ = path;

    const fs::path parent = path.parent_path();
    const bool same_dir = !entries_.empty() && entries_.front().parent_path() == parent;
    if (same_dir) {
        return true;
    }

    std::vector<fs::path> list;
    std::error_code ec;
    fs::directory_iterator it(parent.empty() ? fs::path(".") : parent, ec);
    if (ec) {
        std::cerr << "[NAV] cannot list " << parent.string() << ": " << ec.message() << std::endl;
        entries_.clear();
        return false;
    }
    for (fs::directory_iterator end; it != end; it.increment(ec)) {
        if (ec) {
            break;
        }
        std::error_code type_ec;
        if (it->is_regular_file(type_ec) && accepts(it->path())) {
            list.push_back(parent.empty() ? it->path().filename() : it->path());
        }
    }
    std::sort(list.begin(), list.end());
    entries_ = std::move(list);
    return true;
}

void ImageList::assign(std::vector<fs::path> entries) {
    entries_ = std::move(entries);
}

void ImageList::set_current(const fs::path& path) {
    current_ = path;
}

std::optional<size_t> ImageList::current_index() const {
    if (!current_) {
        return std::nullopt;
    }
    auto it = std::find(entries_.begin(), entries_.end(), *current_);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return static_cast<size_t>(it - entries_.begin());
}

std::optional<fs::path> ImageList::next() const {
    auto idx = current_index();
    if (idx && *idx + 1 < entries_.size()) {
        return entries_[*idx + 1];
    }
    return std::nullopt;
}

std::optional<fs::path> ImageList::previous() const {
    auto idx = current_index();
    if (idx && *idx > 0) {
        return entries_[*idx - 1];
    }
    return std::nullopt;
}

} // namespace raw_view::session

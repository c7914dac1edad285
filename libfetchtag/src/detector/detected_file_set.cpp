//
// Created by Giuseppe Francione on 16/10/26.
//

#include "../../include/detected_file_set.hpp"
#include <algorithm>

namespace fetchtag {

bool DetectedFileSet::insert(const std::filesystem::path& path) {
    std::lock_guard lock(mtx_);
    const auto [it, inserted] = files_.try_emplace(path);
    if (inserted) {
        it->second.path = path;
        it->second.first_seen = std::chrono::system_clock::now();
    }
    return inserted;
}

bool DetectedFileSet::contains(const std::filesystem::path& path) const {
    std::lock_guard lock(mtx_);
    return files_.contains(path);
}

std::optional<DetectedFile> DetectedFileSet::find(const std::filesystem::path& path) const {
    std::lock_guard lock(mtx_);
    const auto it = files_.find(path);
    if (it == files_.end()) return std::nullopt;
    return it->second;
}

std::vector<std::filesystem::path> DetectedFileSet::pending() const {
    std::vector<DetectedFile> entries;
    {
        std::lock_guard lock(mtx_);
        for (const auto& [path, file] : files_) {
            if (!file.stabilized) entries.push_back(file);
        }
    }
    std::ranges::stable_sort(entries, {}, &DetectedFile::first_seen);

    std::vector<std::filesystem::path> out;
    out.reserve(entries.size());
    for (auto& e : entries) out.push_back(std::move(e.path));
    return out;
}

std::vector<std::filesystem::path> DetectedFileSet::stabilized() const {
    std::lock_guard lock(mtx_);
    std::vector<std::filesystem::path> out;
    for (const auto& [path, file] : files_) {
        if (file.stabilized) out.push_back(path);
    }
    return out;
}

bool DetectedFileSet::mark_stabilized(const std::filesystem::path& path) {
    std::lock_guard lock(mtx_);
    const auto it = files_.find(path);
    if (it == files_.end()) return false;
    it->second.stabilized = true;
    return true;
}

void DetectedFileSet::erase(const std::filesystem::path& path) {
    std::lock_guard lock(mtx_);
    files_.erase(path);
}

void DetectedFileSet::clear() {
    std::lock_guard lock(mtx_);
    files_.clear();
}

std::size_t DetectedFileSet::size() const {
    std::lock_guard lock(mtx_);
    return files_.size();
}

} // namespace fetchtag

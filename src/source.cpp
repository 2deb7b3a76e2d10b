#include "source.hpp"

namespace modpath {

static const SourceFile kUnknownFile{.id = 0, .path = "<unknown>"};

FileId SourceManager::add_file(std::string path) {
    if (auto it = by_path_.find(path); it != by_path_.end()) return it->second;

    FileId id = static_cast<FileId>(files_.size());
    files_.push_back(SourceFile{.id = id, .path = std::move(path)});
    by_path_.insert({files_.back().path, id});
    return id;
}

std::optional<FileId> SourceManager::find_file(std::string_view path) const {
    if (auto it = by_path_.find(std::string(path)); it != by_path_.end())
        return it->second;
    return std::nullopt;
}

const SourceFile& SourceManager::file(FileId id) const {
    if (static_cast<size_t>(id) >= files_.size()) return kUnknownFile;
    return files_[static_cast<size_t>(id)];
}

const std::string& SourceManager::path(FileId id) const {
    return file(id).path;
}

std::string SourceManager::describe(Span span) const {
    return path(span.file) + ":" + std::to_string(span.begin.line) + ":" +
           std::to_string(span.begin.column);
}

}  // namespace modpath

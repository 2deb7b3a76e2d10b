#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace modpath {

using FileId = std::uint32_t;

struct SourceLoc {
  std::uint32_t line = 1;
  std::uint32_t column = 1;
};

struct Span {
  FileId file = 0;
  SourceLoc begin{};
  SourceLoc end{};
};

struct SourceFile {
  FileId id = 0;
  std::string path{};
};

// Owns the file names spans point into. Text is not kept: the parser has
// already run by the time anything here is consulted.
class SourceManager {
 public:
  FileId add_file(std::string path);
  std::optional<FileId> find_file(std::string_view path) const;

  const SourceFile& file(FileId id) const;
  const std::string& path(FileId id) const;
  std::size_t size() const { return files_.size(); }

  // `path:line:column` of the span start, `<unknown>` for foreign ids.
  std::string describe(Span span) const;

 private:
  std::vector<SourceFile> files_{};
  std::unordered_map<std::string, FileId> by_path_{};
};

}  // namespace modpath

// tactflow/basic/source_manager.cpp - Line tables and range resolution
#include "tactflow/basic/source_manager.hpp"

#include <algorithm>
#include <system_error>

namespace tactflow
{

// ============================================================================
// SourceFile
// ============================================================================

SourceFile::SourceFile(fs::path path, std::string content)
: path_(std::move(path)), content_(std::move(content))
{
  line_starts_.push_back(0);
  for (size_t i = 0; i < content_.size(); ++i) {
    if (content_[i] == '\n') {
      line_starts_.push_back(static_cast<uint32_t>(i + 1));
    }
  }
}

LineColumn SourceFile::locate(uint32_t offset) const noexcept
{
  offset = std::min(offset, static_cast<uint32_t>(content_.size()));
  const auto next = std::upper_bound(line_starts_.begin(), line_starts_.end(), offset);
  const auto line = static_cast<uint32_t>(next - line_starts_.begin());
  return {line, offset - line_starts_[line - 1] + 1};
}

std::string_view SourceFile::get_line(uint32_t line_index) const noexcept
{
  if (line_index >= line_starts_.size()) {
    return {};
  }

  const uint32_t start = line_starts_[line_index];
  const uint32_t stop = line_index + 1 < line_starts_.size()
                          ? line_starts_[line_index + 1]
                          : static_cast<uint32_t>(content_.size());
  std::string_view line = std::string_view(content_).substr(start, stop - start);
  while (!line.empty() && (line.back() == '\n' || line.back() == '\r')) {
    line.remove_suffix(1);
  }
  return line;
}

std::string_view SourceFile::get_slice(SourceRange range) const noexcept
{
  if (!range.is_valid()) {
    return {};
  }
  const uint32_t start = range.get_begin().offset();
  const uint32_t stop = std::min(range.get_end().offset(), static_cast<uint32_t>(content_.size()));
  if (start >= stop) {
    return {};
  }
  return std::string_view(content_).substr(start, stop - start);
}

// ============================================================================
// SourceRegistry
// ============================================================================

FileId SourceRegistry::add_file(fs::path path, std::string content)
{
  if (files_.size() >= static_cast<size_t>(FileId::k_invalid)) {
    return FileId::invalid();
  }
  const FileId id{static_cast<uint16_t>(files_.size())};
  files_.push_back(std::make_unique<SourceFile>(std::move(path), std::move(content)));
  return id;
}

const SourceFile * SourceRegistry::get_file(FileId id) const noexcept
{
  if (!id.is_valid() || id.value >= files_.size()) {
    return nullptr;
  }
  return files_[id.value].get();
}

FullSourceRange SourceRegistry::resolve(SourceRange range) const noexcept
{
  const SourceFile * file = get_file(range.file_id());
  if (file == nullptr || !range.is_valid()) {
    return {};
  }
  return {file->locate(range.get_begin().offset()), file->locate(range.get_end().offset())};
}

std::string_view SourceRegistry::get_slice(SourceRange range) const noexcept
{
  const SourceFile * file = get_file(range.file_id());
  return file != nullptr ? file->get_slice(range) : std::string_view{};
}

std::optional<std::string> SourceRegistry::describe(SourceRange range, const fs::path & base) const
{
  const FullSourceRange full = resolve(range);
  if (!full.is_valid()) {
    return std::nullopt;
  }

  const fs::path & path = get_file(range.file_id())->path();
  std::string name = path.string();
  if (!base.empty()) {
    std::error_code ec;
    const fs::path relative = fs::relative(path, base, ec);
    if (!ec && !relative.empty()) {
      name = relative.string();
    }
  }
  return name + ":" + std::to_string(full.start.line) + ":" + std::to_string(full.start.column);
}

}  // namespace tactflow

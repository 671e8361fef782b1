#pragma once
#include <filesystem>
#include <string_view>
#include <cantrace/core/result.hpp>

namespace cantrace::core {

// tmp -> write -> fsync -> rename -> fsync dir. On any failure the
// destination keeps its previous content and the tmp file is removed.
Result<void> WriteFileAtomic(const std::filesystem::path& file, std::string_view content);

// fsync helpers, no-ops off POSIX
void FsyncFile(const std::filesystem::path& file);
void FsyncDir(const std::filesystem::path& dir);

} // namespace cantrace::core

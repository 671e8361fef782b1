#include <cantrace/core/atomic_file.hpp>
#include <fstream>
#include <system_error>

#if defined(__unix__) || defined(__APPLE__)
  #include <unistd.h>   // fsync, close
  #include <fcntl.h>    // open
#endif

namespace fs = std::filesystem;

namespace cantrace::core {

void FsyncFile(const fs::path& file) {
#if defined(__unix__) || defined(__APPLE__)
    int fd = ::open(file.c_str(), O_RDONLY);
    if (fd >= 0) { ::fsync(fd); ::close(fd); }
#else
    (void)file;
#endif
}

void FsyncDir(const fs::path& dir) {
#if defined(__unix__) || defined(__APPLE__)
    int flags = O_RDONLY;
  #ifdef O_DIRECTORY
    flags |= O_DIRECTORY;
  #endif
    const fs::path target = dir.empty() ? fs::path(".") : dir;
    int fd = ::open(target.c_str(), flags);
    if (fd >= 0) { ::fsync(fd); ::close(fd); }
#else
    (void)dir;
#endif
}

Result<void> WriteFileAtomic(const fs::path& file, std::string_view content) {
    fs::path tmp = file;
    tmp += ".tmp";

    {
        std::ofstream ofs(tmp, std::ios::binary | std::ios::trunc);
        if (!ofs) {
            return ErrorCode(Errc::kIoError, "cannot open " + tmp.string());
        }
        ofs.write(content.data(), static_cast<std::streamsize>(content.size()));
        ofs.flush();
        if (!ofs) {
            ofs.close();
            std::error_code ec; fs::remove(tmp, ec);
            return ErrorCode(Errc::kIoError, "write failed: " + tmp.string());
        }
        ofs.close();
        FsyncFile(tmp);
    }

    std::error_code ec;
    fs::rename(tmp, file, ec);
    if (ec) {
        std::error_code ec2; fs::remove(tmp, ec2);
        return ErrorCode(Errc::kIoError, "rename to " + file.string() + " failed: " + ec.message());
    }
    FsyncDir(file.parent_path());
    return {};
}

} // namespace cantrace::core

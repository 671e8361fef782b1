#pragma once
#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <cantrace/core/result.hpp>
#include <dispatch/message_dispatcher.hpp>
#include <trace/trace_writer.hpp>

namespace cantrace::session {

// Records the frames of a set of watched identifiers into a rolling trace
// file of their own, next to whatever the trace session captures.
//
// Every watched id is an exact-id dispatcher subscription while recording.
// The file "watch_<local start time>.trc" is created in the folder on the
// first watched frame and continues in "_001", "_002", ... once it reaches
// the size limit. Offsets are taken from the frame timestamps, relative to
// the first recorded frame, and never decrease within a recording.
class WatchRecorder {
public:
    using FileChangedHandler = std::function<void(const std::filesystem::path&)>;

    WatchRecorder(dispatch::MessageDispatcher& dispatcher, std::filesystem::path folder,
                  uint64_t max_file_size = trace::TraceFileWriter::kDefaultMaxFileSize);
    ~WatchRecorder();

    WatchRecorder(const WatchRecorder&) = delete;
    WatchRecorder& operator=(const WatchRecorder&) = delete;

    // Allowed while recording: ids that left the set stop being written
    // before this returns.
    core::Result<void> SetWatchedIds(const std::set<uint32_t>& ids);
    core::Result<void> AddId(uint32_t id);
    core::Result<void> RemoveId(uint32_t id);
    std::set<uint32_t> WatchedIds() const;

    // Only while stopped
    core::Result<void> SetFolder(const std::filesystem::path& folder);
    std::filesystem::path Folder() const;

    core::Result<void> Start();
    // Unsubscribes, then flushes and closes the current file
    core::Result<void> Stop();
    bool IsRecording() const;

    // Empty while no file is open
    std::filesystem::path CurrentFile() const;
    uint64_t RecordedFrames() const noexcept { return recorded_.load(std::memory_order_relaxed); }

    // Called with the new file after an open or rollover and with an empty
    // path on close; runs on a dispatcher thread or the caller of Stop.
    void SetFileChangedHandler(FileChangedHandler cb);

private:
    core::Result<void> WatchLocked(uint32_t id);     // control_mu_ held
    void UnwatchLocked(uint32_t id);                 // control_mu_ held
    void OnFrame(const core::Frame& frame);
    void NotifyFileChanged(const std::filesystem::path& file);

    dispatch::MessageDispatcher& dispatcher_;
    const uint64_t max_file_size_;

    mutable std::mutex control_mu_;   // folder_, ids_, subs_, recording_
    std::filesystem::path folder_;
    std::set<uint32_t> ids_;
    std::map<uint32_t, dispatch::SubscriptionHandle> subs_;
    bool recording_{false};

    mutable std::mutex file_mu_;
    std::unique_ptr<trace::TraceFileWriter> file_;
    std::filesystem::path file_folder_;
    std::chrono::nanoseconds origin_{0};
    std::chrono::nanoseconds last_offset_{0};
    uint64_t next_sequence_{1};
    bool file_failed_{false};
    FileChangedHandler on_file_changed_{};

    std::atomic<uint64_t> recorded_{0};
};

} // namespace cantrace::session

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <set>
#include <sstream>
#include <string>
#include <thread>
#include <bus/socketcan_adapter.hpp>
#include <config/options.hpp>
#include <log.hpp>
#include <session/trace_session.hpp>
#include <session/watch_recorder.hpp>
#include <trace/trace_reader.hpp>
#include <trace/trace_writer.hpp>
#ifdef CANTRACE_WITH_SOMEIP
  #include <com/someip_frame_publisher.hpp>
#endif

using namespace cantrace;

namespace {

std::atomic<bool> g_stop{false};

void OnSignal(int) { g_stop.store(true); }

log::Logger& CliLog() {
    static log::Logger lg = log::Logger::CreateLogger("CLI", "Command line");
    return lg;
}

void Usage() {
    std::cerr <<
        "usage:\n"
        "  cantrace record <out.trc> [--config f.json] [--seconds n] [watch]\n"
        "  cantrace replay <in.trc> [--speed 0.5x|1x|2x|10x|Max] [--config f.json] [--send] [watch]\n"
        "  cantrace dump <in.trc>\n"
        "watch: --watch <hex id>[,<hex id>...] [--watch-folder dir]\n"
        "       also writes the frames of these ids to watch_<time>.trc\n";
}

struct Args {
    std::string command;
    std::string file;
    std::string config;
    std::string speed;
    double seconds{0.0};
    bool send{false};
    std::set<uint32_t> watch;
    std::string watch_folder;
};

// "123,0x18DAF110" -> {0x123, 0x18DAF110}
bool ParseIds(const std::string& text, std::set<uint32_t>& out) {
    std::istringstream in(text);
    std::string item;
    while (std::getline(in, item, ',')) {
        char* end = nullptr;
        const unsigned long v = std::strtoul(item.c_str(), &end, 16);
        if (item.empty() || *end != '\0' || v > core::kMaxExtendedId) return false;
        out.insert(static_cast<uint32_t>(v));
    }
    return !out.empty();
}

bool ParseArgs(int argc, char** argv, Args& a) {
    if (argc < 3) return false;
    a.command = argv[1];
    a.file = argv[2];
    for (int i = 3; i < argc; ++i) {
        const std::string arg = argv[i];
        auto next = [&](std::string& out) {
            if (i + 1 >= argc) return false;
            out = argv[++i];
            return true;
        };
        std::string v;
        if (arg == "--config") {
            if (!next(a.config)) return false;
        } else if (arg == "--speed") {
            if (!next(a.speed)) return false;
        } else if (arg == "--seconds") {
            if (!next(v)) return false;
            char* end = nullptr;
            a.seconds = std::strtod(v.c_str(), &end);
            if (end == v.c_str() || *end != '\0' || a.seconds < 0) return false;
        } else if (arg == "--send") {
            a.send = true;
        } else if (arg == "--watch") {
            if (!next(v) || !ParseIds(v, a.watch)) return false;
        } else if (arg == "--watch-folder") {
            if (!next(a.watch_folder)) return false;
        } else {
            std::cerr << "unknown option " << arg << "\n";
            return false;
        }
    }
    return true;
}

bool LoadConfig(const Args& a, config::WorkbenchOptions& out) {
    if (a.config.empty()) {
        config::ApplyLogging(out.logging);
        return true;
    }
    auto res = config::LoadOptions(a.config);
    if (!res) {
        std::cerr << "cannot load " << a.config << ": " << res.Error().Describe() << "\n";
        return false;
    }
    out = *res;
    config::ApplyLogging(out.logging);
    return true;
}

#ifdef CANTRACE_WITH_SOMEIP
std::unique_ptr<com::SomeipFramePublisher> StartPublisher(session::TraceSession& s,
                                                          const config::WorkbenchOptions& opts) {
    if (!opts.someip.enabled) return nullptr;
    auto pub = std::make_unique<com::SomeipFramePublisher>(s.Dispatcher(), opts.someip);
    if (auto r = pub->Start(); !r) {
        CANTRACE_LOGWARN(CliLog(), "SOME/IP publishing disabled: {}", r.Error().Describe());
        return nullptr;
    }
    return pub;
}
#endif

// Declared after the session so it lets go of the dispatcher first
std::unique_ptr<session::WatchRecorder> StartWatch(session::TraceSession& s, const Args& a,
                                                   const config::WorkbenchOptions& opts) {
    if (a.watch.empty()) return nullptr;
    std::filesystem::path folder = a.watch_folder;
    if (folder.empty()) folder = std::filesystem::path(a.file).parent_path();
    if (folder.empty()) folder = ".";
    auto w = std::make_unique<session::WatchRecorder>(s.Dispatcher(), folder, opts.tracer.max_file_size);
    if (auto r = w->SetWatchedIds(a.watch); !r) {
        CANTRACE_LOGWARN(CliLog(), "watch trace disabled: {}", r.Error().Describe());
        return nullptr;
    }
    if (auto r = w->Start(); !r) {
        CANTRACE_LOGWARN(CliLog(), "watch trace disabled: {}", r.Error().Describe());
        return nullptr;
    }
    return w;
}

int Record(const Args& a) {
    config::WorkbenchOptions opts;
    if (!LoadConfig(a, opts)) return 2;

    session::TraceSession s(opts);
#ifdef CANTRACE_WITH_SOMEIP
    auto publisher = StartPublisher(s, opts);
#endif
    auto watch = StartWatch(s, a, opts);
    if (auto r = s.StartRecording(); !r) {
        CANTRACE_LOGERROR(CliLog(), "{}", r.Error().Describe());
        return 1;
    }
    auto adapter = std::make_shared<bus::SocketCanAdapter>();
    if (auto r = s.StartLive(adapter); !r) {
        std::cerr << "cannot capture on " << opts.bus.interface << ": " << r.Error().Describe() << "\n";
        return 1;
    }

    const auto deadline = std::chrono::steady_clock::now() +
        std::chrono::duration_cast<std::chrono::steady_clock::duration>(std::chrono::duration<double>(a.seconds));
    while (!g_stop.load()) {
        if (a.seconds > 0 && std::chrono::steady_clock::now() >= deadline) break;
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    s.StopLive();
    if (auto r = s.StopRecording(); !r) {
        CANTRACE_LOGWARN(CliLog(), "{}", r.Error().Describe());
    }
    if (watch) {
        if (auto r = watch->Stop(); !r) CANTRACE_LOGWARN(CliLog(), "{}", r.Error().Describe());
        std::cout << "watched " << watch->RecordedFrames() << " frames into " << watch->Folder().string() << "\n";
    }
    if (auto r = s.SaveTrace(a.file); !r) {
        std::cerr << "save failed: " << r.Error().Describe() << "\n";
        return 1;
    }
    std::cout << "recorded " << s.Buffer().Size() << " frames to " << a.file << "\n";
    return 0;
}

int Replay(const Args& a) {
    config::WorkbenchOptions opts;
    if (!LoadConfig(a, opts)) return 2;

    trace::SpeedPreset speed = opts.replay.speed;
    if (!a.speed.empty()) {
        auto p = trace::SpeedFromString(a.speed);
        if (!p) {
            std::cerr << "unknown speed " << a.speed << "\n";
            return 2;
        }
        speed = *p;
    }

    auto loaded = trace::ReadTraceFile(a.file);
    if (!loaded) {
        std::cerr << a.file << ": " << loaded.Error().Describe() << "\n";
        return 1;
    }

    // touched by the session's threads; declared first so they outlive it
    std::atomic<bool> done{false};
    std::atomic<bool> failed{false};
    uint64_t shown = 0;               // printer drain thread only
    std::chrono::nanoseconds first{0};

    session::TraceSession s(opts);
#ifdef CANTRACE_WITH_SOMEIP
    auto publisher = StartPublisher(s, opts);
#endif
    auto watch = StartWatch(s, a, opts);

    auto printer = s.Dispatcher().Subscribe(
        dispatch::Filter::All(),
        [&shown, &first](const core::Frame& f) {
            if (shown == 0) first = f.Timestamp();
            const std::string line = trace::FormatLine(++shown, f.Timestamp() - first, f);
            std::fwrite(line.data(), 1, line.size(), stdout);
        },
        dispatch::SubscriptionOptions{"printer", 0, dispatch::OverflowPolicy::kUnbounded});
    if (!printer) {
        CANTRACE_LOGERROR(CliLog(), "{}", printer.Error().Describe());
        return 1;
    }

    std::shared_ptr<bus::SocketCanAdapter> tx;
    if (a.send) {
        tx = std::make_shared<bus::SocketCanAdapter>();
        if (auto r = tx->Open(opts.bus); !r) {
            std::cerr << "cannot open " << opts.bus.interface << ": " << r.Error().Describe() << "\n";
            return 1;
        }
        auto sender = s.Dispatcher().Subscribe(
            dispatch::Filter::All(),
            [tx](const core::Frame& f) {
                if (f.IsError()) return;
                if (auto r = tx->Send(f); !r) {
                    CANTRACE_LOGWARN(CliLog(), "send 0x{} failed: {}", f.IdHex(), r.Error().Describe());
                }
            },
            dispatch::SubscriptionOptions{"sender", 0, dispatch::OverflowPolicy::kUnbounded});
        if (!sender) {
            CANTRACE_LOGERROR(CliLog(), "{}", sender.Error().Describe());
            return 1;
        }
    }

    s.SetReplayFinishedHandler([&done] { done.store(true); });
    s.SetReplayErrorHandler([&done, &failed](const core::ErrorCode&) {
        failed.store(true);
        done.store(true);
    });

    if (auto r = s.LoadReplay(std::move(loaded.Value())); !r) {
        std::cerr << r.Error().Describe() << "\n";
        return 1;
    }
    if (auto r = s.StartReplay(speed, opts.replay.capture); !r) {
        std::cerr << r.Error().Describe() << "\n";
        return 1;
    }
    CANTRACE_LOGINFO(CliLog(), "replaying {} at {}", a.file, trace::ToString(speed));
    while (!done.load() && !g_stop.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
    s.StopReplay();
    if (!s.Dispatcher().WaitUntilIdle(session::TraceSession::kDrainTimeout)) {
        CANTRACE_LOGWARN(CliLog(), "consumers still busy at exit");
    }
    return failed.load() ? 1 : 0;
}

int Dump(const Args& a) {
    config::ApplyLogging(config::LoggingOptions{});
    auto loaded = trace::ReadTraceFile(a.file);
    if (!loaded) {
        std::cerr << a.file << ": " << loaded.Error().Describe() << "\n";
        return 1;
    }
    const auto& t = loaded.Value();
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(t.Duration()).count();
    char duration[32];
    std::snprintf(duration, sizeof(duration), "%lld.%03lld s",
                  static_cast<long long>(ms / 1000), static_cast<long long>(ms % 1000));

    std::size_t errors = 0, fd = 0, extended = 0;
    for (const auto& r : t.records) {
        if (r.frame.IsError()) ++errors;
        if (r.frame.IsFd()) ++fd;
        if (r.frame.IsExtended()) ++extended;
    }
    std::cout << "file:       " << a.file << "\n"
              << "start time: " << (t.start_time ? trace::FormatStartTime(*t.start_time) : "unknown") << "\n"
              << "records:    " << t.records.size() << "\n"
              << "duration:   " << duration << "\n"
              << "extended:   " << extended << "\n"
              << "fd:         " << fd << "\n"
              << "errors:     " << errors << "\n";
    return 0;
}

} // namespace

int main(int argc, char** argv) {
    Args args;
    if (!ParseArgs(argc, argv, args)) {
        Usage();
        return 2;
    }
    std::signal(SIGINT, OnSignal);
    std::signal(SIGTERM, OnSignal);

    if (args.command == "record") return Record(args);
    if (args.command == "replay") return Replay(args);
    if (args.command == "dump") return Dump(args);
    Usage();
    return 2;
}

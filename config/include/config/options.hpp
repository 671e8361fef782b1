#pragma once
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <cantrace/core/result.hpp>
#include <bus/bus_adapter.hpp>
#include <dispatch/frame_queue.hpp>
#include <log.hpp>
#include <trace/trace_player.hpp>

namespace cantrace::config {

struct TracerOptions {
    std::size_t buffer_size{100000};
    dispatch::OverflowPolicy capture_queue{dispatch::OverflowPolicy::kUnbounded};
    std::size_t capture_queue_capacity{65536};
    std::string record_folder{};          // empty: no streaming to disk
    uint64_t max_file_size{1000ULL * 1000ULL * 1000ULL};
};

struct DispatcherOptions {
    std::size_t queue_capacity{1024};
    dispatch::OverflowPolicy overflow{dispatch::OverflowPolicy::kDropOldest};
};

struct ReplayOptions {
    trace::SpeedPreset speed{trace::SpeedPreset::kNormal};
    bool capture{false};
};

struct LoggingOptions {
    log::LogLevel level{log::LogLevel::kInfo};
    std::string ecu_id{"ECU1"};
    std::string app_id{"CTRC"};
    bool dlt{false};
};

struct SomeipOptions {
    bool enabled{false};
    uint16_t service_id{0x4321};
    uint16_t instance_id{0x0001};
    uint16_t event_id{0x8001};
    uint16_t event_group{0x0001};
};

struct WorkbenchOptions {
    TracerOptions tracer{};
    DispatcherOptions dispatcher{};
    bus::BusConfig bus{};
    ReplayOptions replay{};
    LoggingOptions logging{};
    SomeipOptions someip{};
};

std::string_view ToString(dispatch::OverflowPolicy p);
std::optional<dispatch::OverflowPolicy> OverflowFromString(std::string_view s);

// Missing keys take their defaults, unknown keys are ignored.
// kNotFound: no such file; kCorruption: not JSON or a value of the wrong type;
// kInvalidArgument: a number outside the range of its option
core::Result<WorkbenchOptions> LoadOptions(const std::filesystem::path& file);
core::Result<WorkbenchOptions> ParseOptions(const std::string& text);

core::Result<void> SaveOptions(const std::filesystem::path& file, const WorkbenchOptions& options);
std::string DumpOptions(const WorkbenchOptions& options);

// Installs the configured level, ids and sinks on the LogManager
void ApplyLogging(const LoggingOptions& options);

} // namespace cantrace::config

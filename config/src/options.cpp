#include <config/options.hpp>
#include <cctype>
#include <cstdint>
#include <fstream>
#include <limits>
#include <stdexcept>
#include <sstream>
#include <type_traits>
#include <nlohmann/json.hpp>
#include <cantrace/core/atomic_file.hpp>
#include <sinks_console.hpp>
#include <sinks_dlt.hpp>

using nlohmann::json;

namespace cantrace::config {

namespace {

log::Logger& ConfigLog() {
    static log::Logger lg = log::Logger::CreateLogger("CONF", "Configuration");
    return lg;
}

// Thrown inside the parser for values json accepts but we do not
struct BadValue : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// A number that does not fit the option's type
struct OutOfRange : std::runtime_error {
    using std::runtime_error::runtime_error;
};

template <typename T>
T Get(const json& obj, const char* key, T def) {
    if (!obj.is_object() || !obj.contains(key)) return def;
    const json& v = obj.at(key);
    if constexpr (std::is_integral_v<T> && !std::is_same_v<T, bool>) {
        static_assert(std::is_unsigned_v<T>, "options only hold unsigned integers");
        if (v.is_number_integer()) {
            const bool fits = v.is_number_unsigned()
                                  ? v.get<uint64_t>() <= std::numeric_limits<T>::max()
                                  : v.get<int64_t>() >= 0 &&
                                        static_cast<uint64_t>(v.get<int64_t>()) <= std::numeric_limits<T>::max();
            if (!fits) {
                throw OutOfRange(std::string(key) + " = " + v.dump() + ", expected 0.." +
                                 std::to_string(std::numeric_limits<T>::max()));
            }
        }
    }
    return v.get<T>();
}

const json& Section(const json& root, const char* key) {
    static const json kEmpty = json::object();
    if (!root.contains(key)) return kEmpty;
    const json& s = root.at(key);
    if (!s.is_object()) throw BadValue(std::string(key) + " must be an object");
    return s;
}

WorkbenchOptions FromJson(const json& j) {
    if (!j.is_object()) throw BadValue("top level must be an object");
    WorkbenchOptions o;

    const json& t = Section(j, "tracer");
    o.tracer.buffer_size = Get<std::size_t>(t, "buffer_size", o.tracer.buffer_size);
    const auto cq = Get<std::string>(t, "capture_queue", std::string(ToString(o.tracer.capture_queue)));
    if (auto p = OverflowFromString(cq)) o.tracer.capture_queue = *p;
    else throw BadValue("tracer.capture_queue: " + cq);
    o.tracer.capture_queue_capacity = Get<std::size_t>(t, "capture_queue_capacity", o.tracer.capture_queue_capacity);
    o.tracer.record_folder = Get<std::string>(t, "record_folder", o.tracer.record_folder);
    o.tracer.max_file_size = Get<uint64_t>(t, "max_file_size", o.tracer.max_file_size);

    const json& d = Section(j, "dispatcher");
    o.dispatcher.queue_capacity = Get<std::size_t>(d, "queue_capacity", o.dispatcher.queue_capacity);
    const auto ov = Get<std::string>(d, "overflow", std::string(ToString(o.dispatcher.overflow)));
    if (auto p = OverflowFromString(ov)) o.dispatcher.overflow = *p;
    else throw BadValue("dispatcher.overflow: " + ov);

    const json& b = Section(j, "bus");
    o.bus.interface = Get<std::string>(b, "interface", o.bus.interface);
    o.bus.fd = Get<bool>(b, "fd", o.bus.fd);
    o.bus.bitrate = Get<uint32_t>(b, "bitrate", o.bus.bitrate);
    o.bus.channel = Get<uint8_t>(b, "channel", o.bus.channel);
    o.bus.receive_own_messages = Get<bool>(b, "receive_own_messages", o.bus.receive_own_messages);

    const json& r = Section(j, "replay");
    const auto sp = Get<std::string>(r, "speed", std::string(trace::ToString(o.replay.speed)));
    if (auto p = trace::SpeedFromString(sp)) o.replay.speed = *p;
    else throw BadValue("replay.speed: " + sp);
    o.replay.capture = Get<bool>(r, "capture", o.replay.capture);

    const json& l = Section(j, "logging");
    const auto lv = Get<std::string>(l, "level", std::string(log::ToString(o.logging.level)));
    if (auto p = log::LevelFromString(lv)) o.logging.level = *p;
    else throw BadValue("logging.level: " + lv);
    o.logging.ecu_id = Get<std::string>(l, "ecu_id", o.logging.ecu_id);
    o.logging.app_id = Get<std::string>(l, "app_id", o.logging.app_id);
    o.logging.dlt = Get<bool>(l, "dlt", o.logging.dlt);

    const json& s = Section(j, "someip");
    o.someip.enabled = Get<bool>(s, "enabled", o.someip.enabled);
    o.someip.service_id = Get<uint16_t>(s, "service_id", o.someip.service_id);
    o.someip.instance_id = Get<uint16_t>(s, "instance_id", o.someip.instance_id);
    o.someip.event_id = Get<uint16_t>(s, "event_id", o.someip.event_id);
    o.someip.event_group = Get<uint16_t>(s, "event_group", o.someip.event_group);
    return o;
}

json ToJson(const WorkbenchOptions& o) {
    json j;
    j["tracer"] = {
        {"buffer_size", o.tracer.buffer_size},
        {"capture_queue", std::string(ToString(o.tracer.capture_queue))},
        {"capture_queue_capacity", o.tracer.capture_queue_capacity},
        {"record_folder", o.tracer.record_folder},
        {"max_file_size", o.tracer.max_file_size},
    };
    j["dispatcher"] = {
        {"queue_capacity", o.dispatcher.queue_capacity},
        {"overflow", std::string(ToString(o.dispatcher.overflow))},
    };
    j["bus"] = {
        {"interface", o.bus.interface},
        {"fd", o.bus.fd},
        {"bitrate", o.bus.bitrate},
        {"channel", o.bus.channel},
        {"receive_own_messages", o.bus.receive_own_messages},
    };
    j["replay"] = {
        {"speed", std::string(trace::ToString(o.replay.speed))},
        {"capture", o.replay.capture},
    };
    std::string level(log::ToString(o.logging.level));
    for (auto& c : level) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    j["logging"] = {
        {"level", level},
        {"ecu_id", o.logging.ecu_id},
        {"app_id", o.logging.app_id},
        {"dlt", o.logging.dlt},
    };
    j["someip"] = {
        {"enabled", o.someip.enabled},
        {"service_id", o.someip.service_id},
        {"instance_id", o.someip.instance_id},
        {"event_id", o.someip.event_id},
        {"event_group", o.someip.event_group},
    };
    return j;
}

core::Result<WorkbenchOptions> Parse(std::istream& in, const std::string& origin) {
    json j;
    try {
        in >> j;
    } catch (const json::exception& e) {
        CANTRACE_LOGERROR(ConfigLog(), "{}: not valid JSON ({})", origin, e.what());
        return core::ErrorCode(core::Errc::kCorruption, origin + ": " + e.what());
    }
    try {
        return FromJson(j);
    } catch (const json::exception& e) {
        CANTRACE_LOGERROR(ConfigLog(), "{}: {}", origin, e.what());
        return core::ErrorCode(core::Errc::kCorruption, origin + ": " + e.what());
    } catch (const BadValue& e) {
        CANTRACE_LOGERROR(ConfigLog(), "{}: invalid value {}", origin, e.what());
        return core::ErrorCode(core::Errc::kCorruption, origin + ": invalid value " + e.what());
    } catch (const OutOfRange& e) {
        CANTRACE_LOGERROR(ConfigLog(), "{}: out of range {}", origin, e.what());
        return core::ErrorCode(core::Errc::kInvalidArgument, origin + ": out of range " + e.what());
    }
}

} // namespace

std::string_view ToString(dispatch::OverflowPolicy p) {
    switch (p) {
        case dispatch::OverflowPolicy::kDropOldest: return "drop_oldest";
        case dispatch::OverflowPolicy::kDropNewest: return "drop_newest";
        case dispatch::OverflowPolicy::kUnbounded:  return "unbounded";
    }
    return "drop_oldest";
}

std::optional<dispatch::OverflowPolicy> OverflowFromString(std::string_view s) {
    if (s == "drop_oldest") return dispatch::OverflowPolicy::kDropOldest;
    if (s == "drop_newest") return dispatch::OverflowPolicy::kDropNewest;
    if (s == "unbounded")   return dispatch::OverflowPolicy::kUnbounded;
    return std::nullopt;
}

core::Result<WorkbenchOptions> LoadOptions(const std::filesystem::path& file) {
    std::ifstream in(file);
    if (!in) {
        CANTRACE_LOGWARN(ConfigLog(), "options file {} not found", file.string());
        return core::ErrorCode(core::Errc::kNotFound, file.string());
    }
    auto res = Parse(in, file.string());
    if (res) CANTRACE_LOGINFO(ConfigLog(), "options loaded from {}", file.string());
    return res;
}

core::Result<WorkbenchOptions> ParseOptions(const std::string& text) {
    std::istringstream in(text);
    return Parse(in, "<inline>");
}

std::string DumpOptions(const WorkbenchOptions& options) {
    return ToJson(options).dump(2) + "\n";
}

core::Result<void> SaveOptions(const std::filesystem::path& file, const WorkbenchOptions& options) {
    auto res = core::WriteFileAtomic(file, DumpOptions(options));
    if (!res) {
        CANTRACE_LOGERROR(ConfigLog(), "saving options failed: {}", res.Error().Describe());
    }
    return res;
}

void ApplyLogging(const LoggingOptions& options) {
    auto& lm = log::LogManager::Instance();
    lm.SetGlobalIds(options.ecu_id, options.app_id);
    lm.SetDefaultLevel(options.level);
    lm.ClearSinks();
    lm.AddSink(std::make_shared<log::ConsoleSink>());
    if (options.dlt) {
        lm.AddSink(std::make_shared<log::DltSink>());
    }
}

} // namespace cantrace::config

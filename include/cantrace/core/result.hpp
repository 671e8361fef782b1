#pragma once
#include <cstddef>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace cantrace::core {

// Error domain shared by every cantrace module
enum class Errc {
    kSuccess = 0,
    kParseError,
    kIoError,
    kDeliveryError,
    kPlaybackError,
    kStateError,
    kInvalidArgument,
    kNotFound,
    kCorruption,
    kBusError
};

inline constexpr std::string_view ToString(Errc e) {
    switch (e) {
        case Errc::kSuccess:         return "Success";
        case Errc::kParseError:      return "ParseError";
        case Errc::kIoError:         return "IOError";
        case Errc::kDeliveryError:   return "DeliveryError";
        case Errc::kPlaybackError:   return "PlaybackError";
        case Errc::kStateError:      return "StateError";
        case Errc::kInvalidArgument: return "InvalidArgument";
        case Errc::kNotFound:        return "NotFound";
        case Errc::kCorruption:      return "Corruption";
        case Errc::kBusError:        return "BusError";
    }
    return "Unknown";
}

class ErrorCode {
public:
    Errc value;
    std::string message;
    // ParseError only: 1-based line number and the raw line
    std::size_t line{0};
    std::string content;

    ErrorCode(Errc v) : value(v) {}
    ErrorCode(Errc v, std::string msg) : value(v), message(std::move(msg)) {}
    ErrorCode(Errc v, std::string msg, std::size_t ln, std::string raw)
        : value(v), message(std::move(msg)), line(ln), content(std::move(raw)) {}

    operator bool() const { return value != Errc::kSuccess; }

    std::string Describe() const {
        std::string out(ToString(value));
        if (line != 0) out += " at line " + std::to_string(line);
        if (!message.empty()) out += ": " + message;
        if (!content.empty()) out += " [" + content + "]";
        return out;
    }
};

template<typename T>
class Result {
    std::variant<T, ErrorCode> data_;
public:
    Result(const T& v) : data_(v) {}
    Result(T&& v) : data_(std::move(v)) {}
    Result(ErrorCode e) : data_(std::move(e)) {}
    Result(Errc e) : data_(ErrorCode(e)) {}
    bool HasValue() const { return std::holds_alternative<T>(data_); }
    T& Value() { return std::get<T>(data_); }
    const T& Value() const { return std::get<T>(data_); }
    const ErrorCode& Error() const { return std::get<ErrorCode>(data_); }

    explicit operator bool() const { return HasValue(); }

    T& operator*() { return Value(); }
    const T& operator*() const { return Value(); }
    T* operator->() { return &Value(); }
    const T* operator->() const { return &Value(); }
};

template<>
class Result<void> {
    bool ok_;
    ErrorCode err_;
public:
    Result() : ok_(true), err_(Errc::kSuccess) {}
    Result(ErrorCode e) : ok_(false), err_(std::move(e)) {}
    Result(Errc e) : ok_(false), err_(e) {}

    bool HasValue() const { return ok_; }
    void Value() const {}
    const ErrorCode& Error() const { return err_; }

    explicit operator bool() const { return ok_; }
};

} // namespace cantrace::core

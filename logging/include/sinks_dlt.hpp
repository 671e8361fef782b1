#pragma once
#include "log.hpp"
#include <mutex>
#include <unordered_map>
#include <string>

namespace cantrace::log {

class DltSink : public ISink {
public:
  explicit DltSink(std::string app_description = "CAN trace workbench");
  ~DltSink() override;

  void write(const LogRecord& r) noexcept override;

private:
  void ensureAppRegistered(const std::string& app_id);
  void ensureCtxRegistered(const std::string& ctx_id, const std::string& ctx_desc);

  // ctx_id -> DLT context handle, opaque so dlt headers stay out of here
  struct CtxHandle { void* h = nullptr; };
  std::mutex mu_;
  std::string app_desc_;
  std::string registered_app_id_;
  std::unordered_map<std::string, CtxHandle> ctx_by_id_;
};

} // namespace cantrace::log

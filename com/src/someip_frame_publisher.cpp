#include <com/someip_frame_publisher.hpp>
#include <cstdio>
#include <set>
#include <vector>
#include <com/frame_codec.hpp>
#include <log.hpp>

namespace cantrace::com {

namespace {

log::Logger& SomeipLog() {
    static log::Logger lg = log::Logger::CreateLogger("SOME", "SOME/IP frame publisher");
    return lg;
}

std::string Hex(uint16_t v) {
    char buf[8];
    std::snprintf(buf, sizeof(buf), "0x%04X", static_cast<unsigned>(v));
    return buf;
}

} // namespace

SomeipFramePublisher::SomeipFramePublisher(dispatch::MessageDispatcher& dispatcher,
                                           config::SomeipOptions options, std::string app_name)
    : dispatcher_(dispatcher), options_(options), app_name_(std::move(app_name)) {}

SomeipFramePublisher::~SomeipFramePublisher() {
    Stop();
}

core::Result<void> SomeipFramePublisher::Start(dispatch::Filter filter) {
    std::lock_guard<std::mutex> lk(mu_);
    if (app_) return core::ErrorCode(core::Errc::kStateError, "publisher already started");

    auto app = vsomeip::runtime::get()->create_application(app_name_);
    if (!app || !app->init()) {
        CANTRACE_LOGERROR(SomeipLog(), "vsomeip application '{}' failed to initialize", app_name_);
        return core::ErrorCode(core::Errc::kIoError, "vsomeip init failed for " + app_name_);
    }

    app->offer_service(options_.service_id, options_.instance_id);
    std::set<vsomeip::eventgroup_t> groups{options_.event_group};
    app->offer_event(options_.service_id, options_.instance_id, options_.event_id, groups,
                     vsomeip::event_type_e::ET_EVENT, std::chrono::milliseconds::zero(),
                     false,  // not change resilient
                     true);  // update on change
    app_ = app;
    app_thread_ = std::thread([app] { app->start(); });

    dispatch::SubscriptionOptions sub;
    sub.name = "someip";
    auto handle = dispatcher_.Subscribe(filter, [this](const core::Frame& f) { Publish(f); }, sub);
    if (!handle) {
        app_->stop_offer_service(options_.service_id, options_.instance_id);
        app_->stop();
        if (app_thread_.joinable()) app_thread_.join();
        app_.reset();
        return handle.Error();
    }
    handle_ = *handle;
    CANTRACE_LOGINFO(SomeipLog(), "offering frames on service {}:{} event {}",
                     Hex(options_.service_id), Hex(options_.instance_id), Hex(options_.event_id));
    return {};
}

void SomeipFramePublisher::Stop() {
    std::lock_guard<std::mutex> lk(mu_);
    if (!app_) return;
    if (handle_.IsValid()) {
        if (auto r = dispatcher_.Unsubscribe(handle_); !r) {
            CANTRACE_LOGWARN(SomeipLog(), "unsubscribe failed: {}", r.Error().Describe());
        }
        handle_ = {};
    }
    app_->stop_offer_event(options_.service_id, options_.instance_id, options_.event_id);
    app_->stop_offer_service(options_.service_id, options_.instance_id);
    app_->stop();
    if (app_thread_.joinable()) app_thread_.join();
    app_.reset();
    CANTRACE_LOGINFO(SomeipLog(), "stopped after {} notifications", Published());
}

// Runs on the subscription's drain thread
void SomeipFramePublisher::Publish(const core::Frame& frame) {
    const std::vector<uint8_t> bytes = EncodeFrame(frame);
    auto payload = vsomeip::runtime::get()->create_payload();
    payload->set_data(std::vector<vsomeip::byte_t>(bytes.begin(), bytes.end()));
    app_->notify(options_.service_id, options_.instance_id, options_.event_id, payload, true);
    published_.fetch_add(1, std::memory_order_relaxed);
}

} // namespace cantrace::com

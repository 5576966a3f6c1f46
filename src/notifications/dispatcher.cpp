#include "notifications/dispatcher.hpp"

#include <thread>
#include <utility>
#include "core/logging/logger.hpp"

namespace orch::notifications {

namespace {

bool deliver(const NotificationSink& sink, const NotificationEvent& event) {
    auto sent = sink.send(event);
    if (core::errors::is_error(sent)) {
        LOG_WARN("Notification " + event.type + " via " + sink.name() + " failed: " +
                 core::errors::get_error(sent).message);
        return false;
    }
    return true;
}

}  // namespace

Dispatcher::Dispatcher(const bool enabled, const DispatchMode mode)
    : enabled_(enabled), mode_(mode) {}

std::unique_ptr<Dispatcher> Dispatcher::from_config(
    const core::config::NotificationsConfig& config) {
    auto dispatcher = std::make_unique<Dispatcher>(config.enabled);
    dispatcher->add_sink(std::make_shared<OsSink>(config.os));
    for (const auto& webhook : config.webhooks) {
        if (webhook.url.empty()) {
            LOG_DEBUG("Skipping webhook " + webhook.name + " without a URL");
            continue;
        }
        dispatcher->add_sink(std::make_shared<WebhookSink>(webhook));
    }
    return dispatcher;
}

void Dispatcher::add_sink(std::shared_ptr<NotificationSink> sink) {
    sinks_.push_back(std::move(sink));
}

void Dispatcher::notify(const NotificationEvent& event) const {
    if (!enabled_) {
        return;
    }
    for (const auto& sink : sinks_) {
        if (!sink->enabled() || !sink->handles_event(event)) {
            continue;
        }
        if (mode_ == DispatchMode::Inline) {
            deliver(*sink, event);
            continue;
        }
        // The thread owns copies so it may outlive the dispatcher.
        std::thread([sink, event]() { deliver(*sink, event); }).detach();
    }
}

std::size_t Dispatcher::notify_sync(const NotificationEvent& event) const {
    std::size_t delivered = 0;
    if (!enabled_) {
        return delivered;
    }
    for (const auto& sink : sinks_) {
        if (sink->enabled() && sink->handles_event(event) && deliver(*sink, event)) {
            ++delivered;
        }
    }
    return delivered;
}

}  // namespace orch::notifications

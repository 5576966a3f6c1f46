#include "notifications/sinks.hpp"

#include <algorithm>
#include <cstdlib>
#include <mutex>
#include <curl/curl.h>
#include "core/logging/logger.hpp"
#include "core/process/process_runner.hpp"
#include "core/util/text.hpp"
#include "core/util/time.hpp"

namespace orch::notifications {

using core::errors::ErrorCategory;
using core::errors::OrchError;

namespace {

std::string env_value(const std::string& name) {
    if (name.empty()) {
        return "";
    }
    const char* value = std::getenv(name.c_str());
    return value == nullptr ? "" : value;
}

#ifdef __APPLE__
// AppleScript string literal.
std::string applescript_quote(const std::string& value) {
    return "\"" + core::util::replace_all(core::util::replace_all(value, "\\", "\\\\"), "\"", "\\\"") +
           "\"";
}
#endif

void ensure_curl_initialized() {
    static std::once_flag once;
    std::call_once(once, []() { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

std::size_t discard_body(char*, std::size_t size, std::size_t nmemb, void*) {
    return size * nmemb;
}

}  // namespace

bool filter_matches(const std::vector<std::string>& events, const NotificationEvent& event) {
    return events.empty() || std::find(events.begin(), events.end(), event.type) != events.end();
}

OsSink::OsSink(const core::config::OsNotificationConfig& config)
    : enabled_(config.enabled), sound_(config.sound), events_(config.events) {}

bool OsSink::handles_event(const NotificationEvent& event) const {
    return filter_matches(events_, event);
}

std::vector<std::string> OsSink::command_for(const NotificationEvent& event) const {
    const OsNotification note = event.to_os_notification();
#ifdef __APPLE__
    std::string script = "display notification " + applescript_quote(note.body) + " with title " +
                         applescript_quote(note.title) + " subtitle " +
                         applescript_quote(note.subtitle);
    if (sound_) {
        script += " sound name \"default\"";
    }
    return {"osascript", "-e", script};
#else
    const std::string body = note.subtitle.empty() ? note.body : note.subtitle + "\n" + note.body;
    std::vector<std::string> argv{"notify-send", "--app-name=operator"};
    if (!sound_) {
        argv.push_back("--hint=boolean:suppress-sound:true");
    }
    argv.push_back(note.title);
    argv.push_back(body);
    return argv;
#endif
}

core::errors::Status OsSink::send(const NotificationEvent& event) const {
    core::process::ProcessRequest request;
    request.argv = command_for(event);
    request.timeout_ms = 5000;
    if (!core::process::find_executable(request.argv.front())) {
        return OrchError{ErrorCategory::Precondition,
                         request.argv.front() + " is not available for OS notifications",
                         "notifier_missing"};
    }
    auto capture = core::process::run_process(request);
    if (core::errors::is_error(capture)) {
        return core::errors::get_error(capture);
    }
    const auto& result = core::errors::get_value(capture);
    if (!result.success()) {
        return OrchError{ErrorCategory::External,
                         request.argv.front() + " failed: " + core::util::trim(result.stderr_text),
                         "os_notification_failed"};
    }
    return core::errors::ok();
}

WebhookSink::WebhookSink(const core::config::WebhookConfig& config)
    : name_(config.name.empty() ? "webhook" : config.name),
      url_(config.url),
      enabled_(config.enabled),
      events_(config.events) {
    const std::string auth_type = core::util::lowercase(config.auth_type);
    if (auth_type == "bearer") {
        auth_ = WebhookAuth::Bearer;
        token_ = env_value(config.token_env);
        if (token_.empty() && !config.token_env.empty()) {
            LOG_WARN("Webhook " + name_ + ": " + config.token_env + " is not set or empty");
        }
    } else if (auth_type == "basic") {
        auth_ = WebhookAuth::Basic;
        username_ = config.username;
        password_ = env_value(config.password_env);
        if (password_.empty() && !config.password_env.empty()) {
            LOG_WARN("Webhook " + name_ + ": " + config.password_env + " is not set or empty");
        }
    }
}

bool WebhookSink::handles_event(const NotificationEvent& event) const {
    return filter_matches(events_, event);
}

std::string WebhookSink::authorization_header() const {
    if (auth_ == WebhookAuth::Bearer) {
        return "Authorization: Bearer " + token_;
    }
    return "";
}

core::errors::Status WebhookSink::send(const NotificationEvent& event) const {
    ensure_curl_initialized();
    CURL* curl = curl_easy_init();
    if (curl == nullptr) {
        return OrchError{ErrorCategory::Internal, "curl init failed", "webhook_init_failed"};
    }

    const std::string body = event.to_payload(core::util::now_epoch_seconds()).dump();
    struct curl_slist* headers = nullptr;
    headers = curl_slist_append(headers, "Content-Type: application/json");
    const std::string authorization = authorization_header();
    if (!authorization.empty()) {
        headers = curl_slist_append(headers, authorization.c_str());
    }
    const std::string credentials = username_ + ":" + password_;

    curl_easy_setopt(curl, CURLOPT_URL, url_.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_POST, 1L);
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, kTimeoutSeconds);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, discard_body);
    if (auth_ == WebhookAuth::Basic) {
        curl_easy_setopt(curl, CURLOPT_HTTPAUTH, static_cast<long>(CURLAUTH_BASIC));
        curl_easy_setopt(curl, CURLOPT_USERPWD, credentials.c_str());
    }

    const CURLcode res = curl_easy_perform(curl);
    long status = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);

    if (res != CURLE_OK) {
        return OrchError{ErrorCategory::External,
                         "Webhook " + name_ + " request failed: " + curl_easy_strerror(res),
                         "webhook_failed"};
    }
    if (status < 200 || status >= 300) {
        return OrchError{ErrorCategory::External,
                         "Webhook " + name_ + " returned HTTP " + std::to_string(status),
                         "webhook_status"};
    }
    LOG_DEBUG("Webhook " + name_ + " delivered " + event.type);
    return core::errors::ok();
}

}  // namespace orch::notifications

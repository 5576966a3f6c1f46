#include "api/api_router.hpp"

#include <algorithm>
#include <cstddef>
#include <exception>
#include <initializer_list>
#include <set>
#include <utility>
#include "core/logging/logger.hpp"
#include "core/util/text.hpp"
#include "core/util/time.hpp"

namespace orch::api {

using core::errors::ErrorCategory;
using core::errors::OrchError;
using nlohmann::json;

namespace {

std::vector<std::string> split_path(const std::string& path) {
    const auto query = path.find('?');
    std::vector<std::string> segments;
    for (const auto& part : core::util::split(path.substr(0, query), '/')) {
        if (!part.empty()) {
            segments.push_back(part);
        }
    }
    return segments;
}

// Matches "issuetypes/:key" style patterns, filling params for ":name" segments.
bool match(const std::string& pattern, const std::vector<std::string>& segments,
           std::map<std::string, std::string>& params) {
    const auto parts = split_path(pattern);
    if (parts.size() != segments.size()) {
        return false;
    }
    std::map<std::string, std::string> captured;
    for (std::size_t i = 0; i < parts.size(); ++i) {
        if (!parts[i].empty() && parts[i][0] == ':') {
            captured[parts[i].substr(1)] = segments[i];
        } else if (parts[i] != segments[i]) {
            return false;
        }
    }
    params = std::move(captured);
    return true;
}

core::errors::Result<json> parse_body(const std::string& body) {
    if (core::util::trim(body).empty()) {
        return json::object();
    }
    json parsed = json::parse(body, nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object()) {
        return OrchError{ErrorCategory::Input, "Request body must be a JSON object",
                         "invalid_json"};
    }
    return parsed;
}

// Optional body fields must carry the expected JSON type when present.
core::errors::Status expect_field(const json& body, const char* key, json::value_t type) {
    if (!body.contains(key)) {
        return core::errors::ok();
    }
    const json& value = body.at(key);
    const bool matches = type == json::value_t::boolean ? value.is_boolean() : value.is_string();
    if (!matches) {
        return OrchError{ErrorCategory::Input,
                         std::string("Field '") + key + "' must be a " +
                             (type == json::value_t::boolean ? "boolean" : "string"),
                         "invalid_field"};
    }
    return core::errors::ok();
}

ApiResponse ok_response(json body) {
    ApiResponse response;
    response.body = std::move(body);
    return response;
}

}  // namespace

int http_status_for(const ErrorCategory category) {
    switch (category) {
        case ErrorCategory::NotFound:
            return 404;
        case ErrorCategory::Conflict:
            return 409;
        case ErrorCategory::Permission:
            return 403;
        case ErrorCategory::Input:
        case ErrorCategory::Validation:
        case ErrorCategory::Malformed:
            return 400;
        case ErrorCategory::Precondition:
            return 412;
        case ErrorCategory::External:
        case ErrorCategory::Internal:
            return 500;
    }
    return 500;
}

ApiResponse error_response(const OrchError& error) {
    ApiResponse response;
    response.status = http_status_for(error.category);
    response.body = json{{"error", error.code}, {"message", error.message}};
    if (!error.hint.empty()) {
        response.body["hint"] = error.hint;
    }
    return response;
}

ApiRouter::ApiRouter(issuetypes::IssueTypeRegistry& registry, queue::TicketStore& tickets,
                     session::StateStore& state, supervisor::Supervisor& supervisor,
                     launcher::Launcher& launcher, std::string version)
    : registry_(registry),
      tickets_(tickets),
      state_(state),
      supervisor_(supervisor),
      launcher_(launcher),
      version_(std::move(version)) {}

ApiResponse ApiRouter::handle(const ApiRequest& request) const {
    try {
        return dispatch(request);
    } catch (const json::exception& e) {
        LOG_WARN("API " + request.method + " " + request.path + " rejected: " + e.what());
        return error_response(OrchError{ErrorCategory::Input,
                                        std::string("Invalid request body: ") + e.what(),
                                        "invalid_field"});
    } catch (const std::exception& e) {
        LOG_ERROR("API " + request.method + " " + request.path + " failed: " + e.what());
        return error_response(OrchError{ErrorCategory::Internal, e.what(), "internal_error"});
    }
}

ApiResponse ApiRouter::dispatch(const ApiRequest& request) const {
    auto segments = split_path(request.path);
    const auto prefix = split_path(kApiPrefix);
    if (segments.size() < prefix.size() ||
        !std::equal(prefix.begin(), prefix.end(), segments.begin())) {
        return error_response(OrchError{ErrorCategory::NotFound,
                                        "No route for " + request.path, "route_not_found"});
    }
    segments.erase(segments.begin(),
                   segments.begin() + static_cast<std::ptrdiff_t>(prefix.size()));

    auto body = parse_body(request.body);
    if (core::errors::is_error(body)) {
        return error_response(core::errors::get_error(body));
    }
    const json& payload = core::errors::get_value(body);
    const std::string& method = request.method;
    Params params;

    if (method == "GET") {
        if (match("health", segments, params)) return health();
        if (match("status", segments, params)) return status();
        if (match("issuetypes", segments, params)) return list_issuetypes();
        if (match("issuetypes/:key", segments, params)) return get_issuetype(params);
        if (match("collections", segments, params)) return list_collections();
        if (match("collections/active", segments, params)) return active_collection();
        if (match("queue/kanban", segments, params)) return kanban();
        if (match("queue/status", segments, params)) return queue_status();
        if (match("agents/active", segments, params)) return active_agents();
    } else if (method == "POST") {
        if (match("issuetypes", segments, params)) return create_issuetype(payload);
        if (match("queue/pause", segments, params)) return pause_queue();
        if (match("queue/resume", segments, params)) return resume_queue();
        if (match("agents/:id/approve", segments, params)) return approve_agent(params);
        if (match("agents/:id/reject", segments, params)) return reject_agent(params, payload);
        if (match("tickets/:id/launch", segments, params)) return launch_ticket(params, payload);
        if (match("tickets/:id/steps/:step/complete", segments, params)) {
            return complete_step(params);
        }
    } else if (method == "PUT") {
        if (match("issuetypes/:key", segments, params)) return update_issuetype(params, payload);
        if (match("collections/:name/activate", segments, params)) {
            return activate_collection(params);
        }
    } else if (method == "DELETE") {
        if (match("issuetypes/:key", segments, params)) return delete_issuetype(params);
    }

    return error_response(OrchError{ErrorCategory::NotFound,
                                    "No route for " + method + " " + request.path,
                                    "route_not_found"});
}

ApiResponse ApiRouter::health() const {
    return ok_response(json{{"status", "ok"}, {"version", version_}});
}

ApiResponse ApiRouter::status() const {
    const auto snapshot = state_.snapshot();
    return ok_response(json{{"status", "ok"},
                            {"version", version_},
                            {"issuetype_count", registry_.type_count()},
                            {"collection_count", registry_.collection_count()},
                            {"active_collection", registry_.active_collection_name()},
                            {"paused", snapshot.paused},
                            {"active_agents", snapshot.agents.size()},
                            {"queued", tickets_.list_queue().size()}});
}

ApiResponse ApiRouter::list_issuetypes() const {
    json types = json::array();
    for (const auto& issue_type : registry_.all_types()) {
        types.push_back(issuetypes::issue_type_to_json(issue_type));
    }
    return ok_response(types);
}

ApiResponse ApiRouter::get_issuetype(const Params& params) const {
    const auto& key = params.at("key");
    const auto issue_type = registry_.get(key);
    if (!issue_type) {
        return error_response(OrchError{ErrorCategory::NotFound,
                                        "Issue type '" + key + "' not found",
                                        "issuetype_not_found"});
    }
    return ok_response(issuetypes::issue_type_to_json(*issue_type));
}

ApiResponse ApiRouter::create_issuetype(const json& body) const {
    auto parsed = issuetypes::issue_type_from_json(body);
    if (core::errors::is_error(parsed)) {
        return error_response(core::errors::get_error(parsed));
    }
    auto issue_type = core::errors::get_value(parsed);
    issue_type.source = issuetypes::IssueTypeSource::user();

    auto registered = registry_.register_type(issue_type);
    if (core::errors::is_error(registered)) {
        return error_response(core::errors::get_error(registered));
    }
    auto saved = registry_.save_user_type(issue_type);
    if (core::errors::is_error(saved)) {
        LOG_WARN("API: issue type " + issue_type.key + " registered but not saved: " +
                 core::errors::get_error(saved).message);
    }
    LOG_INFO("API: created issue type " + issue_type.key);
    ApiResponse response = ok_response(issuetypes::issue_type_to_json(issue_type));
    response.status = 201;
    return response;
}

ApiResponse ApiRouter::update_issuetype(const Params& params, const json& body) const {
    const auto& key = params.at("key");
    json document = body;
    if (!document.contains("key")) {
        document["key"] = key;
    }
    auto parsed = issuetypes::issue_type_from_json(document);
    if (core::errors::is_error(parsed)) {
        return error_response(core::errors::get_error(parsed));
    }
    auto updated = registry_.update_type(key, core::errors::get_value(parsed));
    if (core::errors::is_error(updated)) {
        return error_response(core::errors::get_error(updated));
    }
    const auto stored = registry_.get(key);
    if (!stored) {
        return error_response(OrchError{ErrorCategory::Internal,
                                        "Issue type '" + key + "' vanished during update",
                                        "issuetype_not_found"});
    }
    if (stored->source.kind == issuetypes::IssueTypeSource::Kind::User) {
        auto saved = registry_.save_user_type(*stored);
        if (core::errors::is_error(saved)) {
            LOG_WARN("API: issue type " + key + " updated but not saved: " +
                     core::errors::get_error(saved).message);
        }
    }
    return ok_response(issuetypes::issue_type_to_json(*stored));
}

ApiResponse ApiRouter::delete_issuetype(const Params& params) const {
    const auto& key = params.at("key");
    auto removed = registry_.remove_type(key);
    if (core::errors::is_error(removed)) {
        return error_response(core::errors::get_error(removed));
    }
    return ok_response(json{{"deleted", key}});
}

ApiResponse ApiRouter::list_collections() const {
    const std::string active = registry_.active_collection_name();
    json collections = json::array();
    for (const auto& collection : registry_.all_collections()) {
        json entry = issuetypes::collection_to_json(collection);
        entry["active"] = collection.name == active;
        collections.push_back(entry);
    }
    return ok_response(collections);
}

ApiResponse ApiRouter::active_collection() const {
    const auto collection = registry_.get_collection(registry_.active_collection_name());
    if (!collection) {
        return error_response(OrchError{ErrorCategory::NotFound, "No active collection",
                                        "collection_not_found"});
    }
    json entry = issuetypes::collection_to_json(*collection);
    entry["active"] = true;
    return ok_response(entry);
}

ApiResponse ApiRouter::activate_collection(const Params& params) const {
    auto activated = registry_.activate_collection(params.at("name"));
    if (core::errors::is_error(activated)) {
        return error_response(core::errors::get_error(activated));
    }
    return active_collection();
}

ApiResponse ApiRouter::kanban() const {
    std::set<std::string> awaiting_ids;
    for (const auto& agent : state_.snapshot().agents) {
        if (agent.status == session::AgentStatus::AwaitingInput) {
            awaiting_ids.insert(agent.ticket_id);
        }
    }

    auto card = [this](const queue::Ticket& ticket) {
        std::string step_display = ticket.step;
        if (const auto issue_type = registry_.get(ticket.ticket_type)) {
            const auto* step = ticket.step.empty() ? issue_type->first_step()
                                                   : issue_type->find_step(ticket.step);
            if (step != nullptr) {
                step_display = step->display();
            }
        }
        return json{{"id", ticket.id},
                    {"summary", ticket.summary},
                    {"ticket_type", ticket.ticket_type},
                    {"project", ticket.project},
                    {"status", ticket.status},
                    {"step", ticket.step},
                    {"step_display_name", step_display},
                    {"priority", ticket.priority},
                    {"timestamp", ticket.timestamp}};
    };

    json queue_column = json::array();
    json running = json::array();
    json awaiting = json::array();
    json done = json::array();

    for (const auto& ticket : tickets_.list_by_priority(registry_)) {
        (ticket.status == "awaiting" ? awaiting : queue_column).push_back(card(ticket));
    }
    auto in_progress = tickets_.list_in_progress();
    std::stable_sort(in_progress.begin(), in_progress.end(),
                     [this](const queue::Ticket& a, const queue::Ticket& b) {
                         const auto pa = registry_.priority_index(a.ticket_type);
                         const auto pb = registry_.priority_index(b.ticket_type);
                         return pa != pb ? pa < pb : a.timestamp < b.timestamp;
                     });
    for (const auto& ticket : in_progress) {
        const bool waiting = awaiting_ids.count(ticket.id) > 0 || ticket.status == "awaiting" ||
                             ticket.status == "blocked";
        (waiting ? awaiting : running).push_back(card(ticket));
    }
    auto completed = tickets_.list_completed();
    std::stable_sort(completed.begin(), completed.end(),
                     [](const queue::Ticket& a, const queue::Ticket& b) {
                         return a.timestamp > b.timestamp;
                     });
    for (const auto& ticket : completed) {
        done.push_back(card(ticket));
    }

    const std::size_t total = queue_column.size() + running.size() + awaiting.size() + done.size();
    return ok_response(json{{"queue", queue_column},
                            {"running", running},
                            {"awaiting", awaiting},
                            {"done", done},
                            {"total_count", total},
                            {"last_updated",
                             core::util::format_iso8601(core::util::now_epoch_seconds())}});
}

ApiResponse ApiRouter::queue_status() const {
    const auto queued = tickets_.list_queue();
    std::size_t failed = 0;
    json by_type = json::object();
    for (const auto& ticket : queued) {
        if (ticket.status == "failed") {
            ++failed;
        }
        const std::string key = core::util::lowercase(ticket.ticket_type);
        by_type[key] = by_type.value(key, 0) + 1;
    }
    std::size_t awaiting = 0;
    const auto snapshot = state_.snapshot();
    for (const auto& agent : snapshot.agents) {
        if (agent.status == session::AgentStatus::AwaitingInput) {
            ++awaiting;
        }
    }
    return ok_response(json{{"queued", queued.size()},
                            {"failed", failed},
                            {"in_progress", tickets_.list_in_progress().size()},
                            {"awaiting", awaiting},
                            {"completed", tickets_.list_completed().size()},
                            {"by_type", by_type},
                            {"paused", snapshot.paused}});
}

ApiResponse ApiRouter::pause_queue() const {
    auto paused = supervisor_.pause();
    if (core::errors::is_error(paused)) {
        return error_response(core::errors::get_error(paused));
    }
    return ok_response(json{{"paused", true}});
}

ApiResponse ApiRouter::resume_queue() const {
    auto resumed = supervisor_.resume();
    if (core::errors::is_error(resumed)) {
        return error_response(core::errors::get_error(resumed));
    }
    return ok_response(json{{"paused", false}});
}

ApiResponse ApiRouter::active_agents() const {
    json agents = json::array();
    for (const auto& agent : state_.snapshot().agents) {
        agents.push_back(session::agent_to_json(agent));
    }
    const std::size_t count = agents.size();
    return ok_response(json{{"agents", agents}, {"count", count}});
}

ApiResponse ApiRouter::approve_agent(const Params& params) const {
    const auto& id = params.at("id");
    auto approved = supervisor_.approve(id);
    if (core::errors::is_error(approved)) {
        return error_response(core::errors::get_error(approved));
    }
    return ok_response(json{{"agent_id", id}, {"status", "approved"},
                            {"message", "Review approved"}});
}

ApiResponse ApiRouter::reject_agent(const Params& params, const json& body) const {
    const auto& id = params.at("id");
    auto valid = expect_field(body, "reason", json::value_t::string);
    if (core::errors::is_error(valid)) {
        return error_response(core::errors::get_error(valid));
    }
    const std::string reason = body.value("reason", std::string());
    auto rejected = supervisor_.reject(id, reason);
    if (core::errors::is_error(rejected)) {
        return error_response(core::errors::get_error(rejected));
    }
    return ok_response(json{{"agent_id", id}, {"status", "rejected"},
                            {"message", "Review rejected: " + reason}});
}

ApiResponse ApiRouter::launch_ticket(const Params& params, const json& body) const {
    const auto& id = params.at("id");
    auto found = tickets_.find_ticket(id);
    if (core::errors::is_error(found)) {
        return error_response(core::errors::get_error(found));
    }
    queue::Ticket ticket = core::errors::get_value(found);
    if (state_.find_by_ticket(ticket.id)) {
        return error_response(OrchError{ErrorCategory::Conflict,
                                        "Ticket " + ticket.id + " already has an agent",
                                        "agent_exists"});
    }

    for (const auto& [key, type] : {std::make_pair("provider", json::value_t::string),
                                    std::make_pair("model", json::value_t::string),
                                    std::make_pair("wrapper", json::value_t::string),
                                    std::make_pair("yolo_mode", json::value_t::boolean)}) {
        auto valid = expect_field(body, key, type);
        if (core::errors::is_error(valid)) {
            return error_response(core::errors::get_error(valid));
        }
    }

    launcher::LaunchOptions options = launcher_.default_options();
    if (body.contains("provider")) {
        options.provider = body["provider"].get<std::string>();
    }
    if (body.contains("model")) {
        options.model = body["model"].get<std::string>();
    }
    options.yolo = body.value("yolo_mode", options.yolo);
    if (body.value("wrapper", std::string()) == "docker") {
        options.docker = true;
    }

    const bool claimed_here = ticket.filepath.parent_path() == tickets_.queue_dir();
    if (claimed_here) {
        auto claimed = tickets_.claim_ticket(ticket);
        if (core::errors::is_error(claimed)) {
            return error_response(core::errors::get_error(claimed));
        }
        ticket = core::errors::get_value(claimed);
    }

    auto prepared = launcher_.prepare(ticket, options);
    if (core::errors::is_error(prepared)) {
        if (claimed_here) {
            auto returned = tickets_.return_to_queue(ticket, "queued");
            if (core::errors::is_error(returned)) {
                LOG_ERROR("API: unable to return " + ticket.id + " to the queue: " +
                          core::errors::get_error(returned).message);
            }
        }
        return error_response(core::errors::get_error(prepared));
    }
    const auto& launch = core::errors::get_value(prepared);
    auto recorded = ticket.set_session_id(launch.step, launch.session_id);
    if (core::errors::is_error(recorded)) {
        LOG_WARN("API: session id not recorded for " + ticket.id + ": " +
                 core::errors::get_error(recorded).message);
    }
    LOG_INFO("API: prepared launch of " + ticket.id + " (" + launch.step + ")");
    return ok_response(launcher::prepared_launch_to_json(launch));
}

ApiResponse ApiRouter::complete_step(const Params& params) const {
    const auto& id = params.at("id");
    const auto& step = params.at("step");
    auto found = tickets_.find_ticket(id);
    if (core::errors::is_error(found)) {
        return error_response(core::errors::get_error(found));
    }
    auto completed = supervisor_.complete_step(core::errors::get_value(found).id, step);
    if (core::errors::is_error(completed)) {
        return error_response(core::errors::get_error(completed));
    }

    json response{{"ticket_id", id}, {"step", step}};
    if (const auto agent = state_.find_by_ticket(core::errors::get_value(found).id)) {
        response["status"] = session::to_string(agent->status);
        response["current_step"] = agent->current_step;
        response["review_pending"] = agent->review_pending;
    } else {
        response["status"] = "finished";
        response["current_step"] = nullptr;
        response["review_pending"] = false;
    }
    return ok_response(response);
}

}  // namespace orch::api

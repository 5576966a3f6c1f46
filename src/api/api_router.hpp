#pragma once

#include <map>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/errors/orch_errors.hpp"
#include "issuetypes/registry.hpp"
#include "launcher/launcher.hpp"
#include "queue/ticket_store.hpp"
#include "session/state_store.hpp"
#include "supervisor/supervisor.hpp"

namespace orch::api {

inline constexpr const char* kApiPrefix = "/api/v1";

struct ApiRequest {
    std::string method;
    std::string path;  // may carry a query string, which is ignored
    std::string body;
};

struct ApiResponse {
    int status = 200;
    nlohmann::json body = nlohmann::json::object();
};

int http_status_for(core::errors::ErrorCategory category);
// {"error": code, "message": message} with the mapped status.
ApiResponse error_response(const core::errors::OrchError& error);

// Transport-free dispatch of the /api/v1 surface.
class ApiRouter {
public:
    ApiRouter(issuetypes::IssueTypeRegistry& registry, queue::TicketStore& tickets,
              session::StateStore& state, supervisor::Supervisor& supervisor,
              launcher::Launcher& launcher, std::string version);

    // Never throws: body type errors map to 400, anything else to 500.
    ApiResponse handle(const ApiRequest& request) const;

private:
    using Params = std::map<std::string, std::string>;

    ApiResponse dispatch(const ApiRequest& request) const;

    ApiResponse health() const;
    ApiResponse status() const;

    ApiResponse list_issuetypes() const;
    ApiResponse get_issuetype(const Params& params) const;
    ApiResponse create_issuetype(const nlohmann::json& body) const;
    ApiResponse update_issuetype(const Params& params, const nlohmann::json& body) const;
    ApiResponse delete_issuetype(const Params& params) const;

    ApiResponse list_collections() const;
    ApiResponse active_collection() const;
    ApiResponse activate_collection(const Params& params) const;

    ApiResponse kanban() const;
    ApiResponse queue_status() const;
    ApiResponse pause_queue() const;
    ApiResponse resume_queue() const;

    ApiResponse active_agents() const;
    ApiResponse approve_agent(const Params& params) const;
    ApiResponse reject_agent(const Params& params, const nlohmann::json& body) const;

    ApiResponse launch_ticket(const Params& params, const nlohmann::json& body) const;
    ApiResponse complete_step(const Params& params) const;

    issuetypes::IssueTypeRegistry& registry_;
    queue::TicketStore& tickets_;
    session::StateStore& state_;
    supervisor::Supervisor& supervisor_;
    launcher::Launcher& launcher_;
    std::string version_;
};

}  // namespace orch::api

#include "control_api.hpp"

#include <future>
#include <memory>
#include <stdexcept>

#include "config.hpp"
#include "log.hpp"

namespace control
{

// Invalid request body or parameter
class bad_request : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

static http::response json_response(int code, const json& body)
{
    http::response res;
    res.set_code(code);
    res.set_header("Content-Type", "application/json");
    res.set_body(body.dump());
    return res;
}

static http::response error_response(int code, const std::string& message)
{
    return json_response(code, json {{"error", message}});
}

static json parse_body(const http::request& req)
{
    json body = json::parse(req.get_body(), nullptr, false);
    if(body.is_discarded() || !body.is_object())
        throw bad_request {"Body has to be a JSON object"};
    return body;
}

static std::string string_field(const json& body, const char* name, bool required)
{
    if(!body.contains(name))
    {
        if(required)
            throw bad_request {std::string {"Missing field "} + name};
        return {};
    }

    const json& value = body.at(name);
    if(!value.is_string())
        throw bad_request {std::string {"Field "} + name + " has to be a string"};
    return value.get<std::string>();
}

control_api::control_api(utils::scheduler& sched, googlecast::receiver_session& session,
    relay::playback_bridge& bridge, std::chrono::milliseconds timeout)
    : m_scheduler {sched}, m_session {session}, m_bridge {bridge}, m_timeout {timeout}
{}

json control_api::status() const
{
    const googlecast::session_status session = m_session.status();
    const relay::bridge_status bridge = m_bridge.status();

    json out;
    out["chromecast"] = {
        {"ip", session.device ? json(session.device->ip) : json(nullptr)},
        {"port", session.device ? json(session.device->port) : json(nullptr)},
        {"name", m_device_name},
        {"enabled", bridge.enabled}
    };

    json target = nullptr;
    if(session.target)
        target = {{"host", session.target->host}, {"port", session.target->port}, {"player", session.target->player}};
    out["session"] = {
        {"phase", googlecast::to_string(session.phase)},
        {"transport_id", session.transport_id},
        {"target", target}
    };

    out["bridge"] = {
        {"running", bridge.running},
        {"casting", bridge.casting},
        {"active_player", bridge.active_player},
        {"preferred_player", {{"id", bridge.preferred_player_id}, {"name", bridge.preferred_player_name}}},
        {"mode", bridge.last_mode ? json(lms::to_string(*bridge.last_mode)) : json(nullptr)}
    };

    out["lms"] = {{"host", bridge.server.host}, {"port", bridge.server.port}};
    return out;
}

http::response control_api::handle(const http::request& req)
{
    const std::string& method = req.get_method();
    const std::string& path = req.get_path();

    try {
        if(path == "/api/status" && method == "GET")
            return json_response(200, status());
        if(path == "/api/chromecast" && method == "POST")
            return post_chromecast(req);
        if(path == "/api/chromecast" && method == "DELETE")
            return delete_chromecast();
        if(path == "/api/player" && method == "POST")
            return post_player(req);
        if(path == "/api/lms" && method == "POST")
            return post_lms(req);
        if(method == "OPTIONS")
            return json_response(204, json::object());
    } catch(const bad_request& e) {
        utils::log::warn("[Control] {} {}: {}", method, path, e.what());
        return error_response(400, e.what());
    }

    return error_response(404, "Not found");
}

http::response control_api::dispatch(const http::request& req)
{
    auto result = std::make_shared<std::promise<http::response>>();
    std::future<http::response> answer = result->get_future();
    m_scheduler.post([this, req, result]() {
        try {
            result->set_value(handle(req));
        } catch(const std::exception& e) {
            utils::log::error("[Control] {} {} failed: {}", req.get_method(), req.get_path(), e.what());
            result->set_value(error_response(500, e.what()));
        }
    });

    if(answer.wait_for(m_timeout) != std::future_status::ready)
        return error_response(503, "Controller busy");
    return answer.get();
}

http::response control_api::post_chromecast(const http::request& req)
{
    const json body = parse_body(req);
    const std::string ip = string_field(body, "ip", true);
    if(ip.empty())
        throw bad_request {"Field ip must not be empty"};

    bool enabled = true;
    if(body.contains("enabled"))
    {
        if(!body.at("enabled").is_boolean())
            throw bad_request {"Field enabled has to be a boolean"};
        enabled = body.at("enabled").get<bool>();
    }

    m_device_name = string_field(body, "name", false);
    m_session.set_device(googlecast::device_endpoint {ip});
    m_bridge.set_enabled(enabled);
    utils::log::info("[Control] Chromecast set to {} ({}), casting {}", m_device_name, ip,
        enabled ? "enabled" : "disabled");
    return json_response(200, status());
}

http::response control_api::delete_chromecast()
{
    m_device_name.clear();
    m_session.set_device(std::nullopt);
    utils::log::info("[Control] Chromecast removed");
    return json_response(200, status());
}

http::response control_api::post_player(const http::request& req)
{
    const json body = parse_body(req);
    std::string id = string_field(body, "id", true);
    if(id.empty())
        throw bad_request {"Field id must not be empty"};

    m_bridge.set_preferred_player(std::move(id), string_field(body, "name", false));
    return json_response(200, status());
}

http::response control_api::post_lms(const http::request& req)
{
    const json body = parse_body(req);
    std::string host = string_field(body, "host", true);
    if(host.empty())
        throw bad_request {"Field host must not be empty"};

    uint16_t port = 9000;
    if(body.contains("port"))
    {
        const json& value = body.at("port");
        try {
            if(value.is_number_integer())
                port = utils::parse_port(std::to_string(value.get<int64_t>()));
            else if(value.is_string())
                port = utils::parse_port(value.get<std::string>());
            else
                throw bad_request {"Field port has to be a number"};
        } catch(const utils::config_error& e) {
            throw bad_request {e.what()};
        }
    }

    m_bridge.set_server(lms::server_address {std::move(host), port});
    return json_response(200, status());
}

} // namespace control

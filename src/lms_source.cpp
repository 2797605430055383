#include "lms_source.hpp"

#include <memory>

#include "log.hpp"

namespace lms
{

static const char* status_tags = "tags:aAlcdegiIKloNrstuwy";

json make_request_body(const std::string& player_id, const json& command)
{
    return json {
        {"id", 1},
        {"method", "slim.request"},
        {"params", json::array({player_id, command})}
    };
}

json unwrap_result(const std::string& body)
{
    json answer;
    try {
        answer = json::parse(body);
    } catch(const json::parse_error& e) {
        throw upstream_unavailable {std::string {"Malformed JSON-RPC answer: "} + e.what()};
    }

    if(!answer.is_object() || !answer.contains("result"))
        throw upstream_unavailable {"JSON-RPC answer without result"};

    return answer["result"];
}

json_rpc_source::json_rpc_source(utils::scheduler& sched, const http::client& client, server_address address,
    std::chrono::milliseconds timeout)
    : m_scheduler {sched}, m_client {client}, m_address {std::move(address)}, m_timeout {timeout}
{}

json json_rpc_source::request(const http::client& client, const server_address& address,
    const std::string& player_id, const json& command)
{
    http::response res;
    try {
        res = client.post(address.base_url() + "/jsonrpc.js", make_request_body(player_id, command).dump(), "application/json");
    } catch(const std::exception& e) {
        throw upstream_unavailable {e.what()};
    }

    if(res.get_code() != 200)
        throw upstream_unavailable {"LMS answered with status " + std::to_string(res.get_code())};

    return unwrap_result(res.get_body());
}

void json_rpc_source::call(const std::string& player_id, json command, std::function<void(std::optional<json>)> done)
{
    auto started = m_scheduler.now();
    auto shared_done = std::make_shared<std::function<void(std::optional<json>)>>(std::move(done));

    m_scheduler.offload([this, address = m_address, player_id, command = std::move(command), started, shared_done]()
    {
        std::optional<json> result;
        try {
            result = request(m_client, address, player_id, command);
        } catch(const upstream_unavailable& e) {
            utils::log::warn("[LMS] {} unavailable: {}", address.base_url(), e.what());
        }

        m_scheduler.post([this, result = std::move(result), started, shared_done]() mutable
        {
            if(result && m_scheduler.now() - started > m_timeout)
            {
                utils::log::warn("[LMS] Dropping answer that arrived after {} ms", m_timeout.count());
                result.reset();
            }
            (*shared_done)(std::move(result));
        });
    });
}

void json_rpc_source::fetch_players(players_callback done)
{
    call("", json::array({"players", "0", "100"}), [done = std::move(done)](std::optional<json> result)
    {
        if(!result)
        {
            done(std::nullopt);
            return;
        }
        done(parse_players(*result));
    });
}

void json_rpc_source::fetch_status(const std::string& player_id, status_callback done)
{
    call(player_id, json::array({"status", "-", "1", status_tags}), [done = std::move(done)](std::optional<json> result)
    {
        if(!result)
        {
            done(std::nullopt);
            return;
        }

        std::optional<playback_snapshot> snapshot;
        try {
            snapshot = parse_status(*result);
        } catch(const upstream_unavailable& e) {
            utils::log::warn("[LMS] Unusable status: {}", e.what());
        }
        done(std::move(snapshot));
    });
}

} // namespace lms

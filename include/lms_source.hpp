#ifndef LMS_SOURCE_HPP
#define LMS_SOURCE_HPP

#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "http/client.hpp"
#include "playback_snapshot.hpp"
#include "scheduler.hpp"

using nlohmann::json;

namespace lms
{

// Polled playback source. Callbacks run on the scheduler, nullopt means the
// source was unavailable for this request.
class playback_source
{
public:

    using players_callback = std::function<void(std::optional<std::vector<player_info>>)>;
    using status_callback = std::function<void(std::optional<playback_snapshot>)>;

    virtual ~playback_source() = default;

    virtual void fetch_players(players_callback done) = 0;

    virtual void fetch_status(const std::string& player_id, status_callback done) = 0;

    virtual server_address address() const = 0;

    virtual void set_address(server_address address) = 0;
};

// Body of a slim.request call
json make_request_body(const std::string& player_id, const json& command);

// Extracts "result" from a JSON-RPC answer, throws upstream_unavailable
json unwrap_result(const std::string& body);

// Logitech Media Server JSON-RPC endpoint (/jsonrpc.js)
class json_rpc_source : public playback_source
{
public:

    json_rpc_source() = delete;
    json_rpc_source(const json_rpc_source&) = delete;
    json_rpc_source& operator=(const json_rpc_source&) = delete;
    json_rpc_source(json_rpc_source&&) = delete;
    json_rpc_source& operator=(json_rpc_source&&) = delete;
    ~json_rpc_source() override = default;

    json_rpc_source(utils::scheduler& sched, const http::client& client, server_address address,
        std::chrono::milliseconds timeout = std::chrono::milliseconds {5000});

    void fetch_players(players_callback done) override;

    void fetch_status(const std::string& player_id, status_callback done) override;

    server_address address() const override
    {
        return m_address;
    }

    void set_address(server_address address) override
    {
        m_address = std::move(address);
    }

    // Blocking call, throws upstream_unavailable
    static json request(const http::client& client, const server_address& address,
        const std::string& player_id, const json& command);

private:

    // Runs the call off the scheduler and hands the result back on it
    void call(const std::string& player_id, json command, std::function<void(std::optional<json>)> done);

    utils::scheduler& m_scheduler;

    const http::client& m_client;

    server_address m_address;

    std::chrono::milliseconds m_timeout;

};

} // namespace lms

#endif

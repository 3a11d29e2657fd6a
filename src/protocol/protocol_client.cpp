// src/protocol/protocol_client.cpp
#include "agentorch/protocol/protocol_client.h"
#include "agentorch/common/errors.h"
#include <spdlog/spdlog.h>
#include <algorithm>

namespace agentorch {

std::string to_string(ConnectionState state) {
    switch (state) {
        case ConnectionState::DISCONNECTED: return "disconnected";
        case ConnectionState::CONNECTED:    return "connected";
        case ConnectionState::FAILED:       return "failed";
    }
    return "disconnected";
}

void LocalProtocolClient::add_server(const std::string& server_id, std::shared_ptr<const ToolRegistry> tools) {
    std::lock_guard<std::mutex> lock(mutex_);
    servers_[server_id] = Server{std::move(tools), ConnectionState::DISCONNECTED, std::nullopt};
}

void LocalProtocolClient::connect(const std::string& server_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = servers_.find(server_id);
    if (it == servers_.end()) {
        throw CollaboratorError("Unknown protocol server: " + server_id);
    }
    if (!it->second.tools) {
        it->second.state = ConnectionState::FAILED;
        it->second.last_error = "server has no tool registry";
        throw CollaboratorError("Protocol server '" + server_id + "' cannot be connected: no tools");
    }
    it->second.state = ConnectionState::CONNECTED;
    it->second.last_error.reset();
    spdlog::debug("Protocol server {} connected", server_id);
}

void LocalProtocolClient::disconnect(const std::string& server_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = servers_.find(server_id);
    if (it == servers_.end()) {
        throw CollaboratorError("Unknown protocol server: " + server_id);
    }
    it->second.state = ConnectionState::DISCONNECTED;
}

ProtocolServerStatus LocalProtocolClient::status(const std::string& server_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    ProtocolServerStatus result;
    result.server_id = server_id;
    auto it = servers_.find(server_id);
    if (it == servers_.end()) {
        result.last_error = "unknown server";
        return result;
    }
    result.state = it->second.state;
    result.last_error = it->second.last_error;
    if (it->second.tools) {
        result.tools = it->second.tools->list_tools();
    }
    return result;
}

Value LocalProtocolClient::call_tool(const std::string& server_id,
                                     const std::string& tool_name,
                                     const ToolArguments& args) {
    std::shared_ptr<const ToolRegistry> tools;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = servers_.find(server_id);
        if (it == servers_.end()) {
            throw CollaboratorError("Unknown protocol server: " + server_id);
        }
        if (it->second.state != ConnectionState::CONNECTED) {
            throw CollaboratorError("Protocol server '" + server_id + "' is not connected");
        }
        tools = it->second.tools;
    }
    // 调用在锁外进行
    return tools->call_tool(tool_name, args);
}

void ProtocolClientRegistry::register_client(const std::string& server_id,
                                             std::shared_ptr<ProtocolClient> client) {
    std::lock_guard<std::mutex> lock(mutex_);
    clients_[server_id] = std::move(client);
}

std::shared_ptr<ProtocolClient> ProtocolClientRegistry::client_for(const std::string& server_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = clients_.find(server_id);
    if (it == clients_.end() || !it->second) {
        throw CollaboratorError("No protocol client registered for server: " + server_id);
    }
    return it->second;
}

std::vector<std::string> ProtocolClientRegistry::server_ids() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> ids;
    ids.reserve(clients_.size());
    for (const auto& [id, _] : clients_) {
        ids.push_back(id);
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

} // namespace agentorch

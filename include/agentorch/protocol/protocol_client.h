#ifndef AGENTORCH_PROTOCOL_PROTOCOL_CLIENT_H
#define AGENTORCH_PROTOCOL_PROTOCOL_CLIENT_H

#include "agentorch/common/types.h"
#include "agentorch/tools/registry.h"
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace agentorch {

enum class ConnectionState : uint8_t {
    DISCONNECTED,
    CONNECTED,
    FAILED
};

std::string to_string(ConnectionState state);

struct ProtocolServerStatus {
    std::string server_id;
    ConnectionState state = ConnectionState::DISCONNECTED;
    std::optional<std::string> last_error;
    std::vector<std::string> tools;
};

// Client side of a tool-serving protocol (one client, many servers).
// All failures surface as CollaboratorError.
class ProtocolClient {
public:
    virtual ~ProtocolClient() = default;

    virtual void connect(const std::string& server_id) = 0;
    virtual void disconnect(const std::string& server_id) = 0;
    virtual ProtocolServerStatus status(const std::string& server_id) const = 0;
    virtual Value call_tool(const std::string& server_id,
                            const std::string& tool_name,
                            const ToolArguments& args) = 0;
};

// In-process servers, each exposing its own ToolRegistry.
class LocalProtocolClient : public ProtocolClient {
public:
    void add_server(const std::string& server_id, std::shared_ptr<const ToolRegistry> tools);

    void connect(const std::string& server_id) override;
    void disconnect(const std::string& server_id) override;
    ProtocolServerStatus status(const std::string& server_id) const override;
    Value call_tool(const std::string& server_id,
                    const std::string& tool_name,
                    const ToolArguments& args) override;

private:
    struct Server {
        std::shared_ptr<const ToolRegistry> tools;
        ConnectionState state = ConnectionState::DISCONNECTED;
        std::optional<std::string> last_error;
    };

    mutable std::mutex mutex_;
    std::unordered_map<std::string, Server> servers_;
};

// Routes a server id to the client that serves it.
class ProtocolClientRegistry {
public:
    void register_client(const std::string& server_id, std::shared_ptr<ProtocolClient> client);

    // Throws CollaboratorError if no client serves `server_id`.
    std::shared_ptr<ProtocolClient> client_for(const std::string& server_id) const;

    std::vector<std::string> server_ids() const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<ProtocolClient>> clients_;
};

} // namespace agentorch

#endif // AGENTORCH_PROTOCOL_PROTOCOL_CLIENT_H

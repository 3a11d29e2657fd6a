// src/graph/workflow_loader.cpp
#include "agentorch/graph/workflow_loader.h"
#include "agentorch/common/errors.h"
#include "agentorch/utils/yaml_json.h"
#include <filesystem>
#include <fstream>
#include <sstream>
#include <yaml-cpp/yaml.h>

namespace agentorch {

namespace {

std::string require_string(const Value& obj, const char* key, const std::string& where) {
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_string() || it->get<std::string>().empty()) {
        throw ValidationError(where + ": missing string field '" + key + "'");
    }
    return it->get<std::string>();
}

std::string optional_string(const Value& obj, const char* key, const std::string& fallback = {}) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) return fallback;
    if (it->is_string()) return it->get<std::string>();
    return it->dump();
}

std::vector<Port> parse_ports(const Value& arr, const std::string& where) {
    std::vector<Port> ports;
    if (arr.is_null()) return ports;
    if (!arr.is_array()) {
        throw ValidationError(where + ": ports must be a list");
    }
    for (const auto& p : arr) {
        Port port;
        if (p.is_string()) {
            port.id = port.name = p.get<std::string>();
        } else if (p.is_object()) {
            port.id = require_string(p, "id", where);
            port.name = optional_string(p, "name", port.id);
            port.data_type = optional_string(p, "type", "any");
        } else {
            throw ValidationError(where + ": invalid port entry");
        }
        ports.push_back(std::move(port));
    }
    return ports;
}

NodeOrchestrationSettings parse_node_orchestration(const Value& obj, const std::string& where) {
    NodeOrchestrationSettings settings;
    if (obj.is_null()) return settings;
    if (!obj.is_object()) {
        throw ValidationError(where + ": 'orchestration' must be a map");
    }
    settings.participates = obj.value("participates", true);
    settings.parallel = obj.value("parallel", true);
    settings.priority = obj.value("priority", 0);
    if (auto it = obj.find("roles"); it != obj.end() && it->is_array()) {
        for (const auto& r : *it) {
            auto role = r.is_string() ? parse_node_role(r.get<std::string>()) : std::nullopt;
            if (!role) {
                throw ValidationError(where + ": unknown role " + r.dump());
            }
            settings.roles.push_back(*role);
        }
    }
    return settings;
}

Node parse_node(const Value& n) {
    if (!n.is_object()) {
        throw ValidationError("Node entry must be a map");
    }
    Node node;
    node.id = require_string(n, "id", "node");
    const std::string where = "node '" + node.id + "'";
    node.type = require_string(n, "type", where);
    node.name = optional_string(n, "name", node.id);
    if (auto it = n.find("properties"); it != n.end() && !it->is_null()) {
        if (!it->is_object()) {
            throw ValidationError(where + ": 'properties' must be a map");
        }
        node.properties = *it;
    }
    if (auto it = n.find("position"); it != n.end() && it->is_object()) {
        node.x = it->value("x", 0.0);
        node.y = it->value("y", 0.0);
    }
    node.input_ports = parse_ports(n.value("inputs", Value()), where);
    node.output_ports = parse_ports(n.value("outputs", Value()), where);
    node.orchestration = parse_node_orchestration(n.value("orchestration", Value()), where);
    return node;
}

// "from: a" 或 "from: {node: a, port: out}"
void parse_endpoint(const Value& v, NodeId& node, std::string& port, const std::string& where) {
    if (v.is_string()) {
        node = v.get<std::string>();
    } else if (v.is_object()) {
        node = require_string(v, "node", where);
        port = optional_string(v, "port", port);
    } else {
        throw ValidationError(where + ": invalid endpoint");
    }
}

Connection parse_connection(const Value& c, size_t index) {
    if (!c.is_object()) {
        throw ValidationError("Connection entry must be a map");
    }
    Connection conn;
    const std::string where = "connection #" + std::to_string(index);
    if (!c.contains("from") || !c.contains("to")) {
        throw ValidationError(where + ": 'from' and 'to' are required");
    }
    conn.from_port = optional_string(c, "from_port", "out");
    conn.to_port = optional_string(c, "to_port", "in");
    parse_endpoint(c["from"], conn.from_node, conn.from_port, where);
    parse_endpoint(c["to"], conn.to_node, conn.to_port, where);
    conn.id = optional_string(c, "id", conn.from_node + "->" + conn.to_node);

    const std::string kind = optional_string(c, "kind", "data_flow");
    auto parsed = parse_connection_kind(kind);
    if (!parsed) {
        throw ValidationError(where + ": unknown connection kind '" + kind + "'");
    }
    conn.kind = *parsed;
    if (auto it = c.find("condition"); it != c.end() && it->is_string()) {
        conn.condition = it->get<std::string>();
    }
    return conn;
}

std::vector<ScriptStep> parse_script(const Value& arr, const std::string& id_prefix) {
    std::vector<ScriptStep> steps;
    if (arr.is_null()) return steps;
    if (!arr.is_array()) {
        throw ValidationError("'script' must be a list");
    }
    size_t index = 0;
    for (const auto& s : arr) {
        if (!s.is_object()) {
            throw ValidationError("Script step must be a map");
        }
        ScriptStep step;
        step.id = optional_string(s, "id", id_prefix + std::to_string(index));
        step.name = optional_string(s, "name", step.id);
        const std::string type = require_string(s, "type", "script step '" + step.id + "'");
        auto parsed = parse_script_step_type(type);
        if (!parsed) {
            throw ValidationError("Script step '" + step.id + "' has unknown type: " + type);
        }
        step.type = *parsed;
        step.order = s.value("order", static_cast<int>(index));
        step.enabled = s.value("enabled", true);
        if (auto it = s.find("nodes"); it != s.end() && it->is_array()) {
            for (const auto& n : *it) {
                step.node_ids.push_back(n.get<std::string>());
            }
        }
        if (auto it = s.find("condition"); it != s.end() && it->is_string()) {
            step.condition = it->get<std::string>();
        }
        if (auto it = s.find("parameters"); it != s.end() && it->is_object()) {
            step.parameters = *it;
        }
        step.steps = parse_script(s.value("steps", Value()), step.id + ".");
        step.else_steps = parse_script(s.value("else_steps", Value()), step.id + ".else.");
        steps.push_back(std::move(step));
        ++index;
    }
    return steps;
}

} // namespace

WorkflowGraph WorkflowLoader::from_json(const Value& doc) {
    if (!doc.is_object()) {
        throw ValidationError("Workflow document must be a map");
    }
    WorkflowGraph graph;
    try {
        graph.id = require_string(doc, "id", "workflow");
        graph.name = optional_string(doc, "name", graph.id);
        graph.declared_orchestration = optional_string(doc, "orchestration", "sequential");
        graph.orchestration_type = parse_orchestration_type(graph.declared_orchestration);

        if (auto it = doc.find("nodes"); it != doc.end() && it->is_array()) {
            for (const auto& n : *it) {
                graph.nodes.push_back(parse_node(n));
            }
        }
        if (auto it = doc.find("connections"); it != doc.end() && it->is_array()) {
            size_t index = 0;
            for (const auto& c : *it) {
                graph.connections.push_back(parse_connection(c, index++));
            }
        }
        graph.script = parse_script(doc.value("script", Value()), "step-");
    } catch (const nlohmann::json::exception& e) {
        throw ValidationError("Malformed workflow document: " + std::string(e.what()));
    }

    graph.validate();
    return graph;
}

WorkflowGraph WorkflowLoader::from_yaml_string(const std::string& yaml) {
    YAML::Node root;
    try {
        root = YAML::Load(yaml);
    } catch (const YAML::Exception& e) {
        throw ValidationError("YAML parse error: " + std::string(e.what()));
    }
    return from_json(yaml_to_json(root));
}

WorkflowGraph WorkflowLoader::from_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw ValidationError("Cannot open workflow file: " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();

    if (std::filesystem::path(path).extension() == ".json") {
        Value doc = Value::parse(buffer.str(), nullptr, false);
        if (doc.is_discarded()) {
            throw ValidationError("Invalid JSON in workflow file: " + path);
        }
        return from_json(doc);
    }
    return from_yaml_string(buffer.str());
}

} // namespace agentorch

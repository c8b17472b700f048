/**
 * @file WorkflowGraph.cpp
 * @brief Implementation of the graph runner.
 */

#include "application/WorkflowGraph.hpp"
#include "application/Session.hpp"
#include "domain/WorkflowErrors.hpp"
#include <algorithm>
#include <iostream>
#include <sstream>

namespace campaignflow::application {

using domain::InvariantViolationError;
using domain::SessionCancelledError;
using domain::WorkflowState;

std::string RunOutcomeToString(RunOutcome outcome) {
    switch (outcome) {
        case RunOutcome::Completed: return "completed";
        case RunOutcome::Cancelled: return "cancelled";
        case RunOutcome::Failed: return "failed";
        case RunOutcome::Interrupted: return "interrupted";
    }
    return "failed";
}

void WorkflowGraph::addNode(Node node) {
    if (node.name.empty()) {
        throw std::invalid_argument("node name must not be empty");
    }
    if (m_nodes.count(node.name)) {
        throw std::invalid_argument("duplicate node '" + node.name + "'");
    }
    m_order.push_back(node.name);
    std::string name = node.name;
    m_nodes.emplace(std::move(name), std::move(node));
}

void WorkflowGraph::addEdge(const std::string& source, const std::string& target) {
    if (m_routes.count(source)) {
        throw std::invalid_argument("node '" + source + "' already has conditional edges");
    }
    m_edges[source] = target;
}

void WorkflowGraph::addConditionalEdges(const std::string& source, RouteFn route, std::vector<std::string> targets) {
    if (m_edges.count(source)) {
        throw std::invalid_argument("node '" + source + "' already has a fixed edge");
    }
    m_routes[source] = Route{std::move(route), std::move(targets)};
}

void WorkflowGraph::setEntryPoint(const std::string& name) {
    m_entryPoint = name;
}

std::optional<std::string> WorkflowGraph::validate() const {
    if (m_entryPoint.empty() || !hasNode(m_entryPoint)) {
        return "entry point '" + m_entryPoint + "' is not a node";
    }
    for (const auto& [source, target] : m_edges) {
        if (!hasNode(source)) return "edge from unknown node '" + source + "'";
        if (!hasNode(target)) return "edge from '" + source + "' to unknown node '" + target + "'";
    }
    for (const auto& [source, route] : m_routes) {
        if (!hasNode(source)) return "route from unknown node '" + source + "'";
        if (!route.fn) return "route from '" + source + "' has no predicate";
        for (const auto& target : route.targets) {
            if (!hasNode(target)) return "route from '" + source + "' to unknown node '" + target + "'";
        }
    }
    for (const auto& name : m_order) {
        const Node& node = m_nodes.at(name);
        const bool hasOutgoing = m_edges.count(name) || m_routes.count(name);
        if (node.terminal && hasOutgoing) return "terminal node '" + name + "' has outgoing edges";
        if (!node.terminal && !hasOutgoing) return "node '" + name + "' has no outgoing edge";
    }
    return std::nullopt;
}

RunOutcome WorkflowGraph::run(Session& session, const std::string& startNode) const {
    std::string current = startNode.empty() ? m_entryPoint : startNode;
    if (!hasNode(current)) {
        return fail(session, "unknown start node '" + current + "'");
    }

    WorkflowState& state = session.state();
    while (true) {
        if (session.isCancelled()) {
            return stopped(session);
        }

        const Node& node = m_nodes.at(current);
        const auto phaseBefore = state.phase;
        try {
            session.enterNode(current);
            if (node.run) {
                node.run(state, session);
            }
            if (session.isCancelled()) {
                return stopped(session);
            }
            if (state.phase < phaseBefore) {
                throw InvariantViolationError("phase moved back from " + domain::PhaseToString(phaseBefore) +
                                              " to " + domain::PhaseToString(state.phase) + " in '" + current + "'");
            }
            if (auto violation = state.validate()) {
                throw InvariantViolationError(*violation + " after '" + current + "'");
            }
            if (auto open = session.pendingQuestion()) {
                throw InvariantViolationError("question '" + open->id + "' left open by '" + current + "'");
            }
        } catch (const SessionCancelledError&) {
            std::cout << "[WorkflowGraph] " << session.id() << ": suspended in '" << current
                      << "' torn down" << std::endl;
            return stopped(session);
        } catch (const std::exception& e) {
            if (session.isCancelled()) {
                return stopped(session);
            }
            if (current == kErrorNode) {
                std::cerr << "[WorkflowGraph] " << session.id() << ": error node failed: " << e.what() << std::endl;
                return RunOutcome::Failed;
            }
            return fail(session, e.what());
        }

        if (node.terminal) {
            if (current == kCancelledNode) return RunOutcome::Cancelled;
            if (current == kErrorNode) return RunOutcome::Failed;
            return RunOutcome::Completed;
        }

        try {
            current = next(current, state);
        } catch (const InvariantViolationError& e) {
            return fail(session, e.what());
        }
    }
}

RunOutcome WorkflowGraph::stopped(const Session& session) const {
    return session.isResumable() ? RunOutcome::Interrupted : RunOutcome::Cancelled;
}

std::string WorkflowGraph::next(const std::string& current, const WorkflowState& state) const {
    auto route = m_routes.find(current);
    if (route != m_routes.end()) {
        std::string target = route->second.fn(state);
        const auto& targets = route->second.targets;
        if (std::find(targets.begin(), targets.end(), target) == targets.end()) {
            throw InvariantViolationError("route from '" + current + "' chose undeclared node '" + target + "'");
        }
        return target;
    }
    auto edge = m_edges.find(current);
    if (edge != m_edges.end()) {
        return edge->second;
    }
    throw InvariantViolationError("node '" + current + "' has no outgoing edge");
}

RunOutcome WorkflowGraph::fail(Session& session, const std::string& reason) const {
    std::cerr << "[WorkflowGraph] " << session.id() << ": " << reason << std::endl;
    session.state().lastError = reason;

    auto it = m_nodes.find(kErrorNode);
    if (it == m_nodes.end() || !it->second.run) {
        return RunOutcome::Failed;
    }
    try {
        session.enterNode(kErrorNode);
        it->second.run(session.state(), session);
    } catch (const std::exception& e) {
        std::cerr << "[WorkflowGraph] " << session.id() << ": error node failed: " << e.what() << std::endl;
    }
    return RunOutcome::Failed;
}

std::vector<std::string> WorkflowGraph::nodeNames() const {
    return m_order;
}

bool WorkflowGraph::hasNode(const std::string& name) const {
    return m_nodes.count(name) > 0;
}

bool WorkflowGraph::isTerminal(const std::string& name) const {
    auto it = m_nodes.find(name);
    return it != m_nodes.end() && it->second.terminal;
}

std::string WorkflowGraph::toMermaid() const {
    std::ostringstream out;
    out << "flowchart TD\n";
    out << "    __start__([start])\n";
    for (const auto& name : m_order) {
        const Node& node = m_nodes.at(name);
        if (node.terminal) {
            out << "    " << name << "([" << name << "])\n";
        } else if (node.capability == NodeCapability::Routing) {
            out << "    " << name << "{" << name << "}\n";
        } else if (node.capability == NodeCapability::Interactive) {
            out << "    " << name << "[/" << name << "/]\n";
        } else {
            out << "    " << name << "[" << name << "]\n";
        }
    }
    if (!m_entryPoint.empty()) {
        out << "    __start__ --> " << m_entryPoint << "\n";
    }
    for (const auto& name : m_order) {
        auto edge = m_edges.find(name);
        if (edge != m_edges.end()) {
            out << "    " << name << " --> " << edge->second << "\n";
        }
        auto route = m_routes.find(name);
        if (route != m_routes.end()) {
            for (const auto& target : route->second.targets) {
                out << "    " << name << " -.-> " << target << "\n";
            }
        }
    }
    return out.str();
}

} // namespace campaignflow::application

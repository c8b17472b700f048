/**
 * @file WorkflowGraph.hpp
 * @brief Node set plus routing that drives a session until it suspends or terminates.
 */

#pragma once

#include <functional>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include "domain/WorkflowState.hpp"

namespace campaignflow::application {

class Session;

enum class NodeCapability {
    Automatic,   ///< Runs without user input.
    Interactive, ///< May suspend on the session's broker.
    Routing      ///< Changes nothing; exists to branch.
};

using NodeFn = std::function<void(domain::WorkflowState&, Session&)>;
using RouteFn = std::function<std::string(const domain::WorkflowState&)>;

struct Node {
    std::string name;
    NodeCapability capability = NodeCapability::Automatic;
    NodeFn run;
    bool terminal = false;
};

enum class RunOutcome {
    Completed,
    Cancelled,   ///< Reached the cancelled terminal or cancelled explicitly.
    Failed,      ///< Reached the error terminal.
    Interrupted  ///< Detached mid-run; checkpoint left for resume.
};

std::string RunOutcomeToString(RunOutcome outcome);

/**
 * @class WorkflowGraph
 * @brief Immutable once built. One graph is shared by all sessions; run() is re-entrant.
 *
 * After every node the runner validates the WorkflowState, checks that no question is
 * left open and that the phase did not move backwards. A broken invariant or an
 * exception from a node routes to the node named "error".
 */
class WorkflowGraph {
public:
    static constexpr const char* kErrorNode = "error";
    static constexpr const char* kCancelledNode = "cancelled";

    void addNode(Node node);
    void addEdge(const std::string& source, const std::string& target);

    /**
     * @brief Adds a predicate-driven branch.
     * @param targets Every name the predicate may return.
     */
    void addConditionalEdges(const std::string& source, RouteFn route, std::vector<std::string> targets);

    void setEntryPoint(const std::string& name);
    const std::string& entryPoint() const { return m_entryPoint; }

    /**
     * @brief Checks the wiring.
     * @return Description of the first problem, or nullopt.
     */
    std::optional<std::string> validate() const;

    /**
     * @brief Executes nodes from startNode (the entry point when empty) until a terminal
     *        node finishes or the session is torn down.
     */
    RunOutcome run(Session& session, const std::string& startNode = "") const;

    std::vector<std::string> nodeNames() const;
    bool hasNode(const std::string& name) const;
    bool isTerminal(const std::string& name) const;

    /** @brief Mermaid flowchart of the graph. */
    std::string toMermaid() const;

private:
    struct Route {
        RouteFn fn;
        std::vector<std::string> targets;
    };

    std::string next(const std::string& current, const domain::WorkflowState& state) const;
    RunOutcome fail(Session& session, const std::string& reason) const;
    RunOutcome stopped(const Session& session) const;

    std::map<std::string, Node> m_nodes;
    std::vector<std::string> m_order;
    std::map<std::string, std::string> m_edges;
    std::map<std::string, Route> m_routes;
    std::string m_entryPoint;
};

} // namespace campaignflow::application

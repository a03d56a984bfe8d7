#pragma once

#include "skillroute/types.hpp"
#include <stdexcept>
#include <string>

namespace skillroute {

class SkillRouteException : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class InvalidAgentProfileException : public SkillRouteException {
public:
    InvalidAgentProfileException(const AgentId& id, const std::string& reason)
        : SkillRouteException("Invalid agent profile '" + id + "': " + reason)
        , agent_id_(id) {}

    const AgentId& agent_id() const noexcept { return agent_id_; }

private:
    AgentId agent_id_;
};

class InvalidRoutingRuleException : public SkillRouteException {
public:
    InvalidRoutingRuleException(const RuleId& id, const std::string& reason)
        : SkillRouteException("Invalid routing rule '" + id + "': " + reason)
        , rule_id_(id) {}

    const RuleId& rule_id() const noexcept { return rule_id_; }

private:
    RuleId rule_id_;
};

class QueueFullException : public SkillRouteException {
public:
    QueueFullException(const QueueId& queue_id, std::size_t capacity)
        : SkillRouteException("Queue '" + queue_id + "' is full (capacity " +
                              std::to_string(capacity) + ")")
        , queue_id_(queue_id) {}

    const QueueId& queue_id() const noexcept { return queue_id_; }

private:
    QueueId queue_id_;
};

class MissingCollaboratorException : public SkillRouteException {
public:
    explicit MissingCollaboratorException(const std::string& what)
        : SkillRouteException("Missing collaborator: " + what) {}
};

} // namespace skillroute

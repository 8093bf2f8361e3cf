#include "state_machine.hpp"

#include <algorithm>
#include <cctype>

#include "internal/util/errors.hpp"

namespace casetrack::lifecycle {

bool IsBlank(const std::string& value) {
  return std::all_of(value.begin(), value.end(), [](unsigned char c) { return std::isspace(c) != 0; });
}

TransitionTable& TransitionTable::Allow(const std::string& from, const std::string& to, TransitionRule rule) {
  edges_[from][to] = std::move(rule);
  edges_.try_emplace(to);
  return *this;
}

TransitionTable& TransitionTable::Terminal(const std::string& state) {
  edges_.try_emplace(state);
  return *this;
}

const TransitionRule* TransitionTable::Find(const std::string& from, const std::string& to) const {
  auto it = edges_.find(from);
  if (it == edges_.end()) return nullptr;
  auto edge = it->second.find(to);
  if (edge == it->second.end()) return nullptr;
  return &edge->second;
}

bool TransitionTable::HasState(const std::string& state) const {
  return edges_.contains(state);
}

bool TransitionTable::IsTerminal(const std::string& state) const {
  auto it = edges_.find(state);
  return it != edges_.end() && it->second.empty();
}

std::vector<std::string> TransitionTable::Targets(const std::string& from) const {
  std::vector<std::string> out;
  auto                     it = edges_.find(from);
  if (it == edges_.end()) return out;
  for (const auto& [to, _] : it->second) out.push_back(to);
  return out;
}

StateMachine::StateMachine(std::string entity_type, TransitionTable table, std::string system_actor)
    : entity_type_(std::move(entity_type)), table_(std::move(table)), system_actor_(std::move(system_actor)) {
}

const TransitionRule& StateMachine::AssertTransition(const std::string& from, const std::string& to) const {
  if (!table_.HasState(to)) {
    throw util::InvalidArgument("unknown " + entity_type_ + " state '" + to + "'");
  }

  const auto* rule = table_.Find(from, to);
  if (!rule) {
    if (table_.IsTerminal(from)) {
      throw util::InvalidTransition(entity_type_ + " in terminal state " + from + " cannot move to " + to, from);
    }
    throw util::InvalidTransition(entity_type_ + " cannot move from " + from + " to " + to, from);
  }
  return *rule;
}

const TransitionRule& StateMachine::Check(const std::string& from, const TransitionRequest& request) const {
  const auto& rule = AssertTransition(from, request.to);

  if (rule.system_only && request.actor != system_actor_) {
    throw util::InvalidTransition(entity_type_ + " moves from " + from + " to " + request.to + " only automatically", from);
  }

  if (rule.requires_annotation && IsBlank(request.annotation)) {
    throw util::MissingAnnotation("moving " + entity_type_ + " to " + request.to + " requires a comment");
  }

  for (const auto& field : rule.required_fields) {
    auto it = request.fields.find(field);
    if (it == request.fields.end() || IsBlank(it->second)) {
      throw util::MissingField("moving " + entity_type_ + " to " + request.to + " requires " + field, field);
    }
  }

  return rule;
}

} // namespace casetrack::lifecycle

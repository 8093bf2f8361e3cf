#pragma once

#include <map>
#include <string>
#include <vector>

namespace casetrack::lifecycle {

struct TransitionRule {
  bool                     requires_annotation = false;
  std::vector<std::string> required_fields;
  // only the system actor may take this edge
  bool system_only = false;
};

/*
  Explicit transition table for one entity type.

  Every state is declared; a pair that is not listed is illegal,
  self-transitions included. A declared state with no outgoing edges
  is terminal.
*/
class TransitionTable {
 public:
  TransitionTable& Allow(const std::string& from, const std::string& to, TransitionRule rule = {});
  TransitionTable& Terminal(const std::string& state);

  // nullptr when the pair is not listed
  const TransitionRule* Find(const std::string& from, const std::string& to) const;

  bool HasState(const std::string& state) const;
  bool IsTerminal(const std::string& state) const;

  std::vector<std::string> Targets(const std::string& from) const;

 private:
  std::map<std::string, std::map<std::string, TransitionRule>> edges_;
};

struct TransitionRequest {
  std::string to;
  std::string annotation;
  std::string actor;

  std::map<std::string, std::string> fields;
};

class StateMachine {
 public:
  StateMachine(std::string entity_type, TransitionTable table, std::string system_actor);

  // Throws InvalidTransition (carrying `from` as the current state).
  const TransitionRule& AssertTransition(const std::string& from, const std::string& to) const;

  /*
    Full admission check for a request:
      legal edge            else InvalidTransition
      system-only edge      else InvalidTransition for non-system actors
      annotation present    else MissingAnnotation (empty or whitespace)
      required fields       else MissingField
  */
  const TransitionRule& Check(const std::string& from, const TransitionRequest& request) const;

  const TransitionTable& Table() const {
    return table_;
  }

  const std::string& EntityType() const {
    return entity_type_;
  }

 private:
  std::string     entity_type_;
  TransitionTable table_;
  std::string     system_actor_;
};

bool IsBlank(const std::string& value);

} // namespace casetrack::lifecycle

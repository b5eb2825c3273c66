#pragma once
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "alarm_aggregator.hpp"

namespace mvs {

// What is about to be sent to the panel.
struct CommandRequest {
  std::string installation;
  std::string command;                 // arm_away, arm_home, arm_night, disarm
  std::optional<PanelState> last_known;
};

using CommandDecision = std::function<bool(const CommandRequest&)>;

// Decides whether an arm / disarm command may be issued at all.
class CommandPolicy {
public:
  virtual ~CommandPolicy() = default;
  virtual bool permit(const CommandRequest& req) = 0;
  virtual const char* name() const = 0;
};

// user-issued commands run as asked
class DirectExecutePolicy : public CommandPolicy {
public:
  bool permit(const CommandRequest&) override { return true; }
  const char* name() const override { return "direct"; }
};

// every command waits for an approver (a person, a supervising process)
class ConditionalApprovePolicy : public CommandPolicy {
public:
  explicit ConditionalApprovePolicy(CommandDecision approver);
  bool permit(const CommandRequest& req) override;
  const char* name() const override { return "approve"; }

private:
  CommandDecision approver_;
};

// an external decision function acts on its own, at most max_actions times
class AutonomousLoopPolicy : public CommandPolicy {
public:
  AutonomousLoopPolicy(CommandDecision decide, int max_actions);
  bool permit(const CommandRequest& req) override;
  const char* name() const override { return "autonomous"; }

  int actions_taken() const;

private:
  CommandDecision decide_;
  int max_actions_;
  mutable std::mutex mu_;
  int taken_{0};
};

// "direct" | "approve" | "autonomous"; throws std::runtime_error otherwise
std::unique_ptr<CommandPolicy> make_policy(const std::string& name, CommandDecision fn = {},
                                           int max_actions = 1);

} // namespace mvs

#include "command_policy.hpp"

#include <iostream>
#include <stdexcept>

namespace mvs {

ConditionalApprovePolicy::ConditionalApprovePolicy(CommandDecision approver)
  : approver_(std::move(approver)) {}

bool ConditionalApprovePolicy::permit(const CommandRequest& req) {
  if(!approver_){
    std::cerr << "[ALARM] no approver configured, refusing " << req.command << "\n";
    return false;
  }
  bool ok = approver_(req);
  std::cout << "[ALARM] " << req.command << (ok ? " approved" : " not approved") << "\n";
  return ok;
}

AutonomousLoopPolicy::AutonomousLoopPolicy(CommandDecision decide, int max_actions)
  : decide_(std::move(decide)), max_actions_(max_actions < 0 ? 0 : max_actions) {}

bool AutonomousLoopPolicy::permit(const CommandRequest& req) {
  {
    std::scoped_lock lk(mu_);
    if(taken_ >= max_actions_){
      std::cerr << "[ALARM] autonomous action budget (" << max_actions_ << ") spent, refusing "
                << req.command << "\n";
      return false;
    }
  }

  if(!decide_ || !decide_(req)) return false;

  std::scoped_lock lk(mu_);
  if(taken_ >= max_actions_) return false;
  taken_++;
  return true;
}

int AutonomousLoopPolicy::actions_taken() const {
  std::scoped_lock lk(mu_);
  return taken_;
}

std::unique_ptr<CommandPolicy> make_policy(const std::string& name, CommandDecision fn, int max_actions) {
  if(name.empty() || name == "direct") return std::make_unique<DirectExecutePolicy>();
  if(name == "approve") return std::make_unique<ConditionalApprovePolicy>(std::move(fn));
  if(name == "autonomous") return std::make_unique<AutonomousLoopPolicy>(std::move(fn), max_actions);
  throw std::runtime_error("unknown command policy '" + name + "'");
}

} // namespace mvs

#pragma once

// evogate/approval.hpp — Approval-level algorithm.
//
// Pure function of (risk, sandbox status, ethical compliance):
//   1. base level from risk: safe->automatic, caution->review_required,
//      dangerous->human_approval, blocked->committee_approval
//   2. sandbox not completed: escalate one level, capped at human_approval
//      for the two lowest levels (higher levels unchanged)
//   3. not ethically compliant: human_approval, unless already committee
//
// may_auto_apply() is the only gate for applying without a human decision.

#include "evogate/types.hpp"

namespace evogate {

ApprovalLevel base_approval_level(RiskAssessment risk);

ApprovalLevel determine_approval_level(RiskAssessment risk, SandboxStatus status, bool ethical_compliance);

inline bool may_auto_apply(ApprovalLevel level, SandboxStatus status) {
  return level == ApprovalLevel::automatic && status == SandboxStatus::completed;
}

}  // namespace evogate

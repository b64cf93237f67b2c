#include "evogate/approval.hpp"

namespace evogate {

ApprovalLevel base_approval_level(RiskAssessment risk) {
  switch (risk) {
    case RiskAssessment::safe: return ApprovalLevel::automatic;
    case RiskAssessment::caution: return ApprovalLevel::review_required;
    case RiskAssessment::dangerous: return ApprovalLevel::human_approval;
    case RiskAssessment::blocked: return ApprovalLevel::committee_approval;
  }
  return ApprovalLevel::committee_approval;
}

ApprovalLevel determine_approval_level(RiskAssessment risk, SandboxStatus status, bool ethical_compliance) {
  ApprovalLevel level = base_approval_level(risk);

  if (status != SandboxStatus::completed) {
    switch (level) {
      case ApprovalLevel::automatic: level = ApprovalLevel::review_required; break;
      case ApprovalLevel::review_required: level = ApprovalLevel::human_approval; break;
      case ApprovalLevel::human_approval:
      case ApprovalLevel::committee_approval: break;
    }
  }

  if (!ethical_compliance && level != ApprovalLevel::committee_approval) {
    level = ApprovalLevel::human_approval;
  }
  return level;
}

}  // namespace evogate

#include "params.h"

#include "errors.h"

namespace fmcal {

const char *toString(ProposalStatus s) {
    switch (s) {
    case ProposalStatus::Pending: return "PENDING";
    case ProposalStatus::Approved: return "APPROVED";
    case ProposalStatus::Rejected: return "REJECTED";
    }
    return "?";
}

ProposalStatus proposalStatusFromString(const std::string &s) {
    if (s == "PENDING") return ProposalStatus::Pending;
    if (s == "APPROVED") return ProposalStatus::Approved;
    if (s == "REJECTED") return ProposalStatus::Rejected;
    throw ParseError("Unknown proposal status: " + s);
}

const char *toString(AuditAction a) {
    switch (a) {
    case AuditAction::ChangeParams: return "ChangeParams";
    case AuditAction::Defer: return "Defer";
    }
    return "?";
}

AuditAction auditActionFromString(const std::string &s) {
    if (s == "ChangeParams") return AuditAction::ChangeParams;
    if (s == "Defer") return AuditAction::Defer;
    throw ParseError("Unknown audit action: " + s);
}

}  // namespace fmcal

#ifndef LEDGER_JSON_HPP_
#define LEDGER_JSON_HPP_

#include "advances/advance_ledger.hpp"
#include "allocation/allocation_engine.hpp"
#include "escalation/escalation_engine.hpp"
#include "ledger_errors.hpp"
#include "ledger_types.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

// nlohmann::json conversions for ledger records and engine results.
// Found by argument-dependent lookup, so `nlohmann::json j = record;` works.

namespace recon {

void to_json(nlohmann::json& j, const BankMovement& movement);
void to_json(nlohmann::json& j, const ExpenseRecord& expense);
void to_json(nlohmann::json& j, const SplitRow& row);
void to_json(nlohmann::json& j, const SplitAnnotation& annotation);
void to_json(nlohmann::json& j, const SplitGroup& group);
void to_json(nlohmann::json& j, const EmployeeAdvance& advance);
void to_json(nlohmann::json& j, const NonReconciliationCase& nr_case);
void to_json(nlohmann::json& j, const CaseHistoryEntry& entry);

namespace network {

/** Required payload field; LedgerError(INVALID_ARGUMENT) when missing or mistyped. */
template <typename T>
T field(const nlohmann::json& payload, const char* key) {
  if (!payload.is_object() || !payload.contains(key)) {
    throw LedgerError(ErrorCode::INVALID_ARGUMENT, std::string("Missing field '") + key + "'");
  }
  try {
    return payload.at(key).get<T>();
  } catch (const nlohmann::json::exception&) {
    throw LedgerError(ErrorCode::INVALID_ARGUMENT, std::string("Invalid field '") + key + "'");
  }
}

/** Optional payload field; `fallback` when missing or null. */
template <typename T>
T fieldOr(const nlohmann::json& payload, const char* key, T fallback) {
  if (!payload.is_object() || !payload.contains(key) || payload.at(key).is_null()) {
    return fallback;
  }
  return field<T>(payload, key);
}

/**
 * Import payloads. Throw LedgerError(INVALID_ARGUMENT) for missing or
 * mistyped fields.
 */
BankMovement parseMovement(const nlohmann::json& payload);
ExpenseRecord parseExpense(const nlohmann::json& payload);
std::vector<allocation::SplitMember> parseSplitMembers(const nlohmann::json& members);

}  // namespace network

namespace allocation {
void to_json(nlohmann::json& j, const SplitOutcome& outcome);
void to_json(nlohmann::json& j, const SplitSummary& summary);
}  // namespace allocation

namespace advances {
void to_json(nlohmann::json& j, const PendingAdvance& pending);
void to_json(nlohmann::json& j, const EmployeeAdvanceSummary& summary);
void to_json(nlohmann::json& j, const AdvanceSummary& summary);
}  // namespace advances

namespace escalation {
void to_json(nlohmann::json& j, const ReasonInfo& info);
void to_json(nlohmann::json& j, const EscalationRule& rule);
void to_json(nlohmann::json& j, const SweepReport& report);
}  // namespace escalation

}  // namespace recon

#endif  // LEDGER_JSON_HPP_

#ifndef LEDGER_CONFIG_HPP_
#define LEDGER_CONFIG_HPP_

#include "escalation/escalation_rules.hpp"
#include "notifications/notification_dispatcher.hpp"

#include <nlohmann/json.hpp>

#include <map>
#include <string>
#include <vector>

namespace recon {
namespace config {

/**
 * Typed configuration of the ledger service. Every field has a default, so
 * an empty JSON object is a valid configuration.
 */
struct LedgerConfig {
  struct Server {
    int port = 9090;
  };

  struct Database {
    bool enabled = false;
    std::string host = "localhost";
    int port = 5432;
    std::string name = "recon_ledger";
    std::string username = "recon_user";
    std::string password = "";
    int connection_timeout = 30;  // seconds
    std::string schema_path = "database/schema.sql";
  };

  struct Allocation {
    int max_retries = 3;
  };

  struct Advances {
    int max_retries = 3;
    int warning_after_days = 7;
    int urgent_after_days = 15;
  };

  struct Escalation {
    int default_escalation_after_days = escalation::kDefaultEscalationAfterDays;
    int sweep_interval_seconds = 3600;
    int max_retries = 3;
    std::vector<escalation::EscalationRule> rules;
    std::map<int, std::vector<notifications::NotificationRecipient>> recipients_by_level;
  };

  struct Analytics {
    int rollup_interval_seconds = 900;
  };

  struct Logging {
    std::string level = "info";
  };

  Server server;
  Database database;
  Allocation allocation;
  Advances advances;
  Escalation escalation;
  Analytics analytics;
  Logging logging;
};

/**
 * Builds a configuration from JSON. Unknown keys are ignored.
 * Throws std::runtime_error for values of the wrong type or unknown enum names.
 */
LedgerConfig parseConfig(const nlohmann::json& document);

/**
 * Reads and parses a JSON configuration file.
 */
LedgerConfig loadConfigFile(const std::string& path);

/** Escalation rule from its JSON form (same keys as the config file). */
escalation::EscalationRule parseRule(const nlohmann::json& rule);

}  // namespace config
}  // namespace recon

#endif  // LEDGER_CONFIG_HPP_

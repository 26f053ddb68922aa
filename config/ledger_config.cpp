#include "ledger_config.hpp"

#include <fstream>
#include <stdexcept>

namespace recon {
namespace config {

namespace {

template <typename T>
void read(const nlohmann::json& object, const char* key, T& target) {
  if (!object.contains(key) || object.at(key).is_null()) return;
  try {
    target = object.at(key).get<T>();
  } catch (const nlohmann::json::exception& e) {
    throw std::runtime_error(std::string("Invalid config value for '") + key + "': " + e.what());
  }
}

const nlohmann::json& section(const nlohmann::json& document, const char* key) {
  static const nlohmann::json kEmpty = nlohmann::json::object();
  if (!document.contains(key)) return kEmpty;
  const auto& value = document.at(key);
  if (!value.is_object()) {
    throw std::runtime_error(std::string("Config section '") + key + "' must be an object");
  }
  return value;
}

notifications::NotificationRecipient parseRecipient(const nlohmann::json& value) {
  notifications::NotificationRecipient recipient;
  std::string type = value.value("type", std::string("role"));
  auto parsed = notifications::parseRecipientType(type);
  if (!parsed) {
    throw std::runtime_error("Unknown recipient type: " + type);
  }
  recipient.type = *parsed;
  recipient.identifier = value.value("identifier", std::string());
  return recipient;
}

}  // namespace

escalation::EscalationRule parseRule(const nlohmann::json& value) {
  escalation::EscalationRule rule;
  read(value, "rule_code", rule.rule_code);
  read(value, "rule_name", rule.rule_name);
  read(value, "company_id", rule.company_id);
  read(value, "is_active", rule.is_active);
  read(value, "escalation_after_days", rule.escalation_after_days);

  if (value.contains("minimum_amount") && !value.at("minimum_amount").is_null()) {
    rule.minimum_amount = value.at("minimum_amount").get<Amount>();
  }
  if (value.contains("maximum_amount") && !value.at("maximum_amount").is_null()) {
    rule.maximum_amount = value.at("maximum_amount").get<Amount>();
  }

  if (value.contains("reason_codes")) {
    for (const auto& code : value.at("reason_codes")) {
      auto parsed = parseReasonCode(code.get<std::string>());
      if (!parsed) {
        throw std::runtime_error("Unknown reason code in rule " + rule.rule_code + ": " +
                                 code.get<std::string>());
      }
      rule.reason_codes.push_back(*parsed);
    }
  }
  if (value.contains("categories")) {
    for (const auto& category : value.at("categories")) {
      auto parsed = parseReasonCategory(category.get<std::string>());
      if (!parsed) {
        throw std::runtime_error("Unknown reason category in rule " + rule.rule_code + ": " +
                                 category.get<std::string>());
      }
      rule.categories.push_back(*parsed);
    }
  }
  return rule;
}

LedgerConfig parseConfig(const nlohmann::json& document) {
  if (!document.is_object()) {
    throw std::runtime_error("Config document must be a JSON object");
  }

  LedgerConfig config;

  const auto& server = section(document, "server");
  read(server, "port", config.server.port);

  const auto& database = section(document, "database");
  read(database, "enabled", config.database.enabled);
  read(database, "host", config.database.host);
  read(database, "port", config.database.port);
  read(database, "name", config.database.name);
  read(database, "username", config.database.username);
  read(database, "password", config.database.password);
  read(database, "connection_timeout", config.database.connection_timeout);
  read(database, "schema_path", config.database.schema_path);

  const auto& allocation = section(document, "allocation");
  read(allocation, "max_retries", config.allocation.max_retries);

  const auto& advances = section(document, "advances");
  read(advances, "max_retries", config.advances.max_retries);
  read(advances, "warning_after_days", config.advances.warning_after_days);
  read(advances, "urgent_after_days", config.advances.urgent_after_days);

  const auto& escalation = section(document, "escalation");
  read(escalation, "default_escalation_after_days",
       config.escalation.default_escalation_after_days);
  read(escalation, "sweep_interval_seconds", config.escalation.sweep_interval_seconds);
  read(escalation, "max_retries", config.escalation.max_retries);

  try {
    if (escalation.contains("rules")) {
      for (const auto& rule : escalation.at("rules")) {
        config.escalation.rules.push_back(parseRule(rule));
      }
    }

    // "recipients": {"2": [{"type": "role", "identifier": "finance_lead"}], ...}
    if (escalation.contains("recipients")) {
      for (const auto& item : escalation.at("recipients").items()) {
        auto& target = config.escalation.recipients_by_level[std::stoi(item.key())];
        for (const auto& recipient : item.value()) {
          target.push_back(parseRecipient(recipient));
        }
      }
    }
  } catch (const nlohmann::json::exception& e) {
    throw std::runtime_error(std::string("Invalid escalation config: ") + e.what());
  } catch (const std::invalid_argument& e) {
    throw std::runtime_error(std::string("Invalid escalation level key: ") + e.what());
  }

  const auto& analytics = section(document, "analytics");
  read(analytics, "rollup_interval_seconds", config.analytics.rollup_interval_seconds);

  const auto& logging = section(document, "logging");
  read(logging, "level", config.logging.level);

  if (config.allocation.max_retries < 1 || config.advances.max_retries < 1 ||
      config.escalation.max_retries < 1) {
    throw std::runtime_error("max_retries must be at least 1");
  }
  if (config.escalation.default_escalation_after_days <= 0) {
    throw std::runtime_error("default_escalation_after_days must be positive");
  }

  return config;
}

LedgerConfig loadConfigFile(const std::string& path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    throw std::runtime_error("Failed to open config file: " + path);
  }

  nlohmann::json document;
  try {
    file >> document;
  } catch (const nlohmann::json::parse_error& e) {
    throw std::runtime_error("Failed to parse config file " + path + ": " + e.what());
  }
  return parseConfig(document);
}

}  // namespace config
}  // namespace recon

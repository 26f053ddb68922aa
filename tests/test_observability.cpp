#include "observability/logger.hpp"
#include "observability/metrics.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <sstream>
#include <vector>

using namespace recon::observability;

namespace {

std::vector<nlohmann::json> parseLines(const std::string& output) {
  std::vector<nlohmann::json> lines;
  std::istringstream stream(output);
  std::string line;
  while (std::getline(stream, line)) {
    if (!line.empty()) lines.push_back(nlohmann::json::parse(line));
  }
  return lines;
}

}  // namespace

// Captures the global logger into a string for the duration of a test
class LoggerTest : public ::testing::Test {
 protected:
  void SetUp() override {
    previous_level_ = Logger::getInstance().getLogLevel();
    Logger::getInstance().setOutputStream(output_);
    Logger::getInstance().setLogLevel(LogLevel::INFO);
  }

  void TearDown() override {
    Logger::getInstance().setOutputStream(std::cout);
    Logger::getInstance().setLogLevel(previous_level_);
  }

  std::ostringstream output_;
  LogLevel previous_level_ = LogLevel::INFO;
};

TEST_F(LoggerTest, WritesOneJsonObjectPerLine) {
  Logger::getInstance().info("Split proposed", "ProposeSplit", "op-17");
  Logger::getInstance().warn("Sweep deferred");

  auto lines = parseLines(output_.str());
  ASSERT_EQ(lines.size(), 2u);
  EXPECT_EQ(lines[0]["level"], "INFO");
  EXPECT_EQ(lines[0]["message"], "Split proposed");
  EXPECT_EQ(lines[0]["component"], "ProposeSplit");
  EXPECT_EQ(lines[0]["correlation_id"], "op-17");
  EXPECT_TRUE(lines[0].contains("timestamp"));
  EXPECT_TRUE(lines[0].contains("thread"));
  EXPECT_EQ(lines[1]["level"], "WARN");
  EXPECT_FALSE(lines[1].contains("correlation_id"));
}

TEST_F(LoggerTest, BuilderEmitsTypedFields) {
  {
    Logger::LogBuilder(LogLevel::INFO, "Reimbursement recorded \"partial\"")
        .field("advance_id", "adv-exp-1")
        .field("amount", int64_t{35050})
        .field("complete", false)
        .field("ratio", 0.5)
        .correlation("op-9");
  }

  auto lines = parseLines(output_.str());
  ASSERT_EQ(lines.size(), 1u);
  EXPECT_EQ(lines[0]["message"], "Reimbursement recorded \"partial\"");
  EXPECT_EQ(lines[0]["advance_id"], "adv-exp-1");
  EXPECT_EQ(lines[0]["amount"], 35050);
  EXPECT_EQ(lines[0]["complete"], false);
  EXPECT_DOUBLE_EQ(lines[0]["ratio"].get<double>(), 0.5);
  EXPECT_EQ(lines[0]["correlation_id"], "op-9");
}

TEST_F(LoggerTest, LevelFiltersOutput) {
  Logger::getInstance().setLogLevel(LogLevel::WARN);
  Logger::getInstance().debug("hidden");
  Logger::getInstance().info("hidden");
  Logger::getInstance().error("shown");

  auto lines = parseLines(output_.str());
  ASSERT_EQ(lines.size(), 1u);
  EXPECT_EQ(lines[0]["message"], "shown");
}

TEST(LogLevelTest, ParsesNamesInAnyCase) {
  EXPECT_EQ(parseLogLevel("debug"), LogLevel::DEBUG);
  EXPECT_EQ(parseLogLevel("WARN"), LogLevel::WARN);
  EXPECT_EQ(parseLogLevel("Error"), LogLevel::ERROR);
  EXPECT_FALSE(parseLogLevel("verbose").has_value());
}

TEST(MetricsCollectorTest, CountersAndGauges) {
  MetricsCollector metrics;
  metrics.incrementCounter("recon_requests_total");
  metrics.incrementCounter("recon_requests_total", 2);
  metrics.setGauge("recon_cases_open", 5);
  metrics.incrementGauge("recon_cases_open");
  metrics.decrementGauge("recon_cases_open", 3);

  EXPECT_DOUBLE_EQ(metrics.counterValue("recon_requests_total"), 3.0);
  EXPECT_DOUBLE_EQ(metrics.gaugeValue("recon_cases_open"), 3.0);
  EXPECT_DOUBLE_EQ(metrics.counterValue("never_touched"), 0.0);

  metrics.reset();
  EXPECT_DOUBLE_EQ(metrics.counterValue("recon_requests_total"), 0.0);
}

TEST(MetricsCollectorTest, TimerFeedsHistogram) {
  MetricsCollector metrics;
  {
    MetricsCollector::Timer timer(metrics, "recon_escalation_sweep_seconds");
  }
  metrics.observeHistogram("recon_escalation_sweep_seconds", 0.2);
  EXPECT_EQ(metrics.histogramCount("recon_escalation_sweep_seconds"), 2u);
}

TEST(MetricsCollectorTest, ExportsPrometheusText) {
  MetricsCollector metrics;
  metrics.incrementCounter("recon_requests_total", 4);
  metrics.setGauge("recon_advances_pending_amount", 35050);
  metrics.observeHistogram("recon_request_duration_seconds", 1000.0);

  std::string text = metrics.exportMetrics();
  EXPECT_NE(text.find("# TYPE recon_requests_total counter\nrecon_requests_total 4\n"),
            std::string::npos);
  EXPECT_NE(text.find("# TYPE recon_advances_pending_amount gauge\n"), std::string::npos);
  EXPECT_NE(text.find("recon_request_duration_seconds_bucket{le=\"+Inf\"} 1\n"),
            std::string::npos);
  EXPECT_NE(text.find("recon_request_duration_seconds_count 1\n"), std::string::npos);
}

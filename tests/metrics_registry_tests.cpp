#include <gtest/gtest.h>
#include "chunkvault/utilities/metrics.h"

using chunkvault::MetricsRegistry;

/**
 * @brief Verify correct formatting of label strings in Prometheus format.
 */
TEST(MetricsRegistry, LabelsToString) {
    MetricsRegistry::Labels labels{{"k","v"},{"a","b"}};
    std::string formatted = MetricsRegistry::labelsToString(labels);
    // Map iteration is ordered, so "a" should come before "k".
    EXPECT_EQ(formatted, "{a=\"b\",k=\"v\"}");
    EXPECT_EQ(MetricsRegistry::labelsToString({}), "");
}

/**
 * @brief Validate gauge, counter and histogram reporting.
 */
TEST(MetricsRegistry, BasicRecording) {
    MetricsRegistry::instance().reset();
    MetricsRegistry::instance().setGauge("gauge", 2.5, {{"host","localhost"}});
    MetricsRegistry::instance().incrementCounter("requests_total", 3);
    MetricsRegistry::instance().observe("latency_seconds", 1.2);
    std::string metrics = MetricsRegistry::instance().toPrometheus();
    EXPECT_NE(metrics.find("gauge{host=\"localhost\"} 2.5"), std::string::npos);
    EXPECT_NE(metrics.find("requests_total 3"), std::string::npos);
    EXPECT_NE(metrics.find("latency_seconds_sum 1.2"), std::string::npos);
    EXPECT_NE(metrics.find("latency_seconds_count 1"), std::string::npos);
    MetricsRegistry::instance().reset();
    EXPECT_TRUE(MetricsRegistry::instance().toPrometheus().empty());
}

/**
 * @brief Histogram suffixes go before the label set.
 */
TEST(MetricsRegistry, LabelledHistogram) {
    MetricsRegistry::instance().reset();
    MetricsRegistry::instance().observe("ratio", 2.0, {{"algorithm","zstd"}});
    MetricsRegistry::instance().observe("ratio", 4.0, {{"algorithm","zstd"}});
    std::string metrics = MetricsRegistry::instance().toPrometheus();
    EXPECT_NE(metrics.find("ratio_sum{algorithm=\"zstd\"} 6"), std::string::npos);
    EXPECT_NE(metrics.find("ratio_count{algorithm=\"zstd\"} 2"), std::string::npos);
    MetricsRegistry::instance().reset();
}

TEST(MetricsRegistry, ValueLookups) {
    MetricsRegistry::instance().reset();
    auto& registry = MetricsRegistry::instance();
    registry.incrementCounter("failures_total", 1, {{"location","a"}});
    registry.incrementCounter("failures_total", 1, {{"location","a"}});
    registry.setGauge("pending", 4);
    EXPECT_DOUBLE_EQ(registry.counterValue("failures_total", {{"location","a"}}), 2.0);
    EXPECT_DOUBLE_EQ(registry.counterValue("failures_total", {{"location","b"}}), 0.0);
    EXPECT_DOUBLE_EQ(registry.gaugeValue("pending"), 4.0);
    registry.reset();
}

#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "autoviz/insights.h"
#include <algorithm>
#include <cmath>

namespace autoviz {
namespace testing {

class InsightsTest : public ::testing::Test {
protected:
    std::vector<GraphInsight> run(const IInsightDetector& detector, const DataTable& table,
                                  VisualizationType viz = VisualizationType::SCATTER_3D) {
        types_ = ColumnClassifier().classify(table);
        const AnalysisContext ctx{table, types_, viz, thresholds_};
        return detector.analyze(ctx);
    }

    static std::vector<std::string> titles(const std::vector<GraphInsight>& insights) {
        std::vector<std::string> out;
        for (const auto& insight : insights) out.push_back(insight.title);
        return out;
    }

    InsightThresholds thresholds_;
    ColumnTypeMap types_;
};

// ============================================================================
// Statistical
// ============================================================================

TEST_F(InsightsTest, SkewAndVariability) {
    std::vector<double> values(9, 1.0);
    values.push_back(50.0);
    DataTable table;
    table.add_column(Column::numeric("v", values));

    auto insights = run(StatisticalInsightExtractor(), table);
    ASSERT_EQ(insights.size(), 2u);

    EXPECT_EQ(insights[0].title, "Skewed Distribution in v");
    EXPECT_EQ(insights[0].category, InsightCategory::STATISTICAL);
    EXPECT_EQ(insights[0].severity, InsightSeverity::HIGH);
    EXPECT_DOUBLE_EQ(insights[0].confidence, 1.0);
    EXPECT_THAT(insights[0].description, ::testing::HasSubstr("right-skewed"));

    EXPECT_EQ(insights[1].title, "High Variability in v");
    EXPECT_DOUBLE_EQ(insights[1].confidence, 0.9);
    EXPECT_GT(std::get<double>(insights[1].data_points.at("cv")), 50.0);
}

TEST_F(InsightsTest, LeftSkew) {
    std::vector<double> values(9, 100.0);
    values.push_back(1.0);
    DataTable table;
    table.add_column(Column::numeric("v", values));

    auto insights = run(StatisticalInsightExtractor(), table);
    ASSERT_FALSE(insights.empty());
    EXPECT_THAT(insights[0].description, ::testing::HasSubstr("left-skewed"));
    EXPECT_LT(std::get<double>(insights[0].data_points.at("skewness")), 0.0);
}

TEST_F(InsightsTest, ZeroMeanSkipsVariability) {
    DataTable table;
    table.add_column(Column::numeric("v", {-2, -1, 1, 2, -2, -1, 1, 2}));
    EXPECT_TRUE(run(StatisticalInsightExtractor(), table).empty());
}

TEST_F(InsightsTest, AllMissingColumnIsSkipped) {
    DataTable table;
    table.add_column(Column::numeric("v", {std::nan(""), std::nan("")}));
    EXPECT_TRUE(run(StatisticalInsightExtractor(), table).empty());
    EXPECT_TRUE(run(AnomalyDetector(), table).empty());
    EXPECT_TRUE(run(TrendDetector(), table).empty());
}

// ============================================================================
// Pattern
// ============================================================================

TEST_F(InsightsTest, HistogramPeaks) {
    std::vector<double> bimodal = {0.0, 10.0};
    for (int i = 0; i < 5; ++i) {
        bimodal.push_back(2.5);
        bimodal.push_back(7.5);
    }
    EXPECT_EQ(PatternInsightDetector::count_histogram_peaks(bimodal, 10), 2u);
    EXPECT_EQ(PatternInsightDetector::count_histogram_peaks({3, 3, 3}, 10), 0u);
    EXPECT_EQ(PatternInsightDetector::count_histogram_peaks({}, 10), 0u);
}

TEST_F(InsightsTest, MultimodalNeedsTwoNumericColumns) {
    std::vector<double> bimodal = {0.0, 10.0};
    std::vector<double> other = {1.0, 2.0};
    for (int i = 0; i < 5; ++i) {
        bimodal.push_back(2.5);
        bimodal.push_back(7.5);
        other.push_back(3.0 + 2 * i);
        other.push_back(4.0 + 2 * i);
    }

    DataTable single;
    single.add_column(Column::numeric("bimodal", bimodal));
    EXPECT_TRUE(run(PatternInsightDetector(), single).empty());

    DataTable pair;
    pair.add_column(Column::numeric("bimodal", bimodal));
    pair.add_column(Column::numeric("other", other));
    auto insights = run(PatternInsightDetector(), pair);
    ASSERT_EQ(insights.size(), 1u);
    EXPECT_EQ(insights[0].title, "Multimodal Distribution in bimodal");
    EXPECT_EQ(insights[0].category, InsightCategory::PATTERN);
    EXPECT_DOUBLE_EQ(insights[0].confidence, 0.75);
    EXPECT_EQ(std::get<int64_t>(insights[0].data_points.at("peaks")), 2);
}

TEST_F(InsightsTest, TemporalNameFiresOnce) {
    DataTable table;
    table.add_column(Column::text("created_date", {"a", "b"}));
    table.add_column(Column::text("event_time", {"a", "b"}));
    auto insights = run(PatternInsightDetector(), table);
    ASSERT_EQ(insights.size(), 1u);
    EXPECT_EQ(insights[0].title, "Temporal Data Detected");
    EXPECT_EQ(insights[0].severity, InsightSeverity::LOW);
}

// ============================================================================
// Anomaly
// ============================================================================

class AnomalyTest : public InsightsTest {
protected:
    DataTable seeded(size_t outliers) {
        std::vector<double> values;
        for (int i = 0; i < 100; ++i) values.push_back(i * 0.01);
        for (size_t i = 0; i < outliers; ++i) values.push_back(1000.0);
        DataTable table;
        table.add_column(Column::numeric("signal", values));
        return table;
    }
};

TEST_F(AnomalyTest, SeededOutliers) {
    auto insights = run(AnomalyDetector(), seeded(10));
    ASSERT_EQ(insights.size(), 1u);
    EXPECT_EQ(insights[0].title, "Outliers Detected in signal");
    EXPECT_EQ(insights[0].category, InsightCategory::ANOMALY);
    EXPECT_EQ(insights[0].severity, InsightSeverity::MEDIUM);
    EXPECT_DOUBLE_EQ(insights[0].confidence, 0.9);
    EXPECT_EQ(std::get<int64_t>(insights[0].data_points.at("outlier_count")), 10);
    EXPECT_GE(std::get<double>(insights[0].data_points.at("outlier_pct")), 5.0);

    const auto& bounds = std::get<std::vector<double>>(insights[0].data_points.at("bounds"));
    ASSERT_EQ(bounds.size(), 2u);
    EXPECT_LT(bounds[0], 0.0);
    EXPECT_LT(bounds[1], 1000.0);
}

TEST_F(AnomalyTest, HighSeverityAboveTenPercent) {
    auto insights = run(AnomalyDetector(), seeded(15));
    ASSERT_EQ(insights.size(), 1u);
    EXPECT_EQ(insights[0].severity, InsightSeverity::HIGH);
}

TEST_F(AnomalyTest, CleanColumn) {
    EXPECT_TRUE(run(AnomalyDetector(), seeded(0)).empty());
}

TEST_F(AnomalyTest, TooFewSamples) {
    DataTable table;
    table.add_column(Column::numeric("signal", {1, 1, 1, 1, 1, 1, 1, 1, 1000}));
    EXPECT_TRUE(run(AnomalyDetector(), table).empty());
}

// ============================================================================
// Trend
// ============================================================================

class TrendTest : public InsightsTest {
protected:
    void SetUp() override {
        std::vector<double> p, q;
        for (int i = 0; i < 50; ++i) {
            p.push_back(i);
            q.push_back(2.0 * i + std::sin(i));
        }
        table_.add_column(Column::numeric("p", p));
        table_.add_column(Column::numeric("q", q));
    }

    DataTable table_;
    TrendDetector detector_;
};

TEST_F(TrendTest, StrongPositiveCorrelation) {
    types_ = ColumnClassifier().classify(table_);
    const AnalysisContext ctx{table_, types_, VisualizationType::SCATTER_3D, thresholds_};
    auto insights = detector_.correlation_trends(ctx);
    ASSERT_EQ(insights.size(), 1u);
    EXPECT_EQ(insights[0].title, "Strong Positive Correlation");
    EXPECT_EQ(insights[0].category, InsightCategory::TREND);
    EXPECT_EQ(insights[0].severity, InsightSeverity::HIGH);
    EXPECT_GE(insights[0].confidence, 0.9);
    EXPECT_EQ(std::get<std::string>(insights[0].data_points.at("col1")), "p");
    EXPECT_EQ(std::get<std::string>(insights[0].data_points.at("col2")), "q");
}

TEST_F(TrendTest, StrongNegativeCorrelation) {
    DataTable table;
    std::vector<double> p, q;
    for (int i = 0; i < 20; ++i) {
        p.push_back(i);
        q.push_back(-i);
    }
    table.add_column(Column::numeric("p", p));
    table.add_column(Column::numeric("q", q));
    EXPECT_THAT(titles(run(detector_, table)), ::testing::Contains("Strong Negative Correlation"));
}

TEST_F(TrendTest, MonotonicDrift) {
    types_ = ColumnClassifier().classify(table_);
    const AnalysisContext ctx{table_, types_, VisualizationType::SCATTER_3D, thresholds_};
    auto insights = detector_.monotonic_trends(ctx);
    ASSERT_EQ(insights.size(), 2u);
    EXPECT_EQ(insights[0].title, "Increasing Trend in p");
    EXPECT_NEAR(std::get<double>(insights[0].data_points.at("slope")), 1.0, 1e-9);
    EXPECT_DOUBLE_EQ(insights[0].confidence, 1.0);
}

TEST_F(TrendTest, NonMonotonicRowOrderSkipsDrift) {
    std::vector<double> keys;
    for (int i = 50; i > 0; --i) keys.push_back(i);
    table_.set_row_index(keys);

    types_ = ColumnClassifier().classify(table_);
    const AnalysisContext ctx{table_, types_, VisualizationType::SCATTER_3D, thresholds_};
    EXPECT_TRUE(detector_.monotonic_trends(ctx).empty());
    EXPECT_EQ(detector_.correlation_trends(ctx).size(), 1u);
}

TEST_F(TrendTest, CorrelationColumnBounds) {
    DataTable table;
    for (int c = 0; c < 5; ++c) {
        std::vector<double> values;
        for (int i = 0; i < 10; ++i) values.push_back((c + 1) * i);
        table.add_column(Column::numeric("c" + std::to_string(c), values));
    }
    types_ = ColumnClassifier().classify(table);
    const AnalysisContext ctx{table, types_, VisualizationType::SCATTER_3D, thresholds_};
    auto insights = detector_.correlation_trends(ctx);
    EXPECT_EQ(insights.size(), 6u);
    for (const auto& insight : insights) {
        EXPECT_NE(std::get<std::string>(insight.data_points.at("col2")), "c4");
    }
}

// ============================================================================
// Relationship
// ============================================================================

class RelationshipInsightTest : public InsightsTest {
protected:
    void SetUp() override {
        table_.add_column(Column::text("group", {"a", "a", "a", "a", "b", "b", "b", "b",
                                                 "c", "c", "c", "c"}));
        table_.add_column(Column::numeric("value", {9, 10, 11, 10, 19, 20, 21, 20,
                                                    29, 30, 31, 30}));
    }

    DataTable table_;
};

TEST_F(RelationshipInsightTest, VarianceRatio) {
    auto ratio = RelationshipInsightDetector::variance_ratio(
        table_.column("group"), table_.column("value"), thresholds_);
    ASSERT_TRUE(ratio.has_value());
    EXPECT_NEAR(*ratio, 100.0 / (806.0 / 11.0), 1e-9);
}

TEST_F(RelationshipInsightTest, CategoricalInfluence) {
    auto insights = run(RelationshipInsightDetector(), table_);
    ASSERT_EQ(insights.size(), 1u);
    EXPECT_EQ(insights[0].title, "group Influences value");
    EXPECT_EQ(insights[0].category, InsightCategory::RELATIONSHIP);
    EXPECT_DOUBLE_EQ(insights[0].confidence, 1.0);
}

TEST_F(RelationshipInsightTest, SmallGroupsDoNotQualify) {
    DataTable table;
    table.add_column(Column::text("group", {"a", "a", "b", "b"}));
    table.add_column(Column::numeric("value", {1, 2, 10, 11}));
    EXPECT_FALSE(RelationshipInsightDetector::variance_ratio(
        table.column("group"), table.column("value"), thresholds_).has_value());
    EXPECT_TRUE(run(RelationshipInsightDetector(), table).empty());
}

// ============================================================================
// Network
// ============================================================================

class NetworkInsightTest : public InsightsTest {
protected:
    DataTable star() {
        std::vector<std::string> source, target;
        for (int i = 1; i <= 9; ++i) {
            source.push_back("hub");
            target.push_back("n" + std::to_string(i));
        }
        DataTable table;
        table.add_column(Column::text("source", source));
        table.add_column(Column::text("target", target));
        return table;
    }
};

TEST_F(NetworkInsightTest, DensityAndHubs) {
    auto insights = run(NetworkInsightDetector(), star(), VisualizationType::NETWORK);
    ASSERT_EQ(insights.size(), 2u);

    EXPECT_EQ(insights[0].title, "Moderate Network");
    EXPECT_EQ(std::get<int64_t>(insights[0].data_points.at("nodes")), 10);
    EXPECT_EQ(std::get<int64_t>(insights[0].data_points.at("edges")), 9);
    EXPECT_DOUBLE_EQ(std::get<double>(insights[0].data_points.at("density")), 9.0 / 90.0);

    EXPECT_EQ(insights[1].title, "Network Hubs Detected");
    EXPECT_EQ(insights[1].severity, InsightSeverity::HIGH);
    EXPECT_DOUBLE_EQ(insights[1].confidence, 0.95);
    EXPECT_EQ(std::get<std::string>(insights[1].data_points.at("top_hub")), "hub");
    EXPECT_EQ(std::get<int64_t>(insights[1].data_points.at("top_connections")), 9);
}

TEST_F(NetworkInsightTest, OnlyForNetworkVisualization) {
    EXPECT_TRUE(run(NetworkInsightDetector(), star(), VisualizationType::SCATTER_3D).empty());
}

TEST_F(NetworkInsightTest, NumericNodeIds) {
    DataTable table;
    table.add_column(Column::numeric("from", {1, 2, 3}));
    table.add_column(Column::numeric("to", {2, 3, 1}));
    auto insights = run(NetworkInsightDetector(), table, VisualizationType::NETWORK);
    ASSERT_EQ(insights.size(), 1u);
    EXPECT_EQ(insights[0].title, "Dense Network");
    EXPECT_EQ(std::get<int64_t>(insights[0].data_points.at("nodes")), 3);
}

TEST_F(NetworkInsightTest, SingleNodeSkipsDensity) {
    DataTable table;
    table.add_column(Column::text("source", {"a", "a"}));
    table.add_column(Column::text("target", {"a", "a"}));
    auto insights = run(NetworkInsightDetector(), table, VisualizationType::NETWORK);
    EXPECT_TRUE(insights.empty());
}

// ============================================================================
// Pipeline and labels
// ============================================================================

TEST_F(InsightsTest, DefaultDetectorOrder) {
    auto detectors = create_default_detectors();
    std::vector<std::string> names;
    for (const auto& d : detectors) names.push_back(d->name());
    EXPECT_THAT(names, ::testing::ElementsAre("statistical", "pattern", "anomaly", "trend",
                                              "relationship", "network"));

    AnalysisToggles toggles;
    toggles.statistical = false;
    toggles.network = false;
    EXPECT_EQ(create_default_detectors(toggles).size(), 4u);
}

TEST_F(InsightsTest, Labels) {
    EXPECT_EQ(category_to_string(InsightCategory::ANOMALY), "anomaly");
    EXPECT_EQ(severity_to_string(InsightSeverity::MEDIUM), "medium");
    EXPECT_EQ(severity_weight(InsightSeverity::LOW), 1);
    EXPECT_EQ(severity_weight(InsightSeverity::HIGH), 3);
}

TEST_F(InsightsTest, CorrelationTemplateStrength) {
    GraphInsight moderate = insight_templates::correlation_trend("a", "b", 0.8, thresholds_);
    EXPECT_EQ(moderate.title, "Moderate Positive Correlation");
    EXPECT_EQ(moderate.severity, InsightSeverity::MEDIUM);
    EXPECT_EQ(moderate.description, "a and b show moderate positive correlation (r=0.800)");
}

}  // namespace testing
}  // namespace autoviz

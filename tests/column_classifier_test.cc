#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "autoviz/column_classifier.h"
#include "autoviz/errors.h"

namespace autoviz {
namespace testing {

class ColumnClassifierTest : public ::testing::Test {
protected:
    void SetUp() override {
        table_.add_column(Column::numeric("amount", {1.0, 2.0, 3.0}));
        table_.add_column(Column::temporal("created", {0.0, 86400.0, 172800.0}));
        table_.add_column(Column::text("region", {"a", "b", "a"}));
        table_.add_column(Column::other("blob", {"?", "?", "?"}));
        types_ = classifier_.classify(table_);
    }

    DataTable table_;
    ColumnClassifier classifier_;
    ColumnTypeMap types_;
};

TEST_F(ColumnClassifierTest, MapsDeclaredTypesInColumnOrder) {
    ASSERT_EQ(types_.size(), 4u);
    EXPECT_EQ(types_[0], std::make_pair(std::string("amount"), SemanticType::NUMERIC));
    EXPECT_EQ(types_[1], std::make_pair(std::string("created"), SemanticType::TEMPORAL));
    EXPECT_EQ(types_[2], std::make_pair(std::string("region"), SemanticType::CATEGORICAL));
    EXPECT_EQ(types_[3], std::make_pair(std::string("blob"), SemanticType::UNKNOWN));
}

TEST_F(ColumnClassifierTest, EmptyColumnUsesDeclaredType) {
    DataTable table;
    table.add_column(Column::numeric("empty", {}));
    ColumnTypeMap types = classifier_.classify(table);
    ASSERT_EQ(types.size(), 1u);
    EXPECT_EQ(types[0].second, SemanticType::NUMERIC);
}

TEST_F(ColumnClassifierTest, Helpers) {
    EXPECT_THAT(columns_of_type(types_, SemanticType::NUMERIC), ::testing::ElementsAre("amount"));
    EXPECT_EQ(count_of_type(types_, SemanticType::CATEGORICAL), 1u);
    EXPECT_TRUE(has_type(types_, SemanticType::TEMPORAL));
    EXPECT_EQ(type_of(types_, "region"), SemanticType::CATEGORICAL);
    EXPECT_THROW(type_of(types_, "nope"), InputError);
}

TEST_F(ColumnClassifierTest, TypeToString) {
    EXPECT_EQ(ColumnClassifier::type_to_string(SemanticType::NUMERIC), "numeric");
    EXPECT_EQ(ColumnClassifier::type_to_string(SemanticType::TEMPORAL), "temporal");
    EXPECT_EQ(ColumnClassifier::type_to_string(SemanticType::CATEGORICAL), "categorical");
    EXPECT_EQ(ColumnClassifier::type_to_string(SemanticType::UNKNOWN), "unknown");
}

}  // namespace testing
}  // namespace autoviz

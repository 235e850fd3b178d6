#include "expensescan/core/extracted_record.hpp"
#include <gtest/gtest.h>

namespace expensescan {

TEST(ConfidenceNormalizerTest, ConvertsPercentageToScore)
{
    auto assessment = normalize_confidence(87.3);

    EXPECT_NEAR(assessment.score, 0.873, 1e-12);
    EXPECT_FALSE(assessment.low_confidence);
}

TEST(ConfidenceNormalizerTest, FlagsLowConfidence)
{
    EXPECT_TRUE(normalize_confidence(65.0).low_confidence);
    EXPECT_TRUE(normalize_confidence(69.9).low_confidence);
    EXPECT_TRUE(normalize_confidence(0.0).low_confidence);
}

TEST(ConfidenceNormalizerTest, ThresholdIsExclusive)
{
    EXPECT_FALSE(normalize_confidence(70.0).low_confidence);
    EXPECT_FALSE(is_low_confidence(LOW_CONFIDENCE_THRESHOLD));
    EXPECT_DOUBLE_EQ(normalize_confidence(100.0).score, 1.0);
}

class ComposeDescriptionTest : public ::testing::Test {
protected:
    ExtractedRecord record_{};
};

TEST_F(ComposeDescriptionTest, VendorOnly)
{
    record_.vendor_name = "ABC Plumbing LLC";
    EXPECT_EQ(compose_description(record_), "Invoice from ABC Plumbing LLC");
}

TEST_F(ComposeDescriptionTest, VendorAndDescription)
{
    record_.vendor_name = "ABC Plumbing LLC";
    record_.part_description = "Pump repair";

    EXPECT_EQ(compose_description(record_), "Invoice from ABC Plumbing LLC - Pump repair");
    EXPECT_EQ(record_.part_description, "Pump repair");
}

TEST_F(ComposeDescriptionTest, DescriptionOnly)
{
    record_.part_description = "Pump repair";
    EXPECT_EQ(compose_description(record_), "Pump repair");
}

TEST_F(ComposeDescriptionTest, NeitherLeavesLineUnset)
{
    EXPECT_FALSE(compose_description(record_).has_value());
}

TEST(FormPrefillTest, BundlesAmountDescriptionAndWarning)
{
    ExtractedRecord record{.vendor_name = "ACME Corp",
                           .part_description = std::nullopt,
                           .total_amount = 245.5,
                           .date = "03/15/2024",
                           .invoice_number = std::nullopt,
                           .confidence_score = 0.65};

    auto prefill = build_form_prefill(record);

    EXPECT_EQ(prefill.amount, "245.50");
    EXPECT_EQ(prefill.description, "Invoice from ACME Corp");
    EXPECT_TRUE(prefill.low_confidence);
}

TEST(FormPrefillTest, EmptyRecord)
{
    ExtractedRecord record{};
    record.confidence_score = 0.95;

    auto prefill = build_form_prefill(record);

    EXPECT_FALSE(prefill.amount.has_value());
    EXPECT_FALSE(prefill.description.has_value());
    EXPECT_FALSE(prefill.low_confidence);
}

} // namespace expensescan

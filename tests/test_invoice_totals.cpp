// test_invoice_totals.cpp - line item validation and totals arithmetic

#include "invoice.h"

#include <gtest/gtest.h>

using namespace InvoiceMath;

TEST(Round2, RoundsHalvesAwayFromZero)
{
    EXPECT_DOUBLE_EQ(round2(2.675), 2.68);
    EXPECT_DOUBLE_EQ(round2(1.005), 1.01);
    EXPECT_DOUBLE_EQ(round2(-1.005), -1.01);
    EXPECT_DOUBLE_EQ(round2(10.0), 10.0);
    EXPECT_DOUBLE_EQ(round2(0.1 + 0.2), 0.3);
}

TEST(LineItemAmount, IsQuantityTimesRateRounded)
{
    LineItem item{QStringLiteral("Bolt"), 3.0, 33.333};
    EXPECT_DOUBLE_EQ(item.amount(), 100.0);

    LineItem half{QStringLiteral("Nut"), 0.5, 10.01};
    EXPECT_DOUBLE_EQ(half.amount(), 5.01);
}

TEST(ComputeTotals, EmptyInvoiceOnlyCarriesPackingCharge)
{
    const InvoiceTotals t = computeTotals({}, 18.0, 25.0);
    EXPECT_DOUBLE_EQ(t.subtotal, 0.0);
    EXPECT_DOUBLE_EQ(t.taxAmount, 0.0);
    EXPECT_DOUBLE_EQ(t.grandTotal, 25.0);
}

TEST(ComputeTotals, TaxAppliesToSubtotalAndPackingIsAddedAfter)
{
    const QVector<LineItem> items = {
        {QStringLiteral("Pipe"), 2.0, 100.0},
        {QStringLiteral("Elbow"), 3.0, 15.5},
    };
    const InvoiceTotals t = computeTotals(items, 18.0, 50.0);
    EXPECT_DOUBLE_EQ(t.subtotal, 246.5);
    EXPECT_DOUBLE_EQ(t.taxAmount, 44.37);
    EXPECT_DOUBLE_EQ(t.grandTotal, 340.87);
}

TEST(ComputeTotals, ZeroTaxGivesZeroTaxAmount)
{
    const InvoiceTotals t = computeTotals({{QStringLiteral("Sheet"), 1.0, 99.99}}, 0.0, 0.0);
    EXPECT_DOUBLE_EQ(t.taxAmount, 0.0);
    EXPECT_DOUBLE_EQ(t.grandTotal, 99.99);
}

TEST(ComputeTotals, InvoiceTotalsMatchesFreeFunction)
{
    Invoice inv;
    inv.taxPercent = 5.0;
    inv.packingForwarding = 10.0;
    inv.items = {{QStringLiteral("A"), 4.0, 12.5}};

    const InvoiceTotals t = inv.totals();
    EXPECT_DOUBLE_EQ(t.subtotal, 50.0);
    EXPECT_DOUBLE_EQ(t.taxAmount, 2.5);
    EXPECT_DOUBLE_EQ(t.grandTotal, 62.5);
}

TEST(ParseLineItem, AcceptsValidInputAndTrimsName)
{
    const std::optional<LineItem> item =
        parseLineItem(QStringLiteral("  Angle 40x40 "), QStringLiteral("2.5"), QStringLiteral("0"));
    ASSERT_TRUE(item.has_value());
    EXPECT_EQ(item->name, QStringLiteral("Angle 40x40"));
    EXPECT_DOUBLE_EQ(item->qty, 2.5);
    EXPECT_DOUBLE_EQ(item->rate, 0.0);
}

TEST(ParseLineItem, RejectsBadInputWithMessage)
{
    QString error;
    EXPECT_FALSE(parseLineItem(QStringLiteral(" "), QStringLiteral("1"), QStringLiteral("1"), &error));
    EXPECT_EQ(error, QStringLiteral("Enter valid Item, Qty (>0) and Rate (>=0)"));

    EXPECT_FALSE(parseLineItem(QStringLiteral("X"), QStringLiteral("0"), QStringLiteral("1")));
    EXPECT_FALSE(parseLineItem(QStringLiteral("X"), QStringLiteral("-2"), QStringLiteral("1")));
    EXPECT_FALSE(parseLineItem(QStringLiteral("X"), QStringLiteral("1"), QStringLiteral("-0.01")));
    EXPECT_FALSE(parseLineItem(QStringLiteral("X"), QStringLiteral("abc"), QStringLiteral("1")));
    EXPECT_FALSE(parseLineItem(QStringLiteral("X"), QStringLiteral("1"), QString()));
    EXPECT_FALSE(parseLineItem(QStringLiteral("X"), QStringLiteral("inf"), QStringLiteral("1")));
}

TEST(ParseChargeOrZero, EmptyIsZeroAndGarbageIsFlagged)
{
    bool ok = false;
    EXPECT_DOUBLE_EQ(parseChargeOrZero(QString(), &ok), 0.0);
    EXPECT_TRUE(ok);

    EXPECT_DOUBLE_EQ(parseChargeOrZero(QStringLiteral(" 12.5 "), &ok), 12.5);
    EXPECT_TRUE(ok);

    EXPECT_DOUBLE_EQ(parseChargeOrZero(QStringLiteral("12%"), &ok), 0.0);
    EXPECT_FALSE(ok);
}

TEST(Formatting, QuantityMoneyAndFileName)
{
    EXPECT_EQ(formatQuantity(2.0), QStringLiteral("2"));
    EXPECT_EQ(formatQuantity(2.5), QStringLiteral("2.5"));
    EXPECT_EQ(formatMoney(1234.5), QStringLiteral("1234.50"));
    EXPECT_EQ(formatMoney(0.0), QStringLiteral("0.00"));
    EXPECT_EQ(defaultPdfFileName(7), QStringLiteral("Invoice_7.pdf"));
}

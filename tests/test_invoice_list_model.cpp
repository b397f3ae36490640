// test_invoice_list_model.cpp - invoice history model over the record store

#include "invoice.h"
#include "invoicelistmodel.h"
#include "invoicestore.h"

#include <gtest/gtest.h>

#include <QSignalSpy>
#include <QTemporaryDir>

namespace {

Invoice historyInvoice(int chalanNo, const QString &party)
{
    Invoice inv;
    inv.chalanNo = chalanNo;
    inv.partyName = party;
    inv.city = QStringLiteral("Surat");
    inv.date = QStringLiteral("10/02/2026");
    inv.items = {{QStringLiteral("Flange"), 2.0, 60.0}};
    return inv;
}

} // namespace

class InvoiceListModelTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        ASSERT_TRUE(m_dir.isValid());
        ASSERT_TRUE(m_store.open(m_dir.filePath(QStringLiteral("invoices.db"))));
    }

    QTemporaryDir m_dir;
    InvoiceStore m_store;
};

TEST_F(InvoiceListModelTest, ExistingInvoicesAreListedWithoutRefresh)
{
    ASSERT_TRUE(m_store.saveInvoice(historyInvoice(4, QStringLiteral("Mehta Bros"))));
    ASSERT_TRUE(m_store.saveInvoice(historyInvoice(9, QStringLiteral("Kiran Works"))));

    InvoiceListModel model(&m_store);
    ASSERT_EQ(model.rowCount(), 2);
    EXPECT_EQ(model.summaryAt(0).chalanNo, 4);
    EXPECT_EQ(model.summaryAt(1).partyName, QStringLiteral("Kiran Works"));
    EXPECT_EQ(model.columnCount(), static_cast<int>(InvoiceListColumn::COUNT));
}

TEST_F(InvoiceListModelTest, SavingAnInvoiceRefreshesTheHistory)
{
    InvoiceListModel model(&m_store);
    EXPECT_EQ(model.rowCount(), 0);

    QSignalSpy resetSpy(&model, &QAbstractItemModel::modelReset);
    ASSERT_TRUE(m_store.saveInvoice(historyInvoice(1, QStringLiteral("Mehta Bros"))));
    EXPECT_EQ(resetSpy.count(), 1);
    EXPECT_EQ(model.rowCount(), 1);
}

TEST_F(InvoiceListModelTest, UnopenedStoreStartsEmpty)
{
    InvoiceStore unopened;
    InvoiceListModel model(&unopened);
    EXPECT_EQ(model.rowCount(), 0);
}

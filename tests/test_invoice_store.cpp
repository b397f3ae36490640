// test_invoice_store.cpp - SQLite record store

#include "invoice.h"
#include "invoicestore.h"

#include <gtest/gtest.h>

#include <QDir>
#include <QFileInfo>
#include <QSignalSpy>
#include <QTemporaryDir>

#include <climits>

class InvoiceStoreTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        ASSERT_TRUE(m_dir.isValid());
        m_dbPath = m_dir.filePath(QStringLiteral("data/invoices.db"));
        ASSERT_TRUE(m_store.open(m_dbPath)) << m_store.lastError().toStdString();
    }

    static Invoice sampleInvoice(int chalanNo)
    {
        Invoice inv;
        inv.chalanNo = chalanNo;
        inv.partyName = QStringLiteral("Shree Traders");
        inv.city = QStringLiteral("Rajkot");
        inv.lrNo = QStringLiteral("LR-77");
        inv.date = QStringLiteral("05/03/2026");
        inv.taxPercent = 18.0;
        inv.packingForwarding = 50.0;
        inv.items = {
            {QStringLiteral("Pipe"), 2.0, 100.0},
            {QStringLiteral("Elbow"), 3.0, 15.5},
        };
        return inv;
    }

    QTemporaryDir m_dir;
    QString m_dbPath;
    InvoiceStore m_store;
};

TEST_F(InvoiceStoreTest, OpenCreatesFileAndSeedsDefaults)
{
    EXPECT_TRUE(QFileInfo::exists(m_dbPath));
    EXPECT_EQ(m_store.metaValue(QStringLiteral("chalan_no")), QStringLiteral("0"));

    const CompanyProfile profile = m_store.companyProfile();
    EXPECT_EQ(profile.companyName, CompanyProfile().companyName);
    EXPECT_EQ(profile.bankIfsc, CompanyProfile().bankIfsc);
    EXPECT_TRUE(profile.logoPath.isEmpty());
}

TEST_F(InvoiceStoreTest, ReopeningKeepsExistingMeta)
{
    ASSERT_TRUE(m_store.setMetaValue(QStringLiteral("company_name"), QStringLiteral("Acme Steel")));
    m_store.close();

    InvoiceStore other;
    ASSERT_TRUE(other.open(m_dbPath));
    EXPECT_EQ(other.companyProfile().companyName, QStringLiteral("Acme Steel"));
}

TEST_F(InvoiceStoreTest, ChalanNumbersAreHandedOutInOrder)
{
    QSignalSpy spy(&m_store, &InvoiceStore::counterChanged);

    EXPECT_EQ(m_store.peekChalanNumber(), 1);
    EXPECT_EQ(m_store.nextChalanNumber(), 1);
    EXPECT_EQ(m_store.nextChalanNumber(), 2);
    EXPECT_EQ(m_store.peekChalanNumber(), 3);
    EXPECT_EQ(spy.count(), 2);
}

TEST_F(InvoiceStoreTest, ResetCounterRestartsNumbering)
{
    m_store.nextChalanNumber();
    m_store.nextChalanNumber();
    ASSERT_TRUE(m_store.resetChalanCounter());
    EXPECT_EQ(m_store.nextChalanNumber(), 1);

    ASSERT_TRUE(m_store.resetChalanCounter(40));
    EXPECT_EQ(m_store.nextChalanNumber(), 41);
}

TEST_F(InvoiceStoreTest, CounterStopsBeforeIntOverflow)
{
    ASSERT_TRUE(m_store.resetChalanCounter(INT_MAX - 1));
    EXPECT_EQ(m_store.peekChalanNumber(), INT_MAX);

    EXPECT_FALSE(m_store.resetChalanCounter(INT_MAX));
    EXPECT_EQ(m_store.lastErrorKind(), StoreError::OutOfRange);
    EXPECT_FALSE(m_store.resetChalanCounter(-1));
    EXPECT_EQ(m_store.lastErrorKind(), StoreError::OutOfRange);
    EXPECT_EQ(m_store.metaValue(QStringLiteral("chalan_no")), QString::number(INT_MAX - 1));

    // Handing out INT_MAX leaves nothing further to hand out
    EXPECT_EQ(m_store.nextChalanNumber(), INT_MAX);
    EXPECT_EQ(m_store.peekChalanNumber(), 0);
    EXPECT_EQ(m_store.lastErrorKind(), StoreError::OutOfRange);
    EXPECT_EQ(m_store.nextChalanNumber(), 0);
    EXPECT_EQ(m_store.metaValue(QStringLiteral("chalan_no")), QString::number(INT_MAX));
}

TEST_F(InvoiceStoreTest, CorruptCounterFallsBackToHighestStoredChalan)
{
    ASSERT_TRUE(m_store.saveInvoice(sampleInvoice(12)).has_value());
    ASSERT_TRUE(m_store.setMetaValue(QStringLiteral("chalan_no"), QStringLiteral("abc")));
    EXPECT_EQ(m_store.peekChalanNumber(), 13);
}

TEST_F(InvoiceStoreTest, SaveAndLoadRoundTripsHeaderItemsAndTotals)
{
    QSignalSpy spy(&m_store, &InvoiceStore::invoiceSaved);

    const std::optional<SavedInvoice> saved = m_store.saveInvoice(sampleInvoice(5));
    ASSERT_TRUE(saved.has_value()) << m_store.lastError().toStdString();
    EXPECT_GT(saved->id, 0);
    EXPECT_DOUBLE_EQ(saved->totals.grandTotal, 340.87);
    ASSERT_EQ(spy.count(), 1);
    EXPECT_EQ(spy.at(0).at(0).toInt(), 5);

    const std::optional<Invoice> loaded = m_store.invoiceByChalan(5);
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->id, saved->id);
    EXPECT_EQ(loaded->partyName, QStringLiteral("Shree Traders"));
    EXPECT_EQ(loaded->lrNo, QStringLiteral("LR-77"));
    EXPECT_EQ(loaded->date, QStringLiteral("05/03/2026"));
    ASSERT_EQ(loaded->items.size(), 2);
    EXPECT_EQ(loaded->items.at(0).name, QStringLiteral("Pipe"));
    EXPECT_EQ(loaded->items.at(1).name, QStringLiteral("Elbow"));
    EXPECT_DOUBLE_EQ(loaded->items.at(1).rate, 15.5);
    EXPECT_DOUBLE_EQ(loaded->totals().grandTotal, 340.87);
}

TEST_F(InvoiceStoreTest, DuplicateChalanIsRejected)
{
    ASSERT_TRUE(m_store.saveInvoice(sampleInvoice(9)).has_value());

    Invoice again = sampleInvoice(9);
    again.partyName = QStringLiteral("Someone Else");
    EXPECT_FALSE(m_store.saveInvoice(again).has_value());
    EXPECT_EQ(m_store.lastErrorKind(), StoreError::Duplicate);
    EXPECT_EQ(m_store.lastError(), QStringLiteral("Chalan number already exists. Start a new invoice."));

    // The first invoice is untouched
    EXPECT_EQ(m_store.invoiceByChalan(9)->partyName, QStringLiteral("Shree Traders"));
}

TEST_F(InvoiceStoreTest, MissingChalanIsNotFound)
{
    EXPECT_FALSE(m_store.invoiceByChalan(404).has_value());
    EXPECT_EQ(m_store.lastErrorKind(), StoreError::NotFound);
    EXPECT_FALSE(m_store.chalanExists(404));
}

TEST_F(InvoiceStoreTest, ListInvoicesIsOrderedAndCountsItems)
{
    Invoice small = sampleInvoice(8);
    small.items = {{QStringLiteral("Clamp"), 1.0, 20.0}};
    ASSERT_TRUE(m_store.saveInvoice(small).has_value());
    ASSERT_TRUE(m_store.saveInvoice(sampleInvoice(3)).has_value());

    const QVector<InvoiceSummary> list = m_store.listInvoices();
    ASSERT_EQ(list.size(), 2);
    EXPECT_EQ(list.at(0).chalanNo, 3);
    EXPECT_EQ(list.at(0).itemCount, 2);
    EXPECT_EQ(list.at(1).chalanNo, 8);
    EXPECT_EQ(list.at(1).itemCount, 1);
    EXPECT_DOUBLE_EQ(list.at(1).grandTotal, 73.6);
}

TEST_F(InvoiceStoreTest, CompanyProfileRoundTripsAndNotifies)
{
    QSignalSpy spy(&m_store, &InvoiceStore::companyProfileChanged);

    CompanyProfile profile;
    profile.companyName = QStringLiteral("Acme Steel");
    profile.bankAccountNo = QStringLiteral("000111222");
    profile.logoPath = QStringLiteral("/tmp/logo.png");
    ASSERT_TRUE(m_store.setCompanyProfile(profile));
    EXPECT_EQ(spy.count(), 1);

    const CompanyProfile read = m_store.companyProfile();
    EXPECT_EQ(read.companyName, QStringLiteral("Acme Steel"));
    EXPECT_EQ(read.bankAccountNo, QStringLiteral("000111222"));
    EXPECT_EQ(read.logoPath, QStringLiteral("/tmp/logo.png"));
    EXPECT_EQ(read.companyCity, CompanyProfile().companyCity);
}

TEST_F(InvoiceStoreTest, ItemMasterAddUpdateDelete)
{
    QSignalSpy spy(&m_store, &InvoiceStore::itemMasterChanged);

    ASSERT_TRUE(m_store.addMasterItem(QStringLiteral(" Washer "), 2.5));
    ASSERT_TRUE(m_store.addMasterItem(QStringLiteral("Anchor"), 30.0));

    QVector<MasterItem> items = m_store.masterItems();
    ASSERT_EQ(items.size(), 2);
    EXPECT_EQ(items.at(0).name, QStringLiteral("Anchor"));
    EXPECT_EQ(items.at(1).name, QStringLiteral("Washer"));

    EXPECT_FALSE(m_store.addMasterItem(QStringLiteral("Washer"), 3.0));
    EXPECT_EQ(m_store.lastErrorKind(), StoreError::Duplicate);
    EXPECT_EQ(m_store.lastError(), QStringLiteral("Item already exists"));

    const qint64 washerId = items.at(1).id;
    ASSERT_TRUE(m_store.updateMasterItem(washerId, QStringLiteral("Spring Washer"), 4.0));
    EXPECT_EQ(m_store.masterItemRate(QStringLiteral("Spring Washer")).value_or(-1.0), 4.0);
    EXPECT_FALSE(m_store.masterItemRate(QStringLiteral("Washer")).has_value());

    ASSERT_TRUE(m_store.deleteMasterItem(washerId));
    EXPECT_EQ(m_store.masterItemNames(), QStringList{QStringLiteral("Anchor")});

    EXPECT_FALSE(m_store.deleteMasterItem(washerId));
    EXPECT_EQ(m_store.lastErrorKind(), StoreError::NotFound);
    EXPECT_FALSE(m_store.updateMasterItem(9999, QStringLiteral("Ghost"), 1.0));
    EXPECT_EQ(m_store.lastErrorKind(), StoreError::NotFound);

    EXPECT_EQ(spy.count(), 4);
}

TEST_F(InvoiceStoreTest, RememberItemRateInsertsThenUpdates)
{
    ASSERT_TRUE(m_store.rememberItemRate(QStringLiteral("Rod"), 100.0));
    ASSERT_TRUE(m_store.rememberItemRate(QStringLiteral("Rod"), 120.0));

    const QVector<MasterItem> items = m_store.masterItems();
    ASSERT_EQ(items.size(), 1);
    EXPECT_DOUBLE_EQ(items.at(0).defaultRate, 120.0);
}

TEST_F(InvoiceStoreTest, BackupWritesTimestampedCopies)
{
    ASSERT_TRUE(m_store.saveInvoice(sampleInvoice(1)).has_value());

    const QString backupDir = m_dir.filePath(QStringLiteral("backups"));
    const QString first = m_store.backupTo(backupDir);
    const QString second = m_store.backupTo(backupDir);
    ASSERT_FALSE(first.isEmpty()) << m_store.lastError().toStdString();
    ASSERT_FALSE(second.isEmpty());
    EXPECT_NE(first, second);
    EXPECT_TRUE(QFileInfo(first).fileName().startsWith(QStringLiteral("invoices_backup_")));
    EXPECT_TRUE(first.endsWith(QStringLiteral(".db")));

    InvoiceStore restored;
    ASSERT_TRUE(restored.open(first));
    EXPECT_TRUE(restored.chalanExists(1));
}

TEST_F(InvoiceStoreTest, OperationsOnClosedStoreFail)
{
    m_store.close();
    EXPECT_FALSE(m_store.isOpen());
    EXPECT_EQ(m_store.nextChalanNumber(), 0);
    EXPECT_FALSE(m_store.saveInvoice(sampleInvoice(1)).has_value());
    EXPECT_EQ(m_store.lastErrorKind(), StoreError::NotOpen);
    EXPECT_TRUE(m_store.backupTo(m_dir.path()).isEmpty());
}

// test_pdf_exporter.cpp - invoice PDF layout and file output

#include "invoice.h"
#include "pdfexporter.h"

#include <gtest/gtest.h>

#include <QColor>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QImage>
#include <QPageLayout>
#include <QPageSize>
#include <QPdfWriter>
#include <QTemporaryDir>
#include <QTextDocument>

namespace {

Invoice sampleInvoice()
{
    Invoice inv;
    inv.chalanNo = 42;
    inv.partyName = QStringLiteral("R & K <Agencies>");
    inv.city = QStringLiteral("Jamnagar");
    inv.lrNo = QStringLiteral("LR-9");
    inv.date = QStringLiteral("12/06/2026");
    inv.taxPercent = 12.0;
    inv.packingForwarding = 30.0;
    inv.items = {
        {QStringLiteral("Brass Valve\n1 inch"), 4.0, 250.0},
        {QStringLiteral("   "), 1.5, 10.0},
    };
    return inv;
}

} // namespace

TEST(PdfHtml, ContainsHeaderMetaItemsTotalsAndBank)
{
    const Invoice inv = sampleInvoice();
    CompanyProfile profile;
    profile.companyName = QStringLiteral("Acme Steel");
    profile.companyCity = QStringLiteral("Rajkot");
    profile.companyMobile = QStringLiteral("98250 00000");

    const QString html = InvoicePdfExporter::buildHtml(inv, inv.totals(), profile);

    EXPECT_TRUE(html.contains(QStringLiteral("<h1>Acme Steel</h1>")));
    EXPECT_TRUE(html.contains(QStringLiteral("Rajkot | MOB: 98250 00000")));
    EXPECT_TRUE(html.contains(QStringLiteral("Chalan No: 42")));
    EXPECT_TRUE(html.contains(QStringLiteral("Party: R &amp; K &lt;Agencies&gt;")));
    EXPECT_TRUE(html.contains(QStringLiteral("L.R. No: LR-9")));

    // Newlines in item names become line breaks, blank names print as "-"
    EXPECT_TRUE(html.contains(QStringLiteral("Brass Valve<br>1 inch")));
    EXPECT_TRUE(html.contains(QStringLiteral("<td>-</td>")));
    EXPECT_TRUE(html.contains(QStringLiteral("1.5")));

    EXPECT_TRUE(html.contains(QStringLiteral("1015.00")));   // sub total
    EXPECT_TRUE(html.contains(QStringLiteral("Tax 12.00%")));
    EXPECT_TRUE(html.contains(QStringLiteral("121.80")));    // tax amount
    EXPECT_TRUE(html.contains(QStringLiteral("<b>1166.80</b>")));

    EXPECT_TRUE(html.contains(QStringLiteral("A/C NAME : ") + profile.bankAccountName));
    EXPECT_TRUE(html.contains(QStringLiteral("IFSC : ") + profile.bankIfsc));
    EXPECT_FALSE(html.contains(QStringLiteral("<img")));
}

TEST(PdfHtml, ReferencesLogoWhenGiven)
{
    const Invoice inv = sampleInvoice();
    const QString html = InvoicePdfExporter::buildHtml(inv, inv.totals(), CompanyProfile(),
                                                       QStringLiteral("chalan-logo"));
    EXPECT_TRUE(html.contains(QStringLiteral("<img src=\"chalan-logo\"")));
}

TEST(PdfExport, WritesPdfFileAndCreatesDirectory)
{
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());

    QImage logo(64, 64, QImage::Format_RGB32);
    logo.fill(QColor(Qt::darkBlue));
    const QString logoPath = dir.filePath(QStringLiteral("logo.png"));
    ASSERT_TRUE(logo.save(logoPath));

    CompanyProfile profile;
    profile.logoPath = logoPath;

    const Invoice inv = sampleInvoice();
    const QString out = dir.filePath(QStringLiteral("pdf/nested/") + InvoiceMath::defaultPdfFileName(inv.chalanNo));

    InvoicePdfExporter exporter;
    ASSERT_TRUE(exporter.exportInvoice(inv, inv.totals(), profile, out))
        << exporter.lastError().toStdString();

    QFile file(out);
    ASSERT_TRUE(file.open(QIODevice::ReadOnly));
    EXPECT_TRUE(file.read(5).startsWith("%PDF-"));
    EXPECT_GT(QFileInfo(out).size(), 500);
}

TEST(PdfExport, LongInvoiceStillExports)
{
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());

    Invoice inv = sampleInvoice();
    for (int i = 0; i < 120; ++i) {
        inv.items.append(LineItem{QStringLiteral("Item %1").arg(i), 1.0, double(i)});
    }

    InvoicePdfExporter exporter;
    EXPECT_TRUE(exporter.exportInvoice(inv, inv.totals(), CompanyProfile(),
                                       dir.filePath(QStringLiteral("long.pdf"))));
}

TEST(PdfExport, ReportsUnwritableTarget)
{
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());

    // A directory where the file should go
    const QString target = dir.filePath(QStringLiteral("Invoice_1.pdf"));
    ASSERT_TRUE(QDir().mkpath(target));

    InvoicePdfExporter exporter;
    const Invoice inv = sampleInvoice();
    EXPECT_FALSE(exporter.exportInvoice(inv, inv.totals(), CompanyProfile(), target));
    EXPECT_FALSE(exporter.lastError().isEmpty());
}

TEST(PdfLayout, PageIsA5PortraitWithInvoiceMargins)
{
    const QPageLayout layout = InvoicePdfExporter::pageLayout();
    EXPECT_EQ(layout.pageSize().id(), QPageSize::A5);
    EXPECT_EQ(layout.orientation(), QPageLayout::Portrait);
    EXPECT_EQ(layout.units(), QPageLayout::Millimeter);

    const QMarginsF margins = layout.margins();
    EXPECT_DOUBLE_EQ(margins.left(), 10.0);
    EXPECT_DOUBLE_EQ(margins.right(), 10.0);
    EXPECT_DOUBLE_EQ(margins.top(), 15.0);
    EXPECT_DOUBLE_EQ(margins.bottom(), 15.0);
}

TEST(PdfLayout, BodySpansWholePrintableArea)
{
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());

    QPdfWriter writer(dir.filePath(QStringLiteral("layout.pdf")));
    writer.setResolution(300);
    writer.setPageLayout(InvoicePdfExporter::pageLayout());

    QTextDocument doc;
    doc.setHtml(InvoicePdfExporter::buildHtml(sampleInvoice(), sampleInvoice().totals(),
                                              CompanyProfile()));
    InvoicePdfExporter::fitToPage(doc, writer.pageLayout(), writer.resolution());

    const QRect paintRect = writer.pageLayout().paintRectPixels(writer.resolution());
    EXPECT_DOUBLE_EQ(doc.documentMargin(), 0.0);
    EXPECT_DOUBLE_EQ(doc.pageSize().width(), paintRect.width());
    EXPECT_DOUBLE_EQ(doc.pageSize().height(), paintRect.height());
    EXPECT_DOUBLE_EQ(doc.textWidth(), paintRect.width());

    // 128 mm of A5 width at 300 dpi
    EXPECT_NEAR(paintRect.width(), 128.0 / 25.4 * 300.0, 2.0);
}

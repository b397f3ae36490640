// pdfexporter.cpp
// Chalan core - A5 invoice PDF rendering
// Copyright (c) 2026 Chalan Project

#include "pdfexporter.h"
#include "chalan_debug.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QImage>
#include <QPageLayout>
#include <QPageSize>
#include <QPdfWriter>
#include <QTextDocument>
#include <QUrl>

// Logo edge in CSS pixels (30 mm at 96 dpi)
static const int LOGO_PX = 113;

static const char LOGO_RESOURCE[] = "chalan-logo";

static const char STYLE_SHEET[] =
    "body { font-family: sans-serif; font-size: 9pt; }"
    "h1 { font-size: 16pt; margin: 0; text-align: center; }"
    "p.sub { text-align: center; margin-top: 2px; }"
    "p.meta { margin: 0; }"
    "table.items { border-collapse: collapse; }"
    "table.items th { background-color: #d3d3d3; font-weight: bold; }"
    "td.num { text-align: right; }"
    "p.bank { margin: 0; }";

InvoicePdfExporter::InvoicePdfExporter()
{
}

QPageLayout InvoicePdfExporter::pageLayout()
{
    return QPageLayout(QPageSize(QPageSize::A5),
                       QPageLayout::Portrait,
                       QMarginsF(10, 15, 10, 15),
                       QPageLayout::Millimeter);
}

void InvoicePdfExporter::fitToPage(QTextDocument &doc, const QPageLayout &layout, int resolution)
{
    doc.setDocumentMargin(0);
    doc.setPageSize(QSizeF(layout.paintRectPixels(resolution).size()));
}

static QString esc(const QString &text)
{
    return text.toHtmlEscaped();
}

QString InvoicePdfExporter::buildHtml(const Invoice &invoice,
                                      const InvoiceTotals &totals,
                                      const CompanyProfile &profile,
                                      const QString &logoUrl)
{
    using namespace InvoiceMath;

    QString html;
    html += QStringLiteral("<html><body>");

    if (!logoUrl.isEmpty()) {
        html += QStringLiteral("<p align=\"center\"><img src=\"%1\" width=\"%2\" height=\"%2\"></p>")
                    .arg(esc(logoUrl)).arg(LOGO_PX);
    }
    html += QStringLiteral("<h1>%1</h1>").arg(esc(profile.companyName));
    html += QStringLiteral("<p class=\"sub\">%1 | MOB: %2</p><br>")
                .arg(esc(profile.companyCity), esc(profile.companyMobile));

    // ── Invoice meta ──
    html += QStringLiteral("<p class=\"meta\">Chalan No: %1</p>").arg(invoice.chalanNo);
    html += QStringLiteral("<p class=\"meta\">Date: %1</p>").arg(esc(invoice.date));
    html += QStringLiteral("<p class=\"meta\">Party: %1</p>").arg(esc(invoice.partyName));
    html += QStringLiteral("<p class=\"meta\">City: %1</p>").arg(esc(invoice.city));
    html += QStringLiteral("<p class=\"meta\">L.R. No: %1</p><br>").arg(esc(invoice.lrNo));

    // ── Item table ──
    html += QStringLiteral(
        "<table class=\"items\" width=\"100%\" border=\"1\" cellspacing=\"0\" cellpadding=\"3\">"
        "<thead><tr>"
        "<th width=\"10%\">Sr</th><th>Item Name</th>"
        "<th width=\"14%\">Qty</th><th width=\"17%\">Rate</th><th width=\"17%\">Amount</th>"
        "</tr></thead>");

    int sr = 1;
    for (const LineItem &li : invoice.items) {
        QString name = li.name.trimmed();
        if (name.isEmpty()) {
            name = QStringLiteral("-");
        }
        name = esc(name);
        name.replace(QLatin1Char('\n'), QLatin1String("<br>"));

        html += QStringLiteral(
            "<tr><td>%1</td><td>%2</td>"
            "<td class=\"num\">%3</td><td class=\"num\">%4</td><td class=\"num\">%5</td></tr>")
                    .arg(sr++)
                    .arg(name,
                         formatQuantity(li.qty),
                         formatMoney(li.rate),
                         formatMoney(li.amount()));
    }

    auto totalRow = [](const QString &label, double value, bool bold) {
        const QString cell = bold ? QStringLiteral("<b>%1</b>") : QStringLiteral("%1");
        return QStringLiteral(
            "<tr><td colspan=\"2\"></td><td></td>"
            "<td class=\"num\">%1</td><td class=\"num\">%2</td></tr>")
                .arg(cell.arg(label), cell.arg(formatMoney(value)));
    };

    html += totalRow(QStringLiteral("Sub Total"), totals.subtotal, false);
    html += totalRow(QStringLiteral("Tax %1%").arg(formatMoney(invoice.taxPercent)),
                     totals.taxAmount, false);
    html += totalRow(QStringLiteral("P & F"), invoice.packingForwarding, false);
    html += totalRow(QStringLiteral("Grand Total"), totals.grandTotal, true);
    html += QStringLiteral("</table><br><br>");

    // ── Bank block ──
    html += QStringLiteral("<p class=\"bank\">A/C NAME : %1</p>").arg(esc(profile.bankAccountName));
    html += QStringLiteral("<p class=\"bank\">BANK NAME : %1</p>").arg(esc(profile.bankName));
    html += QStringLiteral("<p class=\"bank\">A/C NO : %1&nbsp;&nbsp;&nbsp;&nbsp;IFSC : %2</p>")
                .arg(esc(profile.bankAccountNo), esc(profile.bankIfsc));

    html += QStringLiteral("</body></html>");
    return html;
}

bool InvoicePdfExporter::exportInvoice(const Invoice &invoice,
                                       const InvoiceTotals &totals,
                                       const CompanyProfile &profile,
                                       const QString &filePath)
{
    m_lastError.clear();

    QFileInfo info(filePath);
    if (!QDir().mkpath(info.absolutePath())) {
        m_lastError = QStringLiteral("Cannot create directory %1").arg(info.absolutePath());
        qCWarning(CHALAN_PDF) << m_lastError;
        return false;
    }

    // QPdfWriter only reports an unwritable target through an empty file
    {
        QFile probe(info.absoluteFilePath());
        if (!probe.open(QIODevice::WriteOnly)) {
            m_lastError = QStringLiteral("Cannot write %1: %2")
                              .arg(info.absoluteFilePath(), probe.errorString());
            qCWarning(CHALAN_PDF) << m_lastError;
            return false;
        }
    }

    QTextDocument doc;
    doc.setDefaultStyleSheet(QString::fromLatin1(STYLE_SHEET));

    QString logoUrl;
    if (!profile.logoPath.isEmpty() && QFile::exists(profile.logoPath)) {
        QImage logo(profile.logoPath);
        if (logo.isNull()) {
            qCWarning(CHALAN_PDF) << "Cannot load logo" << profile.logoPath;
        } else {
            logoUrl = QString::fromLatin1(LOGO_RESOURCE);
            doc.addResource(QTextDocument::ImageResource, QUrl(logoUrl), logo);
        }
    }

    doc.setHtml(buildHtml(invoice, totals, profile, logoUrl));

    {
        QPdfWriter writer(info.absoluteFilePath());
        writer.setCreator(QStringLiteral("Chalan"));
        writer.setTitle(QStringLiteral("Chalan %1").arg(invoice.chalanNo));
        writer.setResolution(300);
        writer.setPageLayout(pageLayout());

        // An unsized document would be printed with Qt's own 2 cm margin
        fitToPage(doc, writer.pageLayout(), writer.resolution());
        doc.print(&writer);
    }

    if (QFileInfo(info.absoluteFilePath()).size() == 0) {
        m_lastError = QStringLiteral("Nothing was written to %1").arg(info.absoluteFilePath());
        qCWarning(CHALAN_PDF) << m_lastError;
        return false;
    }

    qCDebug(CHALAN_PDF) << "Wrote chalan" << invoice.chalanNo << "to" << info.absoluteFilePath();
    return true;
}

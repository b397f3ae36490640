// pdfexporter.h
// Chalan core - A5 invoice PDF rendering
// Copyright (c) 2026 Chalan Project

#ifndef PDFEXPORTER_H
#define PDFEXPORTER_H

#include "invoice.h"

#include <QPageLayout>
#include <QString>

class QTextDocument;

/**
 * @brief Renders one invoice to an A5 portrait PDF.
 *
 * The page is laid out as HTML in a QTextDocument and printed onto a
 * QPdfWriter, so long item tables flow onto further pages.
 */
class InvoicePdfExporter
{
public:
    InvoicePdfExporter();

    /// Write filePath, creating its directory.  Returns false on failure,
    /// see lastError().
    bool exportInvoice(const Invoice &invoice,
                       const InvoiceTotals &totals,
                       const CompanyProfile &profile,
                       const QString &filePath);

    QString lastError() const { return m_lastError; }

    /// Document body used for the PDF.  logoUrl is referenced as the
    /// image source when non-empty.
    static QString buildHtml(const Invoice &invoice,
                             const InvoiceTotals &totals,
                             const CompanyProfile &profile,
                             const QString &logoUrl = QString());

    /// A5 portrait, 10 mm left/right and 15 mm top/bottom.
    static QPageLayout pageLayout();

    /// Size doc to the printable area of layout at resolution dpi, with
    /// no extra document margin.
    static void fitToPage(QTextDocument &doc, const QPageLayout &layout, int resolution);

private:
    QString m_lastError;
};

#endif // PDFEXPORTER_H

// invoice.h
// Chalan core - invoice value types and totals arithmetic
//
// Plain value types shared by the record store, the PDF exporter, the
// CSV exchange and both front ends.  Money is held as double and rounded
// to two decimals at every step where a figure is shown or stored.
//
// Copyright (c) 2026 Chalan Project

#ifndef INVOICE_H
#define INVOICE_H

#include <QString>
#include <QVector>

#include <optional>

// One row of an invoice body
struct LineItem {
    QString name;
    double  qty  = 0.0;
    double  rate = 0.0;

    /// qty x rate, rounded to paise
    double amount() const;
};

struct InvoiceTotals {
    double subtotal   = 0.0;
    double taxAmount  = 0.0;
    double grandTotal = 0.0;
};

// A complete invoice as edited in the form and persisted in the store.
// id is 0 until the invoice has been saved.
struct Invoice {
    qint64  id = 0;
    int     chalanNo = 0;
    QString partyName;
    QString city;
    QString lrNo;
    QString date;               // free text, dd/MM/yyyy by default
    double  taxPercent = 0.0;
    double  packingForwarding = 0.0;   // "P & F" charge, added after tax
    QVector<LineItem> items;

    InvoiceTotals totals() const;
};

// One row of the invoice history list
struct InvoiceSummary {
    qint64  id = 0;
    int     chalanNo = 0;
    QString partyName;
    QString city;
    QString date;
    double  grandTotal = 0.0;
    int     itemCount = 0;
};

struct MasterItem {
    qint64  id = 0;
    QString name;
    double  defaultRate = 0.0;
};

// Seller details printed on every PDF.  Stored as key/value rows in the
// meta table; see InvoiceStore::companyProfile().
struct CompanyProfile {
    QString companyName     = QStringLiteral("COMPANY NAME");
    QString companyCity     = QStringLiteral("CITY");
    QString companyMobile   = QStringLiteral("+91-123456789");
    QString bankAccountName = QStringLiteral("VIVEK G. RUPAPARA");
    QString bankName        = QStringLiteral("BANK");
    QString bankAccountNo   = QStringLiteral("123456789");
    QString bankIfsc        = QStringLiteral("XYZ0123456");
    QString logoPath;
};

namespace InvoiceMath {

/// Round to two decimals, halves away from zero.
double round2(double value);

InvoiceTotals computeTotals(const QVector<LineItem> &items,
                            double taxPercent,
                            double packingForwarding);

/// Validate the add-item inputs of the form.
/// Name must be non-empty after trimming, qty a number > 0 and rate a
/// number >= 0.  On failure *error (if given) receives a user message.
std::optional<LineItem> parseLineItem(const QString &name,
                                      const QString &qtyText,
                                      const QString &rateText,
                                      QString *error = nullptr);

/// Parse a tax percent or P&F field.  Empty text is 0.  Non-numeric text
/// is also 0 but sets *ok to false so the caller can reset the field.
double parseChargeOrZero(const QString &text, bool *ok = nullptr);

/// Shortest general form, like printf("%g"): 2 -> "2", 2.5 -> "2.5"
QString formatQuantity(double qty);

/// Two decimals, no grouping: 1234.5 -> "1234.50"
QString formatMoney(double value);

/// "Invoice_<n>.pdf"
QString defaultPdfFileName(int chalanNo);

} // namespace InvoiceMath

#endif // INVOICE_H

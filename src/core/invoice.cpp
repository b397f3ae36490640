#include "invoice.h"

#include <algorithm>
#include <cmath>

double LineItem::amount() const
{
    return InvoiceMath::round2(qty * rate);
}

InvoiceTotals Invoice::totals() const
{
    return InvoiceMath::computeTotals(items, taxPercent, packingForwarding);
}

namespace InvoiceMath {

double round2(double value)
{
    // 2.675 is stored as 2.67499999..., nudge it back over the half
    const double scaled = value * 100.0;
    const double nudged = scaled + std::copysign(1e-9 * std::max(1.0, std::fabs(scaled)), scaled);
    return std::round(nudged) / 100.0;
}

InvoiceTotals computeTotals(const QVector<LineItem> &items,
                            double taxPercent,
                            double packingForwarding)
{
    double sum = 0.0;
    for (const LineItem &item : items)
        sum += item.amount();

    InvoiceTotals t;
    t.subtotal  = round2(sum);
    t.taxAmount = (taxPercent != 0.0) ? round2(t.subtotal * (taxPercent / 100.0)) : 0.0;
    t.grandTotal = round2(t.subtotal + t.taxAmount + packingForwarding);
    return t;
}

std::optional<LineItem> parseLineItem(const QString &name,
                                      const QString &qtyText,
                                      const QString &rateText,
                                      QString *error)
{
    const QString invalid = QStringLiteral("Enter valid Item, Qty (>0) and Rate (>=0)");

    LineItem item;
    item.name = name.trimmed();

    bool qtyOk = false;
    bool rateOk = false;
    item.qty  = qtyText.trimmed().toDouble(&qtyOk);
    item.rate = rateText.trimmed().toDouble(&rateOk);

    if (item.name.isEmpty() || !qtyOk || !rateOk
        || !std::isfinite(item.qty) || !std::isfinite(item.rate)
        || item.qty <= 0.0 || item.rate < 0.0) {
        if (error)
            *error = invalid;
        return std::nullopt;
    }
    return item;
}

double parseChargeOrZero(const QString &text, bool *ok)
{
    const QString trimmed = text.trimmed();
    if (trimmed.isEmpty()) {
        if (ok)
            *ok = true;
        return 0.0;
    }

    bool parsed = false;
    double value = trimmed.toDouble(&parsed);
    if (!parsed || !std::isfinite(value)) {
        if (ok)
            *ok = false;
        return 0.0;
    }
    if (ok)
        *ok = true;
    return value;
}

QString formatQuantity(double qty)
{
    return QString::number(qty, 'g', 6);
}

QString formatMoney(double value)
{
    return QString::number(value, 'f', 2);
}

QString defaultPdfFileName(int chalanNo)
{
    return QStringLiteral("Invoice_%1.pdf").arg(chalanNo);
}

} // namespace InvoiceMath

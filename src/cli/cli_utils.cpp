// cli_utils.cpp - CLI utility functions implementation

#include "cli_utils.h"
#include "output_streams.h"

#include <QtGlobal>
#include <algorithm>

bool CLIUtils::parseChalanNumber(const QString& text, int& chalanNo) {
    bool ok = false;
    const int value = text.trimmed().toInt(&ok);
    if (!ok || value < 1) {
        return false;
    }
    chalanNo = value;
    return true;
}

bool CLIUtils::parseRate(const QString& text, double& rate) {
    bool ok = false;
    const double value = text.trimmed().toDouble(&ok);
    if (!ok || value < 0.0 || !qIsFinite(value)) {
        return false;
    }
    rate = value;
    return true;
}

bool CLIUtils::parseId(const QString& text, qint64& id) {
    bool ok = false;
    const qint64 value = text.trimmed().toLongLong(&ok);
    if (!ok || value < 1) {
        return false;
    }
    id = value;
    return true;
}

void CLIUtils::printTable(const QStringList& headers,
                          const QVector<QStringList>& rows,
                          const QList<int>& rightAligned) {
    // Column widths from the widest cell
    QVector<int> widths(headers.size(), 0);
    for (int c = 0; c < headers.size(); ++c) {
        widths[c] = headers[c].size();
    }
    for (const QStringList& row : rows) {
        for (int c = 0; c < row.size() && c < widths.size(); ++c) {
            widths[c] = std::max(widths[c], static_cast<int>(row[c].size()));
        }
    }

    auto printRow = [&](const QStringList& cells) {
        QStringList padded;
        for (int c = 0; c < widths.size(); ++c) {
            const QString cell = c < cells.size() ? cells[c] : QString();
            padded << (rightAligned.contains(c) ? cell.rightJustified(widths[c])
                                                : cell.leftJustified(widths[c]));
        }
        cout << padded.join("  ").trimmed() << Qt::endl;
    };

    printRow(headers);
    QStringList rules;
    for (int w : widths) {
        rules << QString(w, QLatin1Char('-'));
    }
    cout << rules.join("  ") << Qt::endl;
    for (const QStringList& row : rows) {
        printRow(row);
    }
}

void CLIUtils::printInvoice(const Invoice& invoice) {
    const InvoiceTotals totals = invoice.totals();

    cout << "Chalan No: " << invoice.chalanNo << Qt::endl;
    cout << "Date:      " << invoice.date << Qt::endl;
    cout << "Party:     " << invoice.partyName << Qt::endl;
    cout << "City:      " << invoice.city << Qt::endl;
    cout << "L.R. No:   " << invoice.lrNo << Qt::endl;
    cout << Qt::endl;

    QVector<QStringList> rows;
    int sr = 1;
    for (const LineItem& item : invoice.items) {
        rows << QStringList{
            QString::number(sr++),
            item.name,
            InvoiceMath::formatQuantity(item.qty),
            InvoiceMath::formatMoney(item.rate),
            InvoiceMath::formatMoney(item.amount())
        };
    }
    printTable({"Sr", "Item", "Qty", "Rate", "Amount"}, rows, {0, 2, 3, 4});

    cout << Qt::endl;
    cout << "Sub Total:   " << InvoiceMath::formatMoney(totals.subtotal).rightJustified(12) << Qt::endl;
    cout << "Tax " << (InvoiceMath::formatMoney(invoice.taxPercent) + "%:").leftJustified(9)
         << InvoiceMath::formatMoney(totals.taxAmount).rightJustified(12) << Qt::endl;
    cout << "P & F:       " << InvoiceMath::formatMoney(invoice.packingForwarding).rightJustified(12) << Qt::endl;
    cout << "Grand Total: " << InvoiceMath::formatMoney(totals.grandTotal).rightJustified(12) << Qt::endl;
}

void CLIUtils::printError(const QString& message) {
    cerr << "Error: " << message << Qt::endl;
}

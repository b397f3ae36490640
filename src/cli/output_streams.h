// output_streams.h - stdout/stderr streams shared by the chalan-cli sources
#ifndef CHALAN_OUTPUT_STREAMS_H
#define CHALAN_OUTPUT_STREAMS_H

#include <QTextStream>

// Defined in output_streams.cpp; tables and invoices go to cout, diagnostics to cerr
extern QTextStream cout;
extern QTextStream cerr;

#endif // CHALAN_OUTPUT_STREAMS_H

// output_streams.cpp - stdout/stderr streams shared by the chalan-cli sources

#include "output_streams.h"

QTextStream cout(stdout);
QTextStream cerr(stderr);

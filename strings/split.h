// Copyright 2018, Beeri 15.  All rights reserved.
//
#pragma once

#include <vector>

// Splits the null-terminated line in place. Column pointers point into line.
// Comma-delimited lines support double-quoted values with "" as the escaped quote.
void SplitCSVLineWithDelimiter(char* line, char delimiter,
                               std::vector<char*>* cols);

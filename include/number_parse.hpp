#pragma once
#include <string>

namespace geocell::text {

// Whole-string decimal parse. Leading/trailing whitespace is ignored; empty
// text, trailing junk, hex literals and non-finite results throw
// InvalidInput, with `what` naming the field in the message.
double parseDouble(const std::string& text, const std::string& what);

// Base-10 integer that fits in int, same trimming and error rules.
int parseInt(const std::string& text, const std::string& what);

} // namespace geocell::text

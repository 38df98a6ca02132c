#ifndef STRINGIO_H
#define STRINGIO_H

#include <iostream>
#include <string>
#include <vector>

namespace stringio {

/** Splits a string by a delimiter into an existing vector */
std::vector<std::string> &split(const std::string&, char, std::vector<std::string>&);
/** Splits a string by a delimiter into a new vector */
std::vector<std::string> split(const std::string&, char);
/** Splits a string at runs of whitespace, dropping empty fields. */
std::vector<std::string> tokenize(const std::string&);
/** Reads a line from a stream, dealing with different styles of line endings. */
std::istream& safeGetline(std::istream& is, std::string& t);
/** Removes leading and trailing whitespace. */
std::string trim(const std::string&);

} /* namespace stringio */

#endif /*STRINGIO_H */

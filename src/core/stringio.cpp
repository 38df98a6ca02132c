#include "stringio.hpp"
#include <cstdio> // EOF
#include <sstream>

using namespace std;

namespace stringio {

vector<string> &split(const string &s, char delim, vector<string> &elems) {
    stringstream ss(s);
    string item;
    while (std::getline(ss, item, delim)) {
        elems.push_back(item);
    }
    return elems;
}

vector<string> split(const string &s, char delim) {
    vector<string> elems;
    split(s, delim, elems);
    return elems;
}

vector<string> tokenize(const string &s) {
    vector<string> elems;
    istringstream ss(s);
    string item;
    while (ss >> item) {
        elems.push_back(item);
    }
    return elems;
}

string trim(const string &s) {
    const char* ws = " \t\r\n\f\v";
    size_t first = s.find_first_not_of(ws);
    if (first == string::npos)
        return "";
    size_t last = s.find_last_not_of(ws);
    return s.substr(first, last - first + 1);
}

/** Deals with different line endings used on Linux, Mac, Windows platforms */
istream& safeGetline(istream& is, string& t)
{
    t.clear();

    // read through the streambuf (guarded by a sentry) to see raw CR/LF
    istream::sentry se(is, true);
    streambuf* sb = is.rdbuf();

    for(;;) {
        int c = sb->sbumpc();
        switch (c) {
        case '\n':
            return is;
        case '\r':
            if(sb->sgetc() == '\n')
                sb->sbumpc();
            return is;
        case EOF:
            // Also handle the case when the last line has no line ending
            if(t.empty())
                is.setstate(ios::eofbit);
            return is;
        default:
            t += (char)c;
        }
    }
}

} /* namespace stringio */

#include "common/stl_utils.hpp"
#include <boost/algorithm/string/trim.hpp>
#include <boost/lexical_cast.hpp>

using namespace std;
using namespace boost;

optional<double> parse_number(const string &s) {
    string trimmed = algorithm::trim_copy(s);
    if (trimmed.empty()) return nullopt;
    try {
        return lexical_cast<double>(trimmed);
    } catch (bad_lexical_cast &) {
        return nullopt;
    }
}

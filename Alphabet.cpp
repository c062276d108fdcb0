#include "Alphabet.h"
#include <locale>
#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/predicate.hpp>

bool RID::IsB62(const std::string &s) {
    if (s.empty()) return false;
    // classic locale: alnum is exactly [a-zA-Z0-9], bytes >= 0x80 are rejected
    static const std::locale classic = std::locale::classic();
    return boost::algorithm::all(s, boost::algorithm::is_alnum(classic));
}

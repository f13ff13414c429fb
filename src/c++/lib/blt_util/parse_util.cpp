//
// EigenConv - VCF to Eigenstrat genotype converter
// Copyright (c) 2009-2018 Illumina, Inc.
//
// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// at your option) any later version.
//
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU General Public License for more details.
//
// You should have received a copy of the GNU General Public License
// along with this program.  If not, see <http://www.gnu.org/licenses/>.
//
//

#include "blt_util/parse_util.hh"
#include "common/Exceptions.hh"

#include <cerrno>
#include <climits>
#include <cstdlib>

#include <sstream>



static
void
parse_exception(
    const char* type_label,
    const char* parse_str)
{
    std::ostringstream oss;
    oss << "Can't parse " << type_label << " from string: '" << parse_str << "'";
    BOOST_THROW_EXCEPTION(eigenconv::common::GeneralException(oss.str()));
}



namespace eigenconv
{
namespace blt_util
{

long
parse_long(const char*& s)
{
    static const int base(10);

    errno = 0;

    char* endptr;
    const long val(strtol(s, &endptr, base));
    if ((errno == ERANGE && (val == LONG_MIN || val == LONG_MAX))
        || (errno != 0 && val == 0) || (endptr == s))
    {
        parse_exception("long int",s);
    }

    s = endptr;

    return val;
}



long
parse_long_str(const std::string& s)
{
    const char* s2(s.c_str());
    const long val(parse_long(s2));
    if ((s2-s.c_str())!=static_cast<long>(s.length()))
    {
        parse_exception("long int",s.c_str());
    }
    return val;
}



double
parse_double(const char*& s)
{
    errno = 0;

    char* endptr;
    const double val(strtod(s, &endptr));
    if ((errno == ERANGE) || (endptr == s))
    {
        parse_exception("double",s);
    }

    s = endptr;
    return val;
}



double
parse_double_str(const std::string& s)
{
    const char* s2(s.c_str());
    const double val(parse_double(s2));
    if ((s2-s.c_str())!=static_cast<long>(s.length()))
    {
        parse_exception("double",s.c_str());
    }
    return val;
}

}
}

//===----------------------------------------------------------------------===//
//
// Part of the Strata project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the helpers attached to SourceLoc: validity checks, equality used
// when the debugger compares primary locations between stops, and the textual
// rendering shared by trace output and stack traces.
//
//===----------------------------------------------------------------------===//

#include "support/source_location.hpp"

#include "support/source_manager.hpp"

#include <sstream>

namespace strata::support
{

/// @brief Report whether the location references a registered file.
///
/// @details Only the file id is considered; a location may still lack line
///          or column information and be valid.
bool SourceLoc::isValid() const
{
    return hasFile();
}

bool operator==(const SourceLoc &a, const SourceLoc &b)
{
    return a.file_id == b.file_id && a.line == b.line && a.column == b.column;
}

bool operator!=(const SourceLoc &a, const SourceLoc &b)
{
    return !(a == b);
}

/// @brief Format a location for display.
///
/// @details When a source manager is supplied and knows the file id, the
///          stored path is used; otherwise the numeric id is printed with a
///          leading '#'.  Missing columns are omitted.
std::string formatLoc(const SourceLoc &loc, const SourceManager *sm)
{
    std::ostringstream os;
    std::string_view path = sm ? sm->getPath(loc.file_id) : std::string_view{};
    if (!path.empty())
        os << path;
    else
        os << '#' << loc.file_id;
    os << ':' << loc.line;
    if (loc.column != 0)
        os << ':' << loc.column;
    return os.str();
}

} // namespace strata::support

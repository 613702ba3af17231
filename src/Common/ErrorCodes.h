#pragma once

#include <cstddef>
#include <string_view>
#include <base/types.h>

/** Error codes used by SSTIO::Exception.
  * The list itself lives in ErrorCodes.cpp; other translation units declare the codes they need
  * with `extern const int NAME;` inside `namespace ErrorCodes`.
  */

namespace SSTIO
{

namespace ErrorCodes
{
    /// ErrorCode identifier (index in array).
    using ErrorCode = int;

    /// Get name of error_code by identifier.
    /// Returns statically allocated string.
    std::string_view getName(ErrorCode error_code);
}

}

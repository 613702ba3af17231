#include <Common/ErrorCodes.h>

/** Previously, these constants were located in one enum.
  * But in this case there is a problem: when you add a new constant, you need to recompile
  * all translation units that use at least one constant (almost the whole project).
  * Therefore it is made so that definitions of constants are located here, in one file,
  * and their declaration are in different files, at the place of use.
  *
  * Later it was converted to the lookup table, to provide getName().
  */

#define APPLY_FOR_ERROR_CODES(M) \
    M(0, OK) \
    M(1, LOGICAL_ERROR) \
    M(2, BAD_ARGUMENTS) \
    M(3, ARGUMENT_OUT_OF_BOUND) \
    M(4, CANNOT_ALLOCATE_MEMORY) \
    M(5, FILE_DOESNT_EXIST) \
    M(6, CANNOT_OPEN_FILE) \
    M(7, CANNOT_CLOSE_FILE) \
    M(8, CANNOT_STAT) \
    M(9, CANNOT_READ_FROM_FILE_DESCRIPTOR) \
    M(10, FS_READ_ERROR) \
    M(11, UNKNOWN_FILESYSTEM) \
    M(12, FILE_ALREADY_CLOSED) \
    \
    M(1000, POCO_EXCEPTION) \
    M(1001, STD_EXCEPTION) \
    M(1002, UNKNOWN_EXCEPTION) \
/* See END */

namespace SSTIO
{
namespace ErrorCodes
{
#define M(VALUE, NAME) extern const ErrorCode NAME = VALUE;
    APPLY_FOR_ERROR_CODES(M)
#undef M

    constexpr ErrorCode END = 1002;

    constexpr std::string_view unknown_name = "UNKNOWN";

    struct ErrorCodesNames
    {
        std::string_view names[END + 1];
        ErrorCodesNames()
        {
#define M(VALUE, NAME) names[VALUE] = std::string_view(#NAME);
            APPLY_FOR_ERROR_CODES(M)
#undef M
        }
    } static error_codes_names;

    std::string_view getName(ErrorCode error_code)
    {
        if (error_code < 0 || error_code > END)
            return unknown_name;
        std::string_view name = error_codes_names.names[error_code];
        return name.empty() ? unknown_name : name;
    }
}

}

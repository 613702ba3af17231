#pragma once

#include <base/types.h>


namespace SSTIO
{

/// Parts of `scheme:[//authority]path`.
struct FileNameParts
{
    String scheme;
    String authority;
    String path;
};

/** Splits a file name the way Hadoop paths are split: the scheme ends at the first colon that comes
  * before any slash, the authority follows `//` up to the next slash.
  * The path is kept byte for byte: no percent-decoding, `?` and `#` are ordinary characters.
  * A name without scheme has empty scheme and authority.
  */
FileNameParts splitFileName(const String & file_name);

/** Brings a file name to the canonical form `scheme://authority/path`:
  * - a name without scheme gets `default_scheme`;
  * - repeated slashes are collapsed, trailing slash is removed;
  * - relative names of the `file` scheme are made absolute against the current directory.
  * Throws BAD_ARGUMENTS for empty names.
  */
String normalizeFileName(const String & file_name, const String & default_scheme = "file");

/// Everything before the last slash of a normalized name, without the slash.
String getParentPath(const String & normalized_name);

/// Everything after the last slash of a normalized name.
String getFileNameFromPath(const String & normalized_name);

}

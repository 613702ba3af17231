#include <Disks/normalizeFileName.h>

#include <Common/Exception.h>

#include <cctype>
#include <filesystem>

namespace fs = std::filesystem;


namespace SSTIO
{

namespace ErrorCodes
{
    extern const int BAD_ARGUMENTS;
}

namespace
{

String collapseSlashes(const String & path)
{
    String res;
    res.reserve(path.size());
    for (char c : path)
    {
        if (c == '/' && !res.empty() && res.back() == '/')
            continue;
        res += c;
    }

    if (res.size() > 1 && res.back() == '/')
        res.pop_back();
    return res;
}

/// RFC 3986: ALPHA *( ALPHA / DIGIT / "+" / "-" / "." )
bool isValidScheme(const String & scheme)
{
    if (scheme.empty() || !isalpha(static_cast<unsigned char>(scheme.front())))
        return false;
    for (char c : scheme)
        if (!isalnum(static_cast<unsigned char>(c)) && c != '+' && c != '-' && c != '.')
            return false;
    return true;
}

String trim(const String & s)
{
    size_t begin = s.find_first_not_of(" \t\r\n");
    if (begin == String::npos)
        return {};
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(begin, end - begin + 1);
}

}

FileNameParts splitFileName(const String & file_name)
{
    FileNameParts parts;
    String rest = file_name;

    size_t colon = file_name.find(':');
    size_t slash = file_name.find('/');
    if (colon != String::npos && (slash == String::npos || colon < slash) && isValidScheme(file_name.substr(0, colon)))
    {
        parts.scheme = file_name.substr(0, colon);
        rest = file_name.substr(colon + 1);

        if (rest.starts_with("//"))
        {
            size_t path_begin = rest.find('/', 2);
            parts.authority = rest.substr(2, path_begin == String::npos ? String::npos : path_begin - 2);
            rest = path_begin == String::npos ? String{} : rest.substr(path_begin);
        }
    }

    parts.path = std::move(rest);
    return parts;
}

String normalizeFileName(const String & file_name, const String & default_scheme)
{
    String name = trim(file_name);
    if (name.empty())
        throw Exception(ErrorCodes::BAD_ARGUMENTS, "File name is empty");

    FileNameParts parts = splitFileName(name);
    if (parts.scheme.empty())
    {
        parts.scheme = default_scheme;
        if (parts.path.front() != '/' && default_scheme == "file")
            parts.path = fs::absolute(fs::path(parts.path)).lexically_normal().string();
    }

    String path = collapseSlashes(parts.path);
    if (path.empty() || path.front() != '/')
        path = "/" + path;

    return parts.scheme + "://" + parts.authority + path;
}

String getParentPath(const String & normalized_name)
{
    size_t pos = normalized_name.find_last_of('/');
    if (pos == String::npos)
        return {};
    return normalized_name.substr(0, pos);
}

String getFileNameFromPath(const String & normalized_name)
{
    size_t pos = normalized_name.find_last_of('/');
    if (pos == String::npos)
        return normalized_name;
    return normalized_name.substr(pos + 1);
}

}

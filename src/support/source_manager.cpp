//===----------------------------------------------------------------------===//
//
// Part of the Strata project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the SourceManager utility responsible for tracking source files
// referenced by debug symbols.  The manager assigns stable numeric identifiers
// to file paths and resolves those identifiers back to normalized strings when
// printing locations or resolving "break at file:line" requests.
//
//===----------------------------------------------------------------------===//

#include "source_manager.hpp"

#include <filesystem>
#include <iostream>
#include <limits>

namespace strata::support
{
namespace
{
std::string normalizePath(std::string path)
{
    std::filesystem::path p(std::move(path));
    return p.lexically_normal().generic_string();
}

std::string_view basename(std::string_view path)
{
    size_t pos = path.find_last_of('/');
    return pos == std::string_view::npos ? path : path.substr(pos + 1);
}
} // namespace

/// @brief Register a file path and assign it a stable identifier.
///
/// @details The path is normalized into a generic string so output is
///          platform independent.  Identifiers start at one, leaving zero to
///          represent an unknown location.  Registering the same path twice
///          returns the original identifier.
///
/// @param path Filesystem path to normalize and store.
/// @return Identifier (>0) representing the stored path.
uint32_t SourceManager::addFile(std::string path)
{
    std::string normalized = normalizePath(std::move(path));

    if (auto it = path_to_id_.find(normalized); it != path_to_id_.end())
        return it->second;

    if (next_file_id_ > std::numeric_limits<uint32_t>::max())
    {
        std::cerr << "error: " << kSourceManagerFileIdOverflowMessage << "\n";
        return 0;
    }

    const uint32_t file_id = static_cast<uint32_t>(next_file_id_++);
    files_.push_back(std::move(normalized));
    path_to_id_.emplace(files_.back(), file_id);
    return file_id;
}

/// @brief Retrieve the canonical path associated with a file identifier.
///
/// @param file_id 1-based identifier previously returned by addFile().
/// @return Stored path, or empty string view if @p file_id is invalid.
std::string_view SourceManager::getPath(uint32_t file_id) const
{
    if (file_id == 0 || file_id > files_.size())
        return {};
    return files_[file_id - 1];
}

/// @brief Resolve a user-supplied path to a file identifier.
///
/// @details Full-path matches win.  A basename match is accepted only when
///          exactly one registered file carries that basename, so "main.nr"
///          never silently picks one of several candidates.
uint32_t SourceManager::findFile(std::string_view path) const
{
    std::string normalized = normalizePath(std::string(path));
    if (auto it = path_to_id_.find(normalized); it != path_to_id_.end())
        return it->second;

    uint32_t match = 0;
    std::string_view wanted = basename(normalized);
    for (size_t i = 0; i < files_.size(); ++i)
    {
        if (basename(files_[i]) != wanted)
            continue;
        if (match != 0)
            return 0;
        match = static_cast<uint32_t>(i + 1);
    }
    return match;
}
} // namespace strata::support

#pragma once

#include <string>
#include <vector>

#include "archive_request.hpp"

namespace vault::packaging {

/*
  Turns command line paths into archive items.

    file      → one item named after the file (no directory component)
    directory → every regular file below it, named <dir name>/<relative path>,
                sorted by relative path

  Throws util::PackagingError for paths that do not exist.
*/
std::vector<SourceItem> CollectSources(const std::vector<std::string>& paths);

} // namespace vault::packaging

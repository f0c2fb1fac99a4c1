#pragma once

#include <string>

#include <QString>

namespace basmgr {

// Reads the whole file. A missing file yields empty content and sets
// *existed to false; any other failure throws IoError.
std::string readTextFile(const QString &path, bool *existed = nullptr);

// Replaces path with data through a temporary file and rename, so readers
// see either the old or the new content. Creates missing parent directories.
// Throws IoError.
void writeFileAtomically(const QString &path, const std::string &data);

void ensureDirectory(const QString &path);

} // namespace basmgr

#ifndef TVLINK_FILE_UTILS_H
#define TVLINK_FILE_UTILS_H

#include <optional>
#include <string>
#include <sys/types.h>

namespace tvlink {

// Writes `<path>.tmp`, fsyncs, then renames over `path`.
bool write_file_atomically(const std::string& path, const std::string& contents, mode_t mode = 0644);

std::optional<std::string> read_file(const std::string& path);

} // namespace tvlink

#endif // TVLINK_FILE_UTILS_H

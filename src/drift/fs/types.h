#ifndef DRIFT_FS_TYPES_H
#define DRIFT_FS_TYPES_H

#include <filesystem>

namespace drift {

// (Note that file_path is of course slightly incorrect because the path could
// refer to a directory, but it's a lot easier to read.)
typedef std::filesystem::path file_path;

} // namespace drift

#endif

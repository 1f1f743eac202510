#pragma once

#include "frontier/queues/disk_queue.h"

#include <filesystem>
#include <functional>
#include <string>

namespace frontier {

/**
 * @brief Random hex token (128 bits) from the OpenSSL CSPRNG
 * @throws StorageIOException if the generator fails
 */
[[nodiscard]] std::string random_path_suffix();

/**
 * @brief Source of path suffixes for unique_path_queue()
 */
using PathSuffixGenerator = std::function<std::string()>;

/**
 * @brief Wrap a disk queue constructor so every queue gets a fresh file
 * @param construct Constructor of any disk-backed queue
 * @param make_suffix Suffix source, random_path_suffix() unless overridden
 * @return Constructor that appends "-<suffix>" to the base path,
 *         extending it until no file or directory of that name exists
 *
 * Two queues built through the wrapper never alias the same file, even
 * when callers hand it the same base path.
 */
[[nodiscard]] DiskQueueConstructor unique_path_queue(DiskQueueConstructor construct,
                                                     PathSuffixGenerator make_suffix = random_path_suffix);

} // namespace frontier

#include "frontier/queues/unique_path.h"
#include "frontier/core/exceptions.h"

#include <openssl/rand.h>

#include <iomanip>
#include <sstream>

namespace frontier {

std::string random_path_suffix() {
    unsigned char bytes[16];
    if (RAND_bytes(bytes, sizeof(bytes)) != 1) {
        throw StorageIOException("<random>", "suffix generation", "RAND_bytes failed");
    }

    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (unsigned char byte : bytes) {
        oss << std::setw(2) << static_cast<int>(byte);
    }
    return oss.str();
}

DiskQueueConstructor unique_path_queue(DiskQueueConstructor construct, PathSuffixGenerator make_suffix) {
    if (!make_suffix) {
        make_suffix = random_path_suffix;
    }

    return [construct = std::move(construct), make_suffix = std::move(make_suffix)](
               const std::filesystem::path& base_path) {
        std::string candidate = base_path.string() + "-" + make_suffix();
        while (std::filesystem::exists(candidate)) {
            candidate += "-" + make_suffix();
        }
        return construct(candidate);
    };
}

} // namespace frontier

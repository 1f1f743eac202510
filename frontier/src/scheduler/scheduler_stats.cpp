#include "frontier/scheduler/scheduler_stats.h"

#include <sstream>

namespace frontier {

std::string SchedulerStats::to_string() const {
    std::ostringstream oss;
    oss << "enqueued=" << total_enqueued()
        << " (memory=" << enqueued_memory << ", disk=" << enqueued_disk << ")"
        << " dequeued=" << total_dequeued()
        << " (memory=" << dequeued_memory << ", disk=" << dequeued_disk << ")"
        << " unserializable=" << unserializable
        << " restored=" << restored
        << " peak_pending=" << peak_pending;
    return oss.str();
}

} // namespace frontier

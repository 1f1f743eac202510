#include "frontier/scheduler/snapshot.h"
#include "frontier/core/exceptions.h"

#include <fstream>
#include <set>
#include <sstream>

namespace frontier {

nlohmann::ordered_json PersistedSnapshot::to_json() const {
    nlohmann::ordered_json document = nlohmann::ordered_json::object();

    for (const auto& slot_state : slots) {
        auto levels = nlohmann::ordered_json::array();
        for (const auto& level : slot_state.levels) {
            levels.push_back({{"priority", level.priority}, {"path", level.location}});
        }
        document[slot_state.slot] = std::move(levels);
    }

    return document;
}

PersistedSnapshot PersistedSnapshot::from_json(const nlohmann::ordered_json& document) {
    PersistedSnapshot snapshot;

    // Nothing was pending when the previous run stopped
    if (document.is_null() || (document.is_array() && document.empty())) {
        return snapshot;
    }

    if (document.is_array()) {
        throw MalformedSnapshotException("expected a mapping of slot to priority levels but found a flat "
                                         "list of priorities, the format used before per-slot scheduling");
    }

    if (!document.is_object()) {
        throw MalformedSnapshotException(std::string("expected a mapping of slot to priority levels, got ") +
                                         document.type_name());
    }

    for (const auto& [slot, levels] : document.items()) {
        if (!levels.is_array() || levels.empty()) {
            throw MalformedSnapshotException("slot '" + slot + "' must map to a non-empty list of priority levels");
        }

        SlotState slot_state;
        slot_state.slot = slot;
        std::set<int> seen;

        for (const auto& level : levels) {
            if (!level.is_object()) {
                throw MalformedSnapshotException("slot '" + slot + "' has a priority level that is not an object");
            }

            auto priority_it = level.find("priority");
            auto path_it = level.find("path");
            if (priority_it == level.end() || !priority_it->is_number_integer()) {
                throw MalformedSnapshotException("slot '" + slot + "' has a level without an integer priority");
            }
            if (path_it == level.end() || !path_it->is_string() || path_it->get<std::string>().empty()) {
                throw MalformedSnapshotException("slot '" + slot + "' has a level without a storage path");
            }

            int priority = priority_it->get<int>();
            if (!seen.insert(priority).second) {
                throw MalformedSnapshotException("slot '" + slot + "' lists priority " +
                                                 std::to_string(priority) + " twice");
            }

            slot_state.levels.push_back({priority, path_it->get<std::string>()});
        }

        snapshot.slots.push_back(std::move(slot_state));
    }

    return snapshot;
}

std::optional<PersistedSnapshot> PersistedSnapshot::load(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return std::nullopt;
    }

    std::ifstream in(path);
    if (!in.is_open()) {
        throw StorageIOException(path.string(), "read", "cannot open snapshot file");
    }

    std::stringstream buffer;
    buffer << in.rdbuf();
    if (in.bad()) {
        throw StorageIOException(path.string(), "read", "I/O error");
    }

    nlohmann::ordered_json document;
    try {
        document = nlohmann::ordered_json::parse(buffer.str());
    } catch (const nlohmann::json::parse_error& e) {
        throw MalformedSnapshotException(path.string() + " is not valid JSON (" + e.what() + ")");
    }

    return from_json(document);
}

void PersistedSnapshot::save(const std::filesystem::path& path) const {
    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            throw StorageIOException(path.parent_path().string(), "create directory", ec.message());
        }
    }

    auto temp_path = path;
    temp_path += ".tmp";

    {
        std::ofstream out(temp_path, std::ios::out | std::ios::trunc);
        if (!out.is_open()) {
            throw StorageIOException(temp_path.string(), "write", "cannot open snapshot file");
        }
        std::string encoded;
        try {
            encoded = to_json().dump(2);
        } catch (const nlohmann::json::type_error& e) {
            throw StorageIOException(temp_path.string(), "encode", e.what());
        }
        out << encoded << '\n';
        out.flush();
        if (!out) {
            throw StorageIOException(temp_path.string(), "write", "I/O error");
        }
    }

    std::filesystem::rename(temp_path, path, ec);
    if (ec) {
        throw StorageIOException(path.string(), "rename", ec.message());
    }
}

} // namespace frontier

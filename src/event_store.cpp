#include "concord/event_store.hpp"

#include <fstream>
#include <system_error>

#include "concord/errors.hpp"

namespace Concord {

// --- MemoryEventStore ---

void MemoryEventStore::persist(const Event& event) {
    events_.push_back(event);
}

const std::vector<Event>& MemoryEventStore::events() const {
    return events_;
}

std::vector<Event> MemoryEventStore::events_for(const std::string& agent_id) const {
    std::vector<Event> out;
    for (const auto& event : events_) {
        if (event.agent_id == agent_id) {
            out.push_back(event);
        }
    }
    return out;
}

// --- FileEventStore ---

FileEventStore::FileEventStore(std::filesystem::path directory) : directory_(std::move(directory)) {
    std::error_code ec;
    std::filesystem::create_directories(directory_, ec);
    if (ec) {
        throw PersistenceError("Cannot create event store directory " + directory_.string() + ": " + ec.message());
    }
}

std::filesystem::path FileEventStore::path_for(const std::string& agent_id) const {
    return directory_ / (agent_id + ".ndjson");
}

void FileEventStore::persist(const Event& event) {
    const auto path = path_for(event.agent_id);
    std::ofstream out(path, std::ios::app);
    if (!out) {
        throw PersistenceError("Cannot open event store file " + path.string());
    }
    out << event.to_json().dump() << '\n';
    out.flush();
    if (!out) {
        throw PersistenceError("Failed to write event to " + path.string());
    }
}

std::vector<Event> FileEventStore::load(const std::string& agent_id) const {
    const auto path = path_for(agent_id);
    std::vector<Event> events;
    if (!std::filesystem::exists(path)) {
        return events;
    }

    std::ifstream in(path);
    if (!in) {
        throw PersistenceError("Cannot open event store file " + path.string());
    }

    std::string line;
    size_t line_no = 0;
    while (std::getline(in, line)) {
        ++line_no;
        if (line.empty()) {
            continue;
        }
        try {
            events.push_back(Event::from_json(nlohmann::json::parse(line)));
        } catch (const nlohmann::json::parse_error& e) {
            throw PersistenceError(path.string() + ":" + std::to_string(line_no) + ": " + e.what());
        } catch (const InvalidArgument& e) {
            throw PersistenceError(path.string() + ":" + std::to_string(line_no) + ": " + e.what());
        }
    }
    return events;
}

} // namespace Concord

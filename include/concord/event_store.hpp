#ifndef CONCORD_EVENT_STORE_HPP
#define CONCORD_EVENT_STORE_HPP

#include <filesystem>
#include <string>
#include <vector>

#include "event.hpp"

namespace Concord {

    /**
     * @brief Durable sink for signed events.
     *
     * persist() is called before an event becomes part of an agent's in-memory chain;
     * an implementation that cannot store the event must throw Concord::PersistenceError.
     */
    class EventStore {
    public:
        virtual ~EventStore() = default;

        virtual void persist(const Event& event) = 0;
    };

    /**
     * @brief Keeps every persisted event in memory, in persist order.
     */
    class MemoryEventStore : public EventStore {
    public:
        void persist(const Event& event) override;

        const std::vector<Event>& events() const;
        std::vector<Event> events_for(const std::string& agent_id) const;

    private:
        std::vector<Event> events_;
    };

    /**
     * @brief Appends events to `<directory>/<agent_id>.ndjson`, one canonical JSON event per line.
     */
    class FileEventStore : public EventStore {
    public:
        /**
         * @param directory Created if it does not exist.
         * @throws Concord::PersistenceError if the directory cannot be created.
         */
        explicit FileEventStore(std::filesystem::path directory);

        void persist(const Event& event) override;

        /**
         * @brief Reads back every event stored for an agent, in append order.
         * @throws Concord::PersistenceError on I/O failure or a corrupt line.
         */
        std::vector<Event> load(const std::string& agent_id) const;

        std::filesystem::path path_for(const std::string& agent_id) const;

    private:
        std::filesystem::path directory_;
    };

} // namespace Concord

#endif // CONCORD_EVENT_STORE_HPP

#include "watch/Event.hpp"
#include "watch/Listener.hpp"

namespace ms::watch {

std::string to_string(const Event::Type type) {
    switch (type) {
    case Event::Type::ADDED: return "added";
    case Event::Type::ADDED_DIRECTORY: return "addedDirectory";
    case Event::Type::CHANGED: return "changed";
    case Event::Type::REMOVED: return "removed";
    case Event::Type::REMOVED_DIRECTORY: return "removedDirectory";
    }
    return "unknown";
}

void deliver(Listener& listener, const Event& event) {
    switch (event.type) {
    case Event::Type::ADDED: listener.onAdded(event.path); break;
    case Event::Type::ADDED_DIRECTORY: listener.onAddedDirectory(event.path); break;
    case Event::Type::CHANGED: listener.onChanged(event.path); break;
    case Event::Type::REMOVED: listener.onRemoved(event.path); break;
    case Event::Type::REMOVED_DIRECTORY: listener.onRemovedDirectory(event.path); break;
    }
}

}

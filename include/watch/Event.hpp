#pragma once

#include <filesystem>
#include <string>

namespace ms::watch {

class Listener;

struct Event {
    enum class Type {
        ADDED,
        ADDED_DIRECTORY,
        CHANGED,
        REMOVED,
        REMOVED_DIRECTORY
    };

    Type type;
    std::filesystem::path path;

    [[nodiscard]] bool isRemoval() const { return type == Type::REMOVED || type == Type::REMOVED_DIRECTORY; }
};

std::string to_string(Event::Type type);

// Delivers the event through the matching Listener callback
void deliver(Listener& listener, const Event& event);

}

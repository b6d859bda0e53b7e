#include "TransferEvent.hpp"

TransferEvent TransferEvent::log(const std::string& message) {
    TransferEvent event;
    event.type = EventType::LOG;
    event.text = message;
    return event;
}

TransferEvent TransferEvent::progress(std::size_t done, std::size_t total) {
    TransferEvent event;
    event.type = EventType::PROGRESS;
    event.done = done;
    event.total = total;
    return event;
}

TransferEvent TransferEvent::finished(const std::string& outputPath) {
    TransferEvent event;
    event.type = EventType::DONE;
    event.text = outputPath;
    return event;
}

TransferEvent TransferEvent::failed(const std::string& errorText) {
    TransferEvent event;
    event.type = EventType::FAILED;
    event.text = errorText;
    return event;
}

TransferEvent TransferEvent::cancelled() {
    TransferEvent event;
    event.type = EventType::CANCELLED;
    return event;
}

bool TransferEvent::isTerminal() const {
    return type == EventType::DONE || type == EventType::FAILED || type == EventType::CANCELLED;
}

std::string TransferEvent::toString() const {
    switch (type) {
        case EventType::PROGRESS:
            return "(progress, (" + std::to_string(done) + ", " + std::to_string(total) + "))";
        case EventType::CANCELLED:
            return "(cancelled, null)";
        default:
            return "(" + ::toString(type) + ", " + text + ")";
    }
}

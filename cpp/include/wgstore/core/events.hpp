#pragma once

#include <string>
#include <utility>

#include "wgstore/core/types.hpp"

namespace wgstore::core {

    enum class EventLevel : u8 {
        Info = 0,
        Warning = 1,
    };

    enum class EventKind : u8 {
        Message = 0,
        IndexRead,
        BackupCreated,
        ContainerWritten,
        EntryReplaced,
        DuplicateDropped,
        OptionalFileMissing,
        NameCollision,
        IndexWritten,
        DryRun,
    };

    struct Event {
        EventLevel level{EventLevel::Info};
        EventKind kind{EventKind::Message};
        std::string message;
    };

    // Receives progress from merge, write and import operations. The library
    // never prints; a null sink or null fn drops events.
    struct EventSink {
        void (*fn)(void* ctx, const Event& ev){nullptr};
        void* ctx{nullptr};
    };

    inline void emit(const EventSink* sink, EventLevel level, EventKind kind, std::string message) {
        if (sink == nullptr || sink->fn == nullptr) {
            return;
        }
        Event ev{level, kind, std::move(message)};
        sink->fn(sink->ctx, ev);
    }

} // namespace wgstore::core

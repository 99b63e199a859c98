#pragma once

#include "resource/Resource.hpp"

namespace M2M {

/**
 * EventSink receives fire-and-forget lifecycle events for the notification
 * subsystem. The dispatcher holds only a weak_ptr<EventSink> and locks it
 * before each delivery; a sink that has been destroyed is skipped.
 *
 * Events are delivered on the thread that executed the request, after the
 * store has been updated.
 */
struct EventSink {
    virtual ~EventSink() = default;

    virtual void resourceCreated(Resource const& resource) = 0;
    virtual void resourceUpdated(Resource const& resource) = 0;
    virtual void resourceDeleted(Resource const& resource) = 0;
};

} // namespace M2M

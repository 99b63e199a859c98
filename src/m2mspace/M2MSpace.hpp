#pragma once

#include "config/CseOptions.hpp"
#include "core/Error.hpp"
#include "core/ResponseStatusCode.hpp"
#include "core/Types.hpp"
#include "dispatch/Dispatcher.hpp"
#include "events/EventSink.hpp"
#include "request/Request.hpp"
#include "request/RequestArguments.hpp"
#include "resource/Resource.hpp"
#include "runtime/CseRuntime.hpp"

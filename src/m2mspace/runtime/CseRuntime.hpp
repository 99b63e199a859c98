#pragma once
#include "config/CseOptions.hpp"
#include "dispatch/Dispatcher.hpp"
#include "events/EventSink.hpp"
#include "registration/RegistrationManager.hpp"
#include "remote/RemoteCseManager.hpp"
#include "resource/ResourceBehavior.hpp"
#include "security/AcpAccessFilter.hpp"
#include "store/MemoryResourceStore.hpp"

#include <memory>
#include <mutex>
#include <string>

namespace M2M {

/**
 * @brief One CSE instance wired from the in-process collaborators.
 *
 * start() creates the CSEBase root and the administrative ACP "acpAdmin"
 * that grants every operation to the admin originator and retrieve/discovery
 * to everybody else.
 */
class CseRuntime {
public:
    static constexpr std::string_view AdminPolicyId = "acpAdmin";

    explicit CseRuntime(CseOptions options, RequestSender sender = {});

    CseRuntime(CseRuntime const&)            = delete;
    CseRuntime& operator=(CseRuntime const&) = delete;

    auto start() -> Expected<void>;
    [[nodiscard]] auto started() const -> bool;

    auto handle(Request const& request) -> Response;

    auto setEventSink(std::weak_ptr<EventSink> sink) -> void;

    [[nodiscard]] auto dispatcher() -> Dispatcher& { return this->dispatcher_; }
    [[nodiscard]] auto store() -> MemoryResourceStore& { return this->store_; }
    [[nodiscard]] auto options() const -> CseOptions const& { return this->options_; }

private:
    auto createCseBase() -> Expected<ResourcePtr>;
    auto createAdminPolicy(Resource const& cseBase) -> Expected<ResourcePtr>;

    CseOptions           options_;
    MemoryResourceStore  store_;
    AcpAccessFilter      access_;
    RegistrationManager  registration_;
    RemoteCseManager     remote_;
    ResourceTypeRegistry types_;
    Dispatcher           dispatcher_;
    mutable std::mutex   startMutex_;
    bool                 started_{false};
};

} // namespace M2M

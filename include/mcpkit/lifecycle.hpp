#pragma once
#include "types.hpp"
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace mcpkit {

enum class LifecycleState {
    Uninitialized,
    Initializing,
    Ready,
    ShuttingDown,
    Closed
};

const char* to_string(LifecycleState state);

/// Per-connection handshake/ready/shutdown state machine.
/// The state only ever moves forward.
class Lifecycle {
public:
    /// Keeps the in-flight count raised for as long as it lives. It also
    /// holds `keep_alive`, typically whatever owns the Lifecycle, so the
    /// count can always be released.
    class InFlightToken {
    public:
        InFlightToken() = default;
        InFlightToken(Lifecycle* owner, std::shared_ptr<const void> keep_alive)
            : keep_alive_(std::move(keep_alive)), owner_(owner) {}
        ~InFlightToken() { release(); }

        InFlightToken(InFlightToken&& o) noexcept
            : keep_alive_(std::move(o.keep_alive_)), owner_(o.owner_) {
            o.owner_ = nullptr;
        }
        InFlightToken& operator=(InFlightToken&& o) noexcept {
            if (this != &o) {
                release();
                keep_alive_ = std::move(o.keep_alive_);
                owner_ = o.owner_;
                o.owner_ = nullptr;
            }
            return *this;
        }
        InFlightToken(const InFlightToken&) = delete;
        InFlightToken& operator=(const InFlightToken&) = delete;

        void release();

    private:
        std::shared_ptr<const void> keep_alive_;
        Lifecycle* owner_ = nullptr;
    };

    Lifecycle() = default;
    Lifecycle(const Lifecycle&) = delete;
    Lifecycle& operator=(const Lifecycle&) = delete;

    [[nodiscard]] LifecycleState state() const;
    [[nodiscard]] bool is_ready() const { return state() == LifecycleState::Ready; }

    /// Uninitialized -> Initializing -> Ready in one step. The caller has
    /// already validated the request and negotiated the version.
    /// Throws McpProtocolError(InvalidRequest) if the connection is not
    /// Uninitialized.
    void initialize(std::string negotiated_version, ClientCapabilities client_caps,
                    Implementation client_info);

    /// Count a request as in flight. The token shares ownership of
    /// `keep_alive` until it is released. Returns an empty optional once the
    /// connection is closed.
    [[nodiscard]] std::optional<InFlightToken> track(std::shared_ptr<const void> keep_alive = nullptr);

    [[nodiscard]] size_t in_flight() const;

    /// Move to ShuttingDown (from any earlier state) and wait up to `grace`
    /// for in-flight calls to finish, then move to Closed. Calls still
    /// running afterwards are abandoned. Returns true if the connection
    /// drained in time. A second call returns immediately.
    bool shutdown(std::chrono::milliseconds grace);

    [[nodiscard]] std::string negotiated_version() const;
    [[nodiscard]] ClientCapabilities client_capabilities() const;
    [[nodiscard]] Implementation client_info() const;

private:
    void advance(LifecycleState next);  // requires mutex_ held
    void finish_one();

    mutable std::mutex mutex_;
    std::condition_variable idle_cv_;
    LifecycleState state_{LifecycleState::Uninitialized};
    size_t in_flight_{0};
    std::string negotiated_version_;
    ClientCapabilities client_caps_;
    Implementation client_info_;
};

} // namespace mcpkit

#pragma once

#include "engine/engine.hpp"

namespace kvmock {

// Client-side pipeline shape over an engine.  Commands are never buffered:
// each one runs against the engine as soon as it is issued, so execute()
// has nothing left to do.
class Pipeline {
public:
    explicit Pipeline(Engine& engine, bool transaction = true) noexcept
        : engine_(engine), transaction_(transaction) {}

    Engine* operator->() noexcept { return &engine_; }
    Engine& engine() noexcept { return engine_; }

    void watch(const std::vector<std::string>& keys = {}) { engine_.watch(keys); }
    void unwatch() { engine_.unwatch(); }
    void multi() { engine_.multi(); }
    void execute() { engine_.execute(); }
    void reset() noexcept {}

    [[nodiscard]] bool transaction() const noexcept { return transaction_; }

private:
    Engine& engine_;
    bool transaction_;
};

} // namespace kvmock

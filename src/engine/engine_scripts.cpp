#include "engine/engine.hpp"

#include "common/digest.hpp"
#include "common/error.hpp"

namespace kvmock {

// ── Scripts ──────────────────────────────────────────────────────────────────

std::string Engine::script_load(const std::string& script) {
    std::string sha = sha1_hex(script);
    scripts_.insert_or_assign(sha, script);
    return sha;
}

std::vector<bool> Engine::script_exists(const std::vector<std::string>& shas) const {
    std::vector<bool> result;
    result.reserve(shas.size());
    for (const auto& sha : shas) {
        result.push_back(scripts_.count(sha) > 0);
    }
    return result;
}

void Engine::script_flush() {
    scripts_.clear();
}

void Engine::script_kill() {
    throw Error(ErrorKind::Unimplemented, "SCRIPT KILL is not emulated");
}

const std::string* Engine::script_source(const std::string& sha) const {
    auto it = scripts_.find(sha);
    return it == scripts_.end() ? nullptr : &it->second;
}

} // namespace kvmock

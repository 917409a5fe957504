#include "command/script.hpp"

#include <utility>

#include "common/digest.hpp"

namespace kvmock::command {

Script::Script(CommandDispatcher& dispatcher, std::string source)
    : dispatcher_(dispatcher)
    , source_(std::move(source))
    , sha_(sha1_hex(source_))
{
}

Reply Script::operator()(const Args& keys, const Args& args) {
    Engine& engine = dispatcher_.engine();
    if (!engine.script_source(sha_)) {
        engine.script_load(source_);
    }
    Args keys_and_args = keys;
    keys_and_args.insert(keys_and_args.end(), args.begin(), args.end());
    return dispatcher_.evalsha(sha_, static_cast<int64_t>(keys.size()), keys_and_args);
}

} // namespace kvmock::command

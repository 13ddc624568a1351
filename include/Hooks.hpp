#pragma once
#include <string>
#include <string_view>
#include <utility>

namespace rtmpingest {
struct HookResult {
    bool accepted{ true };
    std::string reason;

    static HookResult accept()
    {
        return HookResult();
    }

    static HookResult reject(std::string reason)
    {
        return HookResult{ false, std::move(reason) };
    }
};

// Access control callbacks, called synchronously from the session.
class SessionHooks
{
public:
    virtual ~SessionHooks() = default;

    virtual HookResult onConnect(std::string_view app) = 0;
    virtual HookResult onPublish(std::string_view app, std::string_view name, std::string_view kind) = 0;
};

class AcceptAllHooks : public SessionHooks
{
public:
    HookResult onConnect(std::string_view) override
    {
        return HookResult::accept();
    }

    HookResult onPublish(std::string_view, std::string_view, std::string_view) override
    {
        return HookResult::accept();
    }
};
}

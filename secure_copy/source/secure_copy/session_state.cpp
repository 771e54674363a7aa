#include <secure_copy/session_state.hpp>
#include <secure_copy/locality.hpp>

#include <utility/remote_path.hpp>

namespace SecureCopy
{
    std::string SessionState::target() const
    {
        return remoteTarget(host, user);
    }

    std::string SessionState::resolve(std::string const& path) const
    {
        return Utility::resolveAgainst(cwd, path);
    }
}

#include "connection.hpp"
#include <cstdlib>
#include <stdexcept>

namespace tilekeep {

Connection::Connection()
    : conn_(xcb_connect(nullptr, nullptr), xcb_disconnect)
    , screen_(nullptr)
{
    if (xcb_connection_has_error(conn_.get()))
    {
        throw std::runtime_error("Failed to connect to X server");
    }

    screen_ = xcb_setup_roots_iterator(xcb_get_setup(conn_.get())).data;
    if (!screen_)
    {
        throw std::runtime_error("Failed to get screen");
    }

    init_randr();
}

void Connection::init_randr()
{
    auto ext_cookie = xcb_query_extension(conn_.get(), 5, "RANDR");
    auto* ext_reply = xcb_query_extension_reply(conn_.get(), ext_cookie, nullptr);
    if (!ext_reply)
        return;

    bool present = ext_reply->present;
    free(ext_reply);
    if (!present)
        return;

    // RRGetOutputPrimary needs 1.3
    auto cookie = xcb_randr_query_version(conn_.get(), XCB_RANDR_MAJOR_VERSION, XCB_RANDR_MINOR_VERSION);
    auto* reply = xcb_randr_query_version_reply(conn_.get(), cookie, nullptr);
    if (!reply)
        return;

    randr_available_ = reply->major_version > 1 || (reply->major_version == 1 && reply->minor_version >= 3);
    free(reply);
}

xcb_atom_t Connection::intern_atom(std::string_view name) const
{
    auto cookie = xcb_intern_atom(conn_.get(), 0, static_cast<uint16_t>(name.size()), name.data());
    auto* reply = xcb_intern_atom_reply(conn_.get(), cookie, nullptr);
    if (!reply)
        return XCB_NONE;
    xcb_atom_t atom = reply->atom;
    free(reply);
    return atom;
}

} // namespace tilekeep

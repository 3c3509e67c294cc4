#pragma once

#include <memory>
#include <string_view>
#include <xcb/randr.h>
#include <xcb/xcb.h>

namespace tilekeep {

class Connection
{
public:
    Connection();
    ~Connection() = default;

    Connection(Connection const&) = delete;
    Connection& operator=(Connection const&) = delete;
    Connection(Connection&&) = default;
    Connection& operator=(Connection&&) = default;

    xcb_connection_t* get() const { return conn_.get(); }
    xcb_screen_t* screen() const { return screen_; }
    xcb_window_t root() const { return screen_->root; }

    bool has_randr() const { return randr_available_; }

    xcb_atom_t intern_atom(std::string_view name) const;

    void flush() { xcb_flush(conn_.get()); }

private:
    std::unique_ptr<xcb_connection_t, decltype(&xcb_disconnect)> conn_;
    xcb_screen_t* screen_;

    bool randr_available_ = false;

    void init_randr();
};

} // namespace tilekeep

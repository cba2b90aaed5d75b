#pragma once

#include <boost/asio/io_context.hpp>
#include <boost/beast/core/error.hpp>

#include <functional>

#include "clock.hpp"

namespace page_recorder {

// Runs `ioc` until the single pending operation (whose handler stores its
// result in `ec`) completes, or until `limit` passes. On timeout `abort` is
// called to cancel the operation and beast::system_error(timed_out) is thrown.
// A failed operation throws beast::system_error(ec).
void runWithDeadline(boost::asio::io_context& ioc, boost::beast::error_code& ec,
                     Clock::duration limit, const std::function<void()>& abort);

} // namespace page_recorder

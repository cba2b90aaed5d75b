#include "net_deadline.hpp"

#include <boost/asio/error.hpp>
#include <boost/system/system_error.hpp>

namespace page_recorder {

void runWithDeadline(boost::asio::io_context& ioc, boost::beast::error_code& ec,
                     Clock::duration limit, const std::function<void()>& abort) {
    ioc.restart();
    if (limit > Clock::duration::zero()) ioc.run_for(limit);
    if (!ioc.stopped()) {
        abort();
        ioc.run();
        throw boost::system::system_error(boost::asio::error::timed_out);
    }
    if (ec) throw boost::system::system_error(ec);
}

} // namespace page_recorder

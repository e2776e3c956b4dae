#pragma once

#include "stream_session.hpp"

#include <boost/asio/io_context.hpp>
#include <string>

namespace stream_keeper {

/// Build a SessionFactory that opens a streaming GET on @p streamUrl with
/// "Authorization: Bearer <bearerToken>", built on Boost.Beast.
///
/// https:// URLs require OpenSSL support (STREAM_KEEPER_HAS_SSL).
/// @throws std::invalid_argument on a malformed URL.
/// @throws std::runtime_error for https without SSL support.
SessionFactory makeHttpSessionFactory(boost::asio::io_context& ioc,
                                      const std::string& streamUrl,
                                      const std::string& bearerToken,
                                      bool verbose = false);

} // namespace stream_keeper

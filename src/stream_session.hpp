#pragma once

#include <boost/system/error_code.hpp>

#include <functional>
#include <memory>
#include <string>

namespace stream_keeper {

/// One attempt at an open streaming connection.
///
/// Contract for implementations:
///  - start() issues the request.  onResponse fires once when the status
///    line arrives.  For status 200 the body is then read and every complete
///    line is passed to onChunk; for any other status reading stops and the
///    session waits for its owner to cancel it.
///  - onClosed fires at most once, when the connection ends on its own or
///    after cancel() interrupted a pending operation (then with
///    operation_aborted).  No callback fires after onClosed.
///  - cancel() is idempotent and safe to call at any time.
class StreamSession {
public:
    struct Handlers {
        std::function<void(unsigned int status)>               onResponse;
        std::function<void(const std::string& chunk)>          onChunk;
        std::function<void(const boost::system::error_code&)>  onClosed;
    };

    virtual ~StreamSession() = default;

    virtual void start(Handlers handlers) = 0;
    virtual void cancel() = 0;
};

/// Creates a fresh, unstarted session for each connect attempt.
using SessionFactory = std::function<std::shared_ptr<StreamSession>()>;

} // namespace stream_keeper

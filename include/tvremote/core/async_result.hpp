#pragma once
#include "tvremote/core/failures.hpp"
#include <boost/asio/awaitable.hpp>

namespace tvremote {

template<typename T>
using AsyncResult = boost::asio::awaitable<RemoteResult<T>>;

}  // namespace tvremote

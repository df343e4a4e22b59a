#pragma once

#include "vermouth/base-fd.hpp"
#include "vermouth/http-server-config.hpp"
#include "vermouth/router.hpp"
#include "vermouth/transport.hpp"

namespace vermouth {

// Serves exactly one request per connection:
//   read head -> decode request -> resolve route (under the router lock) -> run the middleware chain and handler.
// Protocol errors are answered with their error status (400, 408, 413, 431), unmatched requests with the fixed 404,
// and handler exceptions with a 500 as long as the response head was not sent yet.
// The Router and the config must outlive the dispatcher.
class ConnectionDispatcher {
 public:
  ConnectionDispatcher(const Router& router, const HttpServerConfig& config) noexcept
      : _router(router), _config(config) {}

  // Serves one request on 'transport'. Failures are logged, never thrown.
  void serve(ITransport& transport) const noexcept;

  // Applies the socket options of the config to the accepted 'connection', serves one request on it, then closes it.
  void serve(BaseFd connection) const noexcept;

 private:
  void dispatch(ITransport& transport) const;

  const Router& _router;
  const HttpServerConfig& _config;
};

}  // namespace vermouth

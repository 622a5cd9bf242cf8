/* -*- Mode: C++; tab-width: 4; c-basic-offset: 4; indent-tabs-mode: nil -*- */
/*
 *   Copyright 2025-Present Couchbase, Inc.
 *
 *   Licensed under the Apache License, Version 2.0 (the "License");
 *   you may not use this file except in compliance with the License.
 *   You may obtain a copy of the License at
 *
 *       http://www.apache.org/licenses/LICENSE-2.0
 *
 *   Unless required by applicable law or agreed to in writing, software
 *   distributed under the License is distributed on an "AS IS" BASIS,
 *   WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 *   See the License for the specific language governing permissions and
 *   limitations under the License.
 */

#include "http_transport.hxx"

#include "core/cancellation_token.hxx"
#include "core/logger/logger.hxx"
#include "http_session.hxx"

#include <cbinit/error_codes.hxx>

#include <asio/io_context.hpp>
#include <asio/post.hpp>
#include <asio/ssl/context.hpp>
#include <fmt/core.h>

namespace cbinit::core::io
{
namespace
{
class asio_http_transport : public http_transport
{
public:
  explicit asio_http_transport(asio::io_context& ctx)
    : ctx_{ ctx }
  {
    tls_.set_options(asio::ssl::context::default_workarounds | asio::ssl::context::no_sslv2 |
                     asio::ssl::context::no_sslv3 | asio::ssl::context::no_tlsv1 |
                     asio::ssl::context::no_tlsv1_1);
    tls_.set_verify_mode(asio::ssl::verify_peer);
  }

  /**
   * Without an authority the system CAs are trusted. A certificate authority that cannot be
   * loaded is a configuration error.
   */
  auto trust(const std::optional<certificate_authority>& authority) -> cbinit::error
  {
    std::error_code ec{};
    if (!authority) {
      tls_.set_default_verify_paths(ec);
      if (ec) {
        CBINIT_LOG_WARNING("failed to load system CAs: {}", ec.message());
      }
      return {};
    }
    tls_.add_certificate_authority(
      asio::const_buffer(authority->certificate.data(), authority->certificate.size()), ec);
    if (ec) {
      return { errc::orchestration::certificate_unavailable,
               fmt::format("unable to load the certificate authority: {}", ec.message()) };
    }
    for (std::size_t i = 0; i < authority->chain.size(); ++i) {
      const auto& certificate = authority->chain[i];
      tls_.add_certificate_authority(asio::const_buffer(certificate.data(), certificate.size()),
                                     ec);
      if (ec) {
        return { errc::orchestration::certificate_unavailable,
                 fmt::format(
                   "unable to load certificate #{} of the CA chain: {}", i, ec.message()) };
      }
    }
    return {};
  }

  void send(const endpoint_address& endpoint,
            http_request request,
            const std::shared_ptr<cancellation_token>& token,
            response_handler&& handler) override
  {
    auto service = std::to_string(endpoint.port);
    auto session = endpoint.tls
                     ? std::make_shared<http_session>(ctx_, tls_, endpoint.host, service)
                     : std::make_shared<http_session>(ctx_, endpoint.host, service);

    if (!token) {
      return session->execute(std::move(request), std::move(handler));
    }
    auto subscription = token->subscribe([weak = std::weak_ptr<http_session>(session)]() {
      if (auto self = weak.lock(); self) {
        self->stop();
      }
    });
    if (subscription == 0) {
      // already cancelled
      return asio::post(ctx_, [handler = std::move(handler)]() {
        handler(errc::common::request_canceled, {});
      });
    }
    session->execute(
      std::move(request),
      [token, subscription, handler = std::move(handler)](std::error_code ec,
                                                          http_response response) {
        token->unsubscribe(subscription);
        handler(ec, std::move(response));
      });
  }

private:
  asio::io_context& ctx_;
  asio::ssl::context tls_{ asio::ssl::context::tls_client };
};
} // namespace

auto
make_asio_http_transport(asio::io_context& ctx,
                         const std::optional<certificate_authority>& authority)
  -> tl::expected<std::shared_ptr<http_transport>, cbinit::error>
{
  auto transport = std::make_shared<asio_http_transport>(ctx);
  if (auto err = transport->trust(authority); err) {
    return tl::unexpected(std::move(err));
  }
  return transport;
}
} // namespace cbinit::core::io

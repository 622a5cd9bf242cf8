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

#include "certificate_provider.hxx"

#include "core/logger/logger.hxx"

#include <cbinit/error_codes.hxx>

#include <fmt/core.h>

#include <openssl/bio.h>
#include <openssl/pem.h>
#include <openssl/x509.h>

#include <algorithm>
#include <array>
#include <fstream>
#include <memory>
#include <sstream>

namespace cbinit::core::orchestration
{
namespace
{
struct x509_deleter {
  void operator()(X509* cert) const
  {
    X509_free(cert);
  }
};

struct bio_deleter {
  void operator()(BIO* bio) const
  {
    BIO_free(bio);
  }
};

using x509_ptr = std::unique_ptr<X509, x509_deleter>;

struct parsed_certificate {
  std::string pem{};
  x509_ptr cert{};
};

auto
parse_certificate(const std::string& pem) -> x509_ptr
{
  const std::unique_ptr<BIO, bio_deleter> bio{ BIO_new_mem_buf(pem.data(),
                                                               static_cast<int>(pem.size())) };
  if (!bio) {
    return nullptr;
  }
  return x509_ptr{ PEM_read_bio_X509(bio.get(), nullptr, nullptr, nullptr) };
}

auto
is_self_signed(X509* cert) -> bool
{
  return X509_NAME_cmp(X509_get_subject_name(cert), X509_get_issuer_name(cert)) == 0;
}

auto
subject_of(X509* cert) -> std::string
{
  std::array<char, 256> buffer{};
  X509_NAME_oneline(X509_get_subject_name(cert), buffer.data(), static_cast<int>(buffer.size()));
  return { buffer.data() };
}

auto
read_file(const std::string& path, std::string& content) -> bool
{
  std::ifstream file(path, std::ios::in | std::ios::binary);
  if (!file) {
    return false;
  }
  std::ostringstream buffer;
  buffer << file.rdbuf();
  content = buffer.str();
  return true;
}
} // namespace

auto
make_certificate_authority(const std::string& certificate_pem,
                           const std::vector<std::string>& chain_pems)
  -> tl::expected<certificate_authority, cbinit::error>
{
  auto current = parse_certificate(certificate_pem);
  if (!current) {
    return tl::unexpected(cbinit::error{ errc::orchestration::certificate_unavailable,
                                         "unable to parse the certificate of the authority" });
  }

  std::vector<parsed_certificate> chain{};
  for (const auto& pem : chain_pems) {
    auto cert = parse_certificate(pem);
    if (!cert) {
      return tl::unexpected(cbinit::error{ errc::orchestration::certificate_unavailable,
                                           "unable to parse certificate of the chain" });
    }
    chain.push_back({ pem, std::move(cert) });
  }

  certificate_authority authority{};
  std::string current_pem = certificate_pem;
  while (!is_self_signed(current.get())) {
    auto* issuer = X509_get_issuer_name(current.get());
    auto parent = std::find_if(chain.begin(), chain.end(), [issuer](const auto& candidate) {
      return candidate.cert &&
             X509_NAME_cmp(X509_get_subject_name(candidate.cert.get()), issuer) == 0;
    });
    if (parent == chain.end()) {
      return tl::unexpected(cbinit::error{
        errc::orchestration::certificate_unavailable,
        fmt::format(R"(could not find issuer of "{}" in the chain)", subject_of(current.get())) });
    }
    authority.chain.emplace_back(std::move(current_pem));
    current_pem = parent->pem;
    current = std::move(parent->cert);
  }
  authority.certificate = std::move(current_pem);
  CBINIT_LOG_DEBUG(R"(certificate authority "{}" with {} intermediate certificate(s))",
                   subject_of(current.get()),
                   authority.chain.size());
  return authority;
}

auto
load_certificate_authority(const std::string& certificate_path,
                           const std::vector<std::string>& chain_paths)
  -> tl::expected<certificate_authority, cbinit::error>
{
  std::string certificate_pem{};
  if (!read_file(certificate_path, certificate_pem)) {
    return tl::unexpected(
      cbinit::error{ errc::orchestration::certificate_unavailable,
                     fmt::format(R"(unable to read certificate from "{}")", certificate_path) });
  }
  std::vector<std::string> chain_pems{};
  for (const auto& path : chain_paths) {
    std::string pem{};
    if (!read_file(path, pem)) {
      return tl::unexpected(
        cbinit::error{ errc::orchestration::certificate_unavailable,
                       fmt::format(R"(unable to read certificate from "{}")", path) });
    }
    chain_pems.emplace_back(std::move(pem));
  }
  return make_certificate_authority(certificate_pem, chain_pems);
}
} // namespace cbinit::core::orchestration

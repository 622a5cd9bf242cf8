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

#pragma once

#include <cbinit/error.hxx>
#include <cbinit/topology.hxx>

#include <tl/expected.hpp>

#include <string>
#include <vector>

namespace cbinit::core::orchestration
{
/**
 * Reads the certificate authority of the cluster from PEM files.
 *
 * @param certificate_pem certificate of the authority that signed the node certificates, may be
 * an intermediate certificate
 * @param chain_pems remaining certificates of the chain up to the self-signed root, in any order
 *
 * @return authority with the root certificate and the intermediate certificates ordered from the
 * signing certificate up to the root
 */
auto
make_certificate_authority(const std::string& certificate_pem,
                           const std::vector<std::string>& chain_pems)
  -> tl::expected<certificate_authority, cbinit::error>;

/**
 * Like @ref make_certificate_authority, but reads the PEM data from files.
 */
auto
load_certificate_authority(const std::string& certificate_path,
                           const std::vector<std::string>& chain_paths)
  -> tl::expected<certificate_authority, cbinit::error>;
} // namespace cbinit::core::orchestration

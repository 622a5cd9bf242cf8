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

#include <cbinit/error.hxx>
#include <cbinit/error_codes.hxx>

#include <utility>

namespace cbinit
{
error::error(std::error_code ec, std::string message)
  : ec_{ ec }
  , message_{ std::move(message) }
{
}

auto
error::ec() const -> std::error_code
{
  return ec_;
}

auto
error::message() const -> const std::string&
{
  return message_;
}

auto
error::is_cancellation() const -> bool
{
  return ec_ == errc::common::request_canceled;
}

error::operator bool() const
{
  return ec_.value() != 0;
}

auto
error::operator==(const error& other) const -> bool
{
  return ec_ == other.ec_ && message_ == other.message_;
}
} // namespace cbinit

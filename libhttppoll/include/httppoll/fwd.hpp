//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include <caf/fwd.hpp>
#include <caf/type_id.hpp>

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace httppoll {

// -- classes ------------------------------------------------------------------

class authenticator;
class curl_http_client;
class data_extractor;
class http_api_client;
class http_client;
class json_extractor;
class pollable_api_client;
class transfer;
class url_builder;

// -- structs ------------------------------------------------------------------

struct partition;
struct source_record;
struct transfer_options;

// -- enums --------------------------------------------------------------------

enum class auth_type : uint8_t;
enum class ec : uint8_t;

// -- aliases ------------------------------------------------------------------

/// A single value extracted from a response.
using item = caf::config_value;

/// The progress marker of a partition.
using offset = caf::settings;

namespace http {

struct credentials;
struct header;
struct message;
struct request;
struct response;

} // namespace http

} // namespace httppoll

// -- type announcements -------------------------------------------------------

constexpr inline caf::type_id_t first_httppoll_type_id = 900;

CAF_BEGIN_TYPE_ID_BLOCK(httppoll_types, first_httppoll_type_id)

  CAF_ADD_TYPE_ID(httppoll_types, (httppoll::ec))

CAF_END_TYPE_ID_BLOCK(httppoll_types)

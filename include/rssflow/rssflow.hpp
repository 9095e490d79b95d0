// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of RssFlow, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include "core/config_loader.hpp"
#include "core/logger.hpp"
#include "feed/feed_parser.hpp"
#include "feed/input_buffer.hpp"
#include "feed/parser_options.hpp"
#include "feed/raw_node.hpp"
#include "feed/record_accumulator.hpp"
#include "feed/strategy.hpp"
#include "feed/tokenizer.hpp"
#include "io/byte_source.hpp"
#include "io/fd_source.hpp"
#include "io/memory_source.hpp"
#include "io/socket_source.hpp"
#include "io/tls_source.hpp"
#include "parsers/minimal_toml.hpp"
#include "parsers/xml_lexer.hpp"

#define RSSFLOW_DEFAULT_CONFIG_FILE_PATH "/etc/rssflow/rssflow.toml"

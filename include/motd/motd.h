#pragma once

#include "motd/errors.hpp"
#include "motd/query.hpp"
#include "motd/query_options.hpp"
#include "motd/protocol/pong_decoder.hpp"
#include "motd/protocol/server_id_string.hpp"

#pragma once

/// @file sfv.hpp
/// @brief Main header file for the sfv library.

#include "config.hpp"
#include "fwd.hpp"
#include "coding_path.hpp"
#include "error.hpp"
#include "ordered_map.hpp"
#include "value.hpp"
#include "decode_options.hpp"
#include "decoder.hpp"
#include "bare_item_decoder.hpp"
#include "keyed_inner_list_decoder.hpp"
#include "keyed_item_decoder.hpp"
#include "keyed_map_decoder.hpp"
#include "unkeyed_decoder.hpp"
#include "keyed_container.hpp"
#include "conversion.hpp"
#include "structured_field_value_decoder.hpp"
